#ifndef DOCUMENT_STACK_CLIENT_HPP
#define DOCUMENT_STACK_CLIENT_HPP

#include <memory>
#include <string>

#include "../http/client/interface.hpp"
#include "../http/context/call_context.hpp"
#include "../http/provider/documentstack.hpp"
#include "config.hpp"
#include "debug_sink.hpp"
#include "types.hpp"

namespace documentstack::api {

    // DocumentStack API client.
    //
    //   http::client::CurlGlobal curl_global;
    //   api::Client client(api::Config{.api_key_ = key});
    //   api::GenerateRequest req{.data_ = {{"name", "John Doe"}, {"amount", 100}},
    //                            .options_ = api::GenerateOptions{.filename_ = "invoice"}};
    //   auto result = client.generate(http::context::CallContext::background(), "template-id", req);
    //
    // Every failure is thrown as DocumentStackError. Nothing is retried. The client holds no
    // per-call state and may be shared between threads.
    class Client {
       public:
        // Uses the libcurl transport and, when config.debug_ is set, a std::cerr debug sink.
        explicit Client(Config config);
        Client(Config config, std::unique_ptr<http::client::IHttpClient> transport, std::shared_ptr<IDebugSink> debug_sink = nullptr);

        ~Client() = default;
        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;
        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        [[nodiscard]] GenerateResponse generate(const http::context::CallContext& ctx, const std::string& template_id) const;
        [[nodiscard]] GenerateResponse generate(const http::context::CallContext& ctx, const std::string& template_id, const GenerateRequest& request) const;

        [[nodiscard]] const Config& config() const { return config_; }

       private:
        [[nodiscard]] http::model::Response dispatch(const http::context::CallContext& ctx, const http::model::Request& req) const;

        Config config_;
        http::provider::DocumentStackProvider provider_;
        std::unique_ptr<http::client::IHttpClient> http_;
        std::shared_ptr<IDebugSink> debug_sink_;
    };

}  // namespace documentstack::api

#endif
