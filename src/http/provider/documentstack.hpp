#ifndef DOCUMENT_STACK_PROVIDER_HPP
#define DOCUMENT_STACK_PROVIDER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../../api/config.hpp"
#include "../../api/errors.hpp"
#include "../../api/types.hpp"
#include "../model/model.hpp"

namespace documentstack::http::provider {
    struct HeaderKeys {
        static constexpr const char* AUTHORIZATION = "Authorization";
        static constexpr const char* CONTENT_TYPE = "Content-Type";
        static constexpr const char* CONTENT_DISPOSITION = "Content-Disposition";
        static constexpr const char* CONTENT_LENGTH = "Content-Length";
        static constexpr const char* GENERATION_TIME_MS = "X-Generation-Time-Ms";
        static constexpr const char* RETRY_AFTER = "Retry-After";
    };

    // Maps generate calls onto the DocumentStack wire format: request building on the way
    // out, header and body decoding on the way back.
    class DocumentStackProvider {
       public:
        explicit DocumentStackProvider(const api::Config& config);

        // Throws DocumentStackError (NETWORK) when the payload cannot be encoded as JSON.
        [[nodiscard]] http::model::Request build_generate(const std::string& template_id, const api::GenerateRequest& req) const;
        [[nodiscard]] api::GenerateResponse parse_generate(const http::model::Response& resp) const;

       private:
        std::string base_url_;
        std::string api_key_;
        http::model::HeaderMap headers_;
    };

    // {"data": {...}, "options": {"filename": "..."}}; empty data, absent options and an
    // empty filename are left out.
    std::string encode_generate_body(const api::GenerateRequest& req);

    // nullopt unless the body is a single JSON object whose error/message fields are strings.
    std::optional<api::ApiErrorBody> decode_error_body(const std::string& body);

    // First capture of filename="?([^";\n]+)"?, or "document.pdf".
    std::string parse_filename(std::string_view content_disposition);

    // Turns a non-200 response into the error thrown to the caller. Malformed bodies fall
    // back to "Unknown Error" with the status line as the message.
    api::DocumentStackError classify_error_response(const http::model::Response& resp);
}  // namespace documentstack::http::provider

#endif
