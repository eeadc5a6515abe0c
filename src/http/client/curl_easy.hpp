#ifndef DOCUMENT_STACK_CURL_EASY_HPP
#define DOCUMENT_STACK_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <string>

#include "../context/call_context.hpp"
#include "../model/model.hpp"
#include "interface.hpp"

namespace documentstack::http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // Standard reason phrase for a status code, empty when unknown.
    std::string reason_phrase(long code);

    // libcurl transport. Every call to send() runs on its own easy handle, so one
    // instance can serve concurrent callers; only the timeout is shared.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(std::chrono::seconds timeout);

        ~CurlEasy() override = default;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req, const http::context::CallContext& ctx) override;

       private:
        // Per-call scratch handed to the libcurl callbacks.
        struct Transfer {
            const http::context::CallContext* ctx_{};
            bool headers_done_ = false;  // a full header block arrived, body transfer under way
            bool deadline_bound_ = false;  // the caller's deadline, not the client timeout, set the limit
            long timeout_ms_ = 0;
            std::string body_;
            http::model::Response response_;
            std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        };

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int progress_cb(void* userdata, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now);

        long effective_timeout_ms(Transfer& t) const;
        static void perform_throw(CURL* handle, Transfer& t, const std::string& url);
        static http::model::Response make_response(CURL* handle, Transfer& t);

        std::chrono::milliseconds timeout_;
    };
}  // namespace documentstack::http::client

#endif
