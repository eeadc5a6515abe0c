#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"
#include "../error/transport_error.hpp"
#include "../model/model.hpp"

using namespace std::chrono;

namespace documentstack::http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr const char* USER_AGENT = "documentstack-cpp/1.0";
        static constexpr long NO_PROGRESS = 0L;  // progress callback drives cancellation
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long POST = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long MIN_TIMEOUT_MS = 1L;  // 0 would mean "no timeout" to libcurl
    };

    namespace {
        struct EasyDeleter {
            void operator()(CURL* h) const { curl_easy_cleanup(h); }
        };
        struct SlistDeleter {
            void operator()(curl_slist* l) const { curl_slist_free_all(l); }
        };
        using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
        using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

        template <typename T>
        void setopt(CURL* handle, CURLoption option, T value) {
            const auto rc = curl_easy_setopt(handle, option, value);

            if (rc != CURLE_OK) {
                throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
            }
        }

        HeaderList build_header_list(const http::model::HeaderMap& headers) {
            HeaderList list;
            for (const auto& [name, value] : headers) {
                const std::string line = name + ": " + value;
                curl_slist* next = curl_slist_append(list.get(), line.c_str());
                if (next == nullptr) {
                    throw std::runtime_error("curl_slist_append failed");
                }
                static_cast<void>(list.release());
                list.reset(next);
            }
            // libcurl would otherwise add "Expect: 100-continue" to large bodies.
            curl_slist* next = curl_slist_append(list.get(), "Expect:");
            if (next == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            static_cast<void>(list.release());
            list.reset(next);
            return list;
        }
    }  // namespace

    std::string reason_phrase(long code) {
        switch (code) {
            case 200: return "OK";
            case 201: return "Created";
            case 202: return "Accepted";
            case 204: return "No Content";
            case 301: return "Moved Permanently";
            case 302: return "Found";
            case 304: return "Not Modified";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 402: return "Payment Required";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 408: return "Request Timeout";
            case 409: return "Conflict";
            case 410: return "Gone";
            case 413: return "Request Entity Too Large";
            case 415: return "Unsupported Media Type";
            case 422: return "Unprocessable Entity";
            case 429: return "Too Many Requests";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            case 504: return "Gateway Timeout";
            default: return {};
        }
    }

    CurlEasy::CurlEasy(seconds timeout) : timeout_(duration_cast<milliseconds>(timeout)) {}

    long CurlEasy::effective_timeout_ms(Transfer& t) const {
        long ms = static_cast<long>(timeout_.count());
        if (const auto left = t.ctx_->remaining()) {
            if (left->count() <= ms) {
                ms = static_cast<long>(left->count());
                t.deadline_bound_ = true;
            }
        }
        t.timeout_ms_ = std::max(ms, CurlDefaults::MIN_TIMEOUT_MS);
        return t.timeout_ms_;
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* t = static_cast<Transfer*>(userdata);
        const size_t bytes = size * n_items;
        const std::string line = string_utils::trim(std::string(buffer, bytes));

        if (line.rfind("HTTP/", 0) == 0) {
            // New status line: a redirect hop or an interim 1xx. Forget the previous header block.
            t->response_.headers_.clear();
            t->headers_done_ = false;

            const auto sp = line.find(' ');
            std::string status = sp == std::string::npos ? std::string{} : string_utils::trim(line.substr(sp + 1));
            const auto code = string_utils::parse_integer(status.substr(0, status.find(' ')));
            if (code && status.find(' ') == std::string::npos) {
                const std::string reason = reason_phrase(static_cast<long>(*code));
                if (!reason.empty()) {
                    status += " " + reason;
                }
            }
            t->response_.status_line_ = std::move(status);
            return bytes;
        }

        if (line.empty()) {
            t->headers_done_ = true;
            return bytes;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            // A repeated field keeps its first value.
            t->response_.headers_.try_emplace(string_utils::trim(line.substr(0, colon)), string_utils::trim(line.substr(colon + 1)));
        }

        return bytes;
    }

    int CurlEasy::progress_cb(void* userdata, curl_off_t /*dl_total*/, curl_off_t /*dl_now*/, curl_off_t /*ul_total*/, curl_off_t /*ul_now*/) {
        const auto* t = static_cast<const Transfer*>(userdata);
        return t->ctx_->done() ? 1 : 0;
    }

    http::model::Response CurlEasy::send(const http::model::Request& req, const http::context::CallContext& ctx) {
        EasyHandle handle(curl_easy_init());
        if (!handle) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        Transfer t;
        t.ctx_ = &ctx;

        HeaderList headers = build_header_list(req.headers_);

        CURL* h = handle.get();
        setopt(h, CURLOPT_ERRORBUFFER, t.error_buf_.data());
        setopt(h, CURLOPT_URL, req.url_.c_str());
        setopt(h, CURLOPT_HTTPHEADER, headers.get());
        setopt(h, CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(h, CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(h, CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(h, CURLOPT_TIMEOUT_MS, effective_timeout_ms(t));
        setopt(h, CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(h, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps

        setopt(h, CURLOPT_WRITEFUNCTION, &string_utils::write_to_string);
        setopt(h, CURLOPT_WRITEDATA, &t.body_);
        setopt(h, CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(h, CURLOPT_HEADERDATA, &t);
        setopt(h, CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(h, CURLOPT_XFERINFOFUNCTION, &CurlEasy::progress_cb);
        setopt(h, CURLOPT_XFERINFODATA, &t);

        if (req.method_ == "GET") {
            setopt(h, CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        } else {
            setopt(h, CURLOPT_POST, CurlDefaults::POST);
            setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_.size()));
            setopt(h, CURLOPT_POSTFIELDS, req.body_.c_str());
            if (req.method_ != "POST") {
                setopt(h, CURLOPT_CUSTOMREQUEST, req.method_.c_str());
            }
        }

        perform_throw(h, t, req.url_);
        return make_response(h, t);
    }

    void CurlEasy::perform_throw(CURL* handle, Transfer& t, const std::string& url) {
        const auto rc = curl_easy_perform(handle);

        if (rc == CURLE_OK) {
            return;
        }

        const auto stage = t.headers_done_ ? http_error::TransportStage::READ_BODY : http_error::TransportStage::SEND;

        std::string err;
        bool deadline_bound = false;

        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            deadline_bound = !t.ctx_->stop_requested();
            err = deadline_bound ? "context deadline exceeded" : "operation cancelled";
        } else {
            err = "curl_easy_perform failed: ";
            if (t.error_buf_[0] != '\0') {
                err += t.error_buf_.data();
            } else {
                err += curl_easy_strerror(rc);
            }

            if (rc == CURLE_OPERATION_TIMEDOUT && t.deadline_bound_) {
                // A connect timeout shorter than the deadline reports the same code.
                curl_off_t connect_us = 0;
                curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME_T, &connect_us);
                deadline_bound = t.timeout_ms_ <= CurlDefaults::CONNECT_TIMEOUT_MS || connect_us > 0;
            }
        }

        http_error::TransportError e(static_cast<int>(rc), stage, url, err);
        e.deadline_bound_ = deadline_bound;
        if (stage == http_error::TransportStage::READ_BODY) {
            e.partial_ = make_response(handle, t);
        }
        throw e;
    }

    http::model::Response CurlEasy::make_response(CURL* handle, Transfer& t) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r = std::move(t.response_);
        r.status_ = code;
        r.body_ = std::move(t.body_);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        if (r.status_line_.empty()) {
            r.status_line_ = std::to_string(code) + " " + reason_phrase(code);
        }
        return r;
    }

}  // namespace documentstack::http::client
