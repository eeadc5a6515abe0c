#ifndef DOCUMENT_STACK_MODEL_HPP
#define DOCUMENT_STACK_MODEL_HPP

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace documentstack::http::model {
    enum class HttpStatusCode : long {
        OK = 200,
        BAD_REQUEST = 400,
        UNAUTHORIZED = 401,
        FORBIDDEN = 403,
        NOT_FOUND = 404,
        TOO_MANY_REQUESTS = 429,
        INTERNAL_SERVER_ERROR = 500,
    };

    struct CaseInsensitiveLess {
        bool operator()(std::string_view a, std::string_view b) const {
            return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
            });
        }
        using is_transparent = void;
    };

    // One value per field name; setting an existing name replaces it regardless of case.
    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    struct Request {
        std::string url_;
        std::string method_ = "POST";
        std::string body_;

        HeaderMap headers_;
    };

    struct Response {
        long status_ = 0;
        std::string status_line_;  // "404 Not Found"

        std::string body_;
        std::string effective_url_;

        HeaderMap headers_;

        [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
            const auto it = headers_.find(name);
            if (it == headers_.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    };
}  // namespace documentstack::http::model

#endif
