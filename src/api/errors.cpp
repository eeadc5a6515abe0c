#include "errors.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "../http/model/model.hpp"

using documentstack::http::model::HttpStatusCode;

namespace documentstack::api {
    namespace {
        constexpr long code(HttpStatusCode c) { return static_cast<long>(c); }

        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
    }  // namespace

    bool is_validation_error(long status_code) { return status_code == code(HttpStatusCode::BAD_REQUEST); }
    bool is_authentication_error(long status_code) { return status_code == code(HttpStatusCode::UNAUTHORIZED); }
    bool is_forbidden_error(long status_code) { return status_code == code(HttpStatusCode::FORBIDDEN); }
    bool is_not_found_error(long status_code) { return status_code == code(HttpStatusCode::NOT_FOUND); }
    bool is_rate_limit_error(long status_code) { return status_code == code(HttpStatusCode::TOO_MANY_REQUESTS); }
    bool is_server_error(long status_code) { return status_code >= code(HttpStatusCode::INTERNAL_SERVER_ERROR); }

    const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::CONFIGURATION:
                return "configuration";
            case ErrorKind::VALIDATION:
                return "validation";
            case ErrorKind::NETWORK:
                return "network";
            case ErrorKind::TIMEOUT:
                return "timeout";
            case ErrorKind::API:
                return "api";
            case ErrorKind::RATE_LIMIT:
                return "rate_limit";
        }
        return "unknown";
    }

    std::string describe(const ErrorDetail& detail) {
        const auto api_text = [](const ApiError& e) { return e.error_code_ + ": " + e.message_; };

        return std::visit(overloaded{
                              [](const ConfigurationError& e) { return e.message_; },
                              [&](const ValidationError& e) { return api_text(e.api_); },
                              [](const NetworkError& e) { return e.cause_.empty() ? e.message_ : e.message_ + ": " + e.cause_; },
                              [](const TimeoutError& e) { return "request timed out after " + std::to_string(e.timeout_s_) + " seconds"; },
                              [&](const ApiError& e) { return api_text(e); },
                              [&](const RateLimitError& e) { return api_text(e.api_); },
                          },
                          detail);
    }

    DocumentStackError::DocumentStackError(ErrorDetail detail) : std::runtime_error(describe(detail)), detail_(std::move(detail)) {}

    const ApiError* DocumentStackError::api_error() const {
        if (const auto* v = std::get_if<ValidationError>(&detail_)) {
            return &v->api_;
        }
        if (const auto* a = std::get_if<ApiError>(&detail_)) {
            return a;
        }
        if (const auto* r = std::get_if<RateLimitError>(&detail_)) {
            return &r->api_;
        }
        return nullptr;
    }

    std::optional<long> DocumentStackError::status_code() const {
        const ApiError* e = api_error();
        if (e == nullptr) {
            return std::nullopt;
        }
        return e->status_code_;
    }

    std::optional<int> DocumentStackError::retry_after() const {
        if (const auto* r = std::get_if<RateLimitError>(&detail_)) {
            return r->retry_after_s_;
        }
        return std::nullopt;
    }

    bool DocumentStackError::is_validation_error() const { return api_error() != nullptr && api_error()->is_validation_error(); }
    bool DocumentStackError::is_authentication_error() const { return api_error() != nullptr && api_error()->is_authentication_error(); }
    bool DocumentStackError::is_forbidden_error() const { return api_error() != nullptr && api_error()->is_forbidden_error(); }
    bool DocumentStackError::is_not_found_error() const { return api_error() != nullptr && api_error()->is_not_found_error(); }
    bool DocumentStackError::is_rate_limit_error() const { return api_error() != nullptr && api_error()->is_rate_limit_error(); }
    bool DocumentStackError::is_server_error() const { return api_error() != nullptr && api_error()->is_server_error(); }

    DocumentStackError make_configuration_error(std::string message) { return DocumentStackError(ConfigurationError{.message_ = std::move(message)}); }

    DocumentStackError make_validation_error(std::string message, std::optional<Value> details) {
        return DocumentStackError(ValidationError{.api_ = ApiError{
                                                      .status_code_ = code(HttpStatusCode::BAD_REQUEST),
                                                      .error_code_ = "Bad Request",
                                                      .message_ = std::move(message),
                                                      .details_ = std::move(details),
                                                  }});
    }

    DocumentStackError make_authentication_error(std::string message) {
        return DocumentStackError(ApiError{
            .status_code_ = code(HttpStatusCode::UNAUTHORIZED),
            .error_code_ = "Unauthorized",
            .message_ = std::move(message),
        });
    }

    DocumentStackError make_forbidden_error(std::string message) {
        return DocumentStackError(ApiError{
            .status_code_ = code(HttpStatusCode::FORBIDDEN),
            .error_code_ = "Forbidden",
            .message_ = std::move(message),
        });
    }

    DocumentStackError make_not_found_error(std::string message) {
        return DocumentStackError(ApiError{
            .status_code_ = code(HttpStatusCode::NOT_FOUND),
            .error_code_ = "Not Found",
            .message_ = std::move(message),
        });
    }

}  // namespace documentstack::api
