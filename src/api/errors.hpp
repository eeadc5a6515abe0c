#ifndef DOCUMENT_STACK_ERRORS_HPP
#define DOCUMENT_STACK_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "value.hpp"

namespace documentstack::api {

    bool is_validation_error(long status_code);
    bool is_authentication_error(long status_code);
    bool is_forbidden_error(long status_code);
    bool is_not_found_error(long status_code);
    bool is_rate_limit_error(long status_code);
    bool is_server_error(long status_code);

    // A non-200 response from the API.
    struct ApiError {
        long status_code_{};
        std::string error_code_;
        std::string message_;
        std::optional<Value> details_;

        [[nodiscard]] bool is_validation_error() const { return api::is_validation_error(status_code_); }
        [[nodiscard]] bool is_authentication_error() const { return api::is_authentication_error(status_code_); }
        [[nodiscard]] bool is_forbidden_error() const { return api::is_forbidden_error(status_code_); }
        [[nodiscard]] bool is_not_found_error() const { return api::is_not_found_error(status_code_); }
        [[nodiscard]] bool is_rate_limit_error() const { return api::is_rate_limit_error(status_code_); }
        [[nodiscard]] bool is_server_error() const { return api::is_server_error(status_code_); }
    };

    struct ConfigurationError {
        std::string message_;
    };

    // Rejected locally before any request was sent. Shaped like a 400 from the API.
    struct ValidationError {
        ApiError api_;
    };

    struct NetworkError {
        std::string message_;
        std::string cause_;  // empty when there is no underlying error
    };

    struct TimeoutError {
        int timeout_s_{};
    };

    struct RateLimitError {
        ApiError api_;
        int retry_after_s_{};
    };

    // Alternative order matches ErrorKind.
    using ErrorDetail = std::variant<ConfigurationError, ValidationError, NetworkError, TimeoutError, ApiError, RateLimitError>;

    enum class ErrorKind {
        CONFIGURATION,
        VALIDATION,
        NETWORK,
        TIMEOUT,
        API,
        RATE_LIMIT,
    };

    const char* to_string(ErrorKind kind);

    std::string describe(const ErrorDetail& detail);

    // The single exception type thrown by the client. Exactly one ErrorDetail
    // alternative is held; inspect it with kind() and std::get / std::get_if on detail().
    class DocumentStackError : public std::runtime_error {
       public:
        explicit DocumentStackError(ErrorDetail detail);

        [[nodiscard]] ErrorKind kind() const { return static_cast<ErrorKind>(detail_.index()); }
        [[nodiscard]] const ErrorDetail& detail() const { return detail_; }

        // The API error carried by VALIDATION, API and RATE_LIMIT; nullptr otherwise.
        [[nodiscard]] const ApiError* api_error() const;
        [[nodiscard]] std::optional<long> status_code() const;
        [[nodiscard]] std::optional<int> retry_after() const;

        [[nodiscard]] bool is_validation_error() const;
        [[nodiscard]] bool is_authentication_error() const;
        [[nodiscard]] bool is_forbidden_error() const;
        [[nodiscard]] bool is_not_found_error() const;
        [[nodiscard]] bool is_rate_limit_error() const;
        [[nodiscard]] bool is_server_error() const;

       private:
        ErrorDetail detail_;
    };

    DocumentStackError make_configuration_error(std::string message);
    DocumentStackError make_validation_error(std::string message, std::optional<Value> details = std::nullopt);
    DocumentStackError make_authentication_error(std::string message);
    DocumentStackError make_forbidden_error(std::string message);
    DocumentStackError make_not_found_error(std::string message);

}  // namespace documentstack::api

#endif
