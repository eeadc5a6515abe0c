#ifndef DOCUMENT_STACK_TYPES_HPP
#define DOCUMENT_STACK_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "value.hpp"

namespace documentstack::api {

    struct GenerateOptions {
        std::string filename_;  // without the .pdf extension; empty = server default
    };

    struct GenerateRequest {
        Object data_;  // template variables
        std::optional<GenerateOptions> options_;
    };

    struct GenerateResponse {
        std::vector<std::uint8_t> pdf_;
        std::string filename_;
        std::int64_t generation_time_ms_{};
        std::int64_t content_length_{};
    };

    // Error body sent by the API on any non-200 status.
    struct ApiErrorBody {
        std::string error_;
        std::string message_;
        std::optional<Value> details_;
    };

}  // namespace documentstack::api

#endif
