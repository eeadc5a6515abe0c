#ifndef DOCUMENT_STACK_TRANSPORT_ERROR_HPP
#define DOCUMENT_STACK_TRANSPORT_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace documentstack::http::http_error {
    enum class TransportStage {
        SEND,       // connecting, sending, or reading the response headers
        READ_BODY,  // headers received, body transfer failed
    };

    // Thrown by IHttpClient implementations when no complete response was obtained.
    struct TransportError : public std::runtime_error {
        int code_;
        TransportStage stage_;
        std::string url_;

        // The caller's deadline was the limit the transfer ran into.
        bool deadline_bound_ = false;

        // READ_BODY only: status, headers and whatever part of the body arrived.
        std::optional<http::model::Response> partial_;

        explicit TransportError(int code, TransportStage stage, std::string u, const std::string &msg);
    };
}  // namespace documentstack::http::http_error

#endif
