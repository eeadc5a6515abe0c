#ifndef DOCUMENT_STACK_CLIENT_INTERFACE_HPP
#define DOCUMENT_STACK_CLIENT_INTERFACE_HPP

#include "../context/call_context.hpp"
#include "../model/model.hpp"

namespace documentstack::http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Sends one request. Any HTTP status is returned as a Response; throws
        // http_error::TransportError when no complete response could be read.
        virtual http::model::Response send(const http::model::Request& req, const http::context::CallContext& ctx) = 0;
    };
}  // namespace documentstack::http::client

#endif
