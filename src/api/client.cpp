#include "client.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "../http/client/curl_easy.hpp"
#include "../http/error/transport_error.hpp"
#include "../http/model/model.hpp"
#include "../http/provider/documentstack.hpp"
#include "errors.hpp"

namespace documentstack::api {

    Client::Client(Config config) : Client(std::move(config), nullptr, nullptr) {}

    Client::Client(Config config, std::unique_ptr<http::client::IHttpClient> transport, std::shared_ptr<IDebugSink> debug_sink)
        : config_(resolve_config(std::move(config))), provider_(config_), http_(std::move(transport)), debug_sink_(std::move(debug_sink)) {
        if (!http_) {
            http_ = std::make_unique<http::client::CurlEasy>(std::chrono::seconds{config_.timeout_s_});
        }
        if (!debug_sink_) {
            debug_sink_ = std::make_shared<StreamDebugSink>();
        }
    }

    GenerateResponse Client::generate(const http::context::CallContext& ctx, const std::string& template_id) const {
        return generate(ctx, template_id, GenerateRequest{});
    }

    GenerateResponse Client::generate(const http::context::CallContext& ctx, const std::string& template_id, const GenerateRequest& request) const {
        if (template_id.empty()) {
            throw make_validation_error("Template ID is required");
        }

        const http::model::Request req = provider_.build_generate(template_id, request);

        if (config_.debug_) {
            debug_sink_->on_request(RequestEvent{.method_ = req.method_, .url_ = req.url_, .body_ = req.body_});
        }

        const http::model::Response resp = dispatch(ctx, req);

        if (resp.status_ != static_cast<long>(http::model::HttpStatusCode::OK)) {
            throw http::provider::classify_error_response(resp);
        }

        GenerateResponse out = provider_.parse_generate(resp);

        if (config_.debug_) {
            debug_sink_->on_response(ResponseEvent{
                .filename_ = out.filename_,
                .generation_time_ms_ = out.generation_time_ms_,
                .content_length_ = out.content_length_,
            });
        }

        return out;
    }

    http::model::Response Client::dispatch(const http::context::CallContext& ctx, const http::model::Request& req) const {
        if (ctx.deadline_exceeded()) {
            throw DocumentStackError(TimeoutError{.timeout_s_ = config_.timeout_s_});
        }
        if (ctx.stop_requested()) {
            throw DocumentStackError(NetworkError{.message_ = "request failed", .cause_ = "operation cancelled"});
        }

        try {
            return http_->send(req, ctx);
        } catch (const http::http_error::TransportError& e) {
            // An error status is classified from whatever arrived; only a success needs the whole body.
            if (e.partial_ && e.partial_->status_ != static_cast<long>(http::model::HttpStatusCode::OK)) {
                return *e.partial_;
            }
            if (e.stage_ == http::http_error::TransportStage::READ_BODY) {
                throw DocumentStackError(NetworkError{.message_ = "failed to read response body", .cause_ = e.what()});
            }
            if (e.deadline_bound_ || ctx.deadline_exceeded()) {
                throw DocumentStackError(TimeoutError{.timeout_s_ = config_.timeout_s_});
            }
            throw DocumentStackError(NetworkError{.message_ = "request failed", .cause_ = e.what()});
        } catch (const std::runtime_error& e) {
            throw DocumentStackError(NetworkError{.message_ = "failed to create request", .cause_ = e.what()});
        }
    }

}  // namespace documentstack::api
