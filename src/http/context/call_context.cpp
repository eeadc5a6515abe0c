#include "call_context.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>
#include <utility>

namespace documentstack::http::context {

    CallContext CallContext::background() { return {}; }

    CallContext CallContext::with_deadline(Clock::time_point deadline, std::stop_token stop) {
        CallContext ctx;
        ctx.deadline_ = deadline;
        ctx.stop_ = std::move(stop);
        return ctx;
    }

    CallContext CallContext::with_timeout(std::chrono::milliseconds timeout, std::stop_token stop) {
        return with_deadline(Clock::now() + timeout, std::move(stop));
    }

    CallContext CallContext::with_stop_token(std::stop_token stop) {
        CallContext ctx;
        ctx.stop_ = std::move(stop);
        return ctx;
    }

    bool CallContext::deadline_exceeded() const { return deadline_.has_value() && Clock::now() >= *deadline_; }

    std::optional<std::chrono::milliseconds> CallContext::remaining() const {
        if (!deadline_) {
            return std::nullopt;
        }
        // Rounded up: a transport timeout taken from this never fires before the deadline itself.
        const auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

}  // namespace documentstack::http::context
