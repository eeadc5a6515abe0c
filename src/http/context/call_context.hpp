#ifndef DOCUMENT_STACK_CALL_CONTEXT_HPP
#define DOCUMENT_STACK_CALL_CONTEXT_HPP

#include <chrono>
#include <optional>
#include <stop_token>

namespace documentstack::http::context {
    using Clock = std::chrono::steady_clock;

    // Cancellation and deadline carried into a single call. Cancellation is cooperative:
    // the transport polls stop_requested() and deadline_exceeded() while a transfer runs.
    class CallContext {
       public:
        CallContext() = default;

        static CallContext background();
        static CallContext with_deadline(Clock::time_point deadline, std::stop_token stop = {});
        static CallContext with_timeout(std::chrono::milliseconds timeout, std::stop_token stop = {});
        static CallContext with_stop_token(std::stop_token stop);

        [[nodiscard]] const std::optional<Clock::time_point>& deadline() const { return deadline_; }
        [[nodiscard]] bool stop_requested() const { return stop_.stop_requested(); }
        [[nodiscard]] bool deadline_exceeded() const;
        [[nodiscard]] bool done() const { return stop_requested() || deadline_exceeded(); }

        // Time left before the deadline in whole milliseconds, rounded up and clamped at zero. nullopt when there is no deadline.
        [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

       private:
        std::optional<Clock::time_point> deadline_;
        std::stop_token stop_;
    };
}  // namespace documentstack::http::context

#endif
