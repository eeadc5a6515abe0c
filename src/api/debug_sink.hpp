#ifndef DOCUMENT_STACK_DEBUG_SINK_HPP
#define DOCUMENT_STACK_DEBUG_SINK_HPP

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace documentstack::api {

    struct RequestEvent {
        std::string method_;
        std::string url_;
        std::string body_;
    };

    struct ResponseEvent {
        std::string filename_;
        std::int64_t generation_time_ms_{};
        std::int64_t content_length_{};
    };

    // Receives debug traces from a Client whose Config has debug_ set.
    // Called synchronously on the calling thread; implementations shared between
    // clients used from several threads must do their own locking.
    class IDebugSink {
       public:
        IDebugSink() = default;
        virtual ~IDebugSink() = default;
        IDebugSink(const IDebugSink&) = delete;
        IDebugSink& operator=(const IDebugSink&) = delete;
        IDebugSink(IDebugSink&&) = delete;
        IDebugSink& operator=(IDebugSink&&) = delete;

        virtual void on_request(const RequestEvent& e) = 0;
        virtual void on_response(const ResponseEvent& e) = 0;
    };

    // Writes "[DocumentStack] ..." lines to a stream, std::cerr by default.
    class StreamDebugSink : public IDebugSink {
       public:
        StreamDebugSink();
        explicit StreamDebugSink(std::ostream& out);

        void on_request(const RequestEvent& e) override;
        void on_response(const ResponseEvent& e) override;

       private:
        std::mutex mu_;
        std::ostream& out_;
    };

}  // namespace documentstack::api

#endif
