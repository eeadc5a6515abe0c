#include "debug_sink.hpp"

#include <iostream>
#include <mutex>
#include <ostream>

#include "../utils/constants.hpp"

namespace documentstack::api {

    StreamDebugSink::StreamDebugSink() : out_(std::cerr) {}

    StreamDebugSink::StreamDebugSink(std::ostream& out) : out_(out) {}

    void StreamDebugSink::on_request(const RequestEvent& e) {
        const std::lock_guard<std::mutex> lock(mu_);
        out_ << constants::LOG_PREFIX << "Request: " << e.method_ << " " << e.url_ << "\n"
             << constants::LOG_PREFIX << "Body: " << e.body_ << "\n";
        out_.flush();
    }

    void StreamDebugSink::on_response(const ResponseEvent& e) {
        const std::lock_guard<std::mutex> lock(mu_);
        out_ << constants::LOG_PREFIX << "Response: filename=" << e.filename_ << ", time=" << e.generation_time_ms_ << "ms, size=" << e.content_length_
             << "\n";
        out_.flush();
    }

}  // namespace documentstack::api
