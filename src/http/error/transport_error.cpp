#include "transport_error.hpp"

#include <stdexcept>
#include <string>

namespace documentstack::http::http_error {
    TransportError::TransportError(int code, TransportStage stage, std::string u,
                                   const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), code_(code), stage_(stage), url_(std::move(u)) {}
}  // namespace documentstack::http::http_error
