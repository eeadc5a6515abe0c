#ifndef DOCUMENT_STACK_CONSTANTS_HPP
#define DOCUMENT_STACK_CONSTANTS_HPP

namespace documentstack::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr const char* DEFAULT_BASE_URL = "https://api.documentstack.dev";
    inline constexpr int DEFAULT_TIMEOUT_S = 30;
    inline constexpr const char* DEFAULT_FILENAME = "document.pdf";
    inline constexpr const char* LOG_PREFIX = "[DocumentStack] ";
}  // namespace documentstack::constants

#endif
