#ifndef DOCUMENT_STACK_STRING_UTILS_HPP
#define DOCUMENT_STACK_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace documentstack::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string trim(std::string s);

    // Percent-encodes everything outside the RFC 3986 pchar set, so '/' and '?' never split the segment.
    std::string escape_path_segment(std::string_view segment);

    // Whole-string base 10 integer parse, surrounding whitespace allowed.
    std::optional<long long> parse_integer(std::string_view sv);

    std::string strip_trailing_slash(std::string s);
}  // namespace documentstack::string_utils

#endif
