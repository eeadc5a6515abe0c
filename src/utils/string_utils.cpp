#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "constants.hpp"

namespace documentstack::string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string escape_path_segment(std::string_view segment) {
        static constexpr const char *HEX = "0123456789ABCDEF";
        static constexpr std::string_view LITERAL_SUB_DELIMS = "-_.~$&+:=@";

        std::string out;
        out.reserve(segment.size());
        for (const char ch : segment) {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) != 0 || LITERAL_SUB_DELIMS.find(ch) != std::string_view::npos) {
                out.push_back(ch);
                continue;
            }
            out.push_back('%');
            out.push_back(HEX[c >> 4U]);
            out.push_back(HEX[c & 0x0FU]);
        }
        return out;
    }

    std::optional<long long> parse_integer(std::string_view sv) {
        const std::string s = trim(std::string(sv));
        if (s.empty()) {
            return std::nullopt;
        }

        char *end = nullptr;
        errno = 0;
        const long long v = std::strtoll(s.c_str(), &end, constants::BASE_10);
        if (end == s.c_str() || *end != '\0' || errno == ERANGE) {
            return std::nullopt;
        }
        return v;
    }

    std::string strip_trailing_slash(std::string s) {
        if (!s.empty() && s.back() == '/') {
            s.pop_back();
        }
        return s;
    }
}  // namespace documentstack::string_utils
