#include "value.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace documentstack::api {
    void to_json(nlohmann::json& j, const Value& v) {
        std::visit(
            [&j](const auto& x) {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    j = nullptr;
                } else if constexpr (std::is_same_v<T, double>) {
                    if (!std::isfinite(x)) {
                        throw std::invalid_argument("unsupported value: " + std::to_string(x));
                    }
                    j = x;
                } else if constexpr (std::is_same_v<T, Array>) {
                    j = nlohmann::json::array();
                    for (const auto& item : x) {
                        j.push_back(nlohmann::json(item));
                    }
                } else if constexpr (std::is_same_v<T, Object>) {
                    j = nlohmann::json::object();
                    for (const auto& [key, item] : x) {
                        j[key] = nlohmann::json(item);
                    }
                } else {
                    j = x;
                }
            },
            v.v_);
    }
}  // namespace documentstack::api
