#ifndef DOCUMENT_STACK_VALUE_HPP
#define DOCUMENT_STACK_VALUE_HPP

#include <nlohmann/json_fwd.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace documentstack::api {
    struct Value;

    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    // A JSON-compatible value: null, boolean, integer, number, string, array or object.
    // Template data is an Object of these; no schema is imposed beyond what JSON allows.
    struct Value {
        using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;

        Storage v_;

        Value() : v_(nullptr) {}
        Value(std::nullptr_t) : v_(nullptr) {}  // NOLINT(google-explicit-constructor)
        Value(bool b) : v_(b) {}                // NOLINT(google-explicit-constructor)
        template <std::integral T>
            requires(!std::same_as<T, bool>)
        Value(T i) : v_(static_cast<std::int64_t>(i)) {}  // NOLINT(google-explicit-constructor)
        Value(double d) : v_(d) {}                        // NOLINT(google-explicit-constructor)
        Value(const char* s) : v_(std::string(s)) {}      // NOLINT(google-explicit-constructor)
        Value(std::string s) : v_(std::move(s)) {}        // NOLINT(google-explicit-constructor)
        Value(Array a) : v_(std::move(a)) {}              // NOLINT(google-explicit-constructor)
        Value(Object o) : v_(std::move(o)) {}             // NOLINT(google-explicit-constructor)

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(v_); }

        template <typename T>
        [[nodiscard]] bool is() const {
            return std::holds_alternative<T>(v_);
        }

        // Throws std::bad_variant_access on a kind mismatch.
        template <typename T>
        [[nodiscard]] const T& get() const {
            return std::get<T>(v_);
        }

        friend bool operator==(const Value& a, const Value& b) { return a.v_ == b.v_; }
    };

    // Throws std::invalid_argument for NaN and infinities, which JSON cannot carry.
    void to_json(nlohmann::json& j, const Value& v);
}  // namespace documentstack::api

#endif
