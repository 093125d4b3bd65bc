#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <map>
#include <memory>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace relata {

// Supported field value types (same storage classes SQLite uses)
using value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

using value_list_t = std::vector<value_t>;

// A raw or decoded tuple: field name -> value, ordered by field name
using tuple_t = std::map<std::string, value_t>;

using tuple_list_t = std::vector<tuple_t>;

// Tuple processing function (write/read coercion)
using tuple_fn = std::function<tuple_t(const tuple_t&)>;

// Restriction criteria: field -> allowed values (equality when one value)
using restriction_t = std::map<std::string, value_list_t>;

// Render a value for messages and logs
std::string value_to_string(const value_t& value);

bool is_null(const value_t& value);

nlohmann::json to_json(const value_t& value);
nlohmann::json to_json(const tuple_t& tuple);
nlohmann::json to_json(const tuple_list_t& tuples);

// ============================================================================
// Helper functions for value conversion
// ============================================================================

namespace detail {
    // Convert C++ types to value_t
    inline value_t to_value(std::nullptr_t) { return nullptr; }
    inline value_t to_value(int64_t v) { return v; }
    inline value_t to_value(int v) { return static_cast<int64_t>(v); }
    inline value_t to_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline value_t to_value(double v) { return v; }
    inline value_t to_value(float v) { return static_cast<double>(v); }
    inline value_t to_value(const char* v) { return std::string(v); }
    inline value_t to_value(const std::string& v) { return v; }
    inline value_t to_value(const std::vector<uint8_t>& v) { return v; }

    template<typename T>
    value_t to_value(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return to_value(*v);
    }

    // Convert value_t back to C++ types
    template<typename T>
    T from_value(const value_t& v);

    template<> inline int64_t from_value<int64_t>(const value_t& v) {
        return std::get<int64_t>(v);
    }
    template<> inline int from_value<int>(const value_t& v) {
        return static_cast<int>(std::get<int64_t>(v));
    }
    template<> inline bool from_value<bool>(const value_t& v) {
        return std::get<int64_t>(v) != 0;
    }
    template<> inline double from_value<double>(const value_t& v) {
        return std::get<double>(v);
    }
    template<> inline std::string from_value<std::string>(const value_t& v) {
        return std::get<std::string>(v);
    }
    template<> inline std::vector<uint8_t> from_value<std::vector<uint8_t>>(const value_t& v) {
        return std::get<std::vector<uint8_t>>(v);
    }
} // namespace detail

} // namespace relata

#endif // __cplusplus
