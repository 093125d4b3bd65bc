#include "relata/types.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>

namespace relata {

std::string value_to_string(const value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << std::setprecision(15) << v;
            return ss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::ostringstream ss;
            ss << std::hex << std::setfill('0');
            for (auto b : v) ss << std::setw(2) << static_cast<int>(b);
            return ss.str();
        }
    }, value);
}

bool is_null(const value_t& value) {
    return std::holds_alternative<std::nullptr_t>(value);
}

nlohmann::json to_json(const value_t& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            // Blobs as byte arrays, same as the C API encodes them
            return nlohmann::json(v);
        } else {
            return v;
        }
    }, value);
}

nlohmann::json to_json(const tuple_t& tuple) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [key, value] : tuple) {
        obj[key] = to_json(value);
    }
    return obj;
}

nlohmann::json to_json(const tuple_list_t& tuples) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tuple : tuples) {
        arr.push_back(to_json(tuple));
    }
    return arr;
}

} // namespace relata
