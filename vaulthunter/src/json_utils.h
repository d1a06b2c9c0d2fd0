/**
 * @file json_utils.h
 * @brief JSON utilities with null-safe value extraction
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace vaulthunter {

/**
 * @brief Null-safe value extraction
 *
 * Returns default_val if the key is missing, null, or of another type.
 */
template<typename T>
inline T json_value(const nlohmann::json& j, const std::string& key, const T& default_val = T{}) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return default_val;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_val;
    }
}

/**
 * @brief Render a value as text: strings as-is, anything else as its JSON form
 */
inline std::string json_to_text(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

/**
 * @brief First message of an "errors" array, if the body carries one
 */
inline std::optional<std::string> first_error(const nlohmann::json& body) {
    if (!body.is_object()) {
        return std::nullopt;
    }
    auto it = body.find("errors");
    if (it == body.end() || !it->is_array() || it->empty()) {
        return std::nullopt;
    }
    return json_to_text((*it)[0]);
}

} // namespace vaulthunter
