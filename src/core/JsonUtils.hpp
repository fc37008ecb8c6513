// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcplink::json
{

/// @brief Parses a JSON string, returning a Result.
///
/// Works for both nlohmann::json and nlohmann::ordered_json.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
template <typename Json = nlohmann::json>
[[nodiscard]] auto parse(std::string_view input) -> Result<Json>
{
    try
    {
        return Json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts an optional string field from a JSON object.
template <typename Json>
[[nodiscard]] auto getStringOr(const Json& obj, std::string_view key, std::string_view defaultValue)
    -> std::string
{
    if (!obj.is_object())
        return std::string(defaultValue);
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->template get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
template <typename Json>
[[nodiscard]] auto getIntOr(const Json& obj, std::string_view key, int64_t defaultValue) -> int64_t
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->template get<int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
template <typename Json>
[[nodiscard]] auto getDoubleOr(const Json& obj, std::string_view key, double defaultValue) -> double
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number())
        return it->template get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
template <typename Json>
[[nodiscard]] auto getBoolOr(const Json& obj, std::string_view key, bool defaultValue) -> bool
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->template get<bool>();
    return defaultValue;
}

/// @brief Collects the string elements of an array field, ignoring non-strings.
template <typename Json>
[[nodiscard]] auto getStringList(const Json& obj, std::string_view key) -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    if (!obj.is_object())
        return values;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return values;
    for (const auto& item: *it)
    {
        if (item.is_string())
            values.push_back(item.template get<std::string>());
    }
    return values;
}

/// @brief Collects the string members of an object field, ignoring non-strings.
template <typename Json>
[[nodiscard]] auto getStringMap(const Json& obj, std::string_view key) -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    if (!obj.is_object())
        return values;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_object())
        return values;
    for (const auto& [name, value]: it->items())
    {
        if (value.is_string())
            values[name] = value.template get<std::string>();
    }
    return values;
}

} // namespace mcplink::json
