// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace toolmesh::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code reported on malformed input.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::InvalidResponse)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes a JSON value, returning a Result.
///
/// Strings that are not valid UTF-8 cannot be serialized and are reported as @p code.
[[nodiscard]] inline auto dump(const nlohmann::json& value, ErrorCode code = ErrorCode::InvalidArgument)
    -> Result<std::string>
{
    try
    {
        return value.dump();
    }
    catch (const nlohmann::json::type_error& e)
    {
        return makeError(code, std::format("JSON serialization error: {}", e.what()));
    }
}

/// @brief Pretty-prints a JSON value for humans, replacing invalid UTF-8 with U+FFFD.
[[nodiscard]] inline auto dumpForDisplay(const nlohmann::json& value, int indent = 2) -> std::string
{
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Reads and parses a JSON file.
/// @param path The file path.
/// @param code The error code reported when the file is missing or malformed.
/// @return The parsed JSON document or an Error naming the path.
[[nodiscard]] inline auto readFile(std::string_view path, ErrorCode code) -> Result<nlohmann::json>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(code, std::format("Cannot open file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = parse(ss.str(), code);
    if (!parsed)
        return makeError(code, std::format("{}: {}", path, parsed.error().message));
    return parsed;
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param code The error code reported when the field is missing.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj,
                                    std::string_view key,
                                    ErrorCode code = ErrorCode::InvalidArgument) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(code, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value, or the default if missing or outside the range of int.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr))
        return defaultValue;

    auto const& value = obj[keyStr];
    if (value.is_number_unsigned())
    {
        auto const n = value.get<std::uint64_t>();
        return n <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()) ? static_cast<int>(n)
                                                                                : defaultValue;
    }
    if (value.is_number_integer())
    {
        auto const n = value.get<std::int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
            return defaultValue;
        return static_cast<int>(n);
    }
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The value or the default.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

} // namespace toolmesh::json
