// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>

#include "Error.hpp"

namespace voxtype::json
{

/// @brief Parses a JSON document, reporting syntax errors under @p errorCode.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode errorCode = ErrorCode::ProtocolError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(errorCode, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the string member @p key, or an error under @p errorCode when absent or not a string.
[[nodiscard]] inline auto requireString(const nlohmann::json& obj,
                                        std::string_view key,
                                        ErrorCode errorCode = ErrorCode::ProtocolError) -> Result<std::string>
{
    if (obj.is_object())
        if (auto const it = obj.find(std::string(key)); it != obj.end() && it->is_string())
            return it->get<std::string>();
    return makeError(errorCode, std::format("Missing or invalid string field: {}", key));
}

/// @brief Returns the object member @p key, or nullptr if there is no such object.
[[nodiscard]] inline auto section(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    return it != obj.end() && it->is_object() ? &*it : nullptr;
}

/// @brief Overwrites @p target with member @p key if it is present and of a matching JSON type.
///
/// Missing or mistyped members leave @p target untouched, so a struct initialized with
/// its defaults only picks up what the document actually sets. Floating point targets
/// accept integers too.
/// @return true if @p target was assigned.
template <typename T>
auto read(const nlohmann::json& obj, std::string_view key, T& target) -> bool
{
    if (!obj.is_object())
        return false;
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return false;

    auto matches = false;
    if constexpr (std::is_same_v<T, bool>)
        matches = it->is_boolean();
    else if constexpr (std::is_integral_v<T>)
        matches = it->is_number_integer();
    else if constexpr (std::is_floating_point_v<T>)
        matches = it->is_number();
    else if constexpr (std::is_same_v<T, std::string>)
        matches = it->is_string();
    else
        static_assert(std::is_same_v<T, bool>, "unsupported config field type");

    if (matches)
        target = it->get<T>();
    return matches;
}

} // namespace voxtype::json
