// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace mcpmux::json
{

/// @brief Parses JSON text. Malformed input is a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the member @p key of @p obj if @p obj is an object and the member satisfies @p accepts.
template <typename Predicate>
[[nodiscard]] auto findMember(const nlohmann::json& obj, std::string_view key, Predicate accepts)
    -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !accepts(*it))
        return nullptr;
    return &*it;
}

/// @return The string member, or a ProtocolError if it is missing or not a string.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const* member = findMember(obj, key, [](const nlohmann::json& v) { return v.is_string(); });
    if (!member)
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return member->get<std::string>();
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj, std::string_view key, std::string_view fallback)
    -> std::string
{
    auto const* member = findMember(obj, key, [](const nlohmann::json& v) { return v.is_string(); });
    return member ? member->get<std::string>() : std::string(fallback);
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool fallback) -> bool
{
    auto const* member = findMember(obj, key, [](const nlohmann::json& v) { return v.is_boolean(); });
    return member ? member->get<bool>() : fallback;
}

} // namespace mcpmux::json
