// SPDX-License-Identifier: Apache-2.0
#include "Secrets.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>

namespace mcpmux
{

namespace
{
    auto isValidVariableName(std::string_view name) -> bool
    {
        if (name.empty())
            return false;
        if (std::isdigit(static_cast<unsigned char>(name.front())))
            return false;
        return std::ranges::all_of(name, [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        });
    }
} // namespace

auto isSecretReference(std::string_view value) -> bool
{
    return value.starts_with('$');
}

auto resolveSecret(std::string_view value, std::string_view field) -> Result<std::string>
{
    if (!isSecretReference(value))
        return std::string(value);

    auto const name = std::string(value.substr(1));
    if (!isValidVariableName(name))
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid environment variable reference '{}' in {}", value, field));

    auto const* const resolved = std::getenv(name.c_str());
    if (resolved == nullptr)
        return makeError(ErrorCode::ConfigError,
                         std::format("Environment variable '{}' referenced by {} is not set", name, field));

    if (*resolved == '\0')
        return makeError(ErrorCode::ConfigError,
                         std::format("Environment variable '{}' referenced by {} is empty", name, field));

    return std::string(resolved);
}

auto resolveSecrets(const std::map<std::string, std::string>& values, std::string_view field)
    -> Result<std::map<std::string, std::string>>
{
    auto resolved = std::map<std::string, std::string> {};
    for (const auto& [key, value]: values)
    {
        auto result = resolveSecret(value, std::format("{}.{}", field, key));
        if (!result)
            return std::unexpected(result.error());
        resolved[key] = std::move(*result);
    }
    return resolved;
}

auto maskSecret(std::string_view secret) -> std::string
{
    if (secret.size() <= 4)
        return "****";
    return std::format("{}****", secret.substr(0, 4));
}

} // namespace mcpmux
