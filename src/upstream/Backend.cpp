// SPDX-License-Identifier: Apache-2.0
#include "Backend.hpp"

#include <core/JsonUtils.hpp>
#include <core/Secrets.hpp>

#include <cctype>
#include <format>

namespace mcpmux
{

namespace
{
    auto requireString(const nlohmann::json& object, std::string_view key) -> Result<std::string>
    {
        auto value = json::getString(object, key);
        if (!value || value->empty())
            return makeError(ErrorCode::ConfigError, std::format("'{}' is required and must be a string", key));
        return value;
    }

    auto optionalString(const nlohmann::json& object, std::string_view key) -> Result<std::string>
    {
        auto const it = object.find(std::string(key));
        if (it == object.end() || it->is_null())
            return std::string {};
        if (!it->is_string())
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be a string", key));
        return it->get<std::string>();
    }

    auto stringArray(const nlohmann::json& object, std::string_view key) -> Result<std::vector<std::string>>
    {
        auto const it = object.find(std::string(key));
        if (it == object.end() || it->is_null())
            return std::vector<std::string> {};
        if (!it->is_array())
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be an array of strings", key));

        auto values = std::vector<std::string> {};
        for (const auto& item: *it)
        {
            if (!item.is_string())
                return makeError(ErrorCode::ConfigError, std::format("'{}' must be an array of strings", key));
            values.push_back(item.get<std::string>());
        }
        return values;
    }

    auto stringMap(const nlohmann::json& object, std::string_view key)
        -> Result<std::map<std::string, std::string>>
    {
        auto const it = object.find(std::string(key));
        if (it == object.end() || it->is_null())
            return std::map<std::string, std::string> {};
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be an object of strings", key));

        auto values = std::map<std::string, std::string> {};
        for (const auto& [name, value]: it->items())
        {
            if (!value.is_string())
                return makeError(ErrorCode::ConfigError, std::format("'{}.{}' must be a string", key, name));
            values[name] = value.get<std::string>();
        }
        return values;
    }

    auto maskedValue(const std::string& value) -> std::string
    {
        return isSecretReference(value) ? value : maskSecret(value);
    }

    auto maskedMap(const std::map<std::string, std::string>& values) -> nlohmann::json
    {
        auto object = nlohmann::json::object();
        for (const auto& [name, value]: values)
            object[name] = maskedValue(value);
        return object;
    }

    auto parseHttp(const nlohmann::json& object) -> Result<BackendConfig>
    {
        auto url = requireString(object, "url");
        if (!url)
            return std::unexpected(url.error());
        auto token = optionalString(object, "bearerToken");
        if (!token)
            return std::unexpected(token.error());
        return HttpBackendConfig { .url = std::move(*url), .bearerToken = std::move(*token) };
    }

    auto parseStdio(const nlohmann::json& object) -> Result<BackendConfig>
    {
        auto command = requireString(object, "command");
        if (!command)
            return std::unexpected(command.error());
        auto args = stringArray(object, "args");
        if (!args)
            return std::unexpected(args.error());
        auto env = stringMap(object, "env");
        if (!env)
            return std::unexpected(env.error());
        auto workingDirectory = optionalString(object, "workingDirectory");
        if (!workingDirectory)
            return std::unexpected(workingDirectory.error());

        return StdioBackendConfig {
            .command = std::move(*command),
            .args = std::move(*args),
            .env = std::move(*env),
            .workingDirectory = std::move(*workingDirectory),
        };
    }

    auto parseService(const nlohmann::json& object) -> Result<BackendConfig>
    {
        auto command = requireString(object, "command");
        if (!command)
            return std::unexpected(command.error());
        auto args = stringArray(object, "args");
        if (!args)
            return std::unexpected(args.error());
        auto env = stringMap(object, "env");
        if (!env)
            return std::unexpected(env.error());
        auto workingDirectory = optionalString(object, "workingDirectory");
        if (!workingDirectory)
            return std::unexpected(workingDirectory.error());
        auto healthCheckPath = optionalString(object, "healthCheckPath");
        if (!healthCheckPath)
            return std::unexpected(healthCheckPath.error());

        auto const port = object.find("port");
        if (port == object.end() || !port->is_number_integer())
            return makeError(ErrorCode::ConfigError, "'port' is required and must be an integer");
        auto const portValue = port->get<int64_t>();
        if (portValue < 0 || portValue > 65535)
            return makeError(ErrorCode::ConfigError, std::format("Port {} is out of range", portValue));

        auto config = ServiceBackendConfig {
            .command = std::move(*command),
            .args = std::move(*args),
            .port = static_cast<uint16_t>(portValue),
            .healthCheckPath = healthCheckPath->empty() ? std::string("/mcp") : std::move(*healthCheckPath),
            .startupTimeout = std::chrono::seconds(30),
            .env = std::move(*env),
            .workingDirectory = std::move(*workingDirectory),
        };

        if (auto const timeout = object.find("startupTimeout"); timeout != object.end() && !timeout->is_null())
        {
            if (!timeout->is_number_integer() || timeout->get<int64_t>() <= 0)
                return makeError(ErrorCode::ConfigError, "'startupTimeout' must be a positive number of seconds");
            config.startupTimeout = std::chrono::seconds(timeout->get<int64_t>());
        }
        if (!config.healthCheckPath.starts_with('/'))
            config.healthCheckPath.insert(config.healthCheckPath.begin(), '/');

        return config;
    }
} // namespace

auto toString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Http: return "http";
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Service: return "service";
    }
    return "unknown";
}

auto toString(BackendStatus status) -> std::string_view
{
    switch (status)
    {
        case BackendStatus::Connecting: return "connecting";
        case BackendStatus::Ready: return "ready";
        case BackendStatus::Crashed: return "crashed";
        case BackendStatus::Stopped: return "stopped";
    }
    return "unknown";
}

auto transportKindFromString(std::string_view name) -> std::optional<TransportKind>
{
    auto lower = std::string {};
    for (auto const c: name)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "http")
        return TransportKind::Http;
    if (lower == "stdio")
        return TransportKind::Stdio;
    if (lower == "service")
        return TransportKind::Service;
    return std::nullopt;
}

auto canTransition(BackendStatus from, BackendStatus to) -> bool
{
    switch (from)
    {
        case BackendStatus::Connecting: return to != BackendStatus::Connecting;
        case BackendStatus::Ready: return to == BackendStatus::Crashed || to == BackendStatus::Stopped;
        case BackendStatus::Crashed: return to == BackendStatus::Connecting || to == BackendStatus::Stopped;
        case BackendStatus::Stopped: return to == BackendStatus::Connecting;
    }
    return false;
}

auto transportKindOf(const BackendConfig& config) -> TransportKind
{
    return static_cast<TransportKind>(config.index());
}

auto parseBackendConfig(TransportKind kind, const nlohmann::json& object) -> Result<BackendConfig>
{
    if (!object.is_object())
        return makeError(ErrorCode::ConfigError, "Backend configuration must be an object");

    switch (kind)
    {
        case TransportKind::Http: return parseHttp(object);
        case TransportKind::Stdio: return parseStdio(object);
        case TransportKind::Service: return parseService(object);
    }
    return makeError(ErrorCode::ConfigError, "Unknown transport kind");
}

auto parseBackendSpec(std::string_view id, const nlohmann::json& object) -> Result<BackendSpec>
{
    auto const transport = json::getStringOr(object, "transport", "");
    auto const kind = transportKindFromString(transport);
    if (!kind)
        return makeError(ErrorCode::ConfigError,
                         std::format("Backend '{}': unknown transport '{}' (expected http, stdio or service)",
                                     id,
                                     transport));

    auto config = parseBackendConfig(*kind, object);
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("Backend '{}': {}", id, config.error().message));

    return BackendSpec { .id = std::string(id), .config = std::move(*config) };
}

auto backendConfigToJson(const BackendConfig& config) -> nlohmann::json
{
    if (auto const* http = std::get_if<HttpBackendConfig>(&config))
    {
        auto object = nlohmann::json { { "url", http->url } };
        if (!http->bearerToken.empty())
            object["bearerToken"] = maskedValue(http->bearerToken);
        return object;
    }

    if (auto const* stdio = std::get_if<StdioBackendConfig>(&config))
    {
        return nlohmann::json {
            { "command", stdio->command },
            { "args", stdio->args },
            { "env", maskedMap(stdio->env) },
            { "workingDirectory", stdio->workingDirectory },
        };
    }

    auto const& service = std::get<ServiceBackendConfig>(config);
    return nlohmann::json {
        { "command", service.command },
        { "args", service.args },
        { "port", service.port },
        { "healthCheckPath", service.healthCheckPath },
        { "startupTimeout", service.startupTimeout.count() },
        { "env", maskedMap(service.env) },
        { "workingDirectory", service.workingDirectory },
    };
}

auto backendInfoToJson(const BackendInfo& info) -> nlohmann::json
{
    auto object = nlohmann::json {
        { "name", info.id },
        { "transport", toString(info.transportKind) },
        { "status", toString(info.status) },
        { "toolCount", info.toolCount },
    };
    object["lastError"] = info.lastError.empty() ? nlohmann::json() : nlohmann::json(info.lastError);
    if (!info.lastDiscoveryError.empty())
        object["lastDiscoveryError"] = info.lastDiscoveryError;
    return object;
}

} // namespace mcpmux
