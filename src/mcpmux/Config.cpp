// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Secrets.hpp>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace mcpmux
{

namespace
{
    /// Reads an optional non-negative integer. Anything else present under @p key is a ConfigError.
    auto readCount(const nlohmann::json& section, std::string_view sectionName, std::string_view key, int64_t fallback)
        -> Result<int64_t>
    {
        auto const it = section.find(std::string(key));
        if (it == section.end())
            return fallback;
        if (!it->is_number_integer() || it->get<int64_t>() < 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("{}.{} must be a non-negative integer", sectionName, key));
        return it->get<int64_t>();
    }

    auto readString(const nlohmann::json& section,
                    std::string_view sectionName,
                    std::string_view key,
                    std::string_view fallback) -> Result<std::string>
    {
        auto const it = section.find(std::string(key));
        if (it == section.end() || it->is_null())
            return std::string(fallback);
        if (!it->is_string())
            return makeError(ErrorCode::ConfigError, std::format("{}.{} must be a string", sectionName, key));
        return it->get<std::string>();
    }

    auto parsePort(std::string_view text) -> std::optional<uint16_t>
    {
        auto value = 0u;
        auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || end != text.data() + text.size() || value == 0 || value > 65535)
            return std::nullopt;
        return static_cast<uint16_t>(value);
    }

    auto section(const nlohmann::json& root, std::string_view name) -> Result<nlohmann::json>
    {
        auto const it = root.find(std::string(name));
        if (it == root.end() || it->is_null())
            return nlohmann::json::object();
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be an object", name));
        return *it;
    }

    auto parseServer(const nlohmann::json& root, ServerConfig& server) -> VoidResult
    {
        auto const object = section(root, "server");
        if (!object)
            return std::unexpected(object.error());

        auto host = readString(*object, "server", "host", server.host);
        auto apiToken = readString(*object, "server", "apiToken", server.apiToken);
        auto uiPassword = readString(*object, "server", "uiPassword", server.uiPassword);
        auto port = readCount(*object, "server", "port", server.port);
        auto ttl = readCount(*object, "server", "sessionTtlSeconds", server.sessionTtl.count());
        auto workers = readCount(*object, "server", "workerThreads", static_cast<int64_t>(server.workerThreads));

        if (!host)
            return std::unexpected(host.error());
        if (!apiToken)
            return std::unexpected(apiToken.error());
        if (!uiPassword)
            return std::unexpected(uiPassword.error());
        if (!port)
            return std::unexpected(port.error());
        if (!ttl)
            return std::unexpected(ttl.error());
        if (!workers)
            return std::unexpected(workers.error());
        if (*port == 0 || *port > 65535)
            return makeError(ErrorCode::ConfigError, "server.port must be between 1 and 65535");

        server.host = std::move(*host);
        server.apiToken = std::move(*apiToken);
        server.uiPassword = std::move(*uiPassword);
        server.port = static_cast<uint16_t>(*port);
        server.sessionTtl = std::chrono::seconds(*ttl);
        server.workerThreads = static_cast<std::size_t>(std::max<int64_t>(*workers, 1));
        return {};
    }

    auto parseTimeouts(const nlohmann::json& root, TimeoutConfig& timeouts) -> VoidResult
    {
        auto const object = section(root, "timeouts");
        if (!object)
            return std::unexpected(object.error());

        auto const fields = {
            std::pair { "handshakeMs", &timeouts.handshake },
            std::pair { "discoveryMs", &timeouts.discovery },
            std::pair { "callMs", &timeouts.call },
            std::pair { "healthIntervalMs", &timeouts.healthInterval },
            std::pair { "healthProbeMs", &timeouts.healthProbe },
            std::pair { "stopGraceMs", &timeouts.stopGrace },
            std::pair { "shutdownGraceMs", &timeouts.shutdownGrace },
        };
        for (auto const& [key, target]: fields)
        {
            auto value = readCount(*object, "timeouts", key, target->count());
            if (!value)
                return std::unexpected(value.error());
            *target = std::chrono::milliseconds(*value);
        }
        return {};
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcpmux";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpmux";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = AppConfig {};

    // Server section
    if (auto parsed = parseServer(root, config.server); !parsed)
        return std::unexpected(parsed.error());

    // Logging section
    auto logging = section(root, "logging");
    if (!logging)
        return std::unexpected(logging.error());
    config.logging.level = json::getStringOr(*logging, "level", config.logging.level);
    config.logging.file = json::getStringOr(*logging, "file", "");
    if (!log::levelFromString(config.logging.level))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.logging.level));

    // Timeouts section
    if (auto parsed = parseTimeouts(root, config.timeouts); !parsed)
        return std::unexpected(parsed.error());

    // Discovery section
    auto discovery = section(root, "discovery");
    if (!discovery)
        return std::unexpected(discovery.error());
    auto maxParallel = readCount(*discovery, "discovery", "maxParallel", 4);
    if (!maxParallel)
        return std::unexpected(maxParallel.error());
    config.discovery.maxParallel = static_cast<std::size_t>(std::max<int64_t>(*maxParallel, 1));

    // Tracking section
    auto tracking = section(root, "tracking");
    if (!tracking)
        return std::unexpected(tracking.error());
    auto maxEntries = readCount(*tracking, "tracking", "maxEntries", 1000);
    if (!maxEntries)
        return std::unexpected(maxEntries.error());
    auto retention = readCount(*tracking, "tracking", "retentionHours", 24);
    if (!retention)
        return std::unexpected(retention.error());
    config.tracking.maxEntries = static_cast<std::size_t>(std::max<int64_t>(*maxEntries, 1));
    config.tracking.retention = std::chrono::hours(*retention);

    // Upstreams section
    auto upstreams = section(root, "upstreams");
    if (!upstreams)
        return std::unexpected(upstreams.error());
    for (const auto& [name, upstreamJson]: upstreams->items())
    {
        auto spec = parseBackendSpec(name, upstreamJson);
        if (!spec)
        {
            log::error("Ignoring upstream '{}': {}", name, spec.error().message);
            continue;
        }
        config.upstreams.push_back(std::move(*spec));
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult);
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto applyEnvironmentOverrides(AppConfig& config) -> VoidResult
{
    auto env = [](const char* name) -> std::optional<std::string> {
        auto const* const value = std::getenv(name);
        if (!value)
            return std::nullopt;
        return std::string(value);
    };

    if (auto token = env("MCP_API_TOKEN"))
        config.server.apiToken = std::move(*token);
    if (auto password = env("UI_PASSWORD"))
        config.server.uiPassword = std::move(*password);
    if (auto host = env("HOST"); host && !host->empty())
        config.server.host = std::move(*host);
    if (auto portText = env("PORT"); portText && !portText->empty())
    {
        auto const port = parsePort(*portText);
        if (!port)
            return makeError(ErrorCode::ConfigError, std::format("PORT must be between 1 and 65535, got '{}'", *portText));
        config.server.port = *port;
    }
    if (auto level = env("LOG_LEVEL"); level && !level->empty())
    {
        if (!log::levelFromString(*level))
            return makeError(ErrorCode::ConfigError, std::format("Unknown LOG_LEVEL '{}'", *level));
        config.logging.level = std::move(*level);
    }
    return {};
}

auto resolveServerSecrets(AppConfig& config) -> VoidResult
{
    for (auto const& [field, value]: { std::pair { "server.apiToken", &config.server.apiToken },
                                       std::pair { "server.uiPassword", &config.server.uiPassword } })
    {
        if (!isSecretReference(*value))
            continue;
        auto resolved = resolveSecret(*value, field);
        if (!resolved)
            return std::unexpected(resolved.error());
        *value = std::move(*resolved);
    }
    return {};
}

auto aggregatorOptions(const AppConfig& config) -> AggregatorOptions
{
    return AggregatorOptions {
        .supervisor = SupervisorOptions {
            .healthInterval = config.timeouts.healthInterval,
            .probeTimeout = config.timeouts.healthProbe,
            .stopGrace = config.timeouts.stopGrace,
        },
        .timeouts = McpClientTimeouts {
            .handshake = config.timeouts.handshake,
            .discovery = config.timeouts.discovery,
            .call = config.timeouts.call,
        },
        .tracking = RequestTrackerOptions {
            .maxEntries = config.tracking.maxEntries,
            .retention = config.tracking.retention,
        },
        .maxParallel = config.discovery.maxParallel,
        .connector = {},
    };
}

} // namespace mcpmux
