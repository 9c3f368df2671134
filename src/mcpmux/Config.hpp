// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <upstream/Aggregator.hpp>
#include <upstream/Backend.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Listener and authentication settings.
struct ServerConfig
{
    std::string host = "127.0.0.1";
    uint16_t port = 3050;
    std::string apiToken; ///< Empty leaves the MCP endpoint open.
    std::string uiPassword = "admin";
    std::chrono::seconds sessionTtl { 3600 };
    std::size_t workerThreads = 16;
};

struct LoggingConfig
{
    std::string level = "info";
    std::string file;
};

struct TimeoutConfig
{
    std::chrono::milliseconds handshake { 10000 };
    std::chrono::milliseconds discovery { 30000 };
    std::chrono::milliseconds call { 60000 };
    std::chrono::milliseconds healthInterval { 1000 };
    std::chrono::milliseconds healthProbe { 2000 };
    std::chrono::milliseconds stopGrace { 5000 };
    std::chrono::milliseconds shutdownGrace { 10000 };
};

struct DiscoveryConfig
{
    std::size_t maxParallel = 4;
};

struct TrackingConfig
{
    std::size_t maxEntries = 1000;
    std::chrono::hours retention { 24 };
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ServerConfig server;
    LoggingConfig logging;
    TimeoutConfig timeouts;
    DiscoveryConfig discovery;
    TrackingConfig tracking;
    std::vector<BackendSpec> upstreams;
};

/// @brief Loads the configuration from the default path, or defaults if there is no file.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @return The configuration, or a ConfigError for an unreadable file or a malformed section.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds the configuration from a parsed JSON document.
///
/// Malformed upstream entries are logged and skipped so that one bad backend does not
/// keep the gateway from starting.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Applies MCP_API_TOKEN, UI_PASSWORD, HOST, PORT and LOG_LEVEL from the environment.
[[nodiscard]] auto applyEnvironmentOverrides(AppConfig& config) -> VoidResult;

/// @brief Resolves `$NAME` references in the server secrets.
[[nodiscard]] auto resolveServerSecrets(AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/mcpmux or ~/.config/mcpmux).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Derives the aggregator settings from the application configuration.
[[nodiscard]] auto aggregatorOptions(const AppConfig& config) -> AggregatorOptions;

} // namespace mcpmux
