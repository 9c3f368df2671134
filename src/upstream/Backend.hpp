// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpmux
{

/// @brief How the gateway talks to a backend.
enum class TransportKind : std::uint8_t
{
    Http,    ///< Remote MCP endpoint reached over HTTP(S).
    Stdio,   ///< Child process speaking newline-delimited JSON-RPC on stdin/stdout.
    Service, ///< Child process serving MCP over HTTP on a local port.
};

/// @brief Lifecycle status of a backend.
enum class BackendStatus : std::uint8_t
{
    Connecting,
    Ready,
    Crashed,
    Stopped,
};

[[nodiscard]] auto toString(TransportKind kind) -> std::string_view;
[[nodiscard]] auto toString(BackendStatus status) -> std::string_view;

/// @brief Parses "http", "stdio" or "service" (case-insensitive).
[[nodiscard]] auto transportKindFromString(std::string_view name) -> std::optional<TransportKind>;

/// @brief Returns true if @p from may move to @p to.
///
/// Within one lifecycle pass a backend only moves forward
/// (Connecting -> Ready -> Crashed|Stopped, or Connecting -> Crashed|Stopped).
/// Crashed and Stopped may re-enter Connecting, which only reconnect does.
[[nodiscard]] auto canTransition(BackendStatus from, BackendStatus to) -> bool;

struct HttpBackendConfig
{
    std::string url;
    std::string bearerToken; ///< Literal or `$NAME`; empty means no Authorization header.
};

struct StdioBackendConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string workingDirectory;
};

struct ServiceBackendConfig
{
    std::string command;
    std::vector<std::string> args;
    uint16_t port = 0;
    std::string healthCheckPath = "/mcp";
    std::chrono::seconds startupTimeout { 30 };
    std::map<std::string, std::string> env;
    std::string workingDirectory;
};

/// @brief Transport-specific backend configuration.
using BackendConfig = std::variant<HttpBackendConfig, StdioBackendConfig, ServiceBackendConfig>;

[[nodiscard]] auto transportKindOf(const BackendConfig& config) -> TransportKind;

/// @brief A backend as requested by configuration or the admin API.
struct BackendSpec
{
    std::string id;
    BackendConfig config;
};

/// @brief Point-in-time view of a registered backend.
struct BackendInfo
{
    std::string id;
    TransportKind transportKind = TransportKind::Http;
    BackendStatus status = BackendStatus::Connecting;
    std::string lastError;
    std::size_t toolCount = 0;
    std::string lastDiscoveryError;
};

/// @brief Parses a transport-specific config object (camelCase keys as in the config file).
/// @return The config, or a ConfigError naming the offending field.
[[nodiscard]] auto parseBackendConfig(TransportKind kind, const nlohmann::json& object) -> Result<BackendConfig>;

/// @brief Parses `{"transport": "...", ...}` as found under `upstreams` in the config file.
[[nodiscard]] auto parseBackendSpec(std::string_view id, const nlohmann::json& object) -> Result<BackendSpec>;

/// @brief Serializes a backend config. Bearer tokens and env values are masked unless they are `$NAME` references.
[[nodiscard]] auto backendConfigToJson(const BackendConfig& config) -> nlohmann::json;

[[nodiscard]] auto backendInfoToJson(const BackendInfo& info) -> nlohmann::json;

} // namespace mcpmux
