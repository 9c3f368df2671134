// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpmux
{

/// @brief Error codes for categorizing failures across the gateway.
///
/// Backend-scoped codes (SpawnError through ExecutionError) are contained to the
/// backend they originate from. Only ConfigError and AuthError are surfaced
/// synchronously to the caller of an administrative or tool-invocation operation.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    SpawnError,
    HealthCheckTimeout,
    HandshakeError,
    ConnectionError,
    DiscoveryError,
    ToolNotFound,
    BackendUnavailable,
    ExecutionError,
    AuthError,
    NotFound,
    TransportError,
    ProtocolError,
    TimeoutError,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::SpawnError: return "SpawnError";
        case ErrorCode::HealthCheckTimeout: return "HealthCheckTimeout";
        case ErrorCode::HandshakeError: return "HandshakeError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::DiscoveryError: return "DiscoveryError";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::BackendUnavailable: return "BackendUnavailable";
        case ErrorCode::ExecutionError: return "ExecutionError";
        case ErrorCode::AuthError: return "AuthError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
    }
    return "Unknown";
}

} // namespace mcpmux

template <>
struct std::formatter<mcpmux::Error>: std::formatter<std::string>
{
    auto format(const mcpmux::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpmux::errorCodeName(error.code), error.message), ctx);
    }
};
