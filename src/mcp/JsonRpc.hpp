// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcpmux::jsonrpc
{

/// @brief Standard and gateway-specific JSON-RPC error codes.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int BackendUnavailable = -32001;
    constexpr int UpstreamFailure = -32002;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Represents a parsed JSON-RPC 2.0 request or notification.
struct Request
{
    nlohmann::json id; ///< null for notifications.
    std::string method;
    nlohmann::json params;

    [[nodiscard]] auto isNotification() const -> bool { return id.is_null(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id,
                                     int code,
                                     std::string_view message,
                                     nlohmann::json data = nullptr) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Parses an incoming JSON-RPC 2.0 request or notification.
/// @return The request, or a ProtocolError if the message is not a well-formed request.
[[nodiscard]] auto parseRequest(const nlohmann::json& message) -> Result<Request>;

/// @brief Returns true if the message carries a method and no id.
[[nodiscard]] auto isNotification(const nlohmann::json& message) -> bool;

} // namespace mcpmux::jsonrpc
