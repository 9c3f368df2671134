// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <format>
#include <string>
#include <vector>

namespace mcpmux
{

/// @brief Message pipe to one upstream MCP server.
///
/// Implementations carry whole JSON-RPC messages and know nothing about ids or
/// methods; McpClient does the request/response matching. send() and receive() may be
/// called from different threads, but there is never more than one receive() at a time.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @return Success, or a TransportError/ConnectionError once the peer is gone.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Waits up to @p timeout for the next message from the server.
    /// @return The message, a TimeoutError, a ProtocolError for a message that is not JSON,
    ///         or a TransportError/ConnectionError.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Releases the connection. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns true if every request is answered on a channel of its own, as with
    ///        one HTTP POST per request. McpClient then uses exchange() instead of
    ///        send() and receive(), so concurrent requests do not wait for each other.
    [[nodiscard]] virtual auto hasPerRequestReplies() const -> bool { return false; }

    /// @brief Sends @p request and returns the messages that came back with it.
    ///
    /// Only used when hasPerRequestReplies() is true. Safe to call concurrently, and
    /// close() aborts calls that are still in flight.
    [[nodiscard]] virtual auto exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
        -> Result<std::vector<nlohmann::json>>
    {
        static_cast<void>(request);
        static_cast<void>(timeout);
        return makeError(ErrorCode::TransportError, std::format("{} has no per-request replies", endpoint()));
    }

    /// @brief Human-readable peer, e.g. a URL or a command line. Used in log messages.
    [[nodiscard]] virtual auto endpoint() const -> std::string { return "upstream"; }
};

} // namespace mcpmux
