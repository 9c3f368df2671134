// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief MCP revision spoken by the client and offered by the gateway's own endpoint.
constexpr auto McpProtocolVersion = std::string_view { "2025-03-26" };

/// @brief What an upstream server announced in its initialize reply.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion; ///< The revision the server chose, which may differ from ours.
};

/// @brief Upper bounds for the individual MCP exchanges.
struct McpClientTimeouts
{
    std::chrono::milliseconds handshake { 10000 };
    std::chrono::milliseconds discovery { 30000 };
    std::chrono::milliseconds call { 60000 };
};

/// @brief JSON-RPC session with one upstream MCP server over any Transport.
///
/// One client is shared by concurrent tool calls. Replies are matched to requests by id:
/// whichever caller is waiting takes the reading turn and hands every reply it reads to
/// its owner, so a slow call never holds up a fast one. Transports with per-request
/// replies (HTTP) skip the reading turn altogether. Notifications, unparsable lines and
/// replies nobody waits for are skipped.
///
/// close() wakes every waiting caller, aborts in-flight HTTP exchanges and returns
/// within one receive slice.
class McpClient
{
  public:
    explicit McpClient(std::unique_ptr<Transport> transport, McpClientTimeouts timeouts = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Sends `initialize`, then the `notifications/initialized` notification.
    /// @return The announced capabilities, or ExecutionError/HandshakeError/transport errors.
    [[nodiscard]] auto initialize() -> Result<McpServerCapabilities>;

    /// @brief Collects all tools, following `nextCursor` across pages.
    ///
    /// Entries without a name are skipped with a warning.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;

    /// @return The raw result (including `isError: true` results), or an error. A JSON-RPC
    ///         error reply becomes an ExecutionError.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;

    void close();

    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns false once the client is closed or the transport lost its peer.
    [[nodiscard]] auto isConnected() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpClientTimeouts _timeouts;
    std::atomic<int64_t> _nextId = 1;
    std::atomic<bool> _initialized = false;
    std::atomic<bool> _closed = false;

    std::mutex _sendMutex;

    // Guards the waiting requests and the reading turn.
    std::mutex _mutex;
    std::condition_variable _replyArrived;
    std::map<int64_t, std::optional<Result<nlohmann::json>>> _pending;
    bool _reading = false;

    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<nlohmann::json>;
    [[nodiscard]] auto exchange(int64_t id, std::string_view method, const nlohmann::json& request,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;
    [[nodiscard]] auto awaitReply(int64_t id, std::string_view method, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;
    void dispatchLocked(Result<nlohmann::json> message, std::string_view waitingFor);
};

} // namespace mcpmux
