// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Configuration for an MCP server reachable over HTTP.
struct HttpTransportConfig
{
    std::string url;         ///< MCP endpoint, e.g. `https://host/mcp`.
    std::string bearerToken; ///< Sent as `Authorization: Bearer ...` when not empty.
};

/// @brief Transport that speaks JSON-RPC over HTTP POST (streamable HTTP flavour of MCP).
///
/// Every request is answered by its own POST, so exchange() may run concurrently.
/// Responses may be plain JSON or SSE-framed (`data:` lines). The `Mcp-Session-Id`
/// header is captured from the first response and echoed on every following request.
/// close() aborts in-flight exchanges and ends the session with a DELETE.
///
/// The send()/receive() pair is kept for single callers: requests are posted lazily from
/// receive() so that every exchange is bounded by the receive timeout.
class HttpTransport: public Transport
{
  public:
    explicit HttpTransport(HttpTransportConfig config);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    [[nodiscard]] auto hasPerRequestReplies() const -> bool override { return true; }
    [[nodiscard]] auto exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
        -> Result<std::vector<nlohmann::json>> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto endpoint() const -> std::string override;

    /// @brief Returns the session id assigned by the server, if any.
    [[nodiscard]] auto sessionId() const -> std::string;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Extracts the JSON payloads of a `text/event-stream` body.
///
/// Multi-line `data:` fields of one event are joined with '\n'. Events whose data is
/// not valid JSON are skipped.
[[nodiscard]] auto parseEventStream(std::string_view body) -> std::vector<nlohmann::json>;

} // namespace mcpmux
