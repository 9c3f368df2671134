// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <upstream/Backend.hpp>
#include <upstream/ProcessSupervisor.hpp>

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace mcpmux
{

/// @brief Helper for exhaustive std::visit over a set of lambdas.
template <typename... Ts>
struct Overloaded: Ts...
{
    using Ts::operator()...;
};

/// @brief Remote MCP endpoint.
struct HttpUpstream
{
    std::shared_ptr<McpClient> client;
    std::string url;
};

/// @brief Child process owned by its StdioTransport; it dies with the client.
struct StdioUpstream
{
    std::shared_ptr<McpClient> client;
    std::string command;
};

/// @brief Local HTTP server whose process is owned by the ProcessSupervisor.
struct ServiceUpstream
{
    std::shared_ptr<McpClient> client;
    ProcessHandle process = 0;
    uint16_t port = 0;
};

/// @brief Live client of one backend, whatever its transport.
///
/// All kinds expose the same capability surface. Each operation is an exhaustive
/// visit over the alternatives, so adding a transport kind fails to compile until
/// every operation handles it.
class UpstreamClient
{
  public:
    using Variant = std::variant<HttpUpstream, StdioUpstream, ServiceUpstream>;

    explicit UpstreamClient(Variant transport);
    ~UpstreamClient();

    UpstreamClient(const UpstreamClient&) = delete;
    UpstreamClient& operator=(const UpstreamClient&) = delete;

    /// @brief Lists the backend's tools.
    [[nodiscard]] auto discover() -> Result<std::vector<ToolDefinition>>;

    /// @brief Invokes a tool by its original (unqualified) name.
    [[nodiscard]] auto call(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;

    /// @brief Closes the connection. Stdio children are terminated; Service processes are left to the supervisor.
    void close();

    /// @brief Returns false once the connection is closed or its peer went away.
    [[nodiscard]] auto isConnected() const -> bool;

    [[nodiscard]] auto kind() const -> TransportKind;
    [[nodiscard]] auto describe() const -> std::string;

  private:
    Variant _transport;
};

/// @brief Creates the transport for a validated backend spec whose secrets are already resolved.
using Connector = std::function<Result<std::unique_ptr<Transport>>(const BackendSpec& spec)>;

/// @brief Connector using StdioTransport for Stdio backends and HttpTransport otherwise.
[[nodiscard]] auto defaultConnector() -> Connector;

/// @brief The MCP endpoint of a Service backend listening on @p port.
[[nodiscard]] auto serviceEndpoint(uint16_t port) -> std::string;

} // namespace mcpmux
