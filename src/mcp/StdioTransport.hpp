// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcpmux
{

/// @brief How to launch a local MCP server.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Added to (or overriding) the inherited environment.
    std::string workingDirectory;           ///< Empty keeps the gateway's working directory.
};

/// @brief Runs an MCP server as a child process and talks newline-delimited JSON
///        over its stdin and stdout.
///
/// The child owns no terminal; its stderr is inherited so that its diagnostics land in
/// the gateway's log stream. Closing the transport terminates the child (SIGTERM, then
/// SIGKILL after a short grace period) and reaps it. When stdout reaches EOF the
/// transport reports TransportError and stays disconnected. isConnected() also reaps a
/// child that exited on its own, so a dead server is noticed without a request.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @return Success, or a SpawnError if the command cannot be executed.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto endpoint() const -> std::string override;

    /// @brief The child's pid while it runs, -1 before start(), after close() and once reaped.
    [[nodiscard]] auto pid() const -> pid_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpmux
