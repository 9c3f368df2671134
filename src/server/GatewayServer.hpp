// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/AuthGate.hpp>
#include <core/Error.hpp>
#include <net/HttpServer.hpp>
#include <upstream/Aggregator.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace mcpmux
{

struct GatewayInfo
{
    std::string name = "mcpmux";
    std::string version = "0.1.0";
};

/// @brief HTTP front of the gateway.
///
/// Serves the aggregated MCP endpoint (`POST /mcp`), the admin JSON API under `/api/`
/// and an unauthenticated `/health`. Every request passes the AuthGate before it can
/// reach the aggregator.
class GatewayServer
{
  public:
    GatewayServer(Aggregator& aggregator, auth::AuthGate& auth, GatewayInfo info = {});
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    [[nodiscard]] auto start(const net::HttpServerConfig& config) -> VoidResult;
    void stopAccepting();
    void stop(std::chrono::milliseconds grace);

    [[nodiscard]] auto port() const -> uint16_t { return _http.port(); }

    /// @brief Dispatches one request. Called by the HTTP server on a worker thread.
    [[nodiscard]] auto handle(const net::HttpRequest& request) -> net::HttpResponse;

  private:
    Aggregator& _aggregator;
    auth::AuthGate& _auth;
    GatewayInfo _info;
    net::HttpServer _http;

    [[nodiscard]] auto handleMcp(const net::HttpRequest& request) -> net::HttpResponse;
    [[nodiscard]] auto handleRpc(const nlohmann::json& message, const std::string& clientAddress)
        -> std::optional<nlohmann::json>;
    [[nodiscard]] auto handleToolCall(const nlohmann::json& id,
                                      const nlohmann::json& params,
                                      const std::string& clientAddress) -> nlohmann::json;
    [[nodiscard]] auto handleApi(const net::HttpRequest& request) -> net::HttpResponse;
    [[nodiscard]] auto handleLogin(const net::HttpRequest& request) -> net::HttpResponse;
    [[nodiscard]] auto handleAddBackend(const net::HttpRequest& request) -> net::HttpResponse;
    [[nodiscard]] auto handleListRequests(const net::HttpRequest& request) -> net::HttpResponse;
};

} // namespace mcpmux
