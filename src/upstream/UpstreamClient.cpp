// SPDX-License-Identifier: Apache-2.0
#include "UpstreamClient.hpp"

#include <core/Log.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcpmux
{

UpstreamClient::UpstreamClient(Variant transport): _transport(std::move(transport))
{
}

UpstreamClient::~UpstreamClient()
{
    close();
}

auto UpstreamClient::discover() -> Result<std::vector<ToolDefinition>>
{
    return std::visit(Overloaded {
                          [](HttpUpstream& http) { return http.client->listTools(); },
                          [](StdioUpstream& stdio) { return stdio.client->listTools(); },
                          [](ServiceUpstream& service) { return service.client->listTools(); },
                      },
                      _transport);
}

auto UpstreamClient::call(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto result = std::visit(Overloaded {
                                 [&](HttpUpstream& http) { return http.client->callTool(name, arguments); },
                                 [&](StdioUpstream& stdio) { return stdio.client->callTool(name, arguments); },
                                 [&](ServiceUpstream& service) { return service.client->callTool(name, arguments); },
                             },
                             _transport);

    if (!result && result.error().code == ErrorCode::TransportError)
        log::warning("Transport failure calling '{}' on {}: {}", name, describe(), result.error().message);
    return result;
}

void UpstreamClient::close()
{
    std::visit(Overloaded {
                   [](HttpUpstream& http) {
                       if (http.client)
                           http.client->close();
                   },
                   [](StdioUpstream& stdio) {
                       if (stdio.client)
                           stdio.client->close();
                   },
                   [](ServiceUpstream& service) {
                       if (service.client)
                           service.client->close();
                   },
               },
               _transport);
}

auto UpstreamClient::isConnected() const -> bool
{
    return std::visit(Overloaded {
                          [](const HttpUpstream& http) { return http.client && http.client->isConnected(); },
                          [](const StdioUpstream& stdio) { return stdio.client && stdio.client->isConnected(); },
                          [](const ServiceUpstream& service) { return service.client && service.client->isConnected(); },
                      },
                      _transport);
}

auto UpstreamClient::kind() const -> TransportKind
{
    return std::visit(Overloaded {
                          [](const HttpUpstream&) { return TransportKind::Http; },
                          [](const StdioUpstream&) { return TransportKind::Stdio; },
                          [](const ServiceUpstream&) { return TransportKind::Service; },
                      },
                      _transport);
}

auto UpstreamClient::describe() const -> std::string
{
    return std::visit(Overloaded {
                          [](const HttpUpstream& http) { return std::format("http {}", http.url); },
                          [](const StdioUpstream& stdio) { return std::format("stdio '{}'", stdio.command); },
                          [](const ServiceUpstream& service) {
                              return std::format("service on port {} (process {})", service.port, service.process);
                          },
                      },
                      _transport);
}

auto serviceEndpoint(uint16_t port) -> std::string
{
    return std::format("http://127.0.0.1:{}/mcp", port);
}

auto defaultConnector() -> Connector
{
    return [](const BackendSpec& spec) -> Result<std::unique_ptr<Transport>> {
        return std::visit(
            Overloaded {
                [](const HttpBackendConfig& http) -> Result<std::unique_ptr<Transport>> {
                    return std::make_unique<HttpTransport>(
                        HttpTransportConfig { .url = http.url, .bearerToken = http.bearerToken });
                },
                [](const StdioBackendConfig& stdio) -> Result<std::unique_ptr<Transport>> {
                    auto transport = std::make_unique<StdioTransport>();
                    auto started = transport->start(StdioTransportConfig {
                        .command = stdio.command,
                        .args = stdio.args,
                        .env = stdio.env,
                        .workingDirectory = stdio.workingDirectory,
                    });
                    if (!started)
                        return std::unexpected(started.error());
                    return transport;
                },
                [](const ServiceBackendConfig& service) -> Result<std::unique_ptr<Transport>> {
                    return std::make_unique<HttpTransport>(
                        HttpTransportConfig { .url = serviceEndpoint(service.port), .bearerToken = {} });
                },
            },
            spec.config);
    };
}

} // namespace mcpmux
