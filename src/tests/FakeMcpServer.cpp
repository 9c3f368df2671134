// SPDX-License-Identifier: Apache-2.0
// Scripted MCP server used by the integration tests, over stdio or HTTP.
#include "FakeMcp.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/HttpServer.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace mcpmux;

namespace
{
    auto stopRequested = std::atomic<bool> { false };

    void onSignal(int /*signal*/)
    {
        stopRequested = true;
    }

    /// A `crash` call terminates the process without replying.
    void crashIfRequested(const nlohmann::json& message)
    {
        if (message.value("method", "") == "tools/call" && message.contains("params")
            && message["params"].value("name", "") == "crash")
        {
            std::_Exit(3);
        }
    }

    auto runStdio(const test::FakeToolSet& tools) -> int
    {
        auto line = std::string {};
        while (std::getline(std::cin, line))
        {
            if (line.empty())
                continue;

            auto message = json::parse(line);
            if (!message)
            {
                std::cout << jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, "Parse error").dump()
                          << std::endl;
                continue;
            }

            crashIfRequested(*message);
            if (auto reply = test::handleFakeMessage(*message, tools))
                std::cout << reply->dump() << std::endl;
        }
        return 0;
    }

    auto runHttp(const test::FakeToolSet& tools, uint16_t port, bool sse, const std::string& token) -> int
    {
        auto server = net::HttpServer {};
        auto handler = [&](const net::HttpRequest& request) -> net::HttpResponse {
            if (request.path != "/mcp")
                return net::HttpResponse::json(404, R"({"error":"not found"})");
            if (!token.empty() && request.header("authorization") != "Bearer " + token)
                return net::HttpResponse::json(401, R"({"error":"unauthorized"})");
            if (request.method == "DELETE")
                return net::HttpResponse { .status = 200, .headers = {}, .body = {} };
            if (request.method != "POST")
                return net::HttpResponse::json(405, R"({"error":"method not allowed"})");

            auto message = json::parse(request.body);
            if (!message)
                return net::HttpResponse::json(400, R"({"error":"parse error"})");

            crashIfRequested(*message);
            auto reply = test::handleFakeMessage(*message, tools);
            if (!reply)
                return net::HttpResponse { .status = 202, .headers = {}, .body = {} };

            auto response = net::HttpResponse::json(200, reply->dump());
            if (sse)
            {
                response.headers["content-type"] = "text/event-stream";
                response.body = "event: message\ndata: " + reply->dump() + "\n\n";
            }
            response.headers["mcp-session-id"] = "fake-session";
            return response;
        };

        auto started = server.start(net::HttpServerConfig { .host = "127.0.0.1",
                                                             .port = port,
                                                             .idleTimeout = std::chrono::milliseconds(30000),
                                                             .maxBodyBytes = 1024 * 1024,
                                                             .workerThreads = 4 },
                                    handler);
        if (!started)
        {
            log::error("Fake server cannot listen: {}", started.error().message);
            return 1;
        }

        while (!stopRequested)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));

        server.stop(std::chrono::milliseconds(500));
        return 0;
    }
} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "Scripted MCP server for tests" };

    auto port = uint16_t { 0 };
    auto sse = false;
    auto failDiscovery = false;
    auto token = std::string {};
    auto exitAfter = 0;
    auto tools = test::FakeToolSet {};
    tools.tools = { "echo", "add", "fail", "sleep", "crash" };

    app.add_option("--http", port, "Serve MCP over HTTP on this port instead of stdio");
    app.add_flag("--sse", sse, "Frame HTTP replies as server-sent events");
    app.add_flag("--fail-discovery", failDiscovery, "Answer tools/list with an error");
    app.add_option("--token", token, "Require this bearer token");
    app.add_option("--tools", tools.tools, "Tools to advertise");
    app.add_option("--name", tools.serverName, "Server name reported by initialize");
    app.add_option("--exit-after", exitAfter, "Exit with code 4 after this many milliseconds");

    CLI11_PARSE(app, argc, argv);

    tools.failDiscovery = failDiscovery;
    log::setLevel(log::Level::Warning);

    std::signal(SIGTERM, onSignal);
    std::signal(SIGINT, onSignal);

    if (exitAfter > 0)
    {
        std::thread([exitAfter] {
            std::this_thread::sleep_for(std::chrono::milliseconds(exitAfter));
            std::_Exit(4);
        }).detach();
    }

    if (port != 0)
        return runHttp(tools, port, sse, token);
    return runStdio(tools);
}
