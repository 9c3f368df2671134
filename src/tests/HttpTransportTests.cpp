// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/McpClient.hpp>
#include <net/HttpServer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <format>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcpmux;
using namespace std::chrono_literals;

namespace
{
    /// In-process MCP endpoint answering with the scripted tool set.
    struct FakeHttpEndpoint
    {
        test::FakeToolSet tools;
        bool sse = false;
        std::string requiredToken;

        std::mutex mutex;
        std::vector<std::string> sessionHeaders;
        std::atomic<int> deletes = 0;

        net::HttpServer server;

        auto start() -> uint16_t
        {
            auto started = server.start(net::HttpServerConfig { .host = "127.0.0.1", .port = 0 },
                                        [this](const net::HttpRequest& request) { return handle(request); });
            return started ? server.port() : 0;
        }

        auto url() const -> std::string { return std::format("http://127.0.0.1:{}/mcp", server.port()); }

        auto handle(const net::HttpRequest& request) -> net::HttpResponse
        {
            if (!requiredToken.empty() && request.header("authorization") != "Bearer " + requiredToken)
                return net::HttpResponse::json(401, R"({"error":"unauthorized"})");

            {
                auto lock = std::lock_guard(mutex);
                sessionHeaders.push_back(request.header("mcp-session-id"));
            }

            if (request.method == "DELETE")
            {
                ++deletes;
                return net::HttpResponse { .status = 200, .headers = {}, .body = {} };
            }

            auto message = json::parse(request.body);
            if (!message)
                return net::HttpResponse::json(400, "{}");

            auto reply = test::handleFakeMessage(*message, tools);
            if (!reply)
                return net::HttpResponse { .status = 202, .headers = {}, .body = {} };

            auto response = net::HttpResponse::json(200, reply->dump());
            if (sse)
            {
                response.headers["content-type"] = "text/event-stream";
                response.body = ": keep-alive\n\nevent: message\nid: 1\ndata: " + reply->dump() + "\n\n";
            }
            response.headers["mcp-session-id"] = "session-42";
            return response;
        }
    };

    auto clientFor(const std::string& url, std::string token = {}) -> McpClient
    {
        return McpClient(std::make_unique<HttpTransport>(HttpTransportConfig { .url = url, .bearerToken = token }),
                         McpClientTimeouts { .handshake = 5000ms, .discovery = 5000ms, .call = 5000ms });
    }
} // namespace

TEST_CASE("parseEventStream extracts JSON data events", "[http-transport]")
{
    auto const body = std::string_view("event: message\r\n"
                                       "data: {\"id\":1}\r\n"
                                       "\r\n"
                                       ": comment\n"
                                       "data: {\"id\":\n"
                                       "data: 2}\n"
                                       "\n"
                                       "data: not json\n"
                                       "\n"
                                       "data:{\"id\":3}");

    auto const messages = parseEventStream(body);
    REQUIRE(messages.size() == 3);
    CHECK(messages[0]["id"] == 1);
    CHECK(messages[1]["id"] == 2);
    CHECK(messages[2]["id"] == 3);
}

TEST_CASE("parseEventStream returns nothing for an empty body", "[http-transport]")
{
    CHECK(parseEventStream("").empty());
    CHECK(parseEventStream("\n\n: ping\n\n").empty());
}

TEST_CASE("HttpTransport receive without a pending request times out immediately", "[http-transport]")
{
    auto transport = HttpTransport(HttpTransportConfig { .url = "http://127.0.0.1:9/mcp", .bearerToken = {} });
    CHECK(transport.endpoint() == "http://127.0.0.1:9/mcp");
    auto result = transport.receive(1000ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);

    transport.close();
    CHECK(!transport.isConnected());
    CHECK(!transport.send(jsonrpc::makeRequest(1, "ping")).has_value());
}

TEST_CASE("HttpTransport speaks MCP over plain JSON responses", "[http-transport][integration]")
{
    auto endpoint = FakeHttpEndpoint {};
    REQUIRE(endpoint.start() != 0);

    {
        auto client = clientFor(endpoint.url());
        auto capabilities = client.initialize();
        REQUIRE(capabilities.has_value());
        CHECK(capabilities->serverName == "fake-mcp");

        auto tools = client.listTools();
        REQUIRE(tools.has_value());
        CHECK(tools->size() == 3);

        auto result = client.callTool("add", { { "a", 2 }, { "b", 3 } });
        REQUIRE(result.has_value());
        CHECK(result->joinedText() == "5");
        CHECK(result->structuredContent["sum"] == 5);
    }

    // The session id from the first response is echoed on every later request,
    // and closing the client ends the session with a DELETE.
    auto lock = std::lock_guard(endpoint.mutex);
    REQUIRE(endpoint.sessionHeaders.size() >= 4);
    CHECK(endpoint.sessionHeaders.front().empty());
    for (auto i = std::size_t { 1 }; i < endpoint.sessionHeaders.size(); ++i)
        CHECK(endpoint.sessionHeaders[i] == "session-42");
    CHECK(endpoint.deletes.load() == 1);
}

TEST_CASE("HttpTransport accepts SSE-framed responses", "[http-transport][integration]")
{
    auto endpoint = FakeHttpEndpoint {};
    endpoint.sse = true;
    REQUIRE(endpoint.start() != 0);

    auto client = clientFor(endpoint.url());
    REQUIRE(client.initialize().has_value());

    auto result = client.callTool("echo", { { "text", "streamed" } });
    REQUIRE(result.has_value());
    CHECK(result->joinedText() == "streamed");
}

TEST_CASE("HttpTransport sends the bearer token", "[http-transport][integration]")
{
    auto endpoint = FakeHttpEndpoint {};
    endpoint.requiredToken = "s3cret";
    REQUIRE(endpoint.start() != 0);

    auto authorized = clientFor(endpoint.url(), "s3cret");
    CHECK(authorized.initialize().has_value());

    auto rejected = clientFor(endpoint.url(), "wrong");
    auto result = rejected.initialize();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
}

TEST_CASE("HttpTransport reports an unreachable endpoint", "[http-transport]")
{
    auto client = clientFor(std::format("http://127.0.0.1:{}/mcp", test::freePort()));
    auto result = client.initialize();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
}

TEST_CASE("HttpTransport runs concurrent calls side by side", "[http-transport][integration]")
{
    auto endpoint = FakeHttpEndpoint {};
    endpoint.tools.tools = { "echo", "sleep" };
    REQUIRE(endpoint.start() != 0);

    auto client = clientFor(endpoint.url());
    REQUIRE(client.initialize().has_value());

    auto slow = std::async(std::launch::async, [&] { return client.callTool("sleep", { { "ms", 1000 } }); });
    std::this_thread::sleep_for(50ms);

    auto const started = std::chrono::steady_clock::now();
    auto fast = client.callTool("echo", { { "text", "quick" } });
    CHECK(std::chrono::steady_clock::now() - started < 500ms);
    REQUIRE(fast.has_value());
    CHECK(fast->joinedText() == "quick");

    REQUIRE(slow.get().has_value());
}

TEST_CASE("HttpTransport close aborts a request in flight", "[http-transport][integration]")
{
    auto endpoint = FakeHttpEndpoint {};
    endpoint.tools.tools = { "sleep" };
    REQUIRE(endpoint.start() != 0);

    auto client = clientFor(endpoint.url());
    REQUIRE(client.initialize().has_value());

    auto waiting = std::async(std::launch::async, [&] { return client.callTool("sleep", { { "ms", 2000 } }); });
    std::this_thread::sleep_for(100ms);

    auto const started = std::chrono::steady_clock::now();
    client.close();
    REQUIRE(waiting.wait_for(1s) == std::future_status::ready);
    CHECK(std::chrono::steady_clock::now() - started < 1s);

    auto result = waiting.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}
