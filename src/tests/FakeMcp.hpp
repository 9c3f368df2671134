// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpmux::test
{

/// @brief Behaviour of the scripted MCP server used by the tests.
///
/// Tool semantics are fixed by name: `echo` returns its `text` argument, `add` sums `a`
/// and `b`, `fail` reports `isError`, `sleep` waits `ms` milliseconds, `binary` returns
/// bytes that are not valid UTF-8. Any other listed tool answers "<name> called".
struct FakeToolSet
{
    std::vector<std::string> tools = { "echo", "add", "fail" };
    bool failDiscovery = false;
    bool failHandshake = false;
    std::string serverName = "fake-mcp";
    std::chrono::milliseconds handshakeDelay { 0 };
    std::chrono::milliseconds discoveryDelay { 0 };
};

inline auto textResult(const std::string& text, bool isError = false) -> nlohmann::json
{
    return nlohmann::json {
        { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
        { "isError", isError },
    };
}

inline auto fakeToolDefinition(const std::string& name) -> nlohmann::json
{
    auto schema = nlohmann::json { { "type", "object" }, { "properties", nlohmann::json::object() } };
    if (name == "echo")
        schema["properties"]["text"] = { { "type", "string" } };
    if (name == "add")
        schema["properties"] = { { "a", { { "type", "number" } } }, { "b", { { "type", "number" } } } };
    return nlohmann::json { { "name", name }, { "description", "Fake " + name + " tool" }, { "inputSchema", schema } };
}

inline auto callFakeTool(const std::string& name, const nlohmann::json& arguments) -> nlohmann::json
{
    if (name == "echo")
        return textResult(arguments.value("text", ""));

    if (name == "add")
    {
        auto const sum = arguments.value("a", 0) + arguments.value("b", 0);
        auto result = textResult(std::to_string(sum));
        result["structuredContent"] = { { "sum", sum } };
        return result;
    }

    if (name == "fail")
        return textResult("boom", true);

    if (name == "sleep")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(arguments.value("ms", 0)));
        return textResult("slept");
    }

    if (name == "binary")
        return textResult(std::string("\xff\xfe\xfd", 3));

    return textResult(name + " called");
}

/// @brief Answers one JSON-RPC message like a small MCP server. Notifications yield no reply.
inline auto handleFakeMessage(const nlohmann::json& message, const FakeToolSet& set) -> std::optional<nlohmann::json>
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, request.error().message);
    if (request->isNotification())
        return std::nullopt;

    auto const& id = request->id;
    auto const& method = request->method;

    if (method == "initialize")
    {
        std::this_thread::sleep_for(set.handshakeDelay);
        if (set.failHandshake)
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InternalError, "initialization refused");
        return jsonrpc::makeResult(id,
                                   nlohmann::json {
                                       { "protocolVersion", McpProtocolVersion },
                                       { "capabilities", { { "tools", nlohmann::json::object() } } },
                                       { "serverInfo", { { "name", set.serverName }, { "version", "1.0" } } },
                                   });
    }

    if (method == "ping")
        return jsonrpc::makeResult(id, nlohmann::json::object());

    if (method == "tools/list")
    {
        std::this_thread::sleep_for(set.discoveryDelay);
        if (set.failDiscovery)
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InternalError, "tool listing unavailable");
        auto tools = nlohmann::json::array();
        for (const auto& name: set.tools)
            tools.push_back(fakeToolDefinition(name));
        return jsonrpc::makeResult(id, nlohmann::json { { "tools", tools } });
    }

    if (method == "tools/call")
    {
        auto const name = request->params.value("name", "");
        if (std::ranges::find(set.tools, name) == set.tools.end())
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "Unknown tool: " + name);
        return jsonrpc::makeResult(id, callFakeTool(name, request->params.value("arguments", nlohmann::json::object())));
    }

    return jsonrpc::makeErrorResponse(id, jsonrpc::codes::MethodNotFound, "Method not found: " + method);
}

} // namespace mcpmux::test
