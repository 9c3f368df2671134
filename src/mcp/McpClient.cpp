// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>
#include <optional>

namespace mcpmux
{

namespace
{
    constexpr auto MaxToolPages = 100;

    /// Longest single receive() while waiting for a reply. Bounds how long close() waits.
    constexpr auto ReceiveSlice = std::chrono::milliseconds(100);

    auto toResult(const jsonrpc::Response& response) -> Result<nlohmann::json>
    {
        if (response.error)
            return makeError(ErrorCode::ExecutionError,
                             std::format("RPC error {}: {}", response.error->code, response.error->message));
        return response.result.value_or(nlohmann::json::object());
    }

    auto parseTool(const nlohmann::json& toolJson) -> std::optional<ToolDefinition>
    {
        if (!toolJson.is_object() || !toolJson.contains("name") || !toolJson["name"].is_string())
            return std::nullopt;

        return ToolDefinition {
            .name = toolJson["name"].get<std::string>(),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
        };
    }
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport, McpClientTimeouts timeouts):
    _transport(std::move(transport)), _timeouts(timeouts)
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize() -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "mcpmux" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params), _timeouts.handshake)
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            if (!result.is_object())
                return makeError(ErrorCode::HandshakeError, "initialize result is not an object");

            auto capabilities = McpServerCapabilities {};
            auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
            capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
            capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
            capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", "");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                capabilities.hasTools = caps.contains("tools");
                capabilities.hasResources = caps.contains("resources");
                capabilities.hasPrompts = caps.contains("prompts");
            }

            auto notif = jsonrpc::makeNotification("notifications/initialized");
            auto sent = [&] {
                auto lock = std::lock_guard(_sendMutex);
                return _transport->send(notif);
            }();
            if (!sent)
                return makeError(ErrorCode::HandshakeError,
                                 std::format("Sending initialized notification failed: {}", sent.error().message));

            _initialized = true;
            log::info("MCP server initialized: {} v{} at {}",
                      capabilities.serverName,
                      capabilities.serverVersion,
                      _transport->endpoint());

            return capabilities;
        });
}

auto McpClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<ToolDefinition> {};
    auto cursor = std::string {};

    for (auto page = 0; page < MaxToolPages; ++page)
    {
        auto params = cursor.empty() ? nlohmann::json {} : nlohmann::json { { "cursor", cursor } };
        auto result = sendRequest("tools/list", std::move(params), _timeouts.discovery);
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
        {
            for (const auto& toolJson: (*result)["tools"])
            {
                if (auto tool = parseTool(toolJson))
                    tools.push_back(std::move(*tool));
                else
                    log::warning("Skipping malformed tool entry: {}", toolJson.dump());
            }
        }

        cursor = json::getStringOr(*result, "nextCursor", "");
        if (cursor.empty())
            return tools;
    }

    log::warning("tools/list pagination stopped after {} pages", MaxToolPages);
    return tools;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return sendRequest("tools/call", std::move(params), _timeouts.call)
        .and_then([&name](const nlohmann::json& result) -> Result<ToolResult> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError, "tools/call result is not an object");

            auto toolResult = ToolResult {};
            toolResult.isError = json::getBoolOr(result, "isError", false);
            if (result.contains("content"))
                toolResult.content = result["content"];
            if (result.contains("structuredContent"))
                toolResult.structuredContent = result["structuredContent"];

            log::debug("Tool '{}' returned {} content block(s) (isError: {})",
                       name,
                       toolResult.content.is_array() ? toolResult.content.size() : 1,
                       toolResult.isError);
            return toolResult;
        });
}

void McpClient::close()
{
    if (_closed.exchange(true))
        return;
    _initialized = false;

    {
        auto lock = std::unique_lock(_mutex);
        _replyArrived.notify_all();
        // The caller holding the reading turn gives it up after its current slice.
        _replyArrived.wait(lock, [this] { return !_reading; });
    }

    if (_transport)
        _transport->close();
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::isConnected() const -> bool
{
    return !_closed && _transport && _transport->isConnected();
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    if (_closed)
        return makeError(ErrorCode::TransportError, "MCP client is closed");

    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    if (_transport->hasPerRequestReplies())
        return exchange(id, method, request, timeout);

    // Registered before sending so that whoever reads the reply knows where it belongs.
    {
        auto lock = std::lock_guard(_mutex);
        _pending.emplace(id, std::nullopt);
    }

    auto sent = [&] {
        auto lock = std::lock_guard(_sendMutex);
        return _transport->send(request);
    }();
    if (!sent)
    {
        auto lock = std::lock_guard(_mutex);
        _pending.erase(id);
        return std::unexpected(sent.error());
    }

    return awaitReply(id, method, timeout);
}

auto McpClient::exchange(int64_t id, std::string_view method, const nlohmann::json& request,
                         std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto messages = _transport->exchange(request, timeout);
    if (!messages)
        return std::unexpected(messages.error());

    for (const auto& message: *messages)
    {
        if (jsonrpc::isNotification(message))
            continue;

        auto response = jsonrpc::parseResponse(message);
        if (!response || response->id != nlohmann::json(id))
        {
            log::debug("Skipping unexpected message in the reply to {}: {}", method, message.dump());
            continue;
        }
        return toResult(*response);
    }

    return makeError(ErrorCode::ProtocolError, std::format("{} got no reply from {}", method, _transport->endpoint()));
}

auto McpClient::awaitReply(int64_t id, std::string_view method, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto lock = std::unique_lock(_mutex);

    while (true)
    {
        auto const slot = _pending.find(id);
        if (slot->second)
        {
            auto reply = std::move(*slot->second);
            _pending.erase(slot);
            return reply;
        }

        if (_closed)
        {
            _pending.erase(slot);
            return makeError(ErrorCode::TransportError, std::format("MCP client closed while waiting for {}", method));
        }

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            _pending.erase(slot);
            return makeError(ErrorCode::TimeoutError, std::format("{} timed out after {} ms", method, timeout.count()));
        }

        if (_reading)
        {
            _replyArrived.wait_until(lock, std::min(deadline, now + ReceiveSlice));
            continue;
        }

        _reading = true;
        lock.unlock();
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto message = _transport->receive(std::clamp(remaining, std::chrono::milliseconds(1), ReceiveSlice));
        lock.lock();
        _reading = false;

        dispatchLocked(std::move(message), method);
        _replyArrived.notify_all();
    }
}

void McpClient::dispatchLocked(Result<nlohmann::json> message, std::string_view waitingFor)
{
    if (!message)
    {
        auto const& error = message.error();
        if (error.code == ErrorCode::TimeoutError)
            return;

        // Servers occasionally print stray non-JSON lines; skip them.
        if (error.code == ErrorCode::ProtocolError)
        {
            log::debug("Skipping unparsable message while waiting for {}: {}", waitingFor, error.message);
            return;
        }

        // The connection is gone: every request still waiting fails the same way.
        for (auto& [id, reply]: _pending)
        {
            if (!reply)
                reply = Result<nlohmann::json>(std::unexpected(error));
        }
        return;
    }

    if (jsonrpc::isNotification(*message))
    {
        log::trace("Ignoring notification {} while waiting for {}", message->value("method", ""), waitingFor);
        return;
    }

    auto response = jsonrpc::parseResponse(*message);
    if (!response)
    {
        log::debug("Skipping malformed message while waiting for {}: {}", waitingFor, response.error().message);
        return;
    }

    auto const slot = response->id.is_number_integer() ? _pending.find(response->id.get<int64_t>()) : _pending.end();
    if (slot == _pending.end() || slot->second)
    {
        log::debug("Skipping message with unexpected id {} (waiting for {})", response->id.dump(), waitingFor);
        return;
    }
    slot->second = toResult(*response);
}

} // namespace mcpmux
