// SPDX-License-Identifier: Apache-2.0
#include "GatewayServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <charconv>
#include <format>
#include <string_view>
#include <vector>

namespace mcpmux
{

using net::HttpRequest;
using net::HttpResponse;

namespace
{
    constexpr auto ApiPrefix = std::string_view("/api/");

    auto jsonResponse(unsigned status, const nlohmann::json& body) -> HttpResponse
    {
        return HttpResponse::json(status, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    auto errorResponse(unsigned status, std::string_view message) -> HttpResponse
    {
        return jsonResponse(status, nlohmann::json { { "error", message } });
    }

    auto methodNotAllowed(std::string_view allowed) -> HttpResponse
    {
        auto response = errorResponse(405, "Method not allowed");
        response.headers["allow"] = std::string(allowed);
        return response;
    }

    auto httpStatusFor(ErrorCode code) -> unsigned
    {
        switch (code)
        {
            case ErrorCode::ConfigError: return 400;
            case ErrorCode::NotFound: return 404;
            case ErrorCode::AuthError: return 401;
            case ErrorCode::InvalidArgument: return 409;
            default: return 500;
        }
    }

    auto errorResponse(const Error& error) -> HttpResponse
    {
        return errorResponse(httpStatusFor(error.code), error.message);
    }

    /// Splits "/api/backends/x/reconnect" into {"backends", "x", "reconnect"}.
    auto apiSegments(std::string_view path) -> std::vector<std::string_view>
    {
        auto segments = std::vector<std::string_view> {};
        path.remove_prefix(ApiPrefix.size());
        while (!path.empty())
        {
            auto const slash = path.find('/');
            auto const segment = path.substr(0, slash);
            if (!segment.empty())
                segments.push_back(segment);
            if (slash == std::string_view::npos)
                break;
            path.remove_prefix(slash + 1);
        }
        return segments;
    }

    auto toolToJson(const ToolEntry& tool) -> nlohmann::json
    {
        auto const description = tool.description.empty() ? std::string("Upstream tool") : tool.description;
        auto schema = tool.inputSchema.is_object() ? tool.inputSchema : nlohmann::json { { "type", "object" } };
        return nlohmann::json {
            { "name", tool.qualifiedName },
            { "description", std::format("[{}] {}", tool.backendId, description) },
            { "inputSchema", std::move(schema) },
        };
    }

    auto toolEntryToJson(const ToolEntry& tool) -> nlohmann::json
    {
        return nlohmann::json {
            { "name", tool.qualifiedName },
            { "backend", tool.backendId },
            { "originalName", tool.originalName },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema },
        };
    }

    auto backendsToJson(const std::vector<BackendInfo>& backends) -> nlohmann::json
    {
        auto list = nlohmann::json::array();
        for (const auto& backend: backends)
            list.push_back(backendInfoToJson(backend));
        return list;
    }

    auto parseLimit(std::string_view text) -> std::optional<std::size_t>
    {
        auto value = std::size_t { 0 };
        auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || end != text.data() + text.size() || value == 0)
            return std::nullopt;
        return value;
    }
} // namespace

GatewayServer::GatewayServer(Aggregator& aggregator, auth::AuthGate& auth, GatewayInfo info):
    _aggregator(aggregator), _auth(auth), _info(std::move(info))
{
}

GatewayServer::~GatewayServer()
{
    stop(std::chrono::milliseconds(0));
}

auto GatewayServer::start(const net::HttpServerConfig& config) -> VoidResult
{
    return _http.start(config, [this](const HttpRequest& request) { return handle(request); });
}

void GatewayServer::stopAccepting()
{
    _http.stopAccepting();
}

void GatewayServer::stop(std::chrono::milliseconds grace)
{
    _http.stop(grace);
}

auto GatewayServer::handle(const HttpRequest& request) -> HttpResponse
{
    log::debug("{} {} from {}", request.method, request.target, request.remoteAddress);

    if (request.path == "/health")
    {
        if (request.method != "GET")
            return methodNotAllowed("GET");
        return jsonResponse(200, nlohmann::json { { "status", "ok" } });
    }

    if (request.path == "/mcp")
        return handleMcp(request);

    if (request.path.starts_with(ApiPrefix))
        return handleApi(request);

    return errorResponse(404, "Not found");
}

auto GatewayServer::handleMcp(const HttpRequest& request) -> HttpResponse
{
    if (!_auth.toolEndpointOpen())
    {
        auto const token = auth::bearerToken(request.header("authorization"));
        if (!token)
            return errorResponse(401, "Missing or invalid Authorization header");
        if (!_auth.authorizeToolCall(*token))
            return errorResponse(403, "Invalid token");
    }

    if (request.method != "POST")
        return methodNotAllowed("POST");

    auto message = json::parse(request.body);
    if (!message)
        return jsonResponse(400, jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, "Parse error"));

    if (message->is_array())
    {
        if (message->empty())
            return jsonResponse(
                400, jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, "Empty batch"));

        auto replies = nlohmann::json::array();
        for (const auto& item: *message)
        {
            if (auto reply = handleRpc(item, request.remoteAddress))
                replies.push_back(std::move(*reply));
        }
        if (replies.empty())
            return HttpResponse { .status = 202, .headers = {}, .body = {} };
        return jsonResponse(200, replies);
    }

    auto reply = handleRpc(*message, request.remoteAddress);
    if (!reply)
        return HttpResponse { .status = 202, .headers = {}, .body = {} };
    return jsonResponse(200, *reply);
}

auto GatewayServer::handleRpc(const nlohmann::json& message, const std::string& clientAddress)
    -> std::optional<nlohmann::json>
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
    {
        auto id = message.is_object() ? message.value("id", nlohmann::json(nullptr)) : nlohmann::json(nullptr);
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidRequest, request.error().message);
    }

    if (request->isNotification())
    {
        log::debug("MCP notification: {}", request->method);
        return std::nullopt;
    }

    auto const& id = request->id;
    auto const& method = request->method;

    if (method == "initialize")
    {
        auto const requested = json::getStringOr(request->params, "protocolVersion", McpProtocolVersion);
        log::info("MCP client {} initialized (protocol {})", clientAddress, requested);
        return jsonrpc::makeResult(
            id,
            nlohmann::json {
                { "protocolVersion", McpProtocolVersion },
                { "capabilities", { { "tools", { { "listChanged", false } } } } },
                { "serverInfo", { { "name", _info.name }, { "version", _info.version } } },
            });
    }

    if (method == "ping")
        return jsonrpc::makeResult(id, nlohmann::json::object());

    if (method == "tools/list")
    {
        auto tools = nlohmann::json::array();
        for (const auto& tool: _aggregator.tools())
            tools.push_back(toolToJson(tool));
        return jsonrpc::makeResult(id, nlohmann::json { { "tools", std::move(tools) } });
    }

    if (method == "tools/call")
        return handleToolCall(id, request->params, clientAddress);

    return jsonrpc::makeErrorResponse(id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method));
}

auto GatewayServer::handleToolCall(const nlohmann::json& id,
                                   const nlohmann::json& params,
                                   const std::string& clientAddress) -> nlohmann::json
{
    auto name = json::getString(params, "name");
    if (!name)
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "tools/call requires a tool name");

    auto arguments = params.is_object() ? params.value("arguments", nlohmann::json::object())
                                        : nlohmann::json::object();
    if (!arguments.is_object())
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "Tool arguments must be an object");

    auto outcome = _aggregator.callTool(*name, arguments, clientAddress);
    if (outcome)
        return jsonrpc::makeResult(id, toCallResult(*outcome));

    auto const& error = outcome.error();
    switch (error.code)
    {
        case ErrorCode::ToolNotFound:
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, error.message);
        case ErrorCode::BackendUnavailable:
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::BackendUnavailable, error.message);
        case ErrorCode::ExecutionError:
            // The backend rejected the call itself; report it like any other tool failure.
            return jsonrpc::makeResult(id, toCallResult(ToolExecutionFailure { .message = error.message, .content = {} }));
        default:
            return jsonrpc::makeErrorResponse(id,
                                              jsonrpc::codes::UpstreamFailure,
                                              error.message,
                                              nlohmann::json { { "kind", errorCodeName(error.code) } });
    }
}

auto GatewayServer::handleApi(const HttpRequest& request) -> HttpResponse
{
    auto const segments = apiSegments(request.path);

    if (segments.size() == 1 && segments[0] == "login")
    {
        if (request.method != "POST")
            return methodNotAllowed("POST");
        return handleLogin(request);
    }

    auto const session = request.header("x-session-token");
    if (!_auth.authorizeAdmin(session))
        return errorResponse(401, "Authentication required");

    if (segments.empty())
        return errorResponse(404, "Not found");

    auto const& resource = segments[0];

    if (resource == "logout" && segments.size() == 1)
    {
        if (request.method != "POST")
            return methodNotAllowed("POST");
        _auth.logout(session);
        return jsonResponse(200, nlohmann::json { { "status", "ok" } });
    }

    if (resource == "backends")
    {
        if (segments.size() == 1)
        {
            if (request.method == "GET")
                return jsonResponse(200, backendsToJson(_aggregator.listBackends()));
            if (request.method == "POST")
                return handleAddBackend(request);
            return methodNotAllowed("GET, POST");
        }

        auto const id = std::string(segments[1]);
        if (segments.size() == 2)
        {
            if (request.method == "GET")
            {
                auto backend = _aggregator.backend(id);
                return backend ? jsonResponse(200, backendInfoToJson(*backend)) : errorResponse(backend.error());
            }
            if (request.method == "DELETE")
            {
                if (auto removed = _aggregator.removeBackend(id); !removed)
                    return errorResponse(removed.error());
                return jsonResponse(200, nlohmann::json { { "status", "removed" }, { "name", id } });
            }
            return methodNotAllowed("GET, DELETE");
        }

        if (segments.size() == 3 && segments[2] == "reconnect")
        {
            if (request.method != "POST")
                return methodNotAllowed("POST");
            auto backend = _aggregator.reconnectBackend(id);
            return backend ? jsonResponse(200, backendInfoToJson(*backend)) : errorResponse(backend.error());
        }
    }

    if (resource == "tools" && segments.size() == 1)
    {
        if (request.method != "GET")
            return methodNotAllowed("GET");
        auto tools = nlohmann::json::array();
        for (const auto& tool: _aggregator.tools())
            tools.push_back(toolEntryToJson(tool));
        return jsonResponse(200, tools);
    }

    if (resource == "tools" && segments.size() == 2 && segments[1] == "refresh")
    {
        if (request.method != "POST")
            return methodNotAllowed("POST");
        auto refreshed = _aggregator.refreshTools();
        if (!refreshed)
            return errorResponse(refreshed.error());
        return jsonResponse(200,
                            nlohmann::json {
                                { "backends", *refreshed },
                                { "tools", _aggregator.tools().size() },
                            });
    }

    if (resource == "requests")
    {
        if (request.method != "GET")
            return methodNotAllowed("GET");
        if (segments.size() == 1)
            return handleListRequests(request);
        if (segments.size() == 2)
        {
            auto tracked = _aggregator.tracker().get(segments[1]);
            if (!tracked)
                return errorResponse(404, std::format("Request '{}' not found", segments[1]));
            return jsonResponse(200, toJson(*tracked));
        }
    }

    if (resource == "stats" && segments.size() == 1)
    {
        if (request.method != "GET")
            return methodNotAllowed("GET");
        return jsonResponse(200, toJson(_aggregator.tracker().statistics()));
    }

    return errorResponse(404, "Not found");
}

auto GatewayServer::handleLogin(const HttpRequest& request) -> HttpResponse
{
    auto body = json::parse(request.body);
    if (!body || !body->is_object())
        return errorResponse(400, "Expected a JSON object");

    auto password = json::getString(*body, "password");
    if (!password)
        return errorResponse(400, "Missing password");

    if (_auth.isRateLimited(request.remoteAddress))
        return errorResponse(429, "Too many failed login attempts; try again later");

    auto token = _auth.login(*password, request.remoteAddress);
    if (!token)
        return errorResponse(token.error());
    return jsonResponse(200, nlohmann::json { { "token", *token } });
}

auto GatewayServer::handleAddBackend(const HttpRequest& request) -> HttpResponse
{
    auto body = json::parse(request.body);
    if (!body || !body->is_object())
        return errorResponse(400, "Expected a JSON object");

    auto name = json::getString(*body, "name");
    if (!name)
        return errorResponse(400, "Missing backend name");

    auto const transportName = json::getStringOr(*body, "transport", "");
    auto const kind = transportKindFromString(transportName);
    if (!kind)
        return errorResponse(400, std::format("Unknown transport '{}'", transportName));

    auto config = parseBackendConfig(*kind, body->value("config", nlohmann::json::object()));
    if (!config)
        return errorResponse(config.error());

    auto added = _aggregator.addBackend(BackendSpec { .id = *name, .config = std::move(*config) });
    if (!added)
        return errorResponse(added.error());

    log::info("Backend '{}' added via admin API from {}", *name, request.remoteAddress);
    return jsonResponse(201, backendInfoToJson(*added));
}

auto GatewayServer::handleListRequests(const HttpRequest& request) -> HttpResponse
{
    auto limit = std::size_t { 100 };
    if (auto const it = request.query.find("limit"); it != request.query.end())
    {
        auto const parsed = parseLimit(it->second);
        if (!parsed)
            return errorResponse(400, std::format("Invalid limit '{}'", it->second));
        limit = *parsed;
    }

    auto status = std::optional<RequestStatus> {};
    if (auto const it = request.query.find("status"); it != request.query.end() && !it->second.empty())
    {
        status = requestStatusFromString(it->second);
        if (!status)
            return errorResponse(400, std::format("Invalid status '{}'", it->second));
    }

    auto backend = std::optional<std::string> {};
    if (auto const it = request.query.find("backend"); it != request.query.end() && !it->second.empty())
        backend = it->second;

    auto requests = nlohmann::json::array();
    for (const auto& tracked: _aggregator.tracker().list(limit, status, backend))
        requests.push_back(toJson(tracked));
    return jsonResponse(200, requests);
}

} // namespace mcpmux
