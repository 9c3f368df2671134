// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcpmux::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message, nlohmann::json data)
    -> nlohmann::json
{
    auto error = nlohmann::json {
        { "code", code },
        { "message", message },
    };
    if (!data.is_null())
        error["data"] = std::move(data);

    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", std::move(error) },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto const method = message.find("method");
    if (method == message.end() || !method->is_string())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request has no method");

    auto request = Request {};
    request.method = method->get<std::string>();

    if (auto const id = message.find("id"); id != message.end())
    {
        if (!id->is_string() && !id->is_number_integer() && !id->is_null())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC id must be a string or an integer");
        request.id = *id;
    }

    request.params = message.value("params", nlohmann::json::object());
    if (!request.params.is_object() && !request.params.is_array())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC params must be an object or an array");

    return request;
}

auto isNotification(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("method") && !message.contains("id");
}

} // namespace mcpmux::jsonrpc
