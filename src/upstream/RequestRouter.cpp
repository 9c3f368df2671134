// SPDX-License-Identifier: Apache-2.0
#include "RequestRouter.hpp"

#include <core/Log.hpp>

#include <format>
#include <optional>

namespace mcpmux
{

namespace
{
    /// Serializes @p value, failing on strings that are not valid UTF-8.
    auto tryDump(const nlohmann::json& value) -> std::optional<std::string>
    {
        try
        {
            return value.dump();
        }
        catch (const nlohmann::json::type_error&)
        {
            return std::nullopt;
        }
    }

    auto lossyDump(const nlohmann::json& value) -> std::string
    {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    /// Names the first content block that does not serialize, e.g. "text" or "blob".
    auto offendingType(const nlohmann::json& content, const nlohmann::json& structuredContent) -> std::string
    {
        if (content.is_array())
        {
            for (const auto& block: content)
            {
                if (tryDump(block))
                    continue;
                if (block.is_object() && block.contains("type") && block["type"].is_string())
                    return block["type"].get<std::string>();
                return block.type_name();
            }
        }
        if (!tryDump(structuredContent))
            return std::format("structuredContent ({})", structuredContent.type_name());
        return content.type_name();
    }
} // namespace

auto normalizeToolResult(std::string_view toolName, ToolResult result) -> ToolOutcome
{
    auto const contentText = tryDump(result.content);
    auto const structuredText = tryDump(result.structuredContent);

    if (!contentText || !structuredText)
    {
        auto degraded = ToolDegraded {
            .text = lossyDump(result.content),
            .originalType = offendingType(result.content, result.structuredContent),
        };
        log::warning("Result of tool '{}' is not valid JSON ({}); returning its string form",
                     toolName,
                     degraded.originalType);

        if (result.isError)
            return ToolExecutionFailure { .message = degraded.text, .content = nlohmann::json::array() };
        return degraded;
    }

    auto text = result.joinedText();
    if (result.isError)
    {
        if (text.empty())
            text = std::format("Tool '{}' reported an error", toolName);
        return ToolExecutionFailure { .message = std::move(text), .content = std::move(result.content) };
    }

    if (text.empty() && !result.content.empty())
        text = *contentText;

    return ToolSuccess {
        .content = std::move(result.content),
        .structuredContent = std::move(result.structuredContent),
        .text = std::move(text),
    };
}

auto toCallResult(const ToolOutcome& outcome) -> nlohmann::json
{
    auto textContent = [](const std::string& text) {
        return nlohmann::json::array({ { { "type", "text" }, { "text", text } } });
    };

    return std::visit(Overloaded {
                          [&](const ToolSuccess& success) {
                              auto result = nlohmann::json { { "content", success.content }, { "isError", false } };
                              if (!success.structuredContent.is_null())
                                  result["structuredContent"] = success.structuredContent;
                              return result;
                          },
                          [&](const ToolDegraded& degraded) {
                              return nlohmann::json { { "content", textContent(degraded.text) }, { "isError", false } };
                          },
                          [&](const ToolExecutionFailure& failure) {
                              auto content = failure.content.is_array() && !failure.content.empty()
                                                 ? failure.content
                                                 : textContent(failure.message);
                              return nlohmann::json { { "content", content }, { "isError", true } };
                          },
                      },
                      outcome);
}

RequestRouter::RequestRouter(ToolCatalog& catalog, ConnectionRegistry& registry, RequestTracker& tracker):
    _catalog(catalog), _registry(registry), _tracker(tracker)
{
}

auto RequestRouter::call(std::string_view qualifiedName,
                         const nlohmann::json& arguments,
                         std::string_view clientAddress) -> Result<ToolOutcome>
{
    auto target = _catalog.resolve(qualifiedName);
    if (!target)
        return std::unexpected(target.error());

    auto const& backendId = target->backendId;
    auto const requestId = _tracker.create(backendId, target->originalName, arguments, clientAddress);

    auto client = _registry.get(backendId);
    if (!client)
    {
        auto message = std::format("Backend '{}' is not available", backendId);
        _tracker.fail(requestId, message);
        return makeError(ErrorCode::BackendUnavailable, std::move(message));
    }

    log::info("Calling {}/{}", backendId, target->originalName);
    _tracker.start(requestId);

    auto result = client->call(target->originalName, arguments);
    if (!result)
    {
        _tracker.fail(requestId, result.error().message);

        // A stdio child that went away cannot serve anything until it is reconnected.
        if (result.error().code == ErrorCode::TransportError && client->kind() == TransportKind::Stdio
            && _registry.markCrashed(backendId, result.error().message))
            _catalog.purge(backendId);

        return std::unexpected(result.error());
    }

    auto outcome = normalizeToolResult(qualifiedName, std::move(*result));
    if (auto const* failure = std::get_if<ToolExecutionFailure>(&outcome))
        _tracker.fail(requestId, failure->message);
    else
        _tracker.complete(requestId, toCallResult(outcome));
    return outcome;
}

} // namespace mcpmux
