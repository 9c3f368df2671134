// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <upstream/ConnectionRegistry.hpp>
#include <upstream/RequestTracker.hpp>
#include <upstream/ToolCatalog.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace mcpmux
{

/// @brief A tool result that serializes cleanly.
struct ToolSuccess
{
    nlohmann::json content;
    nlohmann::json structuredContent; // null when absent
    std::string text;                 ///< Joined text blocks, or the serialized content if there are none.
};

/// @brief A tool result that could not be represented as JSON and was converted to text.
struct ToolDegraded
{
    std::string text;
    std::string originalType;
};

/// @brief The backend reported a failure of the tool itself (`isError: true`).
struct ToolExecutionFailure
{
    std::string message;
    nlohmann::json content;
};

using ToolOutcome = std::variant<ToolSuccess, ToolDegraded, ToolExecutionFailure>;

/// @brief Routes a qualified tool call to its backend and normalizes the result.
///
/// Routing problems (unknown tool, backend not Ready, timeout, transport failure) are
/// errors. Anything the backend itself reports is an outcome.
class RequestRouter
{
  public:
    RequestRouter(ToolCatalog& catalog, ConnectionRegistry& registry, RequestTracker& tracker);

    /// @brief Resolves and forwards a tool call.
    /// @return The normalized outcome, or ToolNotFound, BackendUnavailable, TimeoutError,
    ///         TransportError, ConnectionError or ExecutionError (JSON-RPC error reply).
    [[nodiscard]] auto call(std::string_view qualifiedName,
                            const nlohmann::json& arguments,
                            std::string_view clientAddress = {}) -> Result<ToolOutcome>;

  private:
    ToolCatalog& _catalog;
    ConnectionRegistry& _registry;
    RequestTracker& _tracker;
};

/// @brief Converts a raw backend result into a ToolOutcome.
///
/// Values that cannot be serialized (invalid UTF-8 in text or binary blocks) become
/// ToolDegraded with a best-effort textual rendering.
[[nodiscard]] auto normalizeToolResult(std::string_view toolName, ToolResult result) -> ToolOutcome;

/// @brief Renders an outcome as an MCP `tools/call` result object.
[[nodiscard]] auto toCallResult(const ToolOutcome& outcome) -> nlohmann::json;

} // namespace mcpmux
