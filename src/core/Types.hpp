// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace mcpmux
{

/// @brief Defines a tool as advertised by an MCP server.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Raw result of a tools/call as returned by an MCP server.
///
/// The content blocks and structured content are passed through untouched;
/// normalization into a wire-safe shape happens at the request router.
struct ToolResult
{
    nlohmann::json content = nlohmann::json::array();
    nlohmann::json structuredContent; // null when absent
    bool isError = false;

    /// @brief Joins all text content blocks, separated by blank lines.
    [[nodiscard]] auto joinedText() const -> std::string
    {
        auto text = std::string {};
        if (!content.is_array())
            return text;

        for (const auto& item: content)
        {
            if (!item.is_object() || item.value("type", "") != "text")
                continue;
            auto const it = item.find("text");
            if (it == item.end() || !it->is_string())
                continue;
            if (!text.empty())
                text += "\n\n";
            text += it->get<std::string>();
        }
        return text;
    }
};

} // namespace mcpmux
