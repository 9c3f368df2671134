// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace mcpmux::net
{

/// @brief Header map with lower-cased header names.
using HeaderMap = std::map<std::string, std::string>;

/// @brief Lower-cases an ASCII header name.
[[nodiscard]] auto normalizeHeaderName(std::string_view name) -> std::string;

/// @brief Decomposed http/https URL.
struct Url
{
    std::string scheme; ///< "http" or "https".
    std::string host;   ///< Host name or address, without IPv6 brackets.
    std::string port;   ///< Explicit port or the scheme default.
    std::string target; ///< Path plus query, always starting with '/'.

    [[nodiscard]] auto isTls() const -> bool { return scheme == "https"; }
};

/// @brief Maximum accepted URL length.
constexpr auto MaxUrlLength = std::size_t { 2048 };

/// @brief Parses an absolute http or https URL.
/// @return The URL parts or an InvalidArgument error describing what is malformed.
[[nodiscard]] auto parseUrl(std::string_view url) -> Result<Url>;

/// @brief Request as seen by an HTTP server handler.
struct HttpRequest
{
    std::string method;
    std::string target; ///< Raw request target including the query string.
    std::string path;   ///< Target without the query string.
    std::map<std::string, std::string> query;
    HeaderMap headers;
    std::string body;
    std::string remoteAddress;

    /// @brief Returns the header value or an empty string. @p name must be lower-case.
    [[nodiscard]] auto header(std::string_view name) const -> std::string;
};

/// @brief HTTP response, produced by server handlers and returned by the client.
struct HttpResponse
{
    unsigned status = 200;
    HeaderMap headers;
    std::string body;

    /// @brief Returns the header value or an empty string. @p name must be lower-case.
    [[nodiscard]] auto header(std::string_view name) const -> std::string;

    /// @brief Builds a JSON response with the given status code.
    [[nodiscard]] static auto json(unsigned status, std::string body) -> HttpResponse;
};

/// @brief Splits a query string (`a=1&b=two`) into decoded key/value pairs.
[[nodiscard]] auto parseQuery(std::string_view query) -> std::map<std::string, std::string>;

} // namespace mcpmux::net
