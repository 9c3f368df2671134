// SPDX-License-Identifier: Apache-2.0
#include "Http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace mcpmux::net
{

namespace
{
    auto hexValue(char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    auto percentDecode(std::string_view input) -> std::string
    {
        auto output = std::string {};
        output.reserve(input.size());
        for (auto i = std::size_t { 0 }; i < input.size(); ++i)
        {
            auto const c = input[i];
            if (c == '+')
            {
                output += ' ';
            }
            else if (c == '%' && i + 2 < input.size() && hexValue(input[i + 1]) >= 0
                     && hexValue(input[i + 2]) >= 0)
            {
                output += static_cast<char>(hexValue(input[i + 1]) * 16 + hexValue(input[i + 2]));
                i += 2;
            }
            else
            {
                output += c;
            }
        }
        return output;
    }

    auto findHeader(const HeaderMap& headers, std::string_view name) -> std::string
    {
        auto const it = headers.find(std::string(name));
        return it != headers.end() ? it->second : std::string {};
    }
} // namespace

auto normalizeHeaderName(std::string_view name) -> std::string
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

auto parseUrl(std::string_view url) -> Result<Url>
{
    if (url.empty())
        return makeError(ErrorCode::InvalidArgument, "URL is empty");
    if (url.size() > MaxUrlLength)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("URL exceeds {} characters", MaxUrlLength));

    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("URL '{}' has no scheme", url));

    auto parts = Url {};
    parts.scheme = normalizeHeaderName(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https")
        return makeError(ErrorCode::InvalidArgument,
                         std::format("URL scheme '{}' is not http or https", parts.scheme));

    auto rest = url.substr(schemeEnd + 3);
    auto const pathStart = rest.find_first_of("/?#");
    auto authority = rest.substr(0, pathStart);
    auto target = pathStart == std::string_view::npos ? std::string_view { "/" } : rest.substr(pathStart);

    if (auto const at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);

    auto portText = std::string_view {};
    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, std::format("URL '{}' has a malformed IPv6 host", url));
        parts.host = std::string(authority.substr(1, close - 1));
        auto const after = authority.substr(close + 1);
        if (after.starts_with(':'))
            portText = after.substr(1);
        else if (!after.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("URL '{}' has a malformed authority", url));
    }
    else
    {
        auto const colon = authority.rfind(':');
        parts.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos)
            portText = authority.substr(colon + 1);
    }

    if (parts.host.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("URL '{}' has no host", url));

    if (!portText.empty())
    {
        auto port = 0;
        auto const [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc {} || ptr != portText.data() + portText.size() || port < 1 || port > 65535)
            return makeError(ErrorCode::InvalidArgument, std::format("URL '{}' has an invalid port", url));
        parts.port = std::string(portText);
    }
    else
    {
        parts.port = parts.isTls() ? "443" : "80";
    }

    if (auto const fragment = target.find('#'); fragment != std::string_view::npos)
        target = target.substr(0, fragment);
    parts.target = std::string(target);
    if (parts.target.empty() || parts.target.front() != '/')
        parts.target.insert(parts.target.begin(), '/');

    return parts;
}

auto HttpRequest::header(std::string_view name) const -> std::string
{
    return findHeader(headers, name);
}

auto HttpResponse::header(std::string_view name) const -> std::string
{
    return findHeader(headers, name);
}

auto HttpResponse::json(unsigned status, std::string body) -> HttpResponse
{
    return HttpResponse {
        .status = status,
        .headers = { { "content-type", "application/json" } },
        .body = std::move(body),
    };
}

auto parseQuery(std::string_view query) -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    while (!query.empty())
    {
        auto const amp = query.find('&');
        auto const pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view {} : query.substr(amp + 1);
        if (pair.empty())
            continue;

        auto const eq = pair.find('=');
        if (eq == std::string_view::npos)
            values[percentDecode(pair)] = "";
        else
            values[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
    }
    return values;
}

} // namespace mcpmux::net
