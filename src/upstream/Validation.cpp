// SPDX-License-Identifier: Apache-2.0
#include "Validation.hpp"

#include <core/Process.hpp>
#include <net/Http.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <algorithm>
#include <filesystem>
#include <format>

namespace mcpmux::validation
{

namespace
{
    auto isIdCharacter(char c) -> bool
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    }

    auto validateProcessFields(const std::string& command,
                               const std::vector<std::string>& args,
                               const std::string& workingDirectory) -> VoidResult
    {
        return validateCommand(command)
            .and_then([&](const std::string&) { return validateArgs(args); })
            .and_then([&] { return validateWorkingDirectory(workingDirectory); });
    }
} // namespace

auto validateBackendId(std::string_view id) -> VoidResult
{
    if (id.empty() || id.size() > MaxBackendIdLength)
        return makeError(ErrorCode::ConfigError,
                         std::format("Backend name must be 1-{} characters long", MaxBackendIdLength));
    if (!std::ranges::all_of(id, isIdCharacter))
        return makeError(ErrorCode::ConfigError,
                         std::format("Backend name '{}' may only contain letters, digits, '_' and '-'", id));
    return {};
}

auto validateUrl(std::string_view url) -> VoidResult
{
    auto const parsed = net::parseUrl(url);
    if (!parsed)
        return makeError(ErrorCode::ConfigError, std::format("Invalid URL: {}", parsed.error().message));
    return {};
}

auto validatePort(uint16_t port) -> VoidResult
{
    if (port < MinServicePort)
        return makeError(ErrorCode::ConfigError,
                         std::format("Port {} is outside the allowed range {}-65535", port, MinServicePort));
    return {};
}

auto validateArgs(const std::vector<std::string>& args) -> VoidResult
{
    if (args.size() > MaxArgs)
        return makeError(ErrorCode::ConfigError, std::format("At most {} arguments are allowed", MaxArgs));

    for (const auto& arg: args)
    {
        if (arg.size() > MaxArgLength)
            return makeError(ErrorCode::ConfigError,
                             std::format("Argument exceeds {} characters: {}...", MaxArgLength, arg.substr(0, 40)));
    }
    return {};
}

auto validateCommand(std::string_view command) -> Result<std::string>
{
    if (command.empty())
        return makeError(ErrorCode::ConfigError, "Command must not be empty");

    auto resolved = process::findExecutable(command);
    if (!resolved)
        return makeError(ErrorCode::ConfigError, std::format("Command '{}' is not an executable file", command));
    return std::move(*resolved);
}

auto validateWorkingDirectory(std::string_view path) -> VoidResult
{
    if (path.empty())
        return {};

    auto ec = std::error_code {};
    if (!std::filesystem::is_directory(std::filesystem::path(path), ec))
        return makeError(ErrorCode::ConfigError, std::format("Working directory '{}' does not exist", path));
    return {};
}

auto isPortFree(uint16_t port) -> bool
{
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    auto ioc = asio::io_context {};
    auto acceptor = tcp::acceptor(ioc);
    auto ec = boost::system::error_code {};
    auto const endpoint = tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), port);

    acceptor.open(endpoint.protocol(), ec);
    if (ec)
        return false;
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor.bind(endpoint, ec);
    auto const free = !ec;
    acceptor.close(ec);
    return free;
}

auto validateBackendSpec(const BackendSpec& spec) -> VoidResult
{
    if (auto valid = validateBackendId(spec.id); !valid)
        return valid;

    if (auto const* http = std::get_if<HttpBackendConfig>(&spec.config))
        return validateUrl(http->url);

    if (auto const* stdio = std::get_if<StdioBackendConfig>(&spec.config))
        return validateProcessFields(stdio->command, stdio->args, stdio->workingDirectory);

    auto const& service = std::get<ServiceBackendConfig>(spec.config);
    if (auto valid = validatePort(service.port); !valid)
        return valid;
    return validateProcessFields(service.command, service.args, service.workingDirectory);
}

} // namespace mcpmux::validation
