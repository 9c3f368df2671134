// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <mcpmux/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace mcpmux;
using test::ScopedEnv;

namespace
{
    auto writeTempConfig(std::string_view name, std::string_view content) -> std::filesystem::path
    {
        auto const path = std::filesystem::temp_directory_path() / name;
        auto file = std::ofstream(path);
        file << content;
        return path;
    }
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigDir honours XDG_CONFIG_HOME", "[config]")
{
    auto const xdg = ScopedEnv("XDG_CONFIG_HOME", "/tmp/xdg-test");
    CHECK(defaultConfigDir() == "/tmp/xdg-test/mcpmux");
    CHECK(defaultConfigPath() == "/tmp/xdg-test/mcpmux/config.json");
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 3050);
    CHECK(config.server.apiToken.empty());
    CHECK(config.server.uiPassword == "admin");
    CHECK(config.server.sessionTtl == std::chrono::seconds(3600));
    CHECK(config.logging.level == "info");
    CHECK(config.timeouts.handshake == std::chrono::milliseconds(10000));
    CHECK(config.timeouts.call == std::chrono::milliseconds(60000));
    CHECK(config.discovery.maxParallel == 4);
    CHECK(config.tracking.maxEntries == 1000);
    CHECK(config.upstreams.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("mcpmux_test_config.json", R"({
        "server": {
            "host": "0.0.0.0",
            "port": 4000,
            "apiToken": "$MCPMUX_TEST_API_TOKEN",
            "uiPassword": "secret",
            "sessionTtlSeconds": 60,
            "workerThreads": 8
        },
        "logging": { "level": "debug", "file": "/tmp/mcpmux.log" },
        "timeouts": { "handshakeMs": 1500, "callMs": 2500, "shutdownGraceMs": 300 },
        "discovery": { "maxParallel": 2 },
        "tracking": { "maxEntries": 50, "retentionHours": 2 },
        "upstreams": {
            "remote": { "transport": "http", "url": "https://example.com/mcp", "bearerToken": "$REMOTE_TOKEN" },
            "local": { "transport": "stdio", "command": "cat", "args": ["-u"], "env": { "KEY": "value" } },
            "svc": { "transport": "service", "command": "sh", "port": 8123, "startupTimeout": 5 }
        }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 4000);
    CHECK(config.server.apiToken == "$MCPMUX_TEST_API_TOKEN");
    CHECK(config.server.uiPassword == "secret");
    CHECK(config.server.sessionTtl == std::chrono::seconds(60));
    CHECK(config.server.workerThreads == 8);
    CHECK(config.logging.level == "debug");
    CHECK(config.logging.file == "/tmp/mcpmux.log");
    CHECK(config.timeouts.handshake == std::chrono::milliseconds(1500));
    CHECK(config.timeouts.call == std::chrono::milliseconds(2500));
    CHECK(config.timeouts.discovery == std::chrono::milliseconds(30000));
    CHECK(config.timeouts.shutdownGrace == std::chrono::milliseconds(300));
    CHECK(config.discovery.maxParallel == 2);
    CHECK(config.tracking.maxEntries == 50);
    CHECK(config.tracking.retention == std::chrono::hours(2));

    REQUIRE(config.upstreams.size() == 3);
    // nlohmann::json objects iterate in key order
    CHECK(config.upstreams[0].id == "local");
    CHECK(config.upstreams[1].id == "remote");
    CHECK(config.upstreams[2].id == "svc");

    auto const* stdio = std::get_if<StdioBackendConfig>(&config.upstreams[0].config);
    REQUIRE(stdio != nullptr);
    CHECK(stdio->command == "cat");
    CHECK(stdio->args == std::vector<std::string> { "-u" });
    CHECK(stdio->env.at("KEY") == "value");

    auto const* http = std::get_if<HttpBackendConfig>(&config.upstreams[1].config);
    REQUIRE(http != nullptr);
    CHECK(http->url == "https://example.com/mcp");
    CHECK(http->bearerToken == "$REMOTE_TOKEN");

    auto const* service = std::get_if<ServiceBackendConfig>(&config.upstreams[2].config);
    REQUIRE(service != nullptr);
    CHECK(service->port == 8123);
    CHECK(service->healthCheckPath == "/mcp");
    CHECK(service->startupTimeout == std::chrono::seconds(5));

    std::filesystem::remove(tempPath);
}

TEST_CASE("parseConfig skips malformed upstreams but keeps the rest", "[config]")
{
    auto const root = nlohmann::json::parse(R"({
        "upstreams": {
            "good": { "transport": "http", "url": "http://localhost:9000/mcp" },
            "no-transport": { "url": "http://localhost:9001/mcp" },
            "bad-kind": { "transport": "carrier-pigeon" },
            "no-command": { "transport": "stdio" }
        }
    })");

    auto config = parseConfig(root);
    REQUIRE(config.has_value());
    REQUIRE(config->upstreams.size() == 1);
    CHECK(config->upstreams[0].id == "good");
}

TEST_CASE("parseConfig rejects malformed sections", "[config]")
{
    auto const invalid = {
        R"([])",
        R"({ "server": [] })",
        R"({ "server": { "port": 0 } })",
        R"({ "server": { "port": 70000 } })",
        R"({ "server": { "port": "80" } })",
        R"({ "server": { "host": 5 } })",
        R"({ "logging": { "level": "loud" } })",
        R"({ "timeouts": { "callMs": -1 } })",
        R"({ "discovery": { "maxParallel": 1.5 } })",
        R"({ "upstreams": [] })",
    };

    for (auto const* text: invalid)
    {
        auto config = parseConfig(nlohmann::json::parse(text));
        INFO(text);
        REQUIRE(!config.has_value());
        CHECK(config.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("mcpmux_test_invalid.json", "{ invalid json }");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("applyEnvironmentOverrides takes credentials and listener from the environment", "[config]")
{
    auto const token = ScopedEnv("MCP_API_TOKEN", "env-token");
    auto const password = ScopedEnv("UI_PASSWORD", "env-password");
    auto const host = ScopedEnv("HOST", "0.0.0.0");
    auto const port = ScopedEnv("PORT", "3999");
    auto const level = ScopedEnv("LOG_LEVEL", "DEBUG");

    auto config = AppConfig {};
    REQUIRE(applyEnvironmentOverrides(config).has_value());
    CHECK(config.server.apiToken == "env-token");
    CHECK(config.server.uiPassword == "env-password");
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 3999);
    CHECK(config.logging.level == "DEBUG");
}

TEST_CASE("applyEnvironmentOverrides leaves unset variables alone", "[config]")
{
    auto const token = ScopedEnv("MCP_API_TOKEN", nullptr);
    auto const password = ScopedEnv("UI_PASSWORD", nullptr);
    auto const host = ScopedEnv("HOST", nullptr);
    auto const port = ScopedEnv("PORT", nullptr);
    auto const level = ScopedEnv("LOG_LEVEL", nullptr);

    auto config = AppConfig {};
    config.server.apiToken = "from-file";
    REQUIRE(applyEnvironmentOverrides(config).has_value());
    CHECK(config.server.apiToken == "from-file");
    CHECK(config.server.uiPassword == "admin");
    CHECK(config.server.port == 3050);
}

TEST_CASE("applyEnvironmentOverrides rejects invalid values", "[config]")
{
    auto const level = ScopedEnv("LOG_LEVEL", nullptr);
    {
        auto const port = ScopedEnv("PORT", "not-a-port");
        auto config = AppConfig {};
        auto result = applyEnvironmentOverrides(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
    {
        auto const port = ScopedEnv("PORT", nullptr);
        auto const badLevel = ScopedEnv("LOG_LEVEL", "chatty");
        auto config = AppConfig {};
        auto result = applyEnvironmentOverrides(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("resolveServerSecrets expands environment references", "[config]")
{
    auto config = AppConfig {};
    config.server.apiToken = "$MCPMUX_TEST_API_TOKEN";
    config.server.uiPassword = "literal";

    {
        auto const unset = ScopedEnv("MCPMUX_TEST_API_TOKEN", nullptr);
        auto copy = config;
        auto result = resolveServerSecrets(copy);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.find("MCPMUX_TEST_API_TOKEN") != std::string::npos);
    }

    auto const set = ScopedEnv("MCPMUX_TEST_API_TOKEN", "resolved-token");
    REQUIRE(resolveServerSecrets(config).has_value());
    CHECK(config.server.apiToken == "resolved-token");
    CHECK(config.server.uiPassword == "literal");
}

TEST_CASE("aggregatorOptions carries timeouts and limits over", "[config]")
{
    auto config = AppConfig {};
    config.timeouts.call = std::chrono::milliseconds(1234);
    config.timeouts.stopGrace = std::chrono::milliseconds(99);
    config.discovery.maxParallel = 7;
    config.tracking.maxEntries = 11;

    auto const options = aggregatorOptions(config);
    CHECK(options.timeouts.call == std::chrono::milliseconds(1234));
    CHECK(options.supervisor.stopGrace == std::chrono::milliseconds(99));
    CHECK(options.maxParallel == 7);
    CHECK(options.tracking.maxEntries == 11);
    CHECK(options.tracking.retention == std::chrono::hours(24));
    CHECK(!options.connector);
}
