// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <upstream/ConnectionRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace mcpmux;
using namespace std::chrono_literals;
using test::ScopedEnv;

namespace
{
    auto stdioSpec(std::string id) -> BackendSpec
    {
        return BackendSpec {
            .id = std::move(id),
            .config = StdioBackendConfig { .command = "cat", .args = {}, .env = {}, .workingDirectory = {} },
        };
    }
} // namespace

TEST_CASE("ConnectionRegistry connects a backend to Ready", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());

    auto added = registry.add(test::httpSpec("remote"));
    REQUIRE(added.has_value());
    CHECK(*added == "remote");

    CHECK(registry.contains("remote"));
    CHECK(registry.status("remote") == BackendStatus::Ready);
    auto client = registry.get("remote");
    REQUIRE(client != nullptr);
    CHECK(client->kind() == TransportKind::Http);

    auto info = registry.info("remote");
    REQUIRE(info.has_value());
    CHECK(info->transportKind == TransportKind::Http);
    CHECK(info->lastError.empty());
}

TEST_CASE("ConnectionRegistry resolves secrets when connecting, not when configured", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto seenTokens = std::vector<std::string> {};
    auto control = std::make_shared<test::FakeBackendControl>();
    auto registry = ConnectionRegistry(supervisor, [&](const BackendSpec& spec) -> Result<std::unique_ptr<Transport>> {
        seenTokens.push_back(std::get<HttpBackendConfig>(spec.config).bearerToken);
        return std::make_unique<test::FakeMcpTransport>(control);
    });

    auto env = ScopedEnv("MCPMUX_TEST_T", nullptr);

    auto rejected = registry.add(test::httpSpec("a", "$MCPMUX_TEST_T"));
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::ConfigError);
    CHECK(rejected.error().message.find("MCPMUX_TEST_T") != std::string::npos);
    CHECK(!registry.contains("a"));
    CHECK(registry.list().empty());

    env.set("abc");
    auto added = registry.add(test::httpSpec("a", "$MCPMUX_TEST_T"));
    REQUIRE(added.has_value());
    CHECK(registry.status("a") == BackendStatus::Ready);

    env.set("rotated");
    REQUIRE(registry.reconnect("a").has_value());

    CHECK(seenTokens == std::vector<std::string> { "abc", "rotated" });
}

TEST_CASE("ConnectionRegistry rejects duplicate ids and invalid specs", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());

    REQUIRE(registry.add(test::httpSpec("remote")).has_value());

    auto duplicate = registry.add(stdioSpec("remote"));
    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::ConfigError);
    CHECK(registry.info("remote")->transportKind == TransportKind::Http);

    auto badName = registry.add(test::httpSpec("not valid!"));
    REQUIRE(!badName.has_value());
    CHECK(badName.error().code == ErrorCode::ConfigError);

    auto badCommand = registry.add(BackendSpec {
        .id = "ghost",
        .config = StdioBackendConfig { .command = "no-such-binary-mcpmux", .args = {}, .env = {}, .workingDirectory = {} },
    });
    REQUIRE(!badCommand.has_value());
    CHECK(badCommand.error().code == ErrorCode::ConfigError);

    CHECK(registry.list().size() == 1);
    CHECK(backends.control("remote")->connectCount == 1);
}

TEST_CASE("ConnectionRegistry rejects a service port that is already taken", "[registry]")
{
    namespace asio = boost::asio;
    auto ioc = asio::io_context {};
    auto taken = asio::ip::tcp::acceptor(ioc, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0));
    auto const port = taken.local_endpoint().port();

    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());

    auto added = registry.add(BackendSpec {
        .id = "svc",
        .config = ServiceBackendConfig { .command = "sh", .args = {}, .port = port },
    });
    REQUIRE(!added.has_value());
    CHECK(added.error().code == ErrorCode::ConfigError);
    CHECK(!registry.contains("svc"));
}

TEST_CASE("ConnectionRegistry keeps failed backends registered as Crashed", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    backends.control("flaky")->tools.failHandshake = true;
    auto registry = ConnectionRegistry(supervisor, backends.connector());

    auto added = registry.add(test::httpSpec("flaky"));
    REQUIRE(added.has_value());

    auto info = registry.info("flaky");
    REQUIRE(info.has_value());
    CHECK(info->status == BackendStatus::Crashed);
    CHECK(info->lastError.find("Handshake failed") != std::string::npos);
    CHECK(registry.get("flaky") == nullptr);

    // Once the backend behaves, reconnect brings it back.
    backends.control("flaky")->tools.failHandshake = false;
    auto reconnected = registry.reconnect("flaky");
    REQUIRE(reconnected.has_value());
    CHECK(registry.status("flaky") == BackendStatus::Ready);
    CHECK(registry.info("flaky")->lastError.empty());
}

TEST_CASE("ConnectionRegistry reports connector failures as Crashed", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto registry = ConnectionRegistry(supervisor, [](const BackendSpec&) -> Result<std::unique_ptr<Transport>> {
        return makeError(ErrorCode::SpawnError, "cannot start");
    });

    REQUIRE(registry.add(test::httpSpec("broken")).has_value());
    auto info = registry.info("broken");
    REQUIRE(info.has_value());
    CHECK(info->status == BackendStatus::Crashed);
    CHECK(info->lastError == "Connection failed: cannot start");
}

TEST_CASE("ConnectionRegistry markCrashed drops the client once", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());
    REQUIRE(registry.add(test::httpSpec("remote")).has_value());

    CHECK(registry.markCrashed("remote", "stdout closed"));
    CHECK(!registry.markCrashed("remote", "again"));
    CHECK(!registry.markCrashed("unknown", "whatever"));

    auto info = registry.info("remote");
    REQUIRE(info.has_value());
    CHECK(info->status == BackendStatus::Crashed);
    CHECK(info->lastError == "stdout closed");
    CHECK(registry.get("remote") == nullptr);
}

TEST_CASE("ConnectionRegistry markDisconnected crashes backends whose connection went away", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());
    REQUIRE(registry.add(test::httpSpec("alive")).has_value());
    REQUIRE(registry.add(test::httpSpec("gone")).has_value());

    CHECK(registry.markDisconnected().empty());

    backends.control("gone")->disconnected = true;
    CHECK(registry.markDisconnected() == std::vector<std::string> { "gone" });
    CHECK(registry.markDisconnected().empty());

    auto info = registry.info("gone");
    REQUIRE(info.has_value());
    CHECK(info->status == BackendStatus::Crashed);
    CHECK(info->lastError.starts_with("Lost connection to "));
    CHECK(registry.get("gone") == nullptr);
    CHECK(registry.status("alive") == BackendStatus::Ready);

    backends.control("gone")->disconnected = false;
    REQUIRE(registry.reconnect("gone").has_value());
    CHECK(registry.status("gone") == BackendStatus::Ready);
}

TEST_CASE("ConnectionRegistry add then remove leaves the registry as before", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());
    REQUIRE(registry.add(test::httpSpec("keep")).has_value());

    auto const before = registry.list();

    REQUIRE(registry.add(stdioSpec("temp")).has_value());
    CHECK(registry.list().size() == 2);
    REQUIRE(registry.remove("temp").has_value());

    auto const after = registry.list();
    REQUIRE(after.size() == before.size());
    CHECK(after[0].id == before[0].id);
    CHECK(after[0].status == before[0].status);
    CHECK(!registry.contains("temp"));

    auto again = registry.remove("temp");
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::NotFound);
}

TEST_CASE("ConnectionRegistry reconnect rejects unknown ids", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());

    auto result = registry.reconnect("nobody");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotFound);
}

TEST_CASE("ConnectionRegistry closeAll stops every backend", "[registry]")
{
    auto supervisor = ProcessSupervisor {};
    auto backends = test::FakeBackends {};
    auto registry = ConnectionRegistry(supervisor, backends.connector());
    REQUIRE(registry.add(test::httpSpec("a")).has_value());
    REQUIRE(registry.add(stdioSpec("b")).has_value());

    registry.closeAll();

    for (const auto& backend: registry.list())
        CHECK(backend.status == BackendStatus::Stopped);
    CHECK(registry.get("a") == nullptr);
}

TEST_CASE("ConnectionRegistry supervises service backends", "[registry][integration]")
{
    auto supervisor = ProcessSupervisor(SupervisorOptions { .healthInterval = 100ms, .probeTimeout = 500ms, .stopGrace = 1000ms });
    auto registry = ConnectionRegistry(
        supervisor, defaultConnector(), McpClientTimeouts { .handshake = 5000ms, .discovery = 5000ms, .call = 5000ms });

    auto const port = test::freePort();
    auto added = registry.add(BackendSpec {
        .id = "svc",
        .config = ServiceBackendConfig {
            .command = MCPMUX_FAKE_SERVER,
            .args = { "--http", std::to_string(port) },
            .port = port,
            .healthCheckPath = "/mcp",
            .startupTimeout = std::chrono::seconds(10),
            .env = {},
            .workingDirectory = {},
        },
    });
    REQUIRE(added.has_value());
    CHECK(registry.status("svc") == BackendStatus::Ready);

    auto process = registry.processOf("svc");
    REQUIRE(process.has_value());
    CHECK(supervisor.status(*process) == ProcessState::Running);

    auto client = registry.get("svc");
    REQUIRE(client != nullptr);
    CHECK(client->kind() == TransportKind::Service);
    auto tools = client->discover();
    REQUIRE(tools.has_value());
    CHECK(tools->size() == 5);

    REQUIRE(registry.remove("svc").has_value());
    CHECK(supervisor.status(*process).error().code == ErrorCode::NotFound);
}

TEST_CASE("ConnectionRegistry names the error code of a service that never gets healthy", "[registry][integration]")
{
    auto supervisor = ProcessSupervisor(SupervisorOptions { .healthInterval = 100ms, .probeTimeout = 200ms, .stopGrace = 500ms });
    auto registry = ConnectionRegistry(supervisor, defaultConnector());

    auto const port = test::freePort();
    auto added = registry.add(BackendSpec {
        .id = "mute",
        .config = ServiceBackendConfig {
            .command = "sleep",
            .args = { "30" },
            .port = port,
            .healthCheckPath = "/mcp",
            .startupTimeout = std::chrono::seconds(1),
            .env = {},
            .workingDirectory = {},
        },
    });
    REQUIRE(added.has_value());

    auto info = registry.info("mute");
    REQUIRE(info.has_value());
    CHECK(info->status == BackendStatus::Crashed);
    CHECK(info->lastError.starts_with("HealthCheckTimeout: Health check at "));
}
