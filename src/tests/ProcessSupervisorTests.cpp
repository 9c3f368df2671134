// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <upstream/ProcessSupervisor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <format>
#include <string>
#include <vector>

using namespace mcpmux;
using namespace std::chrono_literals;

namespace
{
    auto fastOptions() -> SupervisorOptions
    {
        return SupervisorOptions { .healthInterval = 100ms, .probeTimeout = 500ms, .stopGrace = 1000ms };
    }

    auto fakeServiceSpec(std::string id, uint16_t port) -> ProcessSpec
    {
        return ProcessSpec {
            .backendId = std::move(id),
            .command = MCPMUX_FAKE_SERVER,
            .args = { "--http", std::to_string(port) },
            .env = {},
            .workingDirectory = {},
            .port = port,
            .healthCheckPath = "/mcp",
            .startupTimeout = 10000ms,
        };
    }

    /// Waits for an event of @p backendId reaching @p state.
    auto awaitEvent(ProcessSupervisor& supervisor, std::string_view backendId, ProcessState state)
        -> std::optional<ProcessEvent>
    {
        auto const deadline = std::chrono::steady_clock::now() + 10s;
        while (std::chrono::steady_clock::now() < deadline)
        {
            auto event = supervisor.events().receive(200ms);
            if (event && event->backendId == backendId && event->state == state)
                return event;
        }
        return std::nullopt;
    }
} // namespace

TEST_CASE("ProcessSupervisor brings a service up once its health check answers", "[supervisor][integration]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto const port = test::freePort();
    auto const handle = supervisor.start(fakeServiceSpec("svc", port));

    auto settled = supervisor.waitUntilSettled(handle, 10s);
    REQUIRE(settled.has_value());
    CHECK(*settled == ProcessState::Running);

    auto info = supervisor.info(handle);
    REQUIRE(info.has_value());
    CHECK(info->backendId == "svc");
    CHECK(info->pid > 0);
    CHECK(info->healthCheckUrl == std::format("http://127.0.0.1:{}/mcp", port));
    CHECK(!info->exitCode.has_value());

    REQUIRE(supervisor.stop(handle).has_value());
    CHECK(supervisor.status(handle) == ProcessState::Stopped);
}

TEST_CASE("ProcessSupervisor publishes the lifecycle as events", "[supervisor][integration]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto const handle = supervisor.start(fakeServiceSpec("svc", test::freePort()));

    auto states = std::vector<ProcessState> {};
    auto const deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline
           && (states.empty() || states.back() != ProcessState::Running))
    {
        if (auto event = supervisor.events().receive(200ms))
        {
            CHECK(event->handle == handle);
            states.push_back(event->state);
        }
    }

    CHECK(states
          == std::vector<ProcessState> { ProcessState::Launching, ProcessState::HealthChecking, ProcessState::Running });
}

TEST_CASE("ProcessSupervisor reports an unexpected exit as Crashed", "[supervisor][integration]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto const handle = supervisor.start(fakeServiceSpec("svc", test::freePort()));
    REQUIRE(supervisor.waitUntilSettled(handle, 10s) == ProcessState::Running);

    auto const info = supervisor.info(handle);
    REQUIRE(info.has_value());
    REQUIRE(::kill(info->pid, SIGKILL) == 0);

    auto crashed = awaitEvent(supervisor, "svc", ProcessState::Crashed);
    REQUIRE(crashed.has_value());
    CHECK(crashed->handle == handle);
    CHECK(crashed->exitCode == 128 + SIGKILL);

    auto after = supervisor.info(handle);
    REQUIRE(after.has_value());
    CHECK(after->state == ProcessState::Crashed);
    CHECK(after->lastError.find("exited unexpectedly") != std::string::npos);
}

TEST_CASE("ProcessSupervisor reports a command that cannot be spawned", "[supervisor]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto spec = fakeServiceSpec("ghost", test::freePort());
    spec.command = "/nonexistent/mcp-server";
    auto const handle = supervisor.start(spec);

    CHECK(supervisor.waitUntilSettled(handle, 5s) == ProcessState::Crashed);
    auto info = supervisor.info(handle);
    REQUIRE(info.has_value());
    CHECK(!info->lastError.empty());
    CHECK(info->failure == ErrorCode::SpawnError);
}

TEST_CASE("ProcessSupervisor notices a process that exits during startup", "[supervisor]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto spec = fakeServiceSpec("early", test::freePort());
    spec.command = "sh";
    spec.args = { "-c", "exit 7" };
    auto const handle = supervisor.start(spec);

    CHECK(supervisor.waitUntilSettled(handle, 5s) == ProcessState::Crashed);
    auto info = supervisor.info(handle);
    REQUIRE(info.has_value());
    CHECK(info->exitCode == 7);
    CHECK(info->lastError.find("during startup") != std::string::npos);
    CHECK(!info->failure.has_value());
}

TEST_CASE("ProcessSupervisor gives up when the health check never succeeds", "[supervisor]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto spec = fakeServiceSpec("mute", test::freePort());
    spec.command = "sleep";
    spec.args = { "30" };
    spec.startupTimeout = 500ms;
    auto const handle = supervisor.start(spec);

    CHECK(supervisor.waitUntilSettled(handle, 10s) == ProcessState::Crashed);
    auto info = supervisor.info(handle);
    REQUIRE(info.has_value());
    CHECK(info->lastError.find("Health check") != std::string::npos);
    CHECK(info->failure == ErrorCode::HealthCheckTimeout);
}

TEST_CASE("ProcessSupervisor restart launches the process again", "[supervisor][integration]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto const handle = supervisor.start(fakeServiceSpec("svc", test::freePort()));
    REQUIRE(supervisor.waitUntilSettled(handle, 10s) == ProcessState::Running);
    auto const firstPid = supervisor.info(handle)->pid;

    REQUIRE(supervisor.restart(handle).has_value());
    REQUIRE(supervisor.waitUntilSettled(handle, 10s) == ProcessState::Running);

    auto info = supervisor.info(handle);
    REQUIRE(info.has_value());
    CHECK(info->restartCount == 1);
    CHECK(info->pid != firstPid);
}

TEST_CASE("ProcessSupervisor rejects unknown handles", "[supervisor]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    CHECK(supervisor.stop(42).error().code == ErrorCode::NotFound);
    CHECK(supervisor.restart(42).error().code == ErrorCode::NotFound);
    CHECK(supervisor.status(42).error().code == ErrorCode::NotFound);
}

TEST_CASE("ProcessSupervisor release forgets the handle", "[supervisor][integration]")
{
    auto supervisor = ProcessSupervisor(fastOptions());
    auto const handle = supervisor.start(fakeServiceSpec("svc", test::freePort()));
    REQUIRE(supervisor.waitUntilSettled(handle, 10s) == ProcessState::Running);

    REQUIRE(supervisor.release(handle).has_value());
    CHECK(supervisor.status(handle).error().code == ErrorCode::NotFound);
}
