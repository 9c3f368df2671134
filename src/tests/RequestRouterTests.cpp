// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <upstream/ConnectionRegistry.hpp>
#include <upstream/RequestRouter.hpp>
#include <upstream/RequestTracker.hpp>
#include <upstream/ToolCatalog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mcpmux;
using namespace std::chrono_literals;

namespace
{
    struct RouterFixture
    {
        explicit RouterFixture(Connector connector): registry(supervisor, std::move(connector), timeouts) {}

        McpClientTimeouts timeouts { .handshake = 5000ms, .discovery = 5000ms, .call = 5000ms };
        ProcessSupervisor supervisor;
        ConnectionRegistry registry;
        ToolCatalog catalog { registry };
        RequestTracker tracker;
        RequestRouter router { catalog, registry, tracker };

        void addReady(BackendSpec spec)
        {
            auto const id = spec.id;
            REQUIRE(registry.add(std::move(spec)).has_value());
            REQUIRE(registry.status(id) == BackendStatus::Ready);
            REQUIRE(catalog.refresh(id).has_value());
        }
    };

    auto textBlock(std::string text) -> nlohmann::json
    {
        return nlohmann::json { { "type", "text" }, { "text", std::move(text) } };
    }
} // namespace

TEST_CASE("normalizeToolResult keeps serializable results", "[router]")
{
    auto outcome = normalizeToolResult(
        "a_echo",
        ToolResult { .content = nlohmann::json::array({ textBlock("one"), textBlock("two") }),
                     .structuredContent = { { "n", 2 } },
                     .isError = false });

    auto const* success = std::get_if<ToolSuccess>(&outcome);
    REQUIRE(success != nullptr);
    CHECK(success->text == "one\n\ntwo");
    CHECK(success->structuredContent["n"] == 2);

    auto const result = toCallResult(outcome);
    CHECK(result["isError"] == false);
    CHECK(result["content"].size() == 2);
    CHECK(result["structuredContent"]["n"] == 2);
}

TEST_CASE("normalizeToolResult uses the serialized content when there is no text", "[router]")
{
    auto const image = nlohmann::json { { "type", "image" }, { "data", "AAAA" }, { "mimeType", "image/png" } };
    auto outcome = normalizeToolResult(
        "a_pic", ToolResult { .content = nlohmann::json::array({ image }), .structuredContent = nullptr, .isError = false });

    auto const* success = std::get_if<ToolSuccess>(&outcome);
    REQUIRE(success != nullptr);
    CHECK(success->text == nlohmann::json::array({ image }).dump());
    CHECK(!toCallResult(outcome).contains("structuredContent"));
}

TEST_CASE("normalizeToolResult degrades content that is not valid UTF-8", "[router]")
{
    auto outcome = normalizeToolResult(
        "a_binary",
        ToolResult { .content = nlohmann::json::array({ textBlock(std::string("\xff\xfe", 2)) }),
                     .structuredContent = nullptr,
                     .isError = false });

    auto const* degraded = std::get_if<ToolDegraded>(&outcome);
    REQUIRE(degraded != nullptr);
    CHECK(degraded->originalType == "text");
    CHECK(!degraded->text.empty());

    auto const result = toCallResult(outcome);
    CHECK(result["isError"] == false);
    CHECK(result["content"][0]["type"] == "text");
    CHECK_NOTHROW(result.dump());
}

TEST_CASE("normalizeToolResult turns isError into an execution failure", "[router]")
{
    auto outcome = normalizeToolResult(
        "a_fail",
        ToolResult { .content = nlohmann::json::array({ textBlock("boom") }), .structuredContent = nullptr, .isError = true });

    auto const* failure = std::get_if<ToolExecutionFailure>(&outcome);
    REQUIRE(failure != nullptr);
    CHECK(failure->message == "boom");
    CHECK(toCallResult(outcome)["isError"] == true);
    CHECK(toCallResult(outcome)["content"][0]["text"] == "boom");

    auto silent = normalizeToolResult("a_fail", ToolResult { .content = nlohmann::json::array(), .structuredContent = nullptr, .isError = true });
    auto const* silentFailure = std::get_if<ToolExecutionFailure>(&silent);
    REQUIRE(silentFailure != nullptr);
    CHECK(silentFailure->message == "Tool 'a_fail' reported an error");
    CHECK(toCallResult(silent)["content"][0]["text"] == "Tool 'a_fail' reported an error");
}

TEST_CASE("RequestRouter forwards calls under the original tool name", "[router]")
{
    auto backends = test::FakeBackends {};
    auto fixture = RouterFixture(backends.connector());
    fixture.addReady(test::httpSpec("alpha"));

    auto outcome = fixture.router.call("alpha_add", { { "a", 2 }, { "b", 3 } }, "10.0.0.1");
    REQUIRE(outcome.has_value());
    auto const* success = std::get_if<ToolSuccess>(&*outcome);
    REQUIRE(success != nullptr);
    CHECK(success->text == "5");
    CHECK(success->structuredContent["sum"] == 5);

    auto const requests = fixture.tracker.list();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].backendId == "alpha");
    CHECK(requests[0].toolName == "add");
    CHECK(requests[0].clientAddress == "10.0.0.1");
    CHECK(requests[0].status == RequestStatus::Completed);
    CHECK(requests[0].result["isError"] == false);
}

TEST_CASE("RequestRouter reports tool failures as outcomes", "[router]")
{
    auto backends = test::FakeBackends {};
    auto fixture = RouterFixture(backends.connector());
    fixture.addReady(test::httpSpec("alpha"));

    auto outcome = fixture.router.call("alpha_fail", nlohmann::json::object());
    REQUIRE(outcome.has_value());
    CHECK(std::holds_alternative<ToolExecutionFailure>(*outcome));

    auto const requests = fixture.tracker.list();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].status == RequestStatus::Failed);
    CHECK(requests[0].error == "boom");
    CHECK(fixture.registry.status("alpha") == BackendStatus::Ready);
}

TEST_CASE("RequestRouter degrades results that do not serialize", "[router]")
{
    auto backends = test::FakeBackends {};
    backends.control("alpha")->tools.tools = { "binary" };
    auto fixture = RouterFixture(backends.connector());
    fixture.addReady(test::httpSpec("alpha"));

    auto outcome = fixture.router.call("alpha_binary", nlohmann::json::object());
    REQUIRE(outcome.has_value());
    CHECK(std::holds_alternative<ToolDegraded>(*outcome));
    CHECK(fixture.tracker.list()[0].status == RequestStatus::Completed);
}

TEST_CASE("RequestRouter does not track unknown tools", "[router]")
{
    auto backends = test::FakeBackends {};
    auto fixture = RouterFixture(backends.connector());
    fixture.addReady(test::httpSpec("alpha"));

    auto outcome = fixture.router.call("unknown_tool", nlohmann::json::object());
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::ToolNotFound);
    CHECK(fixture.tracker.size() == 0);
    CHECK(fixture.registry.status("alpha") == BackendStatus::Ready);
}

TEST_CASE("RequestRouter rejects calls to backends that are not ready", "[router]")
{
    auto backends = test::FakeBackends {};
    auto fixture = RouterFixture(backends.connector());
    fixture.addReady(test::httpSpec("alpha"));

    // The catalog still lists the tool, the registry no longer serves it.
    REQUIRE(fixture.registry.markCrashed("alpha", "gone"));

    auto outcome = fixture.router.call("alpha_echo", { { "text", "hi" } });
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::BackendUnavailable);

    auto const requests = fixture.tracker.list();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].status == RequestStatus::Failed);
}

TEST_CASE("RequestRouter leaves remote backends Ready on transport errors", "[router]")
{
    auto backends = test::FakeBackends {};
    auto fixture = RouterFixture(backends.connector());
    fixture.addReady(test::httpSpec("alpha"));

    backends.control("alpha")->broken = true;
    auto outcome = fixture.router.call("alpha_echo", { { "text", "hi" } });
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::TransportError);
    CHECK(fixture.registry.status("alpha") == BackendStatus::Ready);
    CHECK(fixture.catalog.toolCount("alpha") == 3);
    CHECK(fixture.tracker.list()[0].status == RequestStatus::Failed);
}

TEST_CASE("RequestRouter marks a stdio backend Crashed when its process dies", "[router][integration]")
{
    auto fixture = RouterFixture(defaultConnector());
    fixture.addReady(BackendSpec {
        .id = "local",
        .config = StdioBackendConfig { .command = MCPMUX_FAKE_SERVER, .args = {}, .env = {}, .workingDirectory = {} },
    });
    REQUIRE(fixture.catalog.toolCount("local") == 5);

    auto echoed = fixture.router.call("local_echo", { { "text", "still here" } });
    REQUIRE(echoed.has_value());
    CHECK(std::get<ToolSuccess>(*echoed).text == "still here");

    auto crashed = fixture.router.call("local_crash", nlohmann::json::object());
    REQUIRE(!crashed.has_value());
    CHECK(crashed.error().code == ErrorCode::TransportError);

    auto info = fixture.registry.info("local");
    REQUIRE(info.has_value());
    CHECK(info->status == BackendStatus::Crashed);
    CHECK(!info->lastError.empty());
    CHECK(fixture.catalog.toolCount("local") == 0);

    auto after = fixture.router.call("local_echo", { { "text", "gone" } });
    REQUIRE(!after.has_value());
    CHECK(after.error().code == ErrorCode::ToolNotFound);
}
