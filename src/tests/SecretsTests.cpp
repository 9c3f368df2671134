// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <core/Secrets.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpmux;
using test::ScopedEnv;

TEST_CASE("resolveSecret returns literal values verbatim", "[secrets]")
{
    auto value = resolveSecret("plain-token", "bearerToken");
    REQUIRE(value.has_value());
    CHECK(*value == "plain-token");
    CHECK(!isSecretReference("plain-token"));
    CHECK(isSecretReference("$TOKEN"));
}

TEST_CASE("resolveSecret reads the referenced variable at call time", "[secrets]")
{
    auto env = ScopedEnv("MCPMUX_SECRET_UNDER_TEST", "first");
    auto value = resolveSecret("$MCPMUX_SECRET_UNDER_TEST", "bearerToken");
    REQUIRE(value.has_value());
    CHECK(*value == "first");

    env.set("second");
    value = resolveSecret("$MCPMUX_SECRET_UNDER_TEST", "bearerToken");
    REQUIRE(value.has_value());
    CHECK(*value == "second");
}

TEST_CASE("resolveSecret never silently empties a value", "[secrets]")
{
    SECTION("unset")
    {
        auto const env = ScopedEnv("MCPMUX_SECRET_UNDER_TEST", nullptr);
        auto value = resolveSecret("$MCPMUX_SECRET_UNDER_TEST", "backend 'x' bearerToken");
        REQUIRE(!value.has_value());
        CHECK(value.error().code == ErrorCode::ConfigError);
        CHECK(value.error().message.find("MCPMUX_SECRET_UNDER_TEST") != std::string::npos);
        CHECK(value.error().message.find("backend 'x' bearerToken") != std::string::npos);
    }

    SECTION("empty")
    {
        auto const env = ScopedEnv("MCPMUX_SECRET_UNDER_TEST", "");
        auto value = resolveSecret("$MCPMUX_SECRET_UNDER_TEST", "bearerToken");
        REQUIRE(!value.has_value());
        CHECK(value.error().code == ErrorCode::ConfigError);
    }

    SECTION("malformed reference")
    {
        for (auto const* reference: { "$", "$1ABC", "$A-B" })
        {
            auto value = resolveSecret(reference, "bearerToken");
            REQUIRE(!value.has_value());
            CHECK(value.error().code == ErrorCode::ConfigError);
        }
    }
}

TEST_CASE("resolveSecrets resolves every entry or fails as a whole", "[secrets]")
{
    auto const set = ScopedEnv("MCPMUX_SECRET_UNDER_TEST", "resolved");
    auto const unset = ScopedEnv("MCPMUX_SECRET_MISSING", nullptr);

    auto values = resolveSecrets({ { "A", "literal" }, { "B", "$MCPMUX_SECRET_UNDER_TEST" } }, "env");
    REQUIRE(values.has_value());
    CHECK(values->at("A") == "literal");
    CHECK(values->at("B") == "resolved");

    auto failed = resolveSecrets({ { "A", "literal" }, { "B", "$MCPMUX_SECRET_MISSING" } }, "env");
    REQUIRE(!failed.has_value());
    CHECK(failed.error().message.find("env.B") != std::string::npos);
}

TEST_CASE("maskSecret keeps at most four characters", "[secrets]")
{
    CHECK(maskSecret("abcdefgh") == "abcd****");
    CHECK(maskSecret("abc") == "****");
    CHECK(maskSecret("") == "****");
}
