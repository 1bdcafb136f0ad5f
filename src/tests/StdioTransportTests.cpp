// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>
#include <proxy/ContextCatalog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <string>

using namespace envproxy;
using namespace std::chrono_literals;

namespace
{

auto shell(std::string script) -> LaunchSpec
{
    return LaunchSpec {
        .command = "/bin/sh",
        .args = { "-c", std::move(script) },
        .environment = processEnvironment(),
    };
}

} // namespace

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.send(nlohmann::json { { "test", true } }, Clock::now() + 1s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::WriteError);
}

TEST_CASE("StdioTransport receive fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.receive(Clock::now() + 100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport can spawn and communicate with a simple process", "[transport]")
{
    auto transport = StdioTransport();

    auto startResult = transport.start(LaunchSpec {
        .command = "cat",
        .args = {},
        .environment = processEnvironment(),
    });
    REQUIRE(startResult.has_value());
    CHECK(transport.isConnected());

    auto sendResult = transport.send(nlohmann::json { { "test", "hello" } }, Clock::now() + 5s);
    REQUIRE(sendResult.has_value());

    // cat echoes stdin to stdout
    auto recvResult = transport.receive(Clock::now() + 5s);
    REQUIRE(recvResult.has_value());
    CHECK((*recvResult)["test"] == "hello");

    transport.close(DefaultGracePeriod, DefaultKillPeriod);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport skips output that is not a JSON object", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(shell(R"(echo "starting up"; echo "[1,2]"; echo "{broken"; echo "noise" >&2; )"
                                  R"(echo '{"ok":true}')"))
                .has_value());

    auto message = transport.receive(Clock::now() + 5s);
    REQUIRE(message.has_value());
    CHECK((*message)["ok"] == true);

    // The process exited, so the stream is closed now.
    auto next = transport.receive(Clock::now() + 5s);
    REQUIRE(!next.has_value());
    CHECK(next.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport receive gives up at the deadline", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(LaunchSpec { .command = "cat", .args = {}, .environment = processEnvironment() })
                .has_value());

    auto const before = Clock::now();
    auto result = transport.receive(before + 150ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(Clock::now() - before >= 150ms);
    CHECK(transport.isConnected());
}

TEST_CASE("StdioTransport passes exactly the given environment", "[transport]")
{
    ::setenv("ENVPROXY_PARENT_ONLY", "leaked", 1);

    auto transport = StdioTransport();
    auto started = transport.start(LaunchSpec {
        .command = "/bin/sh",
        .args = { "-c",
                  R"(echo "{\"value\":\"$ENVPROXY_VALUE\",\"parent\":\"${ENVPROXY_PARENT_ONLY:-unset}\"}")" },
        .environment = { { "ENVPROXY_VALUE", "from-context" } },
    });
    ::unsetenv("ENVPROXY_PARENT_ONLY");
    REQUIRE(started.has_value());

    auto message = transport.receive(Clock::now() + 5s);
    REQUIRE(message.has_value());
    CHECK((*message)["value"] == "from-context");
    CHECK((*message)["parent"] == "unset");
}

TEST_CASE("StdioTransport close escalates for a backend that ignores its input", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(shell(R"(trap "" TERM; while :; do sleep 1; done)")).has_value());

    auto const before = Clock::now();
    transport.close(100ms, 100ms);
    CHECK(!transport.isConnected());
    CHECK(Clock::now() - before < 5s);

    // Closing again is a no-op.
    transport.close(100ms, 100ms);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails after close", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(LaunchSpec { .command = "cat", .args = {}, .environment = processEnvironment() })
                .has_value());
    transport.close(DefaultGracePeriod, DefaultKillPeriod);

    auto result = transport.send(nlohmann::json { { "late", true } }, Clock::now() + 1s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::WriteError);
}

TEST_CASE("StdioTransport send gives up at its deadline when the backend stops reading", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(shell("exec sleep 30")).has_value());

    // Far larger than a pipe buffer, so the write has to wait for a reader that never comes.
    auto const large = nlohmann::json { { "padding", std::string(1024 * 1024, 'x') } };

    auto const before = Clock::now();
    auto result = transport.send(large, Clock::now() + 300ms);
    auto const elapsed = Clock::now() - before;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::WriteError);
    CHECK(elapsed >= 250ms);
    CHECK(elapsed < 3s);

    transport.close(100ms, 100ms);
}

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto result = StdioTransport::open(LaunchSpec {
        .command = "/nonexistent/command/that/does/not/exist",
        .args = {},
        .environment = processEnvironment(),
    });

    // Some libcs report exec failures only through the child's exit; then the stream closes immediately.
    if (result.has_value())
    {
        auto recvResult = (*result)->receive(Clock::now() + 5s);
        CHECK(!recvResult.has_value());
    }
    else
    {
        CHECK(result.error().code == ErrorCode::SpawnError);
    }
}
