// SPDX-License-Identifier: Apache-2.0
#include <plugin/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

using namespace voicecore;

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport receive fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.receive();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport can spawn and communicate with a simple process", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "cat",
        .args = {},
        .env = {},
    };

    auto startResult = transport.start(config);
    REQUIRE(startResult.has_value());
    CHECK(transport.isConnected());

    // Send a JSON message
    auto msg = nlohmann::json { { "test", "hello" } };
    auto sendResult = transport.send(msg);
    REQUIRE(sendResult.has_value());

    // Read it back (cat echoes stdin to stdout)
    auto recvResult = transport.receive();
    REQUIRE(recvResult.has_value());
    CHECK((*recvResult)["test"] == "hello");

    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "/nonexistent/command/that/does/not/exist",
        .args = {},
        .env = {},
    };

    auto result = transport.start(config);
    // posix_spawnp may succeed even for non-existent commands on some systems,
    // but the process will fail immediately. We check that either start fails
    // or subsequent operations fail.
    if (result.has_value())
    {
        // If spawn succeeded, the process should have died
        auto recvResult = transport.receive();
        CHECK(!recvResult.has_value());
    }
    else
    {
        CHECK(result.error().code == ErrorCode::TransportError);
    }
}

TEST_CASE("StdioTransport receive times out when the process stays silent", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "sh", .args = { "-c", "sleep 2" }, .env = {} })
                .has_value());

    auto result = transport.receive(std::chrono::milliseconds(50));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(transport.isConnected());
}

TEST_CASE("StdioTransport passes extra environment to the process", "[transport]")
{
    auto transport = StdioTransport();
    auto config = StdioTransportConfig {
        .command = "sh",
        .args = { "-c", R"(echo "{\"token\":\"$VOICECORE_TEST_TOKEN\"}")" },
        .env = { { "VOICECORE_TEST_TOKEN", "abc123" } },
    };
    REQUIRE(transport.start(config).has_value());

    auto result = transport.receive(std::chrono::seconds(5));
    REQUIRE(result.has_value());
    CHECK((*result)["token"] == "abc123");
}

TEST_CASE("StdioTransport reports a closed output stream", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "true", .args = {}, .env = {} }).has_value());

    auto result = transport.receive(std::chrono::seconds(5));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails once the process has exited", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "true", .args = {}, .env = {} }).has_value());

    // Writes land in the pipe buffer until the child is gone, then report a broken pipe.
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    auto result = VoidResult {};
    while (result.has_value() && std::chrono::steady_clock::now() < deadline)
    {
        result = transport.send(nlohmann::json { { "jsonrpc", "2.0" }, { "method", "ping" } });
        if (result.has_value())
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(!transport.isConnected());
}
