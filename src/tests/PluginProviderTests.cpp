// SPDX-License-Identifier: Apache-2.0
#include <plugin/JsonRpc.hpp>
#include <plugin/PluginCodec.hpp>
#include <plugin/PluginProvider.hpp>
#include <provider/ProviderManager.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace voicecore;

namespace
{

/// Messages exchanged with a fake plugin. The responder sees every sent
/// message and returns the messages the plugin answers with.
struct FakePlugin
{
    std::function<std::vector<nlohmann::json>(const nlohmann::json& sent)> responder;
    std::mutex mutex;
    std::vector<nlohmann::json> sent;
    std::deque<nlohmann::json> incoming;
    bool connected = true;
    int closeCount = 0;
};

class FakeTransport: public Transport
{
  public:
    explicit FakeTransport(std::shared_ptr<FakePlugin> plugin): _plugin(std::move(plugin)) {}

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        auto const lock = std::lock_guard { _plugin->mutex };
        _plugin->sent.push_back(message);
        if (_plugin->responder)
            for (auto& reply: _plugin->responder(message))
                _plugin->incoming.push_back(std::move(reply));
        return {};
    }

    auto receive(std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json> override
    {
        {
            auto const lock = std::lock_guard { _plugin->mutex };
            if (!_plugin->incoming.empty())
            {
                auto message = std::move(_plugin->incoming.front());
                _plugin->incoming.pop_front();
                return message;
            }
            if (!_plugin->connected)
                return makeError(ErrorCode::TransportError, "closed");
        }
        std::this_thread::sleep_for(std::min(timeout.value_or(std::chrono::milliseconds(1)),
                                             std::chrono::milliseconds(1)));
        return makeError(ErrorCode::TimeoutError, "nothing yet");
    }

    void close() override
    {
        auto const lock = std::lock_guard { _plugin->mutex };
        _plugin->connected = false;
        ++_plugin->closeCount;
    }

    auto isConnected() const -> bool override
    {
        auto const lock = std::lock_guard { _plugin->mutex };
        return _plugin->connected;
    }

  private:
    std::shared_ptr<FakePlugin> _plugin;
};

template <ProviderKind Kind>
auto makePlugin(const std::shared_ptr<FakePlugin>& plugin) -> PluginProvider<Kind>
{
    return PluginProvider<Kind>(
        PluginProviderConfig { .name = "fake", .process = {}, .pollInterval = std::chrono::milliseconds(5) },
        [plugin](const PluginProviderConfig&) -> Result<std::unique_ptr<Transport>> {
            return std::make_unique<FakeTransport>(plugin);
        });
}

auto chunkFor(const nlohmann::json& request, nlohmann::json params) -> nlohmann::json
{
    params["id"] = request["id"];
    return jsonrpc::makeNotification("chunk", std::move(params));
}

auto responseFor(const nlohmann::json& request) -> nlohmann::json
{
    return nlohmann::json { { "jsonrpc", "2.0" }, { "id", request["id"] }, { "result", nlohmann::json::object() } };
}

} // namespace

TEST_CASE("PluginProvider streams chunks until the final response", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    plugin->responder = [](const nlohmann::json& request) {
        return std::vector<nlohmann::json> {
            chunkFor(request, { { "text", "Hello" } }),
            chunkFor(request, { { "text", " there" } }),
            responseFor(request),
        };
    };

    auto provider = makePlugin<ProviderKind::Generation>(plugin);
    REQUIRE(provider.start().has_value());
    CHECK(provider.isConnected());

    auto request = GenerationRequest { .turn = 3, .messages = { ChatMessage { .role = Role::User, .content = "hi" } } };
    auto text = std::string {};
    auto result = provider.streamRequest(request, [&](const TextChunk& chunk) { text += chunk.delta; }, {});

    REQUIRE(result.has_value());
    CHECK(text == "Hello there");

    REQUIRE(plugin->sent.size() == 1);
    CHECK(plugin->sent[0]["method"] == "generate");
    CHECK(plugin->sent[0]["params"]["turn"] == 3);
    CHECK(plugin->sent[0]["params"]["messages"][0]["role"] == "user");
    CHECK(plugin->sent[0]["params"]["messages"][0]["content"] == "hi");
}

TEST_CASE("PluginProvider reports an error response with the kind's error code", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    plugin->responder = [](const nlohmann::json& request) {
        return std::vector<nlohmann::json> { nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", request["id"] },
            { "error", { { "code", -32000 }, { "message", "model overloaded" } } },
        } };
    };

    auto provider = makePlugin<ProviderKind::Transcription>(plugin);
    REQUIRE(provider.start().has_value());

    auto result = provider.streamRequest(TranscriptionRequest { .turn = 1, .samples = { 0.0f, 0.5f } },
                                         [](const TranscriptChunk&) {},
                                         {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TranscriptionError);
    CHECK(result.error().message.find("model overloaded") != std::string::npos);
}

TEST_CASE("PluginProvider skips messages that belong to earlier requests", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    plugin->responder = [](const nlohmann::json& request) {
        auto stale = nlohmann::json { { "id", request["id"].get<std::int64_t>() + 100 } };
        return std::vector<nlohmann::json> {
            chunkFor(stale, { { "text", "late" } }),
            responseFor(stale),
            jsonrpc::makeNotification("log", { { "message", "working" } }),
            chunkFor(request, { { "text", "fresh" } }),
            responseFor(request),
        };
    };

    auto provider = makePlugin<ProviderKind::Generation>(plugin);
    REQUIRE(provider.start().has_value());

    auto deltas = std::vector<std::string> {};
    auto result = provider.streamRequest(
        GenerationRequest { .turn = 1, .messages = {} }, [&](const TextChunk& chunk) { deltas.push_back(chunk.delta); }, {});
    REQUIRE(result.has_value());
    CHECK(deltas == std::vector<std::string> { "fresh" });
}

TEST_CASE("PluginProvider fails a request on a malformed chunk", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    plugin->responder = [](const nlohmann::json& request) {
        return std::vector<nlohmann::json> { chunkFor(request, { { "sampleRate", 16000 } }), responseFor(request) };
    };

    auto provider = makePlugin<ProviderKind::Synthesis>(plugin);
    REQUIRE(provider.start().has_value());

    auto result = provider.streamRequest(SynthesisRequest { .turn = 1, .text = "Hi." }, [](const AudioChunk&) {}, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("PluginProvider announces cancellation to the plugin", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    auto provider = makePlugin<ProviderKind::Synthesis>(plugin);
    REQUIRE(provider.start().has_value());

    auto stopSource = std::stop_source {};
    auto worker = std::jthread([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stopSource.request_stop();
    });

    auto result = provider.streamRequest(
        SynthesisRequest { .turn = 2, .text = "Long reply." }, [](const AudioChunk&) {}, stopSource.get_token());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);

    auto const lock = std::lock_guard { plugin->mutex };
    REQUIRE(plugin->sent.size() == 2);
    CHECK(plugin->sent[1]["method"] == "cancel");
    CHECK(plugin->sent[1]["params"]["id"] == plugin->sent[0]["id"]);
}

TEST_CASE("PluginProvider fails when the plugin goes away", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    plugin->responder = [&](const nlohmann::json&) {
        plugin->connected = false;
        return std::vector<nlohmann::json> {};
    };

    auto provider = makePlugin<ProviderKind::Generation>(plugin);
    REQUIRE(provider.start().has_value());

    auto result = provider.streamRequest(GenerationRequest {}, [](const TextChunk&) {}, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::GenerationError);
    CHECK(!provider.isConnected());

    auto again = provider.streamRequest(GenerationRequest {}, [](const TextChunk&) {}, {});
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::TransportError);
}

TEST_CASE("PluginProvider stop closes the transport once", "[plugin]")
{
    auto plugin = std::make_shared<FakePlugin>();
    auto provider = makePlugin<ProviderKind::Generation>(plugin);
    REQUIRE(provider.start().has_value());

    provider.stop();
    provider.stop();
    CHECK(plugin->closeCount == 1);
    CHECK(!provider.isConnected());
}

TEST_CASE("PluginProvider start reports a failing factory", "[plugin]")
{
    auto provider = GenerationPlugin(PluginProviderConfig { .name = "broken", .process = {} },
                                     [](const PluginProviderConfig&) -> Result<std::unique_ptr<Transport>> {
                                         return makeError(ErrorCode::TransportError, "spawn failed");
                                     });
    auto result = provider.start();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(!provider.isConnected());
}

TEST_CASE("PluginProvider talks to a real process over stdio", "[plugin]")
{
    // Answers every request with one chunk followed by the response.
    auto const script = std::string(
        R"(while read -r line; do )"
        R"(id=$(echo "$line" | sed -n 's/.*"id":\([0-9]*\).*/\1/p'); )"
        R"(echo "{\"jsonrpc\":\"2.0\",\"method\":\"chunk\",\"params\":{\"id\":$id,\"text\":\"pong\"}}"; )"
        R"(echo "{\"jsonrpc\":\"2.0\",\"id\":$id,\"result\":{}}"; )"
        R"(done)");

    auto provider = GenerationPlugin(PluginProviderConfig {
        .name = "shell",
        .process = StdioTransportConfig { .command = "sh", .args = { "-c", script }, .env = {} },
    });
    REQUIRE(provider.start().has_value());

    auto text = std::string {};
    auto result = provider.streamRequest(
        GenerationRequest { .turn = 1, .messages = {} }, [&](const TextChunk& chunk) { text += chunk.delta; }, {});
    REQUIRE(result.has_value());
    CHECK(text == "pong");
    provider.stop();
}

TEST_CASE("PluginProvider whose process exited falls back to the next provider", "[plugin]")
{
    auto plugin = std::make_shared<GenerationPlugin>(PluginProviderConfig {
        .name = "exited",
        .process = StdioTransportConfig { .command = "true", .args = {}, .env = {} },
    });
    auto local = std::make_shared<testing::ScriptedGenerator>("local", testing::generating({ "still here" }));

    auto manager = GenerationManager(ProviderManagerConfig {
        .breaker = CircuitBreakerConfig { .failureThreshold = 1, .cooldown = std::chrono::seconds(60) },
        .firstChunkTimeout = std::chrono::seconds(5),
    });
    manager.addProvider(plugin);
    manager.addProvider(local);
    REQUIRE(manager.start().has_value());

    // Let the plugin process finish while the provider still believes it is connected.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto text = std::string {};
    auto result = manager.streamRequest(
        GenerationRequest { .turn = 1, .messages = {} }, [&](const TextChunk& chunk) { text += chunk.delta; }, {});
    REQUIRE(result.has_value());
    CHECK(text == "still here");
    CHECK(local->calls.load() == 1);

    auto const status = manager.status();
    CHECK(status.active == "local");
    CHECK(status.providers[0].breaker == BreakerState::Open);
    CHECK(!status.providers[0].lastError.empty());
    manager.stop();
}

TEST_CASE("PluginCodec converts samples to clamped 16-bit PCM", "[plugin]")
{
    auto const samples = std::vector<float> { 0.0f, 1.0f, -1.0f, 2.0f, -3.0f, 0.5f };
    CHECK(toPcm16(samples) == std::vector<std::int16_t> { 0, 32767, -32767, 32767, -32767, 16384 });

    auto const restored = fromPcm16(std::vector<std::int16_t> { 0, -32768, 16384 });
    CHECK(restored == std::vector<float> { 0.0f, -1.0f, 0.5f });
}

TEST_CASE("PluginCodec decodes chunks per provider kind", "[plugin]")
{
    SECTION("transcript chunks default to non-final with full confidence")
    {
        auto chunk = decodeChunk<ProviderKind::Transcription>({ { "text", "hello" } });
        REQUIRE(chunk.has_value());
        CHECK(chunk->text == "hello");
        CHECK(!chunk->isFinal);
        CHECK(chunk->confidence == 1.0f);
    }

    SECTION("text chunks require text")
    {
        auto chunk = decodeChunk<ProviderKind::Generation>({ { "delta", "x" } });
        REQUIRE(!chunk.has_value());
    }

    SECTION("audio chunks carry pcm16 and a positive sample rate")
    {
        auto chunk = decodeChunk<ProviderKind::Synthesis>({ { "pcm16", { 0, 16384 } }, { "sampleRate", 16000 } });
        REQUIRE(chunk.has_value());
        CHECK(chunk->sampleRate == 16000);
        CHECK(chunk->samples == std::vector<float> { 0.0f, 0.5f });

        CHECK(!decodeChunk<ProviderKind::Synthesis>({ { "pcm16", { "a" } } }).has_value());
        CHECK(!decodeChunk<ProviderKind::Synthesis>({ { "pcm16", { 1 } }, { "sampleRate", 0 } }).has_value());
    }

    CHECK(pluginMethod(ProviderKind::Synthesis) == "synthesize");
    CHECK(pluginErrorCode(ProviderKind::Generation) == ErrorCode::GenerationError);
}
