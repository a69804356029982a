// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Orchestrator.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace voicecore;
using namespace voicecore::testing;
using namespace std::chrono_literals;

namespace
{
auto testConfig() -> PipelineConfig
{
    auto config = PipelineConfig {};
    config.granularity = SynthesisGranularity::Chunk;
    config.listenTimeout = 5s;
    config.stageTimeout = 5s;
    config.errorRecoveryDelay = 0ms;
    config.systemPrompt = "Be brief.";
    return config;
}

auto managerConfig() -> ProviderManagerConfig
{
    return ProviderManagerConfig {
        .breaker = CircuitBreakerConfig { .failureThreshold = 1, .cooldown = 60s },
        .firstChunkTimeout = 5s,
    };
}

/// Collects what the orchestrator reports on its loop thread.
struct Recorder
{
    mutable std::mutex mutex;
    std::vector<PipelineState> states;
    std::vector<Turn> completed;
    std::vector<Turn> aborted;
    std::vector<PipelineError> errors;
    std::vector<TurnId> bargeIns;
    std::vector<std::string> wakePhrases;
    std::vector<std::string> transcripts;
    std::size_t enqueuedAtBargeIn = 0;

    template <typename T>
    auto snapshot(const std::vector<T>& values) const -> std::vector<T>
    {
        auto const lock = std::lock_guard { mutex };
        return values;
    }
};

struct Harness
{
    explicit Harness(PipelineConfig config = testConfig(),
                     ScriptedTranscriber::Behaviour transcribe = transcribing("what time is it"),
                     ScriptedGenerator::Behaviour generate = generating({ "It's", " 3", " PM." }),
                     ScriptedSynthesizer::Behaviour synthesize = speaking(),
                     ProviderManagerConfig providers = managerConfig()):
        transcriber(std::make_shared<ScriptedTranscriber>("stt", std::move(transcribe))),
        generator(std::make_shared<ScriptedGenerator>("llm", std::move(generate))),
        synthesizer(std::make_shared<ScriptedSynthesizer>("tts", std::move(synthesize))),
        transcription(providers),
        generation(providers),
        synthesis(providers)
    {
        transcription.addProvider(transcriber);
        generation.addProvider(generator);
        synthesis.addProvider(synthesizer);

        orchestrator = std::make_unique<Orchestrator>(
            std::move(config),
            Orchestrator::Dependencies {
                .transcription = transcription,
                .generation = generation,
                .synthesis = synthesis,
                .sink = sink,
            });

        orchestrator->onStateChanged().connect([this](PipelineState, PipelineState to) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.states.push_back(to);
        });
        orchestrator->onTurnCompleted().connect([this](const Turn& turn) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.completed.push_back(turn);
        });
        orchestrator->onTurnAborted().connect([this](const Turn& turn) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.aborted.push_back(turn);
        });
        orchestrator->onError().connect([this](const PipelineError& error) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.errors.push_back(error);
        });
        orchestrator->onBargeIn().connect([this](TurnId turn) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.bargeIns.push_back(turn);
            recorder.enqueuedAtBargeIn = sink.enqueuedTags().size();
        });
        orchestrator->onWakeWord().connect([this](const std::string& phrase, float) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.wakePhrases.push_back(phrase);
        });
        orchestrator->onTranscriptFinal().connect([this](TurnId, const std::string& text) {
            auto const lock = std::lock_guard { recorder.mutex };
            recorder.transcripts.push_back(text);
        });
    }

    void start() { REQUIRE(orchestrator->start().has_value()); }

    void speakUtterance(std::size_t frames)
    {
        orchestrator->post(SpeechStarted {});
        for (auto i = std::size_t { 0 }; i < frames; ++i)
            orchestrator->post(FrameCaptured { makeFrame(i, 0.1f) });
        orchestrator->post(SpeechEnded {});
    }

    [[nodiscard]] auto waitForState(PipelineState state) const -> bool
    {
        return waitFor([&] { return orchestrator->currentState() == state; });
    }

    [[nodiscard]] auto completed() const { return recorder.snapshot(recorder.completed); }
    [[nodiscard]] auto aborted() const { return recorder.snapshot(recorder.aborted); }
    [[nodiscard]] auto errors() const { return recorder.snapshot(recorder.errors); }
    [[nodiscard]] auto states() const { return recorder.snapshot(recorder.states); }

    MockAudioSink sink;
    std::shared_ptr<ScriptedTranscriber> transcriber;
    std::shared_ptr<ScriptedGenerator> generator;
    std::shared_ptr<ScriptedSynthesizer> synthesizer;
    TranscriptionManager transcription;
    GenerationManager generation;
    SynthesisManager synthesis;
    Recorder recorder;
    std::unique_ptr<Orchestrator> orchestrator;
};
} // namespace

TEST_CASE("Orchestrator starts listening for the activation phrase", "[orchestrator]")
{
    auto harness = Harness {};
    CHECK(harness.orchestrator->currentState() == PipelineState::Idle);

    harness.start();
    CHECK(harness.orchestrator->isRunning());
    CHECK(harness.orchestrator->currentState() == PipelineState::WakeListening);

    auto const status = harness.orchestrator->status();
    CHECK(status.activeTurn == NoTurn);
    REQUIRE(status.generation.providers.size() == 1);
    CHECK(status.generation.providers[0].name == "llm");
    CHECK(status.generation.providers[0].connection == ConnectionState::Connected);

    auto const again = harness.orchestrator->start();
    REQUIRE(!again);
    CHECK(again.error().code == ErrorCode::InvalidState);

    harness.orchestrator->stop();
    CHECK(!harness.orchestrator->isRunning());
    CHECK(harness.orchestrator->currentState() == PipelineState::Idle);
}

TEST_CASE("Orchestrator runs a spoken turn from activation to playback", "[orchestrator]")
{
    auto harness = Harness {};
    harness.start();

    harness.orchestrator->post(WakeWordDetected { .phrase = "hey assistant", .confidence = 0.95f });
    harness.speakUtterance(62);

    REQUIRE(waitFor([&] { return !harness.completed().empty(); }));
    REQUIRE(harness.waitForState(PipelineState::WakeListening));

    auto const turn = harness.completed().front();
    CHECK(turn.id == 1);
    CHECK(turn.source == TurnSource::Voice);
    CHECK(turn.outcome == TurnOutcome::Completed);
    CHECK(turn.transcript == "what time is it");
    CHECK(turn.reply == "It's 3 PM.");
    CHECK(turn.playedChunks == 3);
    CHECK(turn.timings.transcriptFinal.has_value());
    CHECK(turn.timings.firstAudioChunk.has_value());
    CHECK(turn.timings.closed.has_value());

    auto const played = harness.sink.playedTags();
    REQUIRE(played.size() == 3);
    for (auto i = std::uint32_t { 0 }; i < 3; ++i)
        CHECK(played[i] == PlaybackTag { .turn = 1, .sequence = i });

    auto const requests = harness.transcriber->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].samples.size() == 62 * 512);
    CHECK(requests[0].turn == 1);

    auto const synthesized = harness.synthesizer->requests();
    REQUIRE(synthesized.size() == 3);
    CHECK(synthesized[0].text == "It's");
    CHECK(synthesized[2].text == " PM.");

    CHECK(harness.states()
          == std::vector<PipelineState> {
              PipelineState::WakeListening,
              PipelineState::Capturing,
              PipelineState::Transcribing,
              PipelineState::Generating,
              PipelineState::Synthesizing,
              PipelineState::Speaking,
              PipelineState::WakeListening,
          });
    CHECK(harness.errors().empty());
}

TEST_CASE("Orchestrator ignores activations below the threshold", "[orchestrator]")
{
    auto harness = Harness {};
    harness.start();

    harness.orchestrator->post(WakeWordDetected { .phrase = "hey assistant", .confidence = 0.2f });
    harness.orchestrator->triggerWake();

    REQUIRE(harness.waitForState(PipelineState::Capturing));
    CHECK(harness.recorder.snapshot(harness.recorder.wakePhrases) == std::vector<std::string> { "manual" });
}

TEST_CASE("Orchestrator interrupts the reply when the user speaks", "[orchestrator]")
{
    auto const slowReply = [](const GenerationRequest&, const ScriptedGenerator::ChunkCallback& onChunk, std::stop_token stop)
        -> VoidResult {
        while (!stop.stop_requested())
        {
            onChunk(TextChunk { .delta = "More words. " });
            std::this_thread::sleep_for(20ms);
        }
        return makeError(ErrorCode::Cancelled, "cancelled");
    };

    auto harness = Harness { testConfig(), transcribing("tell me a story"), slowReply };
    harness.sink.autoComplete = false;
    harness.start();

    harness.orchestrator->triggerWake();
    harness.speakUtterance(10);
    REQUIRE(harness.waitForState(PipelineState::Speaking));

    harness.orchestrator->post(SpeechStarted {});
    REQUIRE(waitFor([&] { return !harness.recorder.snapshot(harness.recorder.bargeIns).empty(); }));
    REQUIRE(harness.waitForState(PipelineState::Capturing));

    CHECK(harness.recorder.snapshot(harness.recorder.bargeIns) == std::vector<TurnId> { 1 });
    CHECK(harness.sink.queuedCount() == 0);
    CHECK(harness.sink.flushCount() >= 1);

    auto const aborted = harness.aborted();
    REQUIRE(aborted.size() == 1);
    CHECK(aborted[0].id == 1);
    CHECK(aborted[0].outcome == TurnOutcome::Interrupted);
    CHECK(harness.orchestrator->status().activeTurn == 2);

    // Nothing of the interrupted reply reaches the sink afterwards.
    std::this_thread::sleep_for(150ms);
    auto const enqueuedAtBargeIn = [&] {
        auto const lock = std::lock_guard { harness.recorder.mutex };
        return harness.recorder.enqueuedAtBargeIn;
    }();
    CHECK(harness.sink.enqueuedTags().size() == enqueuedAtBargeIn);
    CHECK(harness.sink.queuedCount() == 0);
    CHECK(harness.completed().empty());
}

TEST_CASE("Orchestrator does not interrupt when barge-in is off", "[orchestrator]")
{
    auto config = testConfig();
    config.bargeIn = BargeInTrigger::Off;

    auto harness = Harness { config };
    harness.sink.autoComplete = false;
    harness.start();

    harness.orchestrator->sendText("hello");
    REQUIRE(harness.waitForState(PipelineState::Speaking));

    harness.orchestrator->post(SpeechStarted {});
    harness.orchestrator->post(WakeWordDetected { .phrase = "hey assistant", .confidence = 1.0f });
    std::this_thread::sleep_for(50ms);
    CHECK(harness.orchestrator->currentState() == PipelineState::Speaking);

    REQUIRE(waitFor([&] { return harness.sink.queuedCount() == 3; }));
    harness.sink.completeAll();
    REQUIRE(waitFor([&] { return !harness.completed().empty(); }));
    CHECK(harness.recorder.snapshot(harness.recorder.bargeIns).empty());
}

TEST_CASE("Orchestrator recovers when every generation provider fails", "[orchestrator]")
{
    auto harness = Harness { testConfig(), transcribing("what time is it"), failing<ProviderKind::Generation>() };
    harness.start();

    harness.orchestrator->triggerWake();
    harness.speakUtterance(5);

    REQUIRE(waitFor([&] { return !harness.errors().empty(); }));
    REQUIRE(harness.waitForState(PipelineState::WakeListening));

    auto const errors = harness.errors();
    CHECK(errors[0].stage == PipelineStage::Generation);
    CHECK(errors[0].code == ErrorCode::ProviderExhausted);
    CHECK(errors[0].turn == 1);

    auto const aborted = harness.aborted();
    REQUIRE(aborted.size() == 1);
    CHECK(aborted[0].outcome == TurnOutcome::Failed);

    auto const states = harness.states();
    CHECK(std::ranges::find(states, PipelineState::Error) != states.end());
    CHECK(harness.synthesizer->calls.load() == 0);
    CHECK(harness.sink.enqueuedTags().empty());

    SECTION("a later turn fails fast while the breaker is open")
    {
        harness.orchestrator->sendText("still there?");
        REQUIRE(waitFor([&] { return harness.errors().size() == 2; }));
        REQUIRE(harness.waitForState(PipelineState::WakeListening));
        CHECK(harness.generator->calls.load() == 1);
        CHECK(harness.errors()[1].code == ErrorCode::ProviderExhausted);
    }
}

TEST_CASE("Orchestrator recovers when every transcription provider fails", "[orchestrator]")
{
    auto providers = managerConfig();
    providers.breaker.failureThreshold = 3;

    auto harness = Harness { testConfig(),
                             failing<ProviderKind::Transcription>(ErrorCode::TranscriptionError),
                             generating({ "unused" }),
                             speaking(),
                             providers };
    auto backup = std::make_shared<ScriptedTranscriber>("stt-backup", failing<ProviderKind::Transcription>());
    harness.transcription.addProvider(backup);
    harness.start();

    harness.orchestrator->triggerWake();
    harness.speakUtterance(5);

    REQUIRE(waitFor([&] { return !harness.errors().empty(); }));
    REQUIRE(harness.waitForState(PipelineState::WakeListening));

    auto const errors = harness.errors();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].stage == PipelineStage::Transcription);
    CHECK(errors[0].code == ErrorCode::ProviderExhausted);
    CHECK(errors[0].turn == 1);

    CHECK(harness.transcriber->calls.load() == 3);
    CHECK(backup->calls.load() == 3);
    CHECK(harness.generator->calls.load() == 0);

    auto const status = harness.orchestrator->status().transcription;
    REQUIRE(status.providers.size() == 2);
    CHECK(status.providers[0].breaker == BreakerState::Open);
    CHECK(status.providers[1].breaker == BreakerState::Open);

    REQUIRE(waitFor([&] {
        auto const states = harness.states();
        return !states.empty() && states.back() == PipelineState::WakeListening;
    }));
    auto const states = harness.states();
    REQUIRE(states.size() >= 2);
    CHECK(states[states.size() - 2] == PipelineState::Error);
    CHECK(states.back() == PipelineState::WakeListening);
    CHECK(harness.aborted().front().outcome == TurnOutcome::Failed);
}

TEST_CASE("Orchestrator starts synthesis before generation has finished", "[orchestrator]")
{
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto const twoSentences = [release](const GenerationRequest&,
                                        const ScriptedGenerator::ChunkCallback& onChunk,
                                        std::stop_token stop) -> VoidResult {
        onChunk(TextChunk { .delta = "First sentence. " });
        while (!release->load())
        {
            if (stop.stop_requested())
                return makeError(ErrorCode::Cancelled, "cancelled");
            std::this_thread::sleep_for(2ms);
        }
        onChunk(TextChunk { .delta = "Second sentence." });
        return {};
    };

    auto config = testConfig();
    config.granularity = SynthesisGranularity::Sentence;

    auto harness = Harness { config, transcribing("talk to me"), twoSentences };
    harness.start();
    harness.orchestrator->sendText("talk to me");

    REQUIRE(waitFor([&] { return !harness.sink.enqueuedTags().empty(); }));
    CHECK(harness.synthesizer->calls.load() == 1);
    CHECK(harness.completed().empty());

    release->store(true);
    REQUIRE(waitFor([&] { return !harness.completed().empty(); }));

    auto const synthesized = harness.synthesizer->requests();
    REQUIRE(synthesized.size() == 2);
    CHECK(synthesized[0].text == "First sentence.");
    CHECK(synthesized[1].text == "Second sentence.");
    CHECK(harness.completed().front().playedChunks == 2);
}

TEST_CASE("Orchestrator fails a turn that makes no progress", "[orchestrator]")
{
    auto config = testConfig();
    config.stageTimeout = 100ms;

    auto harness = Harness { config, transcribing("x"), hanging<ProviderKind::Generation>() };
    harness.start();
    harness.orchestrator->sendText("are you there?");

    REQUIRE(waitFor([&] { return !harness.errors().empty(); }));
    REQUIRE(harness.waitForState(PipelineState::WakeListening));

    auto const errors = harness.errors();
    CHECK(errors[0].stage == PipelineStage::Generation);
    CHECK(errors[0].code == ErrorCode::TimeoutError);
    CHECK(harness.aborted().front().outcome == TurnOutcome::Failed);
}

TEST_CASE("Orchestrator serves typed text without transcription", "[orchestrator]")
{
    auto harness = Harness {};
    harness.start();

    harness.orchestrator->sendText("   ");
    harness.orchestrator->sendText("what time is it");
    REQUIRE(waitFor([&] { return !harness.completed().empty(); }));

    auto const turn = harness.completed().front();
    CHECK(turn.id == 1);
    CHECK(turn.source == TurnSource::Text);
    CHECK(turn.transcript == "what time is it");
    CHECK(turn.reply == "It's 3 PM.");
    CHECK(harness.transcriber->calls.load() == 0);
    CHECK(harness.recorder.snapshot(harness.recorder.transcripts) == std::vector<std::string> { "what time is it" });

    SECTION("later turns carry the conversation history")
    {
        harness.orchestrator->sendText("and tomorrow?");
        REQUIRE(waitFor([&] { return harness.completed().size() == 2; }));

        auto const requests = harness.generator->requests();
        REQUIRE(requests.size() == 2);
        auto const& messages = requests[1].messages;
        REQUIRE(messages.size() == 4);
        CHECK(messages[0].role == Role::System);
        CHECK(messages[0].content == "Be brief.");
        CHECK(messages[1].content == "what time is it");
        CHECK(messages[2].role == Role::Assistant);
        CHECK(messages[2].content == "It's 3 PM.");
        CHECK(messages[3].content == "and tomorrow?");
    }

    SECTION("clearing the history forgets earlier turns")
    {
        harness.orchestrator->clearHistory();
        harness.orchestrator->sendText("and tomorrow?");
        REQUIRE(waitFor([&] { return harness.completed().size() == 2; }));
        CHECK(harness.generator->requests()[1].messages.size() == 2);
    }
}

TEST_CASE("Orchestrator discards an empty transcript", "[orchestrator]")
{
    auto harness = Harness { testConfig(), transcribing("  ") };
    harness.start();

    harness.orchestrator->triggerWake();
    harness.speakUtterance(4);

    REQUIRE(waitFor([&] { return !harness.aborted().empty(); }));
    REQUIRE(harness.waitForState(PipelineState::WakeListening));
    CHECK(harness.aborted().front().outcome == TurnOutcome::Discarded);
    CHECK(harness.generator->calls.load() == 0);
    CHECK(harness.errors().empty());
}

TEST_CASE("Orchestrator stops listening when no speech follows the activation", "[orchestrator]")
{
    auto config = testConfig();
    config.listenTimeout = 50ms;

    auto harness = Harness { config };
    harness.start();
    harness.orchestrator->triggerWake();

    REQUIRE(waitFor([&] { return !harness.aborted().empty(); }));
    REQUIRE(harness.waitForState(PipelineState::WakeListening));
    CHECK(harness.aborted().front().outcome == TurnOutcome::Discarded);
    CHECK(harness.transcriber->calls.load() == 0);
}

TEST_CASE("Orchestrator finalizes an utterance at the maximum length", "[orchestrator]")
{
    auto config = testConfig();
    config.maxSegmentDuration = 320ms; // ten frames of 512 samples at 16 kHz

    auto harness = Harness { config };
    harness.start();
    harness.orchestrator->triggerWake();
    harness.orchestrator->post(SpeechStarted {});
    for (auto i = std::uint64_t { 0 }; i < 10; ++i)
        harness.orchestrator->post(FrameCaptured { makeFrame(i, 0.1f) });

    REQUIRE(waitFor([&] { return !harness.completed().empty(); }));
    auto const requests = harness.transcriber->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].samples.size() == 10 * 512);
}

TEST_CASE("Orchestrator pauses while the audio device is unavailable", "[orchestrator]")
{
    auto harness = Harness {};
    harness.start();

    harness.orchestrator->triggerWake();
    REQUIRE(harness.waitForState(PipelineState::Capturing));

    harness.orchestrator->post(AudioDeviceFailed { .detail = "microphone unplugged" });
    REQUIRE(harness.waitForState(PipelineState::Idle));

    auto const errors = harness.errors();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].stage == PipelineStage::Audio);
    CHECK(errors[0].code == ErrorCode::AudioError);
    CHECK(errors[0].detail == "microphone unplugged");
    CHECK(harness.aborted().front().outcome == TurnOutcome::Failed);

    harness.orchestrator->triggerWake();
    std::this_thread::sleep_for(50ms);
    CHECK(harness.orchestrator->currentState() == PipelineState::Idle);

    harness.orchestrator->post(AudioDeviceRecovered {});
    REQUIRE(harness.waitForState(PipelineState::WakeListening));
}

TEST_CASE("Orchestrator stop cancels the active turn", "[orchestrator]")
{
    auto harness = Harness { testConfig(), transcribing("x"), hanging<ProviderKind::Generation>() };
    harness.start();
    harness.orchestrator->sendText("long question");
    REQUIRE(harness.waitForState(PipelineState::Generating));

    harness.orchestrator->stop();
    CHECK(harness.orchestrator->currentState() == PipelineState::Idle);

    auto const aborted = harness.aborted();
    REQUIRE(aborted.size() == 1);
    CHECK(aborted[0].outcome == TurnOutcome::Interrupted);
}

TEST_CASE("Orchestrator keeps the start of an utterance that interrupts the reply", "[orchestrator]")
{
    auto harness = Harness {};
    harness.sink.autoComplete = false;
    harness.start();

    harness.orchestrator->sendText("tell me something");
    REQUIRE(harness.waitForState(PipelineState::Speaking));

    // Speech detection lags behind the audio: these frames arrive before SpeechStarted.
    for (auto i = std::uint64_t { 100 }; i < 105; ++i)
        harness.orchestrator->post(FrameCaptured { makeFrame(i, 0.3f) });
    harness.orchestrator->post(SpeechStarted {});
    for (auto i = std::uint64_t { 105 }; i < 108; ++i)
        harness.orchestrator->post(FrameCaptured { makeFrame(i, 0.6f) });
    harness.orchestrator->post(SpeechEnded {});

    REQUIRE(waitFor([&] { return harness.transcriber->calls.load() == 1; }));
    CHECK(harness.recorder.snapshot(harness.recorder.bargeIns) == std::vector<TurnId> { 1 });

    auto const requests = harness.transcriber->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].turn == 2);
    REQUIRE(requests[0].samples.size() == 8 * 512);
    CHECK(requests[0].samples.front() == 0.3f);
    CHECK(requests[0].samples[5 * 512 - 1] == 0.3f);
    CHECK(requests[0].samples[5 * 512] == 0.6f);
    CHECK(requests[0].samples.back() == 0.6f);
}

TEST_CASE("Orchestrator prepends only the most recent audio to a new capture", "[orchestrator]")
{
    auto config = testConfig();
    config.preRoll = 64ms; // two frames of 512 samples at 16 kHz

    auto harness = Harness { config };
    harness.start();

    for (auto i = std::uint64_t { 0 }; i < 5; ++i)
        harness.orchestrator->post(FrameCaptured { makeFrame(i, 0.1f * static_cast<float>(i + 1)) });
    harness.orchestrator->post(WakeWordDetected { .phrase = "hey assistant", .confidence = 0.9f });
    harness.speakUtterance(3);

    REQUIRE(waitFor([&] { return !harness.completed().empty(); }));
    auto const requests = harness.transcriber->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].samples.size() == 5 * 512);
    CHECK(requests[0].samples.front() == 0.1f * 4.0f);
    CHECK(requests[0].samples[512] == 0.1f * 5.0f);
    CHECK(requests[0].samples[2 * 512] == 0.1f);

    SECTION("a capture without pre-roll starts empty")
    {
        harness.orchestrator->triggerWake();
        harness.speakUtterance(2);
        REQUIRE(waitFor([&] { return harness.completed().size() == 2; }));
        auto const later = harness.transcriber->requests();
        REQUIRE(later.size() == 2);
        CHECK(later[1].samples.size() == 2 * 512);
    }
}

TEST_CASE("Orchestrator reports configuration problems as errors", "[orchestrator]")
{
    auto harness = Harness {};
    harness.start();

    harness.orchestrator->reportConfigurationError(
        Error { ErrorCode::CredentialError, "generation provider 'cloud' disabled: missing credential 'cloud.key'" });

    REQUIRE(waitFor([&] { return !harness.errors().empty(); }));
    auto const errors = harness.errors();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].stage == PipelineStage::Configuration);
    CHECK(errors[0].code == ErrorCode::CredentialError);
    CHECK(errors[0].detail.find("cloud.key") != std::string::npos);
    CHECK(errors[0].turn == NoTurn);
    CHECK(harness.orchestrator->currentState() == PipelineState::WakeListening);
}
