// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioCapture.hpp>
#include <audio/AudioFrontEnd.hpp>
#include <audio/AudioPlayback.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <audio/WhisperWakeWordDetector.hpp>
#include <core/Log.hpp>
#include <pipeline/Orchestrator.hpp>
#include <voicecore/ProviderFactory.hpp>

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <print>
#include <string>

namespace voicecore
{

namespace
{

    void printKindStatus(const ProviderKindStatus& status)
    {
        std::println("  {} (active: {})", providerKindName(status.kind), status.active.empty() ? "-" : status.active);
        for (auto const& provider: status.providers)
        {
            if (!provider.enabled)
            {
                std::println("    {:<16} disabled: {}", provider.name, provider.disabledReason);
                continue;
            }
            std::println("    {:<16} {:<12} breaker={} failures={}{}",
                         provider.name,
                         connectionStateName(provider.connection),
                         breakerStateName(provider.breaker),
                         provider.consecutiveFailures,
                         provider.lastError.empty() ? std::string {} : std::format(" last error: {}", provider.lastError));
        }
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<CredentialSource> credentials;
    ProviderSet providers;
    AudioPlayback playback;

    std::unique_ptr<EnergyVoiceActivityDetector> vad;
    std::unique_ptr<WhisperWakeWordDetector> wakeWord;
    std::unique_ptr<AudioFrontEnd> frontEnd;
    std::unique_ptr<AudioCapture> capture;

    std::unique_ptr<Orchestrator> orchestrator;

    // Serializes console output of the loop thread and the input thread.
    std::mutex outputMutex;
    bool replyOpen = false;

    std::mutex turnMutex;
    std::condition_variable turnDone;
    std::optional<Turn> lastTurn;

    explicit Impl(AppConfig config): config(std::move(config)) {}

    ~Impl()
    {
        // The capture thread feeds the front end, which feeds the orchestrator.
        if (capture)
            capture->stop();
        if (frontEnd)
            frontEnd->stop();
        if (orchestrator)
            orchestrator->stop();
    }

    void connectObservers()
    {
        auto& orch = *orchestrator;

        orch.onStateChanged().connect([](PipelineState from, PipelineState to) {
            log::debug("State: {} -> {}", stateName(from), stateName(to));
        });

        orch.onWakeWord().connect([this](const std::string& phrase, float confidence) {
            auto const lock = std::lock_guard { outputMutex };
            std::println("[heard '{}' ({:.2f})]", phrase, confidence);
        });

        orch.onTranscriptFinal().connect([this](TurnId /*turn*/, const std::string& text) {
            auto const lock = std::lock_guard { outputMutex };
            std::println("You: {}", text);
        });

        orch.onResponseChunk().connect([this](const ResponseChunk& chunk) {
            auto const lock = std::lock_guard { outputMutex };
            if (!replyOpen)
            {
                std::print("Assistant: ");
                replyOpen = true;
            }
            std::print("{}", chunk.text);
            std::cout.flush();
        });

        orch.onBargeIn().connect([this](TurnId turn) {
            auto const lock = std::lock_guard { outputMutex };
            closeReply();
            std::println("[interrupted turn {}]", turn);
        });

        orch.onTurnCompleted().connect([this](const Turn& turn) {
            {
                auto const lock = std::lock_guard { outputMutex };
                closeReply();
            }
            log::info("Turn {} completed: {} ms to first audio, {} chunk(s) played",
                      turn.id,
                      elapsedMs(turn.timings.activated, turn.timings.playbackStarted),
                      turn.playedChunks);
            finishTurn(turn);
        });

        orch.onTurnAborted().connect([this](const Turn& turn) {
            {
                auto const lock = std::lock_guard { outputMutex };
                closeReply();
            }
            log::debug("Turn {} ended: {}", turn.id, turnOutcomeName(turn.outcome));
            finishTurn(turn);
        });

        orch.onSegmentEvicted().connect([](TurnId turn, std::uint64_t frames) {
            log::warning("Turn {}: capture buffer full, dropping the oldest audio ({} frame(s) evicted)", turn, frames);
        });

        orch.onError().connect([this](const PipelineError& error) {
            auto const lock = std::lock_guard { outputMutex };
            closeReply();
            std::println(stderr, "Error ({}): [{}] {}", stageName(error.stage), errorCodeName(error.code), error.detail);
        });
    }

    /// Surfaces back-ends that were disabled while building the providers.
    void reportConfigurationErrors()
    {
        for (auto const& problem: providers.configErrors)
            orchestrator->reportConfigurationError(problem);
    }

    /// Requires outputMutex.
    void closeReply()
    {
        if (replyOpen)
        {
            std::println("");
            replyOpen = false;
        }
    }

    void finishTurn(const Turn& turn)
    {
        {
            auto const lock = std::lock_guard { turnMutex };
            lastTurn = turn;
        }
        turnDone.notify_all();
    }

    void setUpMicrophone()
    {
        auto const& vadConfig = config.vad;
        vad = std::make_unique<EnergyVoiceActivityDetector>(EnergyVadConfig {
            .sampleRate = config.pipeline.sampleRate,
            .energyThreshold = vadConfig.energyThreshold,
            .threshold = vadConfig.threshold,
            .negativeThreshold = vadConfig.negativeThreshold,
            .minSpeechMs = vadConfig.minSpeechMs,
            .silenceMs = vadConfig.silenceMs,
            .pauseMs = vadConfig.pauseMs,
        });

        if (config.wakeWord.enabled)
        {
            auto const& wake = config.wakeWord;
            wakeWord = std::make_unique<WhisperWakeWordDetector>(WhisperWakeWordConfig {
                .model = WhisperModelConfig { .modelPath = wake.modelPath.empty() ? defaultWakeModelPath() : wake.modelPath,
                                              .threads = wake.threads },
                .phrases = wake.phrases,
                .language = config.pipeline.language,
                .sampleRate = config.pipeline.sampleRate,
                .window = std::chrono::milliseconds { wake.windowMs },
                .stride = std::chrono::milliseconds { wake.strideMs },
                .energyGate = wake.energyGate,
                .minScore = wake.minScore,
                .cooldown = std::chrono::milliseconds { wake.cooldownMs },
            });
            if (auto result = wakeWord->load(); !result)
            {
                log::error("Activation phrase detection unavailable: {}", result.error());
                wakeWord.reset();
            }
        }

        frontEnd = std::make_unique<AudioFrontEnd>(
            *vad,
            wakeWord.get(),
            [this](InputEvent event) { orchestrator->post(std::move(event)); },
            static_cast<std::size_t>(std::max(1, config.audio.detectorQueueFrames)));

        capture = std::make_unique<AudioCapture>();
        auto result = capture->initialize(
            AudioCaptureConfig {
                .deviceName = config.audio.deviceName,
                .sampleRate = config.pipeline.sampleRate,
                .frameSamples = config.pipeline.frameSamples,
            },
            [this](AudioFrame frame) { frontEnd->push(std::move(frame)); },
            [this](bool available, std::string_view detail) {
                if (available)
                    orchestrator->post(AudioDeviceRecovered {});
                else
                    orchestrator->post(AudioDeviceFailed { .detail = std::string(detail) });
            });
        if (!result)
        {
            log::error("Microphone unavailable: {}", result.error());
            capture.reset();
        }
    }

    void printStatus()
    {
        auto const status = orchestrator->status();
        auto const lock = std::lock_guard { outputMutex };
        std::println("State: {} (turn {})", stateName(status.state), status.activeTurn);
        printKindStatus(status.transcription);
        printKindStatus(status.generation);
        printKindStatus(status.synthesis);
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize(bool withMicrophone) -> VoidResult
{
    auto credentials = makeCredentialSource(_impl->config.secrets);
    if (!credentials)
        return std::unexpected(credentials.error());
    _impl->credentials = std::move(*credentials);

    _impl->providers = buildProviders(_impl->config.providers, *_impl->credentials);

    if (auto result = _impl->playback.initialize(static_cast<unsigned>(_impl->config.audio.playbackSampleRate));
        !result)
        return result;

    _impl->orchestrator = std::make_unique<Orchestrator>(_impl->config.pipeline,
                                                         Orchestrator::Dependencies {
                                                             .transcription = *_impl->providers.transcription,
                                                             .generation = *_impl->providers.generation,
                                                             .synthesis = *_impl->providers.synthesis,
                                                             .sink = _impl->playback,
                                                         });
    _impl->connectObservers();

    if (withMicrophone)
        _impl->setUpMicrophone();

    log::info("Application initialized");
    return {};
}

auto App::run() -> int
{
    if (auto result = _impl->orchestrator->start(); !result)
    {
        log::error("Failed to start: {}", result.error());
        return 1;
    }
    _impl->reportConfigurationErrors();

    if (_impl->capture)
    {
        _impl->frontEnd->start();
        if (auto result = _impl->capture->start(); !result)
        {
            log::error("{}", result.error());
            _impl->orchestrator->post(AudioDeviceFailed { .detail = result.error().message });
        }
    }
    else
    {
        log::warning("No microphone, only typed requests are available");
    }

    {
        auto const lock = std::lock_guard { _impl->outputMutex };
        if (_impl->wakeWord)
            std::println("Listening for '{}'.", _impl->config.wakeWord.phrases.front());
        std::println("Commands: w = talk now, t <text> = type a request, c = forget history, s = status, q = quit");
    }

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (line == "q")
            break;
        if (line == "w")
            _impl->orchestrator->triggerWake();
        else if (line == "s")
            _impl->printStatus();
        else if (line.starts_with("t "))
            _impl->orchestrator->sendText(line.substr(2));
        else if (line == "c")
            _impl->orchestrator->clearHistory();
        else if (!line.empty())
        {
            auto const lock = std::lock_guard { _impl->outputMutex };
            std::println("Unknown command: {}", line);
        }
    }

    if (_impl->capture)
        _impl->capture->stop();
    if (_impl->frontEnd)
        _impl->frontEnd->stop();
    _impl->orchestrator->stop();
    return 0;
}

auto App::say(std::string text) -> int
{
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
    {
        log::error("Nothing to say");
        return 1;
    }

    if (auto result = _impl->orchestrator->start(); !result)
    {
        log::error("Failed to start: {}", result.error());
        return 1;
    }
    _impl->reportConfigurationErrors();

    _impl->orchestrator->sendText(std::move(text));

    auto turn = std::optional<Turn> {};
    {
        auto lock = std::unique_lock { _impl->turnMutex };
        _impl->turnDone.wait(lock, [this] { return _impl->lastTurn.has_value(); });
        turn = _impl->lastTurn;
    }

    _impl->orchestrator->stop();
    return turn->outcome == TurnOutcome::Completed ? 0 : 1;
}

} // namespace voicecore
