// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>
#include <pipeline/Events.hpp>
#include <pipeline/PipelineConfig.hpp>
#include <provider/ProviderManager.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace voicecore
{

/// @brief Immutable snapshot of the pipeline and its providers.
struct PipelineStatus
{
    PipelineState state = PipelineState::Idle;
    TurnId activeTurn = NoTurn;
    ProviderKindStatus transcription;
    ProviderKindStatus generation;
    ProviderKindStatus synthesis;
};

/// @brief Drives the voice interaction state machine.
///
/// All state transitions happen on a single internal event-loop thread, driven
/// by posted input events and by the results of per-turn worker threads that
/// stream through the provider managers. Observers are invoked on the loop
/// thread in event order.
///
/// Turns are cancelled by invalidating their id: results that arrive for
/// anything but the active turn are dropped.
class Orchestrator
{
  public:
    struct Dependencies
    {
        TranscriptionManager& transcription;
        GenerationManager& generation;
        SynthesisManager& synthesis;
        AudioSink& sink;
    };

    Orchestrator(PipelineConfig config, Dependencies dependencies);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Starts the providers and the event loop and begins listening for the activation phrase.
    /// @return InvalidState if already running.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Cancels the active turn, flushes playback, joins all workers and stops the providers.
    ///
    /// The state is Idle afterwards. Must not be called from an observer.
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Returns the current state. Safe to call from any thread.
    [[nodiscard]] auto currentState() const -> PipelineState;

    [[nodiscard]] auto status() const -> PipelineStatus;

    /// @brief Queues an input event. Safe to call from any thread.
    void post(InputEvent event);

    /// @brief Push-to-talk activation.
    void triggerWake();

    /// @brief Starts a turn from typed text.
    void sendText(std::string text);

    /// @brief Forgets the conversation history.
    void clearHistory();

    /// @brief Reports a problem found while setting up the providers, e.g. a missing credential.
    ///
    /// Emitted through onError() with PipelineStage::Configuration on the loop thread.
    void reportConfigurationError(Error problem);

    // Observable events.
    auto onStateChanged() -> Signal<PipelineState, PipelineState>&;
    auto onWakeWord() -> Signal<std::string, float>&;
    auto onTranscriptPartial() -> Signal<TurnId, std::string>&;
    auto onTranscriptFinal() -> Signal<TurnId, std::string>&;
    auto onResponseChunk() -> Signal<ResponseChunk>&;
    auto onAudioChunkReady() -> Signal<SynthesisChunk>&;
    auto onTurnCompleted() -> Signal<Turn>&;
    auto onTurnAborted() -> Signal<Turn>&;
    auto onBargeIn() -> Signal<TurnId>&;
    auto onSegmentEvicted() -> Signal<TurnId, std::uint64_t>&;
    auto onError() -> Signal<PipelineError>&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
