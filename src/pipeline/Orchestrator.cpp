// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <core/Log.hpp>
#include <llm/ChatSession.hpp>
#include <pipeline/PlaybackQueue.hpp>
#include <pipeline/SentenceChunker.hpp>
#include <pipeline/SpeechSegmentAssembler.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <variant>
#include <vector>

namespace voicecore
{

namespace
{
    // Results posted back by the per-turn workers.
    struct TranscriptPartial
    {
        TurnId turn;
        std::string text;
    };

    struct TranscriptFinal
    {
        TurnId turn;
        std::string text;
    };

    struct ResponseChunkReceived
    {
        TurnId turn;
        std::uint32_t sequence;
        std::string text;
    };

    struct GenerationFinished
    {
        TurnId turn;
    };

    struct SynthesisStarted
    {
        TurnId turn;
        std::uint32_t unit;
    };

    struct SynthesisChunkReady
    {
        SynthesisChunk chunk;
    };

    struct SynthesisFinished
    {
        TurnId turn;
        std::uint32_t totalChunks;
    };

    struct StageFailed
    {
        TurnId turn;
        PipelineStage stage;
        Error error;
    };

    struct PlaybackEnded
    {
        PlaybackTag tag;
    };

    struct ClearHistory
    {
    };

    struct ConfigurationProblem
    {
        Error problem;
    };

    using Event = std::variant<FrameCaptured,
                               WakeWordDetected,
                               ManualWake,
                               SpeechStarted,
                               SpeechPaused,
                               SpeechEnded,
                               AudioDeviceFailed,
                               AudioDeviceRecovered,
                               TextSubmitted,
                               TranscriptPartial,
                               TranscriptFinal,
                               ResponseChunkReceived,
                               GenerationFinished,
                               SynthesisStarted,
                               SynthesisChunkReady,
                               SynthesisFinished,
                               StageFailed,
                               PlaybackEnded,
                               ClearHistory,
                               ConfigurationProblem>;

    enum class DeadlineKind : std::uint8_t
    {
        None,
        Listen,
        Stage,
        ErrorRecovery,
    };

    [[nodiscard]] auto isBlank(std::string_view text) -> bool
    {
        return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
    }

    [[nodiscard]] auto stageFor(PipelineState state) -> PipelineStage
    {
        switch (state)
        {
            case PipelineState::Capturing: return PipelineStage::Capture;
            case PipelineState::Transcribing: return PipelineStage::Transcription;
            case PipelineState::Generating: return PipelineStage::Generation;
            case PipelineState::Synthesizing: return PipelineStage::Synthesis;
            case PipelineState::Speaking: return PipelineStage::Playback;
            default: return PipelineStage::Internal;
        }
    }

    /// Text units waiting for the synthesis worker of one turn.
    struct SynthesisInbox
    {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::deque<std::string> units;
        bool closed = false;

        void push(std::string unit)
        {
            {
                auto const lock = std::lock_guard { mutex };
                units.push_back(std::move(unit));
            }
            cv.notify_all();
        }

        void close()
        {
            {
                auto const lock = std::lock_guard { mutex };
                closed = true;
            }
            cv.notify_all();
        }
    };

    /// Everything owned by one turn. Workers only touch the inbox, the stop token
    /// and the running counter; the rest belongs to the loop thread.
    struct TurnContext
    {
        Turn turn;
        std::stop_source stop;
        std::shared_ptr<std::atomic<int>> running = std::make_shared<std::atomic<int>>(0);
        std::shared_ptr<SynthesisInbox> inbox = std::make_shared<SynthesisInbox>();

        bool speechSeen = false;
        std::size_t capturedSamples = 0;
        std::uint32_t responseChunks = 0;
        std::uint32_t synthesisUnits = 0;
        bool generationDone = false;

        std::jthread transcriptionWorker;
        std::jthread generationWorker;
        std::jthread synthesisWorker;

        void cancel()
        {
            stop.request_stop();
            inbox->close();
        }

        [[nodiscard]] auto finished() const -> bool { return running->load() == 0; }
    };
} // namespace

struct Orchestrator::Impl
{
    Impl(PipelineConfig cfg, Dependencies deps):
        config(std::move(cfg)),
        transcription(deps.transcription),
        generation(deps.generation),
        synthesis(deps.synthesis),
        sink(deps.sink),
        assembler(segmentCapacity(config)),
        preRollCapacity(framesForDuration(config, config.preRoll)),
        playback(deps.sink),
        session(config.systemPrompt, config.maxHistoryTurns),
        chunker(config.granularity, config.minSentenceChars)
    {
        assembler.setEvictionCallback([this](TurnId turn, std::uint64_t evictedFrames) {
            segmentEvicted.emit(turn, evictedFrames);
        });
        sink.onPlaybackEnded([this](PlaybackTag tag) { enqueue(PlaybackEnded { tag }); });
    }

    PipelineConfig config;
    TranscriptionManager& transcription;
    GenerationManager& generation;
    SynthesisManager& synthesis;
    AudioSink& sink;

    Signal<PipelineState, PipelineState> stateChanged;
    Signal<std::string, float> wakeWord;
    Signal<TurnId, std::string> transcriptPartial;
    Signal<TurnId, std::string> transcriptFinal;
    Signal<ResponseChunk> responseChunk;
    Signal<SynthesisChunk> audioChunkReady;
    Signal<Turn> turnCompleted;
    Signal<Turn> turnAborted;
    Signal<TurnId> bargeIn;
    Signal<TurnId, std::uint64_t> segmentEvicted;
    Signal<PipelineError> error;

    // Event queue, shared with workers and the audio front end.
    std::mutex queueMutex;
    std::condition_variable_any queueCv;
    std::deque<Event> queue;

    std::atomic<PipelineState> publicState { PipelineState::Idle };
    std::atomic<TurnId> publicTurn { NoTurn };
    std::atomic<bool> running { false };

    // Loop-thread state.
    PipelineState state = PipelineState::Idle;
    SpeechSegmentAssembler assembler;
    std::deque<AudioFrame> preRoll; ///< Most recent frames seen outside a capture.
    std::size_t preRollCapacity = 0;
    PlaybackQueue playback;
    ChatSession session;
    SentenceChunker chunker;
    TurnId nextTurn = 1;
    bool deviceAvailable = true;
    std::unique_ptr<TurnContext> active;
    std::vector<std::unique_ptr<TurnContext>> retired;
    DeadlineKind deadlineKind = DeadlineKind::None;
    std::optional<TimePoint> deadline;

    // Declared last so that it is joined before the state above is destroyed.
    std::jthread loop;

    void enqueue(Event event)
    {
        {
            auto const lock = std::lock_guard { queueMutex };
            queue.push_back(std::move(event));
        }
        queueCv.notify_one();
    }

    void run(std::stop_token stop)
    {
        log::debug("Pipeline event loop started");
        while (!stop.stop_requested())
        {
            auto event = std::optional<Event> {};
            {
                auto lock = std::unique_lock { queueMutex };
                auto const ready = [this] { return !queue.empty(); };
                if (deadline)
                    queueCv.wait_until(lock, stop, *deadline, ready);
                else
                    queueCv.wait(lock, stop, ready);

                if (stop.stop_requested())
                    break;
                if (!queue.empty())
                {
                    event = std::move(queue.front());
                    queue.pop_front();
                }
            }

            guarded([&] {
                if (event)
                    std::visit([this](auto& e) { handle(e); }, *event);
                checkDeadline();
            });
            pruneRetired();
        }
        log::debug("Pipeline event loop stopped");
    }

    /// Runs a handler; any exception ends the active turn and sends the pipeline back to listening.
    template <typename F>
    void guarded(F&& handler)
    {
        try
        {
            handler();
        }
        catch (const std::exception& e)
        {
            auto const turn = active ? active->turn.id : NoTurn;
            log::error("Unexpected failure in pipeline state {} (turn {}): {}", stateName(state), turn, e.what());
            try
            {
                error.emit(PipelineError {
                    .stage = PipelineStage::Internal,
                    .code = ErrorCode::InternalError,
                    .detail = e.what(),
                    .turn = turn,
                });
                abortTurn(TurnOutcome::Failed);
                enterError();
            }
            catch (const std::exception& nested)
            {
                log::error("Recovery after failure in turn {} failed: {}", turn, nested.what());
                forceListening();
            }
        }
    }

    /// Last-resort reset that emits nothing.
    void forceListening()
    {
        if (active)
        {
            active->cancel();
            retired.push_back(std::move(active));
        }
        assembler.discard();
        playback.flush();
        state = running.load() && deviceAvailable ? PipelineState::WakeListening : PipelineState::Idle;
        publicState.store(state);
        publicTurn.store(NoTurn);
        clearDeadline();
    }

    void checkDeadline()
    {
        if (!deadline || Clock::now() < *deadline)
            return;

        auto const kind = std::exchange(deadlineKind, DeadlineKind::None);
        deadline.reset();

        switch (kind)
        {
            case DeadlineKind::None: break;
            case DeadlineKind::Listen:
                if (state == PipelineState::Capturing && active)
                {
                    log::info("No speech within {} ms, discarding capture of turn {}",
                              config.listenTimeout.count(),
                              active->turn.id);
                    abortTurn(TurnOutcome::Discarded);
                    setState(PipelineState::WakeListening);
                }
                break;
            case DeadlineKind::Stage:
                if (active)
                {
                    auto const stage = stageFor(state);
                    log::warning("Turn {} stalled in {} for {} ms", active->turn.id, stateName(state), config.stageTimeout.count());
                    failTurn(stage,
                             Error { ErrorCode::TimeoutError,
                                     std::format("{} made no progress within {} ms",
                                                 stageName(stage),
                                                 config.stageTimeout.count()) });
                }
                break;
            case DeadlineKind::ErrorRecovery:
                if (state == PipelineState::Error)
                    setState(PipelineState::WakeListening);
                break;
        }
    }

    void setDeadline(DeadlineKind kind, std::chrono::milliseconds after)
    {
        if (after.count() <= 0)
        {
            clearDeadline();
            return;
        }
        deadlineKind = kind;
        deadline = Clock::now() + after;
    }

    void clearDeadline()
    {
        deadlineKind = DeadlineKind::None;
        deadline.reset();
    }

    /// Restarts the stall watchdog after progress of the active turn.
    void touchStage()
    {
        switch (state)
        {
            case PipelineState::Transcribing:
            case PipelineState::Generating:
            case PipelineState::Synthesizing:
            case PipelineState::Speaking: setDeadline(DeadlineKind::Stage, config.stageTimeout); break;
            default: break;
        }
    }

    void pruneRetired()
    {
        std::erase_if(retired, [](auto const& context) { return context->finished(); });
    }

    void setState(PipelineState to)
    {
        if (to == state)
            return;

        auto const from = std::exchange(state, to);
        publicState.store(to);
        log::debug("Pipeline state {} -> {}", stateName(from), stateName(to));

        switch (to)
        {
            case PipelineState::Capturing: setDeadline(DeadlineKind::Listen, config.listenTimeout); break;
            case PipelineState::Transcribing:
            case PipelineState::Generating:
            case PipelineState::Synthesizing:
            case PipelineState::Speaking: setDeadline(DeadlineKind::Stage, config.stageTimeout); break;
            case PipelineState::Error: setDeadline(DeadlineKind::ErrorRecovery, config.errorRecoveryDelay); break;
            default: clearDeadline(); break;
        }

        stateChanged.emit(from, to);
    }

    void enterError()
    {
        setState(PipelineState::Error);
        if (config.errorRecoveryDelay.count() <= 0)
            setState(deviceAvailable ? PipelineState::WakeListening : PipelineState::Idle);
    }

    [[nodiscard]] auto isActive(TurnId turn) const -> bool { return active && active->turn.id == turn; }

    auto newTurn(TurnSource source) -> TurnContext&
    {
        active = std::make_unique<TurnContext>();
        active->turn.id = nextTurn++;
        active->turn.source = source;
        active->turn.timings.activated = Clock::now();
        publicTurn.store(active->turn.id);
        return *active;
    }

    void retireActive()
    {
        if (!active)
            return;
        active->cancel();
        retired.push_back(std::move(active));
        publicTurn.store(NoTurn);
    }

    /// Ends the active turn early. Nothing it produced is played after this returns.
    void abortTurn(TurnOutcome outcome)
    {
        if (!active)
            return;

        if (playback.currentTurn() == active->turn.id)
            playback.flush();
        if (assembler.isOpen())
            assembler.discard();
        chunker.reset();

        active->cancel();
        active->turn.outcome = outcome;
        active->turn.timings.closed = Clock::now();
        auto turn = active->turn;
        retireActive();

        log::info("Turn {} {}", turn.id, turnOutcomeName(outcome));
        turnAborted.emit(turn);
    }

    void failTurn(PipelineStage stage, const Error& cause)
    {
        auto const turn = active ? active->turn.id : NoTurn;
        log::error("Turn {} failed in {}: {}", turn, stageName(stage), cause);
        error.emit(PipelineError { .stage = stage, .code = cause.code, .detail = cause.message, .turn = turn });
        abortTurn(TurnOutcome::Failed);
        enterError();
    }

    void completeTurn()
    {
        auto& context = *active;
        context.turn.outcome = TurnOutcome::Completed;
        context.turn.timings.closed = Clock::now();
        context.turn.playedChunks = playback.playedChunks();

        auto const& t = context.turn.timings;
        log::info("Turn {} completed: transcript {} ms, first token {} ms, first audio {} ms, total {} ms",
                  context.turn.id,
                  elapsedMs(t.activated, t.transcriptFinal),
                  elapsedMs(t.transcriptFinal, t.firstResponseChunk),
                  elapsedMs(t.firstResponseChunk, t.firstAudioChunk),
                  elapsedMs(t.activated, t.closed));

        session.addExchange(context.turn.transcript, context.turn.reply);
        auto turn = context.turn;
        retireActive();
        setState(PipelineState::WakeListening);
        turnCompleted.emit(turn);
    }

    void beginCapture()
    {
        auto& context = newTurn(TurnSource::Voice);
        if (auto opened = assembler.open(context.turn.id); !opened)
        {
            // A stale segment without a turn; drop it and retry once.
            log::warning("Discarding stale speech segment: {}", opened.error());
            assembler.discard();
            if (auto retried = assembler.open(context.turn.id); !retried)
            {
                failTurn(PipelineStage::Capture, retried.error());
                return;
            }
        }
        seedCapture();
        log::info("Turn {}: listening", context.turn.id);
        setState(PipelineState::Capturing);
    }

    /// Moves the buffered pre-roll into the segment just opened.
    void seedCapture()
    {
        if (preRoll.empty())
            return;
        log::trace("Turn {}: prepending {} frame(s) of pre-roll", active->turn.id, preRoll.size());
        while (!preRoll.empty())
        {
            active->capturedSamples += preRoll.front().samples.size();
            if (auto appended = assembler.append(std::move(preRoll.front())); !appended)
                log::warning("Turn {}: could not prepend pre-roll: {}", active->turn.id, appended.error());
            preRoll.pop_front();
        }
    }

    void keepPreRoll(AudioFrame frame)
    {
        if (preRollCapacity == 0)
            return;
        if (preRoll.size() == preRollCapacity)
            preRoll.pop_front();
        preRoll.push_back(std::move(frame));
    }

    /// Flushes playback, cancels the reply in progress, and starts a new capture.
    void interrupt()
    {
        if (!active)
            return;
        auto const turn = active->turn.id;
        log::info("Barge-in: interrupting turn {}", turn);
        playback.flush();
        abortTurn(TurnOutcome::Interrupted);
        bargeIn.emit(turn);
    }

    [[nodiscard]] auto isReplying() const -> bool
    {
        return state == PipelineState::Synthesizing || state == PipelineState::Speaking;
    }

    void finalizeCapture()
    {
        auto segment = assembler.finalize();
        if (!segment)
        {
            failTurn(PipelineStage::Capture, segment.error());
            return;
        }

        auto& context = *active;
        context.turn.timings.captureEnded = Clock::now();
        log::debug("Turn {}: captured {} frames ({} evicted)",
                   context.turn.id,
                   segment->frameCount,
                   segment->evictedFrames);
        setState(PipelineState::Transcribing);

        auto request = TranscriptionRequest {
            .turn = context.turn.id,
            .samples = std::move(segment->samples),
            .sampleRate = config.sampleRate,
            .language = config.language,
        };
        context.running->fetch_add(1);
        context.transcriptionWorker =
            std::jthread([this, request = std::move(request), token = context.stop.get_token(), running = context.running] {
                runTranscription(request, token);
                running->fetch_sub(1);
            });
    }

    void beginGeneration()
    {
        auto& context = *active;
        setState(PipelineState::Generating);
        playback.beginTurn(context.turn.id);
        chunker.reset();

        auto request = GenerationRequest {
            .turn = context.turn.id,
            .messages = session.requestMessages(context.turn.transcript),
        };
        context.running->fetch_add(1);
        context.generationWorker =
            std::jthread([this, request = std::move(request), token = context.stop.get_token(), running = context.running] {
                runGeneration(request, token);
                running->fetch_sub(1);
            });
    }

    void queueSynthesis(std::vector<std::string> units)
    {
        auto& context = *active;
        for (auto& unit: units)
        {
            ++context.synthesisUnits;
            context.inbox->push(std::move(unit));
        }

        if (context.synthesisUnits > 0 && !context.synthesisWorker.joinable())
        {
            context.running->fetch_add(1);
            context.synthesisWorker = std::jthread(
                [this, turn = context.turn.id, inbox = context.inbox, token = context.stop.get_token(), running = context.running] {
                    runSynthesis(turn, *inbox, token);
                    running->fetch_sub(1);
                });
        }
    }

    void runTranscription(const TranscriptionRequest& request, std::stop_token stop)
    {
        auto finalText = std::optional<std::string> {};
        auto partials = std::string {};

        auto const result = transcription.streamRequest(
            request,
            [&](const TranscriptChunk& chunk) {
                if (chunk.isFinal)
                {
                    finalText = chunk.text;
                    return;
                }
                partials += chunk.text;
                enqueue(TranscriptPartial { request.turn, chunk.text });
            },
            stop);

        if (!result)
        {
            if (result.error().code != ErrorCode::Cancelled)
                enqueue(StageFailed { request.turn, PipelineStage::Transcription, result.error() });
            return;
        }
        enqueue(TranscriptFinal { request.turn, finalText.value_or(partials) });
    }

    void runGeneration(const GenerationRequest& request, std::stop_token stop)
    {
        auto sequence = std::uint32_t { 0 };
        auto const result = generation.streamRequest(
            request,
            [&](const TextChunk& chunk) {
                if (chunk.delta.empty())
                    return;
                enqueue(ResponseChunkReceived { request.turn, sequence++, chunk.delta });
            },
            stop);

        if (!result)
        {
            if (result.error().code != ErrorCode::Cancelled)
                enqueue(StageFailed { request.turn, PipelineStage::Generation, result.error() });
            return;
        }
        enqueue(GenerationFinished { request.turn });
    }

    void runSynthesis(TurnId turn, SynthesisInbox& inbox, std::stop_token stop)
    {
        auto unit = std::uint32_t { 0 };
        auto sequence = std::uint32_t { 0 };

        while (true)
        {
            auto text = std::string {};
            {
                auto lock = std::unique_lock { inbox.mutex };
                inbox.cv.wait(lock, stop, [&] { return !inbox.units.empty() || inbox.closed; });
                if (stop.stop_requested())
                    return;
                if (inbox.units.empty())
                    break;
                text = std::move(inbox.units.front());
                inbox.units.pop_front();
            }

            enqueue(SynthesisStarted { turn, unit++ });
            auto const result = synthesis.streamRequest(
                SynthesisRequest { .turn = turn, .text = std::move(text) },
                [&](const AudioChunk& audio) {
                    if (audio.samples.empty())
                        return;
                    enqueue(SynthesisChunkReady { SynthesisChunk { .turn = turn, .sequence = sequence++, .audio = audio } });
                },
                stop);

            if (!result)
            {
                if (result.error().code != ErrorCode::Cancelled)
                    enqueue(StageFailed { turn, PipelineStage::Synthesis, result.error() });
                return;
            }
        }
        enqueue(SynthesisFinished { turn, sequence });
    }

    void handle(FrameCaptured& event)
    {
        if (state != PipelineState::Capturing || !active || !assembler.isOpen())
        {
            keepPreRoll(std::move(event.frame));
            return;
        }

        auto const samples = event.frame.samples.size();
        if (auto appended = assembler.append(std::move(event.frame)); !appended)
        {
            failTurn(PipelineStage::Capture, appended.error());
            return;
        }

        active->capturedSamples += samples;
        if (config.maxSegmentDuration.count() > 0)
        {
            auto const limit = static_cast<std::size_t>(config.maxSegmentDuration.count())
                               * static_cast<std::size_t>(config.sampleRate) / 1000;
            if (active->capturedSamples >= limit)
            {
                log::info("Turn {}: maximum utterance length reached", active->turn.id);
                finalizeCapture();
            }
        }
    }

    void handle(WakeWordDetected& event)
    {
        if (event.confidence < config.wakeThreshold)
        {
            log::debug("Ignoring activation '{}' with confidence {:.2f} (threshold {:.2f})",
                       event.phrase,
                       event.confidence,
                       config.wakeThreshold);
            return;
        }

        if (state == PipelineState::WakeListening)
        {
            log::info("Activation '{}' (confidence {:.2f})", event.phrase, event.confidence);
            wakeWord.emit(event.phrase, event.confidence);
            beginCapture();
            return;
        }

        if (isReplying() && config.bargeIn != BargeInTrigger::Off)
        {
            wakeWord.emit(event.phrase, event.confidence);
            interrupt();
            beginCapture();
            return;
        }

        log::trace("Activation ignored in state {}", stateName(state));
    }

    void handle(ManualWake&)
    {
        auto event = WakeWordDetected { .phrase = "manual", .confidence = 1.0f };
        handle(event);
    }

    void handle(SpeechStarted&)
    {
        if (state == PipelineState::Capturing && active)
        {
            if (!active->speechSeen)
            {
                active->speechSeen = true;
                if (deadlineKind == DeadlineKind::Listen)
                    clearDeadline();
            }
            return;
        }

        if (isReplying() && config.bargeIn == BargeInTrigger::Speech)
        {
            interrupt();
            beginCapture();
            if (active)
            {
                active->speechSeen = true;
                clearDeadline();
            }
        }
    }

    void handle(SpeechPaused&)
    {
        if (state == PipelineState::Capturing && active)
            log::trace("Turn {}: speaker paused", active->turn.id);
    }

    void handle(SpeechEnded&)
    {
        if (state == PipelineState::Capturing && active)
            finalizeCapture();
    }

    void handle(AudioDeviceFailed& event)
    {
        log::error("Audio device failed: {}", event.detail);
        deviceAvailable = false;
        error.emit(PipelineError {
            .stage = PipelineStage::Audio,
            .code = ErrorCode::AudioError,
            .detail = event.detail,
            .turn = active ? active->turn.id : NoTurn,
        });
        abortTurn(TurnOutcome::Failed);
        setState(PipelineState::Idle);
    }

    void handle(AudioDeviceRecovered&)
    {
        if (deviceAvailable)
            return;
        deviceAvailable = true;
        log::info("Audio device available again");
        if (state == PipelineState::Idle && running.load())
            setState(PipelineState::WakeListening);
    }

    void handle(TextSubmitted& event)
    {
        if (isBlank(event.text))
            return;

        switch (state)
        {
            case PipelineState::Idle:
            case PipelineState::Error:
                log::warning("Text input ignored while {}", stateName(state));
                return;
            case PipelineState::WakeListening: break;
            case PipelineState::Synthesizing:
            case PipelineState::Speaking: interrupt(); break;
            case PipelineState::Capturing:
            case PipelineState::Transcribing:
            case PipelineState::Generating: abortTurn(TurnOutcome::Interrupted); break;
        }

        auto& context = newTurn(TurnSource::Text);
        context.turn.transcript = std::move(event.text);
        context.turn.timings.transcriptFinal = Clock::now();
        log::info("Turn {}: text input", context.turn.id);
        transcriptFinal.emit(context.turn.id, context.turn.transcript);
        beginGeneration();
    }

    void handle(TranscriptPartial& event)
    {
        if (!isActive(event.turn) || state != PipelineState::Transcribing)
            return;
        touchStage();
        transcriptPartial.emit(event.turn, event.text);
    }

    void handle(TranscriptFinal& event)
    {
        if (!isActive(event.turn) || state != PipelineState::Transcribing)
            return;

        if (isBlank(event.text))
        {
            log::info("Turn {}: empty transcript", event.turn);
            abortTurn(TurnOutcome::Discarded);
            setState(PipelineState::WakeListening);
            return;
        }

        auto& context = *active;
        context.turn.transcript = std::move(event.text);
        context.turn.timings.transcriptFinal = Clock::now();
        log::info("Turn {}: \"{}\"", context.turn.id, context.turn.transcript);
        transcriptFinal.emit(context.turn.id, context.turn.transcript);
        beginGeneration();
    }

    void handle(ResponseChunkReceived& event)
    {
        if (!isActive(event.turn))
            return;

        auto& context = *active;
        ++context.responseChunks;
        context.turn.reply += event.text;
        if (!context.turn.timings.firstResponseChunk)
            context.turn.timings.firstResponseChunk = Clock::now();

        if (state == PipelineState::Generating)
            setState(PipelineState::Synthesizing);
        else
            touchStage();

        responseChunk.emit(ResponseChunk { .turn = event.turn, .sequence = event.sequence, .text = event.text });
        queueSynthesis(chunker.feed(event.text));
    }

    void handle(GenerationFinished& event)
    {
        if (!isActive(event.turn))
            return;

        auto& context = *active;
        context.generationDone = true;
        context.turn.timings.generationDone = Clock::now();
        queueSynthesis(chunker.flush());

        if (context.synthesisUnits == 0)
        {
            log::info("Turn {}: empty reply", context.turn.id);
            completeTurn();
            return;
        }
        context.inbox->close();
        touchStage();
    }

    void handle(SynthesisStarted& event)
    {
        if (!isActive(event.turn))
            return;
        if (!active->turn.timings.firstSynthesisStarted)
            active->turn.timings.firstSynthesisStarted = Clock::now();
        log::trace("Turn {}: synthesizing unit {}", event.turn, event.unit);
    }

    void handle(SynthesisChunkReady& event)
    {
        if (!isActive(event.chunk.turn))
            return;

        auto& context = *active;
        if (!context.turn.timings.firstAudioChunk)
            context.turn.timings.firstAudioChunk = Clock::now();
        audioChunkReady.emit(event.chunk);

        auto submitted = playback.submit(std::move(event.chunk));
        if (!submitted)
        {
            failTurn(PipelineStage::Playback, submitted.error());
            return;
        }

        if (state == PipelineState::Synthesizing && playback.enqueuedChunks() > 0)
        {
            context.turn.timings.playbackStarted = Clock::now();
            setState(PipelineState::Speaking);
        }
        else
            touchStage();
    }

    void handle(SynthesisFinished& event)
    {
        if (!isActive(event.turn))
            return;

        playback.markComplete(event.turn, event.totalChunks);
        if (playback.isTurnFinished())
            completeTurn();
    }

    void handle(StageFailed& event)
    {
        if (!isActive(event.turn))
        {
            log::debug("Ignoring {} failure of finished turn {}", stageName(event.stage), event.turn);
            return;
        }
        failTurn(event.stage, event.error);
    }

    void handle(PlaybackEnded& event)
    {
        if (!active)
            return;

        auto const progress = playback.handlePlaybackEnded(event.tag);
        if (!progress.accepted)
            return;

        active->turn.playedChunks = playback.playedChunks();
        if (progress.turnFinished)
            completeTurn();
        else
            touchStage();
    }

    void handle(ClearHistory&)
    {
        session.clear();
        log::info("Conversation history cleared");
    }

    void handle(ConfigurationProblem& event)
    {
        error.emit(PipelineError {
            .stage = PipelineStage::Configuration,
            .code = event.problem.code,
            .detail = std::move(event.problem.message),
            .turn = NoTurn,
        });
    }
};

Orchestrator::Orchestrator(PipelineConfig config, Dependencies dependencies):
    _impl(std::make_unique<Impl>(std::move(config), dependencies))
{
}

Orchestrator::~Orchestrator()
{
    stop();
    _impl->sink.onPlaybackEnded({});
}

auto Orchestrator::start() -> VoidResult
{
    auto& impl = *_impl;
    if (impl.running.load())
        return makeError(ErrorCode::InvalidState, "Pipeline is already running");

    auto const startManager = [&](auto& manager, PipelineStage stage) {
        if (auto started = manager.start(); !started)
        {
            log::error("{}", started.error());
            impl.error.emit(PipelineError {
                .stage = stage,
                .code = started.error().code,
                .detail = started.error().message,
                .turn = NoTurn,
            });
        }
    };
    startManager(impl.transcription, PipelineStage::Transcription);
    startManager(impl.generation, PipelineStage::Generation);
    startManager(impl.synthesis, PipelineStage::Synthesis);

    impl.running.store(true);
    impl.deviceAvailable = true;
    impl.setState(PipelineState::WakeListening);
    impl.loop = std::jthread([&impl](std::stop_token stop) { impl.run(stop); });
    log::info("Voice pipeline started");
    return {};
}

void Orchestrator::stop()
{
    auto& impl = *_impl;
    if (!impl.running.exchange(false))
        return;

    impl.loop.request_stop();
    impl.loop.join();

    // The loop thread is gone; its state may be touched from here.
    impl.abortTurn(TurnOutcome::Interrupted);
    impl.retired.clear();
    impl.playback.flush();
    impl.assembler.discard();
    impl.preRoll.clear();
    impl.chunker.reset();

    impl.transcription.stop();
    impl.generation.stop();
    impl.synthesis.stop();

    {
        auto const lock = std::lock_guard { impl.queueMutex };
        impl.queue.clear();
    }
    impl.setState(PipelineState::Idle);
    log::info("Voice pipeline stopped");
}

auto Orchestrator::isRunning() const -> bool
{
    return _impl->running.load();
}

auto Orchestrator::currentState() const -> PipelineState
{
    return _impl->publicState.load();
}

auto Orchestrator::status() const -> PipelineStatus
{
    return PipelineStatus {
        .state = _impl->publicState.load(),
        .activeTurn = _impl->publicTurn.load(),
        .transcription = _impl->transcription.status(),
        .generation = _impl->generation.status(),
        .synthesis = _impl->synthesis.status(),
    };
}

void Orchestrator::post(InputEvent event)
{
    std::visit([this](auto&& e) { _impl->enqueue(std::forward<decltype(e)>(e)); }, std::move(event));
}

void Orchestrator::triggerWake()
{
    _impl->enqueue(ManualWake {});
}

void Orchestrator::sendText(std::string text)
{
    _impl->enqueue(TextSubmitted { std::move(text) });
}

void Orchestrator::clearHistory()
{
    _impl->enqueue(ClearHistory {});
}

void Orchestrator::reportConfigurationError(Error problem)
{
    _impl->enqueue(ConfigurationProblem { std::move(problem) });
}

auto Orchestrator::onStateChanged() -> Signal<PipelineState, PipelineState>&
{
    return _impl->stateChanged;
}

auto Orchestrator::onWakeWord() -> Signal<std::string, float>&
{
    return _impl->wakeWord;
}

auto Orchestrator::onTranscriptPartial() -> Signal<TurnId, std::string>&
{
    return _impl->transcriptPartial;
}

auto Orchestrator::onTranscriptFinal() -> Signal<TurnId, std::string>&
{
    return _impl->transcriptFinal;
}

auto Orchestrator::onResponseChunk() -> Signal<ResponseChunk>&
{
    return _impl->responseChunk;
}

auto Orchestrator::onAudioChunkReady() -> Signal<SynthesisChunk>&
{
    return _impl->audioChunkReady;
}

auto Orchestrator::onTurnCompleted() -> Signal<Turn>&
{
    return _impl->turnCompleted;
}

auto Orchestrator::onTurnAborted() -> Signal<Turn>&
{
    return _impl->turnAborted;
}

auto Orchestrator::onBargeIn() -> Signal<TurnId>&
{
    return _impl->bargeIn;
}

auto Orchestrator::onSegmentEvicted() -> Signal<TurnId, std::uint64_t>&
{
    return _impl->segmentEvicted;
}

auto Orchestrator::onError() -> Signal<PipelineError>&
{
    return _impl->error;
}

} // namespace voicecore
