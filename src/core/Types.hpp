// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voicecore
{

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// @brief Identifies a single user interaction. Strictly increasing; 0 means "no turn".
using TurnId = std::uint64_t;

constexpr auto NoTurn = TurnId { 0 };

/// @brief The single, process-wide state of the voice pipeline.
enum class PipelineState : std::uint8_t
{
    Idle,
    WakeListening,
    Capturing,
    Transcribing,
    Generating,
    Synthesizing,
    Speaking,
    Error,
};

[[nodiscard]] constexpr auto stateName(PipelineState state) noexcept -> std::string_view
{
    switch (state)
    {
        case PipelineState::Idle: return "Idle";
        case PipelineState::WakeListening: return "WakeListening";
        case PipelineState::Capturing: return "Capturing";
        case PipelineState::Transcribing: return "Transcribing";
        case PipelineState::Generating: return "Generating";
        case PipelineState::Synthesizing: return "Synthesizing";
        case PipelineState::Speaking: return "Speaking";
        case PipelineState::Error: return "Error";
    }
    return "Unknown";
}

/// @brief The three kinds of remote or local inference services the pipeline consumes.
enum class ProviderKind : std::uint8_t
{
    Transcription,
    Generation,
    Synthesis,
};

[[nodiscard]] constexpr auto providerKindName(ProviderKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
        case ProviderKind::Transcription: return "transcription";
        case ProviderKind::Generation: return "generation";
        case ProviderKind::Synthesis: return "synthesis";
    }
    return "unknown";
}

/// @brief A fixed-size block of mono float32 PCM samples from the microphone.
struct AudioFrame
{
    std::uint64_t sequence = 0;
    TimePoint captured {};
    std::vector<float> samples;
};

/// @brief A block of synthesized audio.
struct AudioChunk
{
    std::vector<float> samples;
    int sampleRate = 22050;
};

/// @brief A piece of generated reply text, numbered within its turn.
struct ResponseChunk
{
    TurnId turn = NoTurn;
    std::uint32_t sequence = 0;
    std::string text;
};

/// @brief A piece of synthesized audio, numbered within its turn.
struct SynthesisChunk
{
    TurnId turn = NoTurn;
    std::uint32_t sequence = 0;
    AudioChunk audio;
};

/// @brief Participant role in the conversation history.
enum class Role
{
    System,
    User,
    Assistant,
};

[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    return Role::User;
}

/// @brief A single message in the conversation.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
};

/// @brief Where a turn's user input came from.
enum class TurnSource : std::uint8_t
{
    Voice,
    Text,
};

/// @brief How a turn ended.
enum class TurnOutcome : std::uint8_t
{
    Pending,
    Completed,
    Interrupted,
    Failed,
    Discarded,
};

[[nodiscard]] constexpr auto turnOutcomeName(TurnOutcome outcome) noexcept -> std::string_view
{
    switch (outcome)
    {
        case TurnOutcome::Pending: return "pending";
        case TurnOutcome::Completed: return "completed";
        case TurnOutcome::Interrupted: return "interrupted";
        case TurnOutcome::Failed: return "failed";
        case TurnOutcome::Discarded: return "discarded";
    }
    return "unknown";
}

/// @brief Timing marks recorded while a turn progresses through the pipeline.
struct TurnTimings
{
    std::optional<TimePoint> activated;
    std::optional<TimePoint> captureEnded;
    std::optional<TimePoint> transcriptFinal;
    std::optional<TimePoint> firstResponseChunk;
    std::optional<TimePoint> generationDone;
    std::optional<TimePoint> firstSynthesisStarted;
    std::optional<TimePoint> firstAudioChunk;
    std::optional<TimePoint> playbackStarted;
    std::optional<TimePoint> closed;
};

/// @brief Milliseconds between two optional marks, or -1 if either is missing.
[[nodiscard]] inline auto elapsedMs(const std::optional<TimePoint>& from, const std::optional<TimePoint>& to)
    -> long long
{
    if (!from || !to)
        return -1;
    return std::chrono::duration_cast<std::chrono::milliseconds>(*to - *from).count();
}

/// @brief One user interaction: utterance, transcript, reply, and its timings.
struct Turn
{
    TurnId id = NoTurn;
    TurnSource source = TurnSource::Voice;
    std::string transcript;
    std::string reply;
    TurnTimings timings;
    std::uint32_t playedChunks = 0;
    TurnOutcome outcome = TurnOutcome::Pending;
};

/// @brief Pipeline stage an error is attributed to.
enum class PipelineStage : std::uint8_t
{
    Audio,
    Capture,
    Transcription,
    Generation,
    Synthesis,
    Playback,
    Configuration,
    Internal,
};

[[nodiscard]] constexpr auto stageName(PipelineStage stage) noexcept -> std::string_view
{
    switch (stage)
    {
        case PipelineStage::Audio: return "audio";
        case PipelineStage::Capture: return "capture";
        case PipelineStage::Transcription: return "transcription";
        case PipelineStage::Generation: return "generation";
        case PipelineStage::Synthesis: return "synthesis";
        case PipelineStage::Playback: return "playback";
        case PipelineStage::Configuration: return "configuration";
        case PipelineStage::Internal: return "internal";
    }
    return "unknown";
}

/// @brief A user-visible failure.
struct PipelineError
{
    PipelineStage stage = PipelineStage::Internal;
    ErrorCode code = ErrorCode::Unknown;
    std::string detail;
    TurnId turn = NoTurn;
};

} // namespace voicecore
