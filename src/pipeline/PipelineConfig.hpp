// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/SentenceChunker.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voicecore
{

/// @brief What interrupts a reply that is being synthesized or spoken.
enum class BargeInTrigger : std::uint8_t
{
    /// Voice activity or the activation phrase.
    Speech,
    /// Only the activation phrase (for setups without echo cancellation).
    WakeWord,
    Off,
};

[[nodiscard]] constexpr auto bargeInTriggerName(BargeInTrigger trigger) noexcept -> std::string_view
{
    switch (trigger)
    {
        case BargeInTrigger::Speech: return "speech";
        case BargeInTrigger::WakeWord: return "wake-word";
        case BargeInTrigger::Off: return "off";
    }
    return "speech";
}

[[nodiscard]] constexpr auto parseBargeInTrigger(std::string_view name) noexcept -> std::optional<BargeInTrigger>
{
    if (name == "speech")
        return BargeInTrigger::Speech;
    if (name == "wake-word")
        return BargeInTrigger::WakeWord;
    if (name == "off")
        return BargeInTrigger::Off;
    return std::nullopt;
}

/// @brief Behavior of the pipeline orchestrator.
struct PipelineConfig
{
    /// Minimum activation confidence that opens a capture.
    float wakeThreshold = 0.5f;

    int sampleRate = 16000;
    int frameSamples = 512;

    /// Captures are finalized after this much audio; zero disables the forced finalize.
    std::chrono::milliseconds maxSegmentDuration { 30'000 };

    /// Ring buffer size of a capture in frames; zero derives it from maxSegmentDuration.
    std::size_t segmentCapacityFrames = 0;

    /// Audio kept from before a capture opens and prepended to it. Covers the
    /// delay of speech-start and activation detection.
    std::chrono::milliseconds preRoll { 750 };

    /// A capture without any detected speech is dropped after this long.
    std::chrono::milliseconds listenTimeout { 8'000 };

    /// A processing stage that makes no progress for this long fails the turn.
    std::chrono::milliseconds stageTimeout { 60'000 };

    /// Time spent in the Error state before listening again.
    std::chrono::milliseconds errorRecoveryDelay { 0 };

    BargeInTrigger bargeIn = BargeInTrigger::Speech;

    SynthesisGranularity granularity = SynthesisGranularity::Sentence;
    std::size_t minSentenceChars = 0;

    std::string language = "en";
    std::string systemPrompt = "You are a helpful voice assistant. Keep your answers short and conversational.";
    std::size_t maxHistoryTurns = 10;
};

/// @brief Number of frames that fit into maxSegmentDuration, rounded up.
[[nodiscard]] inline auto framesForDuration(const PipelineConfig& config, std::chrono::milliseconds duration)
    -> std::size_t
{
    auto const samples = static_cast<std::size_t>(duration.count()) * static_cast<std::size_t>(config.sampleRate) / 1000;
    auto const perFrame = static_cast<std::size_t>(config.frameSamples > 0 ? config.frameSamples : 512);
    return (samples + perFrame - 1) / perFrame;
}

/// @brief The effective capture ring buffer size in frames.
[[nodiscard]] inline auto segmentCapacity(const PipelineConfig& config) -> std::size_t
{
    if (config.segmentCapacityFrames > 0)
        return config.segmentCapacityFrames;
    if (config.maxSegmentDuration.count() > 0)
        return framesForDuration(config, config.maxSegmentDuration);
    return framesForDuration(config, std::chrono::milliseconds { 30'000 });
}

} // namespace voicecore
