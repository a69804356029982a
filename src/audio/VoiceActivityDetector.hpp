// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <span>

namespace voicecore
{

/// @brief Speech boundary reported for a frame.
enum class VadEvent : std::uint8_t
{
    None,
    SpeechStart,
    /// Speech is still considered ongoing although the speaker paused.
    SpeechPause,
    SpeechEnd,
};

/// @brief Abstract voice activity detector, fed one frame at a time.
class VoiceActivityDetector
{
  public:
    virtual ~VoiceActivityDetector() = default;

    /// @brief Processes the next frame.
    /// @return The boundary crossed by this frame, if any.
    [[nodiscard]] virtual auto process(const AudioFrame& frame) -> Result<VadEvent> = 0;

    [[nodiscard]] virtual auto isSpeaking() const -> bool = 0;

    /// @brief Forgets the current utterance state.
    virtual void reset() = 0;
};

struct EnergyVadConfig
{
    int sampleRate = 16000;

    /// RMS level that maps to a speech probability of 0.5.
    float energyThreshold = 0.01f;

    /// Probability at or above which a frame counts as speech.
    float threshold = 0.5f;

    /// Probability below which a frame counts as silence. Between the two, the state is kept.
    float negativeThreshold = 0.35f;

    int minSpeechMs = 250;
    int silenceMs = 1500;
    int pauseMs = 500;
};

/// @brief RMS-energy voice activity detector with hysteresis.
///
/// Speech starts after minSpeechMs of continuous speech frames and ends after
/// silenceMs of continuous silence. A pause longer than pauseMs is reported
/// once as SpeechPause.
class EnergyVoiceActivityDetector: public VoiceActivityDetector
{
  public:
    explicit EnergyVoiceActivityDetector(EnergyVadConfig config = {});

    [[nodiscard]] auto process(const AudioFrame& frame) -> Result<VadEvent> override;
    [[nodiscard]] auto isSpeaking() const -> bool override { return _speaking; }
    void reset() override;

    /// @brief Maps the RMS energy of @p samples to a speech probability in [0, 1].
    [[nodiscard]] static auto speechProbability(std::span<const float> samples, float energyThreshold) -> float;

  private:
    EnergyVadConfig _config;
    bool _speaking = false;
    bool _pauseReported = false;
    double _speechMs = 0.0;
    double _silenceMs = 0.0;
};

} // namespace voicecore
