// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/WakeWordDetector.hpp>
#include <audio/WhisperModel.hpp>

#include <chrono>
#include <deque>
#include <string>
#include <vector>

namespace voicecore
{

struct WhisperWakeWordConfig
{
    WhisperModelConfig model;
    std::vector<std::string> phrases { "hey assistant" };
    std::string language = "en";
    int sampleRate = 16000;

    /// Length of the audio window that is transcribed.
    std::chrono::milliseconds window { 2000 };

    /// Distance between two transcriptions of the window.
    std::chrono::milliseconds stride { 500 };

    /// Windows quieter than this RMS level are not transcribed.
    float energyGate = 0.005f;

    /// Candidates scoring below this are not reported.
    float minScore = 0.4f;

    /// Quiet period after a reported candidate.
    std::chrono::milliseconds cooldown { 2000 };
};

/// @brief Spots activation phrases by transcribing a rolling audio window with whisper.cpp.
///
/// The transcript is fuzzy-matched against each phrase. After a reported
/// candidate the window is cleared and no audio is examined for the cooldown
/// period, so one utterance is reported once.
class WhisperWakeWordDetector final: public WakeWordDetector
{
  public:
    explicit WhisperWakeWordDetector(WhisperWakeWordConfig config);

    [[nodiscard]] auto load() -> VoidResult;

    [[nodiscard]] auto process(const AudioFrame& frame) -> Result<std::optional<WakeWordDetection>> override;

    void reset() override;

  private:
    [[nodiscard]] auto windowSamples() const -> std::size_t;
    [[nodiscard]] auto strideSamples() const -> std::size_t;
    [[nodiscard]] auto samplesFor(std::chrono::milliseconds duration) const -> std::size_t;

    WhisperWakeWordConfig _config;
    WhisperModel _model;
    std::deque<float> _window;
    std::size_t _sinceLastCheck = 0;
    std::size_t _cooldownRemaining = 0;
};

} // namespace voicecore
