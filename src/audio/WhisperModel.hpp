// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace voicecore
{

struct WhisperModelConfig
{
    std::string modelPath;
    int threads = 4;
    bool translate = false;
};

/// @brief A loaded whisper.cpp model. Calls are serialized; the model is not reentrant.
class WhisperModel
{
  public:
    struct Segment
    {
        std::string text;
        float confidence = 0.0f; ///< Mean token probability.
    };

    struct Transcript
    {
        std::string text;
        float confidence = 0.0f;
    };

    using SegmentCallback = std::function<void(const Segment& segment)>;

    WhisperModel();
    ~WhisperModel();

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    [[nodiscard]] auto load(const WhisperModelConfig& config) -> VoidResult;

    void unload();

    [[nodiscard]] auto isLoaded() const -> bool;

    /// @brief Transcribes 16 kHz mono float32 PCM.
    /// @param samples The audio.
    /// @param language Spoken language code, or "auto".
    /// @param onSegment Invoked for each decoded segment, may be empty.
    /// @param stop Aborts decoding with ErrorCode::Cancelled.
    [[nodiscard]] auto transcribe(std::span<const float> samples,
                                  std::string_view language,
                                  const SegmentCallback& onSegment,
                                  std::stop_token stop) -> Result<Transcript>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Trims whitespace and blanks out whisper's non-speech markers such as "[BLANK_AUDIO]".
[[nodiscard]] auto cleanTranscript(std::string_view text) -> std::string;

} // namespace voicecore
