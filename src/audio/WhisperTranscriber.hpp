// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/WhisperModel.hpp>
#include <provider/Provider.hpp>

#include <string>

namespace voicecore
{

/// @brief Local speech-to-text provider backed by whisper.cpp.
///
/// Emits a partial chunk for every decoded segment and a final chunk with the
/// whole transcript. Audio at other rates is resampled to 16 kHz.
class WhisperTranscriber final: public TranscriptionProvider
{
  public:
    WhisperTranscriber(std::string name, WhisperModelConfig config);

    [[nodiscard]] auto name() const -> const std::string& override { return _name; }
    [[nodiscard]] auto start() -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto streamRequest(const TranscriptionRequest& request,
                                     const ChunkCallback& onChunk,
                                     std::stop_token stop) -> VoidResult override;

  private:
    std::string _name;
    WhisperModelConfig _config;
    WhisperModel _model;
};

} // namespace voicecore
