// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <provider/Provider.hpp>

#include <memory>
#include <string>

namespace voicecore
{

struct PiperSynthesizerConfig
{
    /// @brief Path to the piper voice model (.onnx file). Its config is expected at modelPath + ".json".
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;

    /// @brief Output rate of the voice.
    int sampleRate = 22050;
};

/// @brief Local text-to-speech provider backed by the piper library.
///
/// Streams every chunk piper produces as soon as it is ready.
class PiperSynthesizer final: public SynthesisProvider
{
  public:
    PiperSynthesizer(std::string name, PiperSynthesizerConfig config);
    ~PiperSynthesizer() override;

    [[nodiscard]] auto name() const -> const std::string& override { return _name; }
    [[nodiscard]] auto start() -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto streamRequest(const SynthesisRequest& request,
                                     const ChunkCallback& onChunk,
                                     std::stop_token stop) -> VoidResult override;

    struct Impl;

  private:
    std::string _name;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
