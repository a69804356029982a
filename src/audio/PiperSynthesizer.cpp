// SPDX-License-Identifier: Apache-2.0
#include "PiperSynthesizer.hpp"

#include <core/Log.hpp>

#include <format>
#include <mutex>

extern "C"
{
#include <piper.h>
}

namespace voicecore
{

namespace
{
    constexpr auto PiperOk = 0;
    constexpr auto PiperDone = 1;
} // namespace

struct PiperSynthesizer::Impl
{
    PiperSynthesizerConfig config;
    mutable std::mutex mutex;
    piper_synthesizer* synth = nullptr;

    ~Impl()
    {
        if (synth)
            piper_free(synth);
    }
};

PiperSynthesizer::PiperSynthesizer(std::string name, PiperSynthesizerConfig config):
    _name(std::move(name)), _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

PiperSynthesizer::~PiperSynthesizer() = default;

auto PiperSynthesizer::start() -> VoidResult
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->synth)
        return {};

    auto const& config = _impl->config;
    auto const configPath = config.modelPath + ".json";
    auto const espeakData =
        config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

    _impl->synth = piper_create(config.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
    if (!_impl->synth)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     configPath,
                                     espeakData));

    log::info("[{}] Piper voice loaded (model: {}, espeak: {})", _name, config.modelPath, espeakData);
    return {};
}

void PiperSynthesizer::stop()
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->synth)
    {
        piper_free(_impl->synth);
        _impl->synth = nullptr;
    }
}

auto PiperSynthesizer::isConnected() const -> bool
{
    auto const lock = std::lock_guard { _impl->mutex };
    return _impl->synth != nullptr;
}

auto PiperSynthesizer::streamRequest(const SynthesisRequest& request,
                                     const ChunkCallback& onChunk,
                                     std::stop_token stop) -> VoidResult
{
    // One synthesis at a time; piper keeps the utterance state in the synthesizer.
    auto const lock = std::lock_guard { _impl->mutex };
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError, "Piper synthesizer not loaded");

    auto opts = piper_default_synthesize_options(_impl->synth);
    auto const startResult = piper_synthesize_start(_impl->synth, request.text.c_str(), &opts);
    if (startResult != PiperOk)
        return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

    auto chunk = piper_audio_chunk {};
    while (true)
    {
        if (stop.stop_requested())
            return makeError(ErrorCode::Cancelled, "Synthesis cancelled");

        auto const rc = piper_synthesize_next(_impl->synth, &chunk);
        if (rc == PiperDone)
            break;
        if (rc < 0)
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));

        if (chunk.num_samples > 0)
            onChunk(AudioChunk { .samples = { chunk.samples, chunk.samples + chunk.num_samples },
                                 .sampleRate = _impl->config.sampleRate });
    }

    log::trace("[{}] Turn {} synthesized \"{}\"", _name, request.turn, request.text);
    return {};
}

} // namespace voicecore
