// SPDX-License-Identifier: Apache-2.0
#include "WhisperTranscriber.hpp"

#include <audio/Resampler.hpp>
#include <core/Log.hpp>

namespace voicecore
{

namespace
{
    constexpr auto WhisperSampleRate = 16000;
}

WhisperTranscriber::WhisperTranscriber(std::string name, WhisperModelConfig config):
    _name(std::move(name)), _config(std::move(config))
{
}

auto WhisperTranscriber::start() -> VoidResult
{
    return _model.load(_config);
}

void WhisperTranscriber::stop()
{
    _model.unload();
}

auto WhisperTranscriber::isConnected() const -> bool
{
    return _model.isLoaded();
}

auto WhisperTranscriber::streamRequest(const TranscriptionRequest& request,
                                       const ChunkCallback& onChunk,
                                       std::stop_token stop) -> VoidResult
{
    auto resampled = std::vector<float> {};
    auto samples = std::span<const float>(request.samples);
    if (request.sampleRate != WhisperSampleRate)
    {
        resampled = resampleLinear(samples, request.sampleRate, WhisperSampleRate);
        samples = resampled;
    }

    auto const onSegment = [&](const WhisperModel::Segment& segment) {
        onChunk(TranscriptChunk { .text = segment.text, .isFinal = false, .confidence = segment.confidence });
    };

    auto transcript = _model.transcribe(samples, request.language, onSegment, stop);
    if (!transcript)
        return std::unexpected(transcript.error());

    log::debug("[{}] Turn {} transcript: \"{}\"", _name, request.turn, transcript->text);
    onChunk(TranscriptChunk { .text = transcript->text, .isFinal = true, .confidence = transcript->confidence });
    return {};
}

} // namespace voicecore
