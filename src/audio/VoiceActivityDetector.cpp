// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace voicecore
{

EnergyVoiceActivityDetector::EnergyVoiceActivityDetector(EnergyVadConfig config): _config(config)
{
}

auto EnergyVoiceActivityDetector::speechProbability(std::span<const float> samples, float energyThreshold) -> float
{
    if (samples.empty() || energyThreshold <= 0.0f)
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: samples)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(samples.size()));

    return std::min(1.0f, energy / (energyThreshold * 2.0f));
}

auto EnergyVoiceActivityDetector::process(const AudioFrame& frame) -> Result<VadEvent>
{
    if (_config.sampleRate <= 0)
        return makeError(ErrorCode::InvalidArgument, "VAD sample rate must be positive");

    auto const frameMs = 1000.0 * static_cast<double>(frame.samples.size()) / _config.sampleRate;
    auto const probability = speechProbability(frame.samples, _config.energyThreshold);

    if (!_speaking)
    {
        if (probability < _config.threshold)
        {
            _speechMs = 0.0;
            return VadEvent::None;
        }

        _speechMs += frameMs;
        if (_speechMs < _config.minSpeechMs)
            return VadEvent::None;

        _speaking = true;
        _silenceMs = 0.0;
        _pauseReported = false;
        log::trace("VAD: speech start (frame {}, p={:.2f})", frame.sequence, probability);
        return VadEvent::SpeechStart;
    }

    if (probability >= _config.negativeThreshold)
    {
        _silenceMs = 0.0;
        _pauseReported = false;
        return VadEvent::None;
    }

    _silenceMs += frameMs;
    if (_silenceMs >= _config.silenceMs)
    {
        _speaking = false;
        _speechMs = 0.0;
        log::trace("VAD: speech end (frame {})", frame.sequence);
        return VadEvent::SpeechEnd;
    }

    if (!_pauseReported && _silenceMs >= _config.pauseMs)
    {
        _pauseReported = true;
        return VadEvent::SpeechPause;
    }
    return VadEvent::None;
}

void EnergyVoiceActivityDetector::reset()
{
    _speaking = false;
    _pauseReported = false;
    _speechMs = 0.0;
    _silenceMs = 0.0;
}

} // namespace voicecore
