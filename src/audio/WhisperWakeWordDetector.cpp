// SPDX-License-Identifier: Apache-2.0
#include "WhisperWakeWordDetector.hpp"

#include <audio/PhraseMatcher.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace voicecore
{

WhisperWakeWordDetector::WhisperWakeWordDetector(WhisperWakeWordConfig config): _config(std::move(config))
{
}

auto WhisperWakeWordDetector::load() -> VoidResult
{
    if (_config.phrases.empty())
        return makeError(ErrorCode::ConfigError, "No activation phrase configured");
    return _model.load(_config.model);
}

auto WhisperWakeWordDetector::samplesFor(std::chrono::milliseconds duration) const -> std::size_t
{
    return static_cast<std::size_t>(duration.count()) * static_cast<std::size_t>(_config.sampleRate) / 1000;
}

auto WhisperWakeWordDetector::windowSamples() const -> std::size_t
{
    return samplesFor(_config.window);
}

auto WhisperWakeWordDetector::strideSamples() const -> std::size_t
{
    return samplesFor(_config.stride);
}

auto WhisperWakeWordDetector::process(const AudioFrame& frame) -> Result<std::optional<WakeWordDetection>>
{
    if (_cooldownRemaining > 0)
    {
        _cooldownRemaining -= std::min(_cooldownRemaining, frame.samples.size());
        return std::nullopt;
    }

    _window.insert(_window.end(), frame.samples.begin(), frame.samples.end());
    auto const capacity = windowSamples();
    while (_window.size() > capacity)
        _window.pop_front();

    _sinceLastCheck += frame.samples.size();
    if (_sinceLastCheck < strideSamples() || _window.size() < capacity / 2)
        return std::nullopt;
    _sinceLastCheck = 0;

    auto energy = 0.0f;
    for (auto const sample: _window)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(_window.size()));
    if (energy < _config.energyGate)
        return std::nullopt;

    auto const samples = std::vector<float>(_window.begin(), _window.end());
    auto transcript = _model.transcribe(samples, _config.language, {}, std::stop_token {});
    if (!transcript)
        return std::unexpected(transcript.error());
    if (transcript->text.empty())
        return std::nullopt;

    auto best = WakeWordDetection {};
    for (auto const& phrase: _config.phrases)
    {
        auto const score = matchPhrase(transcript->text, phrase);
        if (score > best.confidence)
            best = WakeWordDetection { .phrase = phrase, .confidence = score };
    }

    log::trace("Wake window heard \"{}\" (best '{}' at {:.2f})", transcript->text, best.phrase, best.confidence);
    if (best.confidence < _config.minScore)
        return std::nullopt;

    reset();
    _cooldownRemaining = samplesFor(_config.cooldown);
    return best;
}

void WhisperWakeWordDetector::reset()
{
    _window.clear();
    _sinceLastCheck = 0;
    _cooldownRemaining = 0;
}

} // namespace voicecore
