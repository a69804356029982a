// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayback.hpp"

#include <audio/Resampler.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <deque>
#include <format>
#include <mutex>

namespace voicecore
{

struct AudioPlayback::Impl
{
    struct Buffer
    {
        std::vector<float> samples;
        PlaybackTag tag;
    };

    ma_device device {};
    bool initialized = false;
    unsigned sampleRate = 0;

    // Guards the queue and the callback. The data callback reports ended
    // buffers while holding it, so flush() returning means no flushed buffer
    // can be reported any more.
    mutable std::mutex mutex;
    std::deque<Buffer> queue;
    std::size_t readPos = 0;
    PlaybackEndedCallback onEnded;
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioPlayback::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const totalSamples = static_cast<std::size_t>(frameCount);

        auto lock = std::lock_guard(impl->mutex);
        auto written = std::size_t { 0 };
        while (written < totalSamples && !impl->queue.empty())
        {
            auto& front = impl->queue.front();
            auto const remaining = front.samples.size() - impl->readPos;
            auto const toCopy = std::min(totalSamples - written, remaining);
            std::copy_n(front.samples.data() + impl->readPos, toCopy, out + written);
            impl->readPos += toCopy;
            written += toCopy;

            if (impl->readPos >= front.samples.size())
            {
                auto const tag = front.tag;
                impl->queue.pop_front();
                impl->readPos = 0;
                if (impl->onEnded)
                    impl->onEnded(tag);
            }
        }

        if (written < totalSamples)
            std::fill_n(out + written, totalSamples - written, 0.0f);
    }

} // namespace

AudioPlayback::AudioPlayback(): _impl(std::make_unique<Impl>())
{
}

AudioPlayback::~AudioPlayback()
{
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
}

auto AudioPlayback::initialize(unsigned sampleRate) -> VoidResult
{
    if (_impl->initialized)
        return makeError(ErrorCode::InvalidState, "Playback device already initialized");

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = 1;
    config.sampleRate = sampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = _impl.get();

    auto const result = ma_device_init(nullptr, &config, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));
    _impl->initialized = true;
    _impl->sampleRate = sampleRate;

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start playback: {}", static_cast<int>(startResult)));

    log::info("Audio playback initialized ({}Hz, mono, f32)", sampleRate);
    return {};
}

auto AudioPlayback::enqueue(std::span<const float> samples, int sampleRate, PlaybackTag tag) -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Playback device not initialized");
    if (sampleRate <= 0)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid sample rate {}", sampleRate));

    auto buffer = Impl::Buffer {
        .samples = resampleLinear(samples, sampleRate, static_cast<int>(_impl->sampleRate)),
        .tag = tag,
    };

    auto lock = std::lock_guard(_impl->mutex);
    if (buffer.samples.empty())
    {
        // Nothing to play, but the buffer still counts as played.
        if (_impl->queue.empty() && _impl->onEnded)
            _impl->onEnded(tag);
        else
            _impl->queue.push_back(std::move(buffer));
        return {};
    }
    _impl->queue.push_back(std::move(buffer));
    return {};
}

void AudioPlayback::flush()
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->queue.empty())
        log::debug("Flushing {} queued playback buffer(s)", _impl->queue.size());
    _impl->queue.clear();
    _impl->readPos = 0;
}

void AudioPlayback::onPlaybackEnded(PlaybackEndedCallback callback)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->onEnded = std::move(callback);
}

auto AudioPlayback::queuedBuffers() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

} // namespace voicecore
