// SPDX-License-Identifier: Apache-2.0
#include "AudioFrontEnd.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace voicecore
{

struct AudioFrontEnd::Impl
{
    VoiceActivityDetector& vad;
    WakeWordDetector* wakeWord;
    EventCallback onEvent;
    std::size_t capacity;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<AudioFrame> queue;
    std::atomic<std::uint64_t> dropped { 0 };

    std::jthread worker;

    Impl(VoiceActivityDetector& vad, WakeWordDetector* wakeWord, EventCallback onEvent, std::size_t capacity):
        vad(vad), wakeWord(wakeWord), onEvent(std::move(onEvent)), capacity(std::max<std::size_t>(1, capacity))
    {
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto frame = AudioFrame {};
            {
                auto lock = std::unique_lock(mutex);
                if (!cv.wait(lock, stopToken, [this] { return !queue.empty(); }))
                    return;
                frame = std::move(queue.front());
                queue.pop_front();
            }
            process(std::move(frame));
        }
    }

    void process(AudioFrame frame)
    {
        auto vadEvent = vad.process(frame);
        if (!vadEvent)
        {
            log::warning("Voice activity detection failed: {}", vadEvent.error());
            vadEvent = VadEvent::None;
        }

        auto detection = std::optional<WakeWordDetection> {};
        if (wakeWord)
        {
            auto result = wakeWord->process(frame);
            if (result)
                detection = std::move(*result);
            else
                log::warning("Wake word detection failed: {}", result.error());
        }

        if (*vadEvent == VadEvent::SpeechStart)
            onEvent(SpeechStarted {});

        onEvent(FrameCaptured { .frame = std::move(frame) });

        switch (*vadEvent)
        {
            case VadEvent::SpeechPause: onEvent(SpeechPaused {}); break;
            case VadEvent::SpeechEnd: onEvent(SpeechEnded {}); break;
            case VadEvent::None:
            case VadEvent::SpeechStart: break;
        }

        if (detection)
            onEvent(WakeWordDetected { .phrase = std::move(detection->phrase), .confidence = detection->confidence });
    }
};

AudioFrontEnd::AudioFrontEnd(VoiceActivityDetector& vad,
                             WakeWordDetector* wakeWord,
                             EventCallback onEvent,
                             std::size_t queueCapacity):
    _impl(std::make_unique<Impl>(vad, wakeWord, std::move(onEvent), queueCapacity))
{
}

AudioFrontEnd::~AudioFrontEnd()
{
    stop();
}

void AudioFrontEnd::start()
{
    if (_impl->worker.joinable())
        return;
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

void AudioFrontEnd::stop()
{
    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }

    auto const lock = std::lock_guard(_impl->mutex);
    _impl->queue.clear();
    _impl->vad.reset();
    if (_impl->wakeWord)
        _impl->wakeWord->reset();
}

void AudioFrontEnd::push(AudioFrame frame)
{
    {
        auto const lock = std::lock_guard(_impl->mutex);
        if (_impl->queue.size() >= _impl->capacity)
        {
            _impl->queue.pop_front();
            if (_impl->dropped.fetch_add(1) == 0)
                log::warning("Audio detectors fall behind, dropping frames");
        }
        _impl->queue.push_back(std::move(frame));
    }
    _impl->cv.notify_one();
}

auto AudioFrontEnd::droppedFrames() const -> std::uint64_t
{
    return _impl->dropped.load();
}

} // namespace voicecore
