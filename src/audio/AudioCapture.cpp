// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace voicecore
{

struct AudioCapture::Impl
{
    AudioCaptureConfig config;
    ma_context context {};
    ma_device device {};
    FrameCallback onFrame;
    DeviceStateCallback onDeviceState;
    std::vector<float> pending;
    std::uint64_t nextSequence = 0;
    std::atomic<float> peakLevel { 0.0f };
    std::atomic<bool> capturing = false;
    bool contextInitialized = false;
    bool initialized = false;

    /// Appends device samples and emits every complete frame.
    void consume(const float* samples, ma_uint32 count)
    {
        auto const frameSize = static_cast<std::size_t>(config.frameSamples);
        auto offset = std::size_t { 0 };
        while (offset < count)
        {
            auto const take = std::min<std::size_t>(frameSize - pending.size(), count - offset);
            pending.insert(pending.end(), samples + offset, samples + offset + take);
            offset += take;

            if (pending.size() == frameSize)
            {
                auto frame = AudioFrame { .sequence = nextSequence++, .captured = Clock::now(), .samples = {} };
                frame.samples.swap(pending);
                pending.reserve(frameSize);
                onFrame(std::move(frame));
            }
        }
    }
};

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto s = std::string(text);
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (!impl || !impl->onFrame || !input)
            return;

        auto const* samples = static_cast<const float*>(input);

        auto peak = 0.0f;
        for (auto i = ma_uint32 { 0 }; i < frameCount; ++i)
            peak = std::max(peak, std::abs(samples[i]));
        impl->peakLevel.store(peak, std::memory_order_relaxed);

        impl->consume(samples, frameCount);
    }

    void deviceNotificationCallback(const ma_device_notification* notification)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(notification->pDevice->pUserData);
        if (!impl || !impl->onDeviceState)
            return;

        switch (notification->type)
        {
            case ma_device_notification_type_stopped:
                // Stops we asked for are not failures.
                if (impl->capturing.load())
                    impl->onDeviceState(false, "capture device stopped unexpectedly");
                break;
            case ma_device_notification_type_interruption_began:
                impl->onDeviceState(false, "capture device interrupted");
                break;
            case ma_device_notification_type_interruption_ended:
                impl->onDeviceState(true, "capture device interruption ended");
                break;
            default: break;
        }
    }

    auto selectDevice(ma_context& context, std::string_view deviceName) -> std::optional<ma_device_id>
    {
        ma_device_info* captureDevices = nullptr;
        auto captureCount = ma_uint32 { 0 };
        auto const enumResult = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);
        if (enumResult != MA_SUCCESS)
        {
            log::warning("Failed to enumerate capture devices (code: {}), using default", static_cast<int>(enumResult));
            return std::nullopt;
        }

        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, captureDevices[i].name);

        if (!deviceName.empty())
        {
            auto const target = toLower(deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (toLower(captureDevices[i].name).find(target) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", captureDevices[i].name, deviceName);
                    return captureDevices[i].id;
                }
            }
            log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        // Monitor sources are loopbacks of the speakers, not microphones.
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        {
            if (!toLower(captureDevices[i].name).starts_with("monitor"))
            {
                log::info("Auto-selected capture device '{}'", captureDevices[i].name);
                return captureDevices[i].id;
            }
        }
        return std::nullopt;
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize(AudioCaptureConfig config, FrameCallback onFrame, DeviceStateCallback onDeviceState)
    -> VoidResult
{
    if (_impl->initialized)
        return makeError(ErrorCode::InvalidState, "Audio capture already initialized");
    if (config.frameSamples <= 0 || config.sampleRate <= 0)
        return makeError(ErrorCode::InvalidArgument, "Frame size and sample rate must be positive");

    _impl->config = std::move(config);
    _impl->onFrame = std::move(onFrame);
    _impl->onDeviceState = std::move(onDeviceState);
    _impl->pending.reserve(static_cast<std::size_t>(_impl->config.frameSamples));

    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    auto deviceId = selectDevice(_impl->context, _impl->config.deviceName);

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = static_cast<ma_uint32>(_impl->config.sampleRate);
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.notificationCallback = deviceNotificationCallback;
    deviceConfig.pUserData = _impl.get();
    if (deviceId)
        deviceConfig.capture.pDeviceID = &*deviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize capture device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    log::info("Audio capture on '{}' ({} Hz, mono, {}-sample frames)",
              _impl->device.capture.name,
              _impl->config.sampleRate,
              _impl->config.frameSamples);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Audio device not initialized");

    if (_impl->capturing)
        return {};

    _impl->pending.clear();
    _impl->capturing = true;
    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->capturing = false;
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));
    }

    log::info("Audio capture started");
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing.exchange(false))
        return;

    ma_device_stop(&_impl->device);
    log::info("Audio capture stopped");
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing;
}

auto AudioCapture::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

} // namespace voicecore
