// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace voicecore
{

struct AudioCaptureConfig
{
    /// Case-insensitive substring of the capture device name; empty selects automatically.
    std::string deviceName;
    int sampleRate = 16000;
    int frameSamples = 512;
};

/// @brief Captures the microphone with miniaudio and slices it into fixed-size frames.
///
/// Frames are mono float32, numbered from 0 and stamped with their capture time.
class AudioCapture
{
  public:
    /// @brief Receives each complete frame on the audio device thread. Must not block.
    using FrameCallback = std::function<void(AudioFrame frame)>;

    /// @brief Receives device availability changes: (available, detail).
    using DeviceStateCallback = std::function<void(bool available, std::string_view detail)>;

    AudioCapture();
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Opens the capture device.
    [[nodiscard]] auto initialize(AudioCaptureConfig config, FrameCallback onFrame, DeviceStateCallback onDeviceState)
        -> VoidResult;

    [[nodiscard]] auto start() -> VoidResult;

    void stop();

    [[nodiscard]] auto isCapturing() const -> bool;

    /// @brief Returns the peak level (0.0 to 1.0) of the last device period. Safe from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    // Impl must be accessible from the C audio callbacks.
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
