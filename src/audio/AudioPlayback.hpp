// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>
#include <core/Error.hpp>

#include <memory>
#include <span>

namespace voicecore
{

/// @brief Plays queued PCM buffers through the default playback device using miniaudio.
///
/// Buffers are resampled to the device rate on enqueue and played back to back.
/// The device keeps running while initialized and outputs silence when the queue is empty.
class AudioPlayback final: public AudioSink
{
  public:
    AudioPlayback();
    ~AudioPlayback() override;

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    /// @brief Initializes and starts the playback device.
    /// @param sampleRate Device sample rate in Hz (e.g. 22050).
    [[nodiscard]] auto initialize(unsigned sampleRate) -> VoidResult;

    [[nodiscard]] auto enqueue(std::span<const float> samples, int sampleRate, PlaybackTag tag)
        -> VoidResult override;

    void flush() override;

    void onPlaybackEnded(PlaybackEndedCallback callback) override;

    /// @brief Number of buffers queued or playing.
    [[nodiscard]] auto queuedBuffers() const -> std::size_t;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
