// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/VoiceActivityDetector.hpp>
#include <audio/WakeWordDetector.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <pipeline/Events.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace voicecore
{

/// @brief Moves captured frames off the audio device thread and runs the detectors on them.
///
/// Frames are handed over through a bounded queue; when the detectors fall
/// behind, the oldest frames are dropped. Every frame is forwarded as
/// FrameCaptured, surrounded by the speech boundaries and activation
/// candidates found in it.
class AudioFrontEnd
{
  public:
    using EventCallback = std::function<void(InputEvent event)>;

    /// @param vad Voice activity detector, must outlive the front end.
    /// @param wakeWord Activation-phrase spotter, may be null for push-to-talk only setups.
    /// @param onEvent Receives the events on the detector thread.
    /// @param queueCapacity Maximum number of frames waiting for the detectors.
    AudioFrontEnd(VoiceActivityDetector& vad,
                  WakeWordDetector* wakeWord,
                  EventCallback onEvent,
                  std::size_t queueCapacity = 64);
    ~AudioFrontEnd();

    AudioFrontEnd(const AudioFrontEnd&) = delete;
    AudioFrontEnd& operator=(const AudioFrontEnd&) = delete;

    void start();

    /// @brief Stops the detector thread and drops queued frames.
    void stop();

    /// @brief Queues a frame. Never blocks on the detectors; safe from the audio device thread.
    void push(AudioFrame frame);

    /// @brief Number of frames dropped because the queue was full.
    [[nodiscard]] auto droppedFrames() const -> std::uint64_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
