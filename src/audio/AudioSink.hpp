// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <functional>
#include <span>

namespace voicecore
{

/// @brief Identifies one enqueued buffer: the turn and the chunk sequence within it.
struct PlaybackTag
{
    TurnId turn = NoTurn;
    std::uint32_t sequence = 0;

    auto operator==(const PlaybackTag&) const -> bool = default;
};

/// @brief Abstract audio output device.
class AudioSink
{
  public:
    using PlaybackEndedCallback = std::function<void(PlaybackTag tag)>;

    virtual ~AudioSink() = default;

    /// @brief Queues a buffer for playback after all previously queued buffers.
    /// @param samples Mono float32 PCM.
    /// @param sampleRate Rate of @p samples in Hz.
    /// @param tag Reported back through the playback-ended callback.
    [[nodiscard]] virtual auto enqueue(std::span<const float> samples, int sampleRate, PlaybackTag tag)
        -> VoidResult = 0;

    /// @brief Stops playback and drops all queued buffers.
    ///
    /// When flush() returns, no flushed sample will be played and no
    /// playback-ended callback will be reported for a flushed buffer.
    virtual void flush() = 0;

    /// @brief Installs the callback invoked when a buffer has finished playing.
    /// May be invoked from the audio device thread.
    virtual void onPlaybackEnded(PlaybackEndedCallback callback) = 0;
};

} // namespace voicecore
