// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace voicecore
{

/// @brief A finalized utterance, ready for transcription.
struct SpeechSegment
{
    TurnId turn = NoTurn;
    std::vector<float> samples;
    std::size_t frameCount = 0;
    std::uint64_t evictedFrames = 0;
    std::uint64_t firstSequence = 0;
    std::uint64_t lastSequence = 0;
};

/// @brief Accumulates audio frames of one utterance in a bounded ring buffer.
///
/// At most one segment is open at a time. When the buffer is full, the oldest
/// frame is overwritten, so memory stays fixed no matter how long the user speaks.
class SpeechSegmentAssembler
{
  public:
    /// @brief Called once per segment, on its first eviction: (turn, frames evicted so far).
    using EvictionCallback = std::function<void(TurnId turn, std::uint64_t evictedFrames)>;

    explicit SpeechSegmentAssembler(std::size_t capacityFrames);

    void setEvictionCallback(EvictionCallback callback) { _onEviction = std::move(callback); }

    /// @brief Opens a new segment for @p turn.
    /// @return InvalidArgument if a segment is already open.
    [[nodiscard]] auto open(TurnId turn) -> VoidResult;

    /// @brief Adds a frame to the open segment, evicting the oldest frame when full.
    /// @return InvalidArgument if no segment is open.
    [[nodiscard]] auto append(AudioFrame frame) -> VoidResult;

    /// @brief Closes the open segment and returns its frames in capture order.
    [[nodiscard]] auto finalize() -> Result<SpeechSegment>;

    /// @brief Drops the open segment, if any.
    void discard();

    [[nodiscard]] auto isOpen() const noexcept -> bool { return _turn != NoTurn; }
    [[nodiscard]] auto turn() const noexcept -> TurnId { return _turn; }
    [[nodiscard]] auto frameCount() const noexcept -> std::size_t { return _count; }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _frames.size(); }
    [[nodiscard]] auto evictedFrames() const noexcept -> std::uint64_t { return _evicted; }

  private:
    std::vector<AudioFrame> _frames;
    std::size_t _head = 0; ///< Index of the oldest frame.
    std::size_t _count = 0;
    std::uint64_t _evicted = 0;
    TurnId _turn = NoTurn;
    EvictionCallback _onEviction;
};

} // namespace voicecore
