// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <map>
#include <optional>

namespace voicecore
{

/// @brief Orders synthesized audio of the current turn onto the audio sink.
///
/// Chunks tagged with any other turn are rejected, chunks that arrive early
/// are held until their predecessors have been handed to the sink, and the
/// turn is reported finished once the last declared chunk has played.
/// Not thread-safe: driven from the orchestrator thread only.
class PlaybackQueue
{
  public:
    /// @brief Progress reported for a playback-ended notification.
    struct Progress
    {
        bool accepted = false;     ///< The tag belonged to the current turn.
        bool turnFinished = false; ///< Every declared chunk of the turn has played.
    };

    explicit PlaybackQueue(AudioSink& sink);

    /// @brief Flushes anything left from a previous turn and starts accepting @p turn.
    void beginTurn(TurnId turn);

    /// @brief Accepts a chunk of the current turn.
    /// @return true if the chunk was accepted (queued or handed to the sink), false if it was
    ///         rejected as belonging to another turn or duplicated. Sink failures are errors.
    [[nodiscard]] auto submit(SynthesisChunk chunk) -> Result<bool>;

    /// @brief Declares how many chunks the current turn has in total.
    void markComplete(TurnId turn, std::uint32_t totalChunks);

    /// @brief Processes a playback-ended notification from the sink.
    [[nodiscard]] auto handlePlaybackEnded(PlaybackTag tag) -> Progress;

    /// @brief Stops playback immediately and forgets the current turn.
    void flush();

    [[nodiscard]] auto currentTurn() const noexcept -> TurnId { return _turn; }
    [[nodiscard]] auto playedChunks() const noexcept -> std::uint32_t { return _played; }
    [[nodiscard]] auto enqueuedChunks() const noexcept -> std::uint32_t { return _nextToEnqueue; }
    [[nodiscard]] auto pendingChunks() const noexcept -> std::size_t { return _pending.size(); }

    /// @brief True if nothing of the current turn is waiting or playing.
    [[nodiscard]] auto isIdle() const noexcept -> bool { return _pending.empty() && _played == _nextToEnqueue; }

    /// @brief True once every declared chunk of the current turn has played.
    [[nodiscard]] auto isTurnFinished() const noexcept -> bool
    {
        return _turn != NoTurn && _total && _played >= *_total;
    }

  private:
    [[nodiscard]] auto drain() -> VoidResult;

    AudioSink& _sink;
    TurnId _turn = NoTurn;
    std::map<std::uint32_t, AudioChunk> _pending;
    std::uint32_t _nextToEnqueue = 0;
    std::uint32_t _played = 0;
    std::optional<std::uint32_t> _total;
};

} // namespace voicecore
