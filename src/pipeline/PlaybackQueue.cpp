// SPDX-License-Identifier: Apache-2.0
#include "PlaybackQueue.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace voicecore
{

PlaybackQueue::PlaybackQueue(AudioSink& sink): _sink(sink)
{
}

void PlaybackQueue::beginTurn(TurnId turn)
{
    if (_turn != NoTurn && !isIdle())
        flush();
    _turn = turn;
    _pending.clear();
    _nextToEnqueue = 0;
    _played = 0;
    _total.reset();
}

auto PlaybackQueue::submit(SynthesisChunk chunk) -> Result<bool>
{
    if (_turn == NoTurn || chunk.turn != _turn)
    {
        log::debug("Rejected audio chunk {} of turn {} (current turn {})", chunk.sequence, chunk.turn, _turn);
        return false;
    }
    if (chunk.sequence < _nextToEnqueue || _pending.contains(chunk.sequence))
    {
        log::warning("Duplicate audio chunk {} of turn {}", chunk.sequence, chunk.turn);
        return false;
    }

    _pending.emplace(chunk.sequence, std::move(chunk.audio));
    if (auto drained = drain(); !drained)
        return std::unexpected(drained.error());
    return true;
}

auto PlaybackQueue::drain() -> VoidResult
{
    while (!_pending.empty() && _pending.begin()->first == _nextToEnqueue)
    {
        auto node = _pending.extract(_pending.begin());
        auto const& audio = node.mapped();
        auto const tag = PlaybackTag { .turn = _turn, .sequence = _nextToEnqueue };
        if (auto result = _sink.enqueue(audio.samples, audio.sampleRate, tag); !result)
            return result;
        ++_nextToEnqueue;
    }
    return {};
}

void PlaybackQueue::markComplete(TurnId turn, std::uint32_t totalChunks)
{
    if (turn != _turn)
        return;
    _total = totalChunks;
}

auto PlaybackQueue::handlePlaybackEnded(PlaybackTag tag) -> Progress
{
    if (_turn == NoTurn || tag.turn != _turn || tag.sequence >= _nextToEnqueue)
        return {};

    // The sink plays in order, so the ended chunk is the next unplayed one.
    _played = std::max(_played, tag.sequence + 1);
    return Progress { .accepted = true, .turnFinished = isTurnFinished() };
}

void PlaybackQueue::flush()
{
    _sink.flush();
    _pending.clear();
    _turn = NoTurn;
    _nextToEnqueue = 0;
    _played = 0;
    _total.reset();
}

} // namespace voicecore
