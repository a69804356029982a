// SPDX-License-Identifier: Apache-2.0
#include "SpeechSegmentAssembler.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace voicecore
{

SpeechSegmentAssembler::SpeechSegmentAssembler(std::size_t capacityFrames):
    _frames(std::max<std::size_t>(1, capacityFrames))
{
}

auto SpeechSegmentAssembler::open(TurnId turn) -> VoidResult
{
    if (turn == NoTurn)
        return makeError(ErrorCode::InvalidArgument, "Cannot open a speech segment without a turn");
    if (isOpen())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Speech segment for turn {} is still open", _turn));

    _turn = turn;
    _head = 0;
    _count = 0;
    _evicted = 0;
    return {};
}

auto SpeechSegmentAssembler::append(AudioFrame frame) -> VoidResult
{
    if (!isOpen())
        return makeError(ErrorCode::InvalidArgument, "No speech segment is open");

    auto const cap = _frames.size();
    if (_count < cap)
    {
        _frames[(_head + _count) % cap] = std::move(frame);
        ++_count;
        return {};
    }

    // Full: overwrite the oldest frame.
    _frames[_head] = std::move(frame);
    _head = (_head + 1) % cap;
    if (++_evicted == 1)
    {
        log::warning("Speech segment of turn {} exceeded {} frames, dropping oldest audio", _turn, cap);
        if (_onEviction)
            _onEviction(_turn, _evicted);
    }
    return {};
}

auto SpeechSegmentAssembler::finalize() -> Result<SpeechSegment>
{
    if (!isOpen())
        return makeError(ErrorCode::InvalidArgument, "No speech segment is open");

    auto const cap = _frames.size();
    auto segment = SpeechSegment { .turn = _turn, .samples = {}, .frameCount = _count, .evictedFrames = _evicted };

    auto totalSamples = std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i < _count; ++i)
        totalSamples += _frames[(_head + i) % cap].samples.size();
    segment.samples.reserve(totalSamples);

    for (auto i = std::size_t { 0 }; i < _count; ++i)
    {
        auto& frame = _frames[(_head + i) % cap];
        if (i == 0)
            segment.firstSequence = frame.sequence;
        segment.lastSequence = frame.sequence;
        segment.samples.insert(segment.samples.end(), frame.samples.begin(), frame.samples.end());
        frame.samples.clear();
    }

    _turn = NoTurn;
    _head = 0;
    _count = 0;
    return segment;
}

void SpeechSegmentAssembler::discard()
{
    for (auto& frame: _frames)
        frame.samples.clear();
    _turn = NoTurn;
    _head = 0;
    _count = 0;
}

} // namespace voicecore
