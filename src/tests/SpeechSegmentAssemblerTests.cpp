// SPDX-License-Identifier: Apache-2.0
#include <pipeline/PipelineConfig.hpp>
#include <pipeline/SpeechSegmentAssembler.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace voicecore;
using namespace voicecore::testing;

TEST_CASE("SpeechSegmentAssembler rejects frames without an open segment", "[segment]")
{
    auto assembler = SpeechSegmentAssembler(4);
    auto const appended = assembler.append(makeFrame(0, 0.1f));
    REQUIRE(!appended);
    CHECK(appended.error().code == ErrorCode::InvalidArgument);

    auto const finalized = assembler.finalize();
    REQUIRE(!finalized);
    CHECK(finalized.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SpeechSegmentAssembler allows only one open segment", "[segment]")
{
    auto assembler = SpeechSegmentAssembler(4);
    REQUIRE(assembler.open(1).has_value());
    CHECK(assembler.isOpen());
    CHECK(assembler.turn() == 1);

    auto const second = assembler.open(2);
    REQUIRE(!second);
    CHECK(second.error().code == ErrorCode::InvalidArgument);

    CHECK(!assembler.open(NoTurn));

    assembler.discard();
    CHECK(!assembler.isOpen());
    CHECK(assembler.open(2).has_value());
}

TEST_CASE("SpeechSegmentAssembler concatenates frames in capture order", "[segment]")
{
    auto assembler = SpeechSegmentAssembler(8);
    REQUIRE(assembler.open(7).has_value());
    for (auto i = 0; i < 3; ++i)
        REQUIRE(assembler.append(makeFrame(static_cast<std::uint64_t>(10 + i), static_cast<float>(i), 4)).has_value());

    auto segment = assembler.finalize();
    REQUIRE(segment.has_value());
    CHECK(segment->turn == 7);
    CHECK(segment->frameCount == 3);
    CHECK(segment->evictedFrames == 0);
    CHECK(segment->firstSequence == 10);
    CHECK(segment->lastSequence == 12);
    REQUIRE(segment->samples.size() == 12);
    CHECK(segment->samples.front() == 0.0f);
    CHECK(segment->samples[4] == 1.0f);
    CHECK(segment->samples.back() == 2.0f);
    CHECK(!assembler.isOpen());
}

TEST_CASE("SpeechSegmentAssembler evicts the oldest frames when full", "[segment]")
{
    auto assembler = SpeechSegmentAssembler(3);

    auto evictions = 0;
    auto reportedEvictions = std::uint64_t { 0 };
    assembler.setEvictionCallback([&](TurnId turn, std::uint64_t evictedFrames) {
        CHECK(turn == 1);
        ++evictions;
        reportedEvictions = evictedFrames;
    });

    REQUIRE(assembler.open(1).has_value());
    for (auto i = 0; i < 10; ++i)
    {
        REQUIRE(assembler.append(makeFrame(static_cast<std::uint64_t>(i), static_cast<float>(i), 2)).has_value());
        CHECK(assembler.frameCount() <= assembler.capacity());
    }

    CHECK(evictions == 1);
    CHECK(reportedEvictions == 1);
    CHECK(assembler.evictedFrames() == 7);

    auto segment = assembler.finalize();
    REQUIRE(segment.has_value());
    CHECK(segment->frameCount == 3);
    CHECK(segment->evictedFrames == 7);
    CHECK(segment->firstSequence == 7);
    CHECK(segment->lastSequence == 9);
    CHECK(segment->samples == std::vector<float> { 7.0f, 7.0f, 8.0f, 8.0f, 9.0f, 9.0f });
}

TEST_CASE("SpeechSegmentAssembler starts every segment empty", "[segment]")
{
    auto assembler = SpeechSegmentAssembler(2);
    REQUIRE(assembler.open(1).has_value());
    REQUIRE(assembler.append(makeFrame(0, 0.5f)).has_value());
    REQUIRE(assembler.append(makeFrame(1, 0.5f)).has_value());
    REQUIRE(assembler.append(makeFrame(2, 0.5f)).has_value());
    assembler.discard();

    REQUIRE(assembler.open(2).has_value());
    CHECK(assembler.frameCount() == 0);
    CHECK(assembler.evictedFrames() == 0);
    auto segment = assembler.finalize();
    REQUIRE(segment.has_value());
    CHECK(segment->samples.empty());
}

TEST_CASE("segmentCapacity derives the frame count from the maximum duration", "[segment]")
{
    auto config = PipelineConfig {};
    config.sampleRate = 16000;
    config.frameSamples = 512;
    config.maxSegmentDuration = std::chrono::milliseconds { 1000 };
    CHECK(segmentCapacity(config) == 32);

    config.segmentCapacityFrames = 10;
    CHECK(segmentCapacity(config) == 10);
}
