// SPDX-License-Identifier: Apache-2.0
#include <pipeline/SentenceChunker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace voicecore;

namespace
{
auto feedAll(SentenceChunker& chunker, const std::vector<std::string>& pieces) -> std::vector<std::string>
{
    auto units = std::vector<std::string> {};
    for (auto const& piece: pieces)
    {
        auto produced = chunker.feed(piece);
        units.insert(units.end(), produced.begin(), produced.end());
    }
    auto rest = chunker.flush();
    units.insert(units.end(), rest.begin(), rest.end());
    return units;
}
} // namespace

TEST_CASE("SentenceChunker: chunk granularity passes every chunk through", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Chunk);
    CHECK(feedAll(chunker, { "It's", " 3", " PM." }) == std::vector<std::string> { "It's", " 3", " PM." });
}

TEST_CASE("SentenceChunker: chunk granularity drops blank chunks", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Chunk);
    CHECK(chunker.feed("  \n").empty());
    CHECK(chunker.feed("ok") == std::vector<std::string> { "ok" });
}

TEST_CASE("SentenceChunker: splits at sentence boundaries", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(chunker.feed("Hello world. How are").size() == 1);
    CHECK(chunker.feed(" you? I am").size() == 1);
    CHECK(chunker.flush() == std::vector<std::string> { "I am" });
}

TEST_CASE("SentenceChunker: units are trimmed", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(feedAll(chunker, { "  First!  Second?\nThird " })
          == std::vector<std::string> { "First!", "Second?", "Third" });
}

TEST_CASE("SentenceChunker: a period without a following space does not split", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(chunker.feed("It costs 3.50 dollars").empty());
    CHECK(chunker.flush() == std::vector<std::string> { "It costs 3.50 dollars" });
}

TEST_CASE("SentenceChunker: short fragments are merged with the next sentence", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence, 10);
    CHECK(feedAll(chunker, { "1. Take the first step. Done" })
          == std::vector<std::string> { "1. Take the first step.", "Done" });
}

TEST_CASE("SentenceChunker: think block is removed", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(feedAll(chunker, { "<think>internal reasoning</think>The answer is 42." })
          == std::vector<std::string> { "The answer is 42." });
}

TEST_CASE("SentenceChunker: think tags split across chunks", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(feedAll(chunker, { "<thi", "nk>hidden</th", "ink>Visible. " }) == std::vector<std::string> { "Visible." });
}

TEST_CASE("SentenceChunker: unclosed think block is dropped", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Chunk);
    CHECK(chunker.feed("<think>still thinking").empty());
    CHECK(chunker.flush().empty());
}

TEST_CASE("SentenceChunker: angle brackets that are not think tags are kept", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(feedAll(chunker, { "a <b> c" }) == std::vector<std::string> { "a <b> c" });
}

TEST_CASE("SentenceChunker: reset drops buffered text", "[chunker]")
{
    auto chunker = SentenceChunker(SynthesisGranularity::Sentence);
    CHECK(chunker.feed("half a sent").empty());
    chunker.reset();
    CHECK(chunker.flush().empty());
}
