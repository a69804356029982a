// SPDX-License-Identifier: Apache-2.0
#include <audio/PhraseMatcher.hpp>
#include <audio/Resampler.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace voicecore;

TEST_CASE("normalizeWords lower-cases and strips punctuation", "[wake]")
{
    CHECK(normalizeWords("Hey, Jarvis! What's up?") == std::vector<std::string> { "hey", "jarvis", "whats", "up" });
    CHECK(normalizeWords("  ...  ").empty());
}

TEST_CASE("matchPhrase scores an exact occurrence as 1", "[wake]")
{
    CHECK(matchPhrase("hey jarvis", "hey jarvis") == 1.0f);
    CHECK(matchPhrase("Okay. Hey Jarvis, turn on the lights.", "hey jarvis") == 1.0f);
}

TEST_CASE("matchPhrase tolerates small transcription errors", "[wake]")
{
    CHECK(matchPhrase("Hey, Jarvi!", "hey jarvis") > 0.85f);
    CHECK(matchPhrase("hey jarvis", "hey jarvis") > matchPhrase("hay jervis", "hey jarvis"));
}

TEST_CASE("matchPhrase scores unrelated text low", "[wake]")
{
    CHECK(matchPhrase("the weather is nice today", "hey jarvis") < 0.5f);
    CHECK(matchPhrase("", "hey jarvis") == 0.0f);
    CHECK(matchPhrase("hey jarvis", "") == 0.0f);
}

TEST_CASE("resampleLinear converts between sample rates", "[resample]")
{
    auto const input = std::vector<float> { 0.0f, 1.0f, 0.0f, -1.0f };

    SECTION("same rate copies the input")
    {
        CHECK(resampleLinear(input, 16000, 16000) == input);
    }

    SECTION("downsampling halves the sample count")
    {
        CHECK(resampleLinear(input, 32000, 16000) == std::vector<float> { 0.0f, 0.0f });
    }

    SECTION("upsampling interpolates between samples")
    {
        auto const output = resampleLinear(input, 16000, 32000);
        REQUIRE(output.size() == 8);
        CHECK(output[0] == 0.0f);
        CHECK(output[1] == 0.5f);
        CHECK(output[2] == 1.0f);
        CHECK(output[7] == -1.0f);
    }

    SECTION("invalid rates leave the input unchanged")
    {
        CHECK(resampleLinear(input, 0, 16000) == input);
    }
}
