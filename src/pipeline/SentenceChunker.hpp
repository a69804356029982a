// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voicecore
{

/// @brief How streamed reply text is grouped into synthesis units.
enum class SynthesisGranularity : std::uint8_t
{
    /// Every response chunk becomes its own unit (lowest latency).
    Chunk,
    /// Units end at sentence boundaries: ". ", "! ", "? " or a newline.
    Sentence,
};

/// @brief Groups streamed reply text into units for speech synthesis.
///
/// Content inside <think>...</think> blocks (emitted by reasoning models) is
/// dropped, even when a tag spans several chunks.
class SentenceChunker
{
  public:
    explicit SentenceChunker(SynthesisGranularity granularity = SynthesisGranularity::Sentence,
                             std::size_t minSentenceChars = 0);

    /// @brief Feeds a piece of reply text.
    /// @return The units completed by this piece, in order.
    [[nodiscard]] auto feed(std::string_view text) -> std::vector<std::string>;

    /// @brief Returns whatever remains buffered as a final unit and resets the tag filter.
    [[nodiscard]] auto flush() -> std::vector<std::string>;

    /// @brief Drops all buffered text.
    void reset();

  private:
    void filterThink(std::string_view text, std::string& out);
    [[nodiscard]] auto extractSentences() -> std::vector<std::string>;

    SynthesisGranularity _granularity;
    std::size_t _minSentenceChars;
    std::string _buffer;
    std::string _tagBuffer;
    bool _insideThink = false;
};

} // namespace voicecore
