// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace voicecore
{

/// @brief Lower-cases @p text and splits it into words, dropping punctuation.
[[nodiscard]] auto normalizeWords(std::string_view text) -> std::vector<std::string>;

/// @brief Scores how well @p phrase occurs in @p transcript.
///
/// Compares the phrase with every window of consecutive transcript words of
/// similar length using edit distance, so "hey jarvis" still matches a
/// transcript of "Hey, Jarvi!".
/// @return Similarity in [0, 1]; 1 for an exact occurrence.
[[nodiscard]] auto matchPhrase(std::string_view transcript, std::string_view phrase) -> float;

} // namespace voicecore
