// SPDX-License-Identifier: Apache-2.0
#include "PhraseMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace voicecore
{

namespace
{
    [[nodiscard]] auto editDistance(std::string_view a, std::string_view b) -> std::size_t
    {
        auto row = std::vector<std::size_t>(b.size() + 1);
        for (auto j = std::size_t { 0 }; j <= b.size(); ++j)
            row[j] = j;

        for (auto i = std::size_t { 1 }; i <= a.size(); ++i)
        {
            auto diagonal = row[0];
            row[0] = i;
            for (auto j = std::size_t { 1 }; j <= b.size(); ++j)
            {
                auto const above = row[j];
                auto const cost = a[i - 1] == b[j - 1] ? 0u : 1u;
                row[j] = std::min({ row[j] + 1, row[j - 1] + 1, diagonal + cost });
                diagonal = above;
            }
        }
        return row[b.size()];
    }

    [[nodiscard]] auto join(const std::vector<std::string>& words, std::size_t first, std::size_t count) -> std::string
    {
        auto result = std::string {};
        for (auto i = first; i < first + count; ++i)
        {
            if (!result.empty())
                result += ' ';
            result += words[i];
        }
        return result;
    }
} // namespace

auto normalizeWords(std::string_view text) -> std::vector<std::string>
{
    auto words = std::vector<std::string> {};
    auto current = std::string {};
    for (auto const ch: text)
    {
        auto const c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '\'')
        {
            if (c != '\'')
                current += static_cast<char>(std::tolower(c));
            continue;
        }
        if (!current.empty())
            words.push_back(std::exchange(current, std::string {}));
    }
    if (!current.empty())
        words.push_back(std::move(current));
    return words;
}

auto matchPhrase(std::string_view transcript, std::string_view phrase) -> float
{
    auto const phraseWords = normalizeWords(phrase);
    auto const words = normalizeWords(transcript);
    if (phraseWords.empty() || words.empty())
        return 0.0f;

    auto const target = join(phraseWords, 0, phraseWords.size());
    auto best = 0.0f;

    auto const minWindow = std::max<std::size_t>(1, phraseWords.size() - 1);
    auto const maxWindow = phraseWords.size() + 1;
    for (auto window = minWindow; window <= maxWindow; ++window)
    {
        if (window > words.size())
            break;
        for (auto first = std::size_t { 0 }; first + window <= words.size(); ++first)
        {
            auto const candidate = join(words, first, window);
            auto const longest = std::max(candidate.size(), target.size());
            auto const distance = editDistance(candidate, target);
            auto const score = 1.0f - static_cast<float>(distance) / static_cast<float>(longest);
            best = std::max(best, score);
        }
    }
    return best;
}

} // namespace voicecore
