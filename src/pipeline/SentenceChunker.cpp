// SPDX-License-Identifier: Apache-2.0
#include "SentenceChunker.hpp"

#include <algorithm>
#include <utility>

namespace voicecore
{

namespace
{
    using namespace std::string_view_literals;

    [[nodiscard]] auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](char c) { return c == ' ' || c == '\n' || c == '\t' || c == '\r'; });
    }

    void trimTrailing(std::string& text)
    {
        while (!text.empty() && (text.back() == ' ' || text.back() == '\n' || text.back() == '\r'))
            text.pop_back();
    }

    void trimLeading(std::string& text)
    {
        auto const first = text.find_first_not_of(" \n\r\t");
        text.erase(0, first == std::string::npos ? text.size() : first);
    }
} // namespace

SentenceChunker::SentenceChunker(SynthesisGranularity granularity, std::size_t minSentenceChars):
    _granularity(granularity), _minSentenceChars(minSentenceChars)
{
}

void SentenceChunker::filterThink(std::string_view text, std::string& out)
{
    for (auto const ch: text)
    {
        if (!_tagBuffer.empty())
        {
            _tagBuffer += ch;

            if (_tagBuffer == "<think>")
            {
                _insideThink = true;
                _tagBuffer.clear();
                continue;
            }
            if (_tagBuffer == "</think>")
            {
                _insideThink = false;
                _tagBuffer.clear();
                continue;
            }

            if ("<think>"sv.starts_with(_tagBuffer) || "</think>"sv.starts_with(_tagBuffer))
                continue;

            if (!_insideThink)
                out.append(_tagBuffer);
            _tagBuffer.clear();
            continue;
        }

        if (ch == '<')
        {
            _tagBuffer = "<";
            continue;
        }

        if (!_insideThink)
            out += ch;
    }
}

auto SentenceChunker::feed(std::string_view text) -> std::vector<std::string>
{
    if (_granularity == SynthesisGranularity::Chunk)
    {
        auto unit = std::string {};
        filterThink(text, unit);
        if (isBlank(unit))
            return {};
        return { std::move(unit) };
    }

    filterThink(text, _buffer);
    return extractSentences();
}

auto SentenceChunker::extractSentences() -> std::vector<std::string>
{
    auto sentences = std::vector<std::string> {};
    auto searchFrom = std::size_t { 0 };

    while (true)
    {
        auto pos = std::string::npos;
        for (auto i = searchFrom; i < _buffer.size(); ++i)
        {
            auto const ch = _buffer[i];
            if (ch == '\n')
            {
                pos = i;
                break;
            }
            if ((ch == '.' || ch == '!' || ch == '?') && i + 1 < _buffer.size() && _buffer[i + 1] == ' ')
            {
                pos = i + 1;
                break;
            }
        }

        if (pos == std::string::npos)
            break;

        auto sentence = _buffer.substr(0, pos + 1);
        trimTrailing(sentence);
        trimLeading(sentence);

        // Short fragments such as "1." are merged with the next sentence.
        if (!sentence.empty() && sentence.size() < _minSentenceChars)
        {
            searchFrom = pos + 1;
            continue;
        }

        _buffer.erase(0, pos + 1);
        searchFrom = 0;
        if (!sentence.empty())
            sentences.push_back(std::move(sentence));
    }
    return sentences;
}

auto SentenceChunker::flush() -> std::vector<std::string>
{
    if (!_insideThink)
        _buffer.append(_tagBuffer);
    _tagBuffer.clear();
    _insideThink = false;

    auto rest = std::exchange(_buffer, std::string {});
    trimTrailing(rest);
    trimLeading(rest);
    if (rest.empty())
        return {};
    return { std::move(rest) };
}

void SentenceChunker::reset()
{
    _buffer.clear();
    _tagBuffer.clear();
    _insideThink = false;
}

} // namespace voicecore
