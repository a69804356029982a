// SPDX-License-Identifier: Apache-2.0
#include "ChatSession.hpp"

#include <utility>

namespace voicecore
{

ChatSession::ChatSession(std::string systemPrompt, std::size_t maxHistoryTurns):
    _systemPrompt(std::move(systemPrompt)), _maxHistoryTurns(maxHistoryTurns)
{
    ensureSystemPrompt();
}

void ChatSession::addExchange(std::string userText, std::string assistantText)
{
    _messages.push_back(ChatMessage { .role = Role::User, .content = std::move(userText) });
    _messages.push_back(ChatMessage { .role = Role::Assistant, .content = std::move(assistantText) });
    trim();
}

auto ChatSession::messages() const -> const std::vector<ChatMessage>&
{
    return _messages;
}

auto ChatSession::requestMessages(std::string userText) const -> std::vector<ChatMessage>
{
    auto result = _messages;
    result.push_back(ChatMessage { .role = Role::User, .content = std::move(userText) });
    return result;
}

void ChatSession::clear()
{
    _messages.clear();
    ensureSystemPrompt();
}

auto ChatSession::messageCount() const -> std::size_t
{
    if (_systemPrompt.empty())
        return _messages.size();
    return _messages.empty() ? 0 : _messages.size() - 1;
}

auto ChatSession::systemPrompt() const -> const std::string&
{
    return _systemPrompt;
}

void ChatSession::setSystemPrompt(std::string prompt)
{
    _systemPrompt = std::move(prompt);
    _messages.clear();
    ensureSystemPrompt();
}

void ChatSession::ensureSystemPrompt()
{
    if (!_systemPrompt.empty())
        _messages.insert(_messages.begin(), ChatMessage { .role = Role::System, .content = _systemPrompt });
}

void ChatSession::trim()
{
    auto const first = _systemPrompt.empty() ? std::size_t { 0 } : std::size_t { 1 };
    auto const limit = _maxHistoryTurns * 2;
    auto const count = _messages.size() - first;
    if (count <= limit)
        return;

    auto const excess = static_cast<std::ptrdiff_t>(count - limit);
    auto const begin = _messages.begin() + static_cast<std::ptrdiff_t>(first);
    _messages.erase(begin, begin + excess);
}

} // namespace voicecore
