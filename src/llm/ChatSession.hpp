// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace voicecore
{

/// @brief Conversation history that is sent along with every generation request.
///
/// Only completed exchanges are recorded. The history keeps at most
/// maxHistoryTurns user/assistant exchanges; older ones are dropped first.
class ChatSession
{
  public:
    /// @param systemPrompt Prepended to every conversation, if not empty.
    /// @param maxHistoryTurns Number of exchanges to keep; 0 keeps none.
    explicit ChatSession(std::string systemPrompt = "", std::size_t maxHistoryTurns = 10);

    /// @brief Records a completed exchange and trims the history.
    void addExchange(std::string userText, std::string assistantText);

    /// @brief Returns all messages, including the system prompt.
    [[nodiscard]] auto messages() const -> const std::vector<ChatMessage>&;

    /// @brief Returns the messages for a new request: the history followed by @p userText.
    [[nodiscard]] auto requestMessages(std::string userText) const -> std::vector<ChatMessage>;

    /// @brief Clears all messages except the system prompt.
    void clear();

    /// @brief Returns the number of messages, excluding the system prompt.
    [[nodiscard]] auto messageCount() const -> std::size_t;

    [[nodiscard]] auto exchangeCount() const -> std::size_t { return messageCount() / 2; }

    [[nodiscard]] auto systemPrompt() const -> const std::string&;

    /// @brief Sets a new system prompt and clears the history.
    void setSystemPrompt(std::string prompt);

  private:
    void ensureSystemPrompt();
    void trim();

    std::string _systemPrompt;
    std::size_t _maxHistoryTurns;
    std::vector<ChatMessage> _messages;
};

} // namespace voicecore
