// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace voicecore::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty callback to revert to stderr output.
/// The callback may be invoked from audio, provider and pipeline threads,
/// but never concurrently.
void setCallback(LogCallback callback);

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @return The level, or std::nullopt if the name is unknown.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Returns the fixed-width tag printed for @p level, e.g. "WARN ".
[[nodiscard]] auto levelTag(Level level) -> std::string_view;

/// @brief Writes a log message at the given level.
///
/// If a callback is installed via setCallback(), the message is routed there.
/// Otherwise, it is written to stderr prefixed with the seconds elapsed since
/// start-up and the level tag.
void write(Level level, std::string_view message);

/// @brief Reassembles text that arrives in arbitrary pieces into lines and logs each complete line.
///
/// Libraries such as whisper.cpp and llama.cpp emit partial lines through their
/// log hooks. Trailing whitespace is trimmed and blank lines are dropped.
class LineForwarder
{
  public:
    void feed(Level level, std::string_view text);

    /// @brief Logs whatever incomplete line is still buffered.
    void flush(Level level);

  private:
    std::mutex _mutex;
    std::string _buffer;
};

/// @brief Logs an error message.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a warning message.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Warning)
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs an info message.
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace message.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace voicecore::log
