// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <print>
#include <string>

namespace voicecore::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
    auto const processStart = std::chrono::steady_clock::now();

    void writeTrimmed(Level level, std::string_view line)
    {
        if (auto const end = line.find_last_not_of(" \t\r"); end != std::string_view::npos)
            write(level, line.substr(0, end + 1));
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard { globalMutex };
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error")
        return Level::Error;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "info")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto const lock = std::lock_guard { globalMutex };

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    auto const elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - processStart);
    std::println(stderr, "[{:9.3f}] [{}] {}", elapsed.count(), levelTag(level), message);
}

auto levelTag(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

void LineForwarder::feed(Level level, std::string_view text)
{
    auto const lock = std::lock_guard { _mutex };
    _buffer += text;

    auto start = std::size_t { 0 };
    for (auto nl = _buffer.find('\n'); nl != std::string::npos; nl = _buffer.find('\n', start))
    {
        writeTrimmed(level, std::string_view(_buffer).substr(start, nl - start));
        start = nl + 1;
    }
    _buffer.erase(0, start);
}

void LineForwarder::flush(Level level)
{
    auto const lock = std::lock_guard { _mutex };
    writeTrimmed(level, _buffer);
    _buffer.clear();
}

} // namespace voicecore::log
