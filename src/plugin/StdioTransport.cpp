// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace voicecore
{

namespace
{
    // A write to a plugin that already exited must surface as EPIPE, not terminate the host.
    void ignoreBrokenPipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::atomic<bool> connected = false;
    std::string readBuffer;
    std::string command;
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    ignoreBrokenPipe();

    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe(stdinPipe) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (pipe(stdoutPipe) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    // The parent's ends must not leak into other children.
    fcntl(stdinPipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(stdoutPipe[0], F_SETFD, FD_CLOEXEC);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[1]);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const name = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(name)))
                envStrings.emplace_back(entry);
        }
    }
    for (auto const& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->command = config.command;
    _impl->connected = true;
    log::info("Plugin process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to '{}': {}", _impl->command, std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }
    return {};
}

auto StdioTransport::receive(std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = timeout ? std::optional { std::chrono::steady_clock::now() + *timeout } : std::nullopt;

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (line.empty() || line == "\r")
                continue;

            return json::parse(line);
        }

        auto waitMs = -1;
        if (deadline)
        {
            auto const remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return makeError(ErrorCode::TimeoutError, "No message received in time");
            waitMs = static_cast<int>(remaining.count());
        }

        auto fds = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&fds, 1, waitMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("Process '{}' closed its output", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
    }
    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }
    if (_impl->childPid > 0)
    {
        kill(_impl->childPid, SIGTERM);
        int status;
        waitpid(_impl->childPid, &status, 0);
        _impl->childPid = -1;
        log::debug("Plugin process '{}' closed", _impl->command);
    }
    _impl->connected = false;
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace voicecore
