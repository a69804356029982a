// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace voicecore
{

/// @brief An ordered list of subscribers that are invoked in connection order.
///
/// Subscribers may connect or disconnect from any thread. emit() invokes a
/// snapshot of the subscriber list, so a handler may disconnect itself.
template <typename... Args>
class Signal
{
  public:
    using Handler = std::function<void(Args...)>;
    using ConnectionId = std::uint64_t;

    Signal() = default;
    Signal(const Signal&) = delete;
    auto operator=(const Signal&) -> Signal& = delete;

    /// @brief Adds a subscriber.
    /// @return An id that can be passed to disconnect().
    auto connect(Handler handler) -> ConnectionId
    {
        auto const lock = std::lock_guard { _mutex };
        auto const id = ++_nextId;
        _handlers.emplace_back(id, std::move(handler));
        return id;
    }

    void disconnect(ConnectionId id)
    {
        auto const lock = std::lock_guard { _mutex };
        std::erase_if(_handlers, [id](auto const& entry) { return entry.first == id; });
    }

    void disconnectAll()
    {
        auto const lock = std::lock_guard { _mutex };
        _handlers.clear();
    }

    [[nodiscard]] auto empty() const -> bool
    {
        auto const lock = std::lock_guard { _mutex };
        return _handlers.empty();
    }

    void emit(const Args&... args) const
    {
        auto snapshot = std::vector<Handler> {};
        {
            auto const lock = std::lock_guard { _mutex };
            snapshot.reserve(_handlers.size());
            for (auto const& [id, handler]: _handlers)
                snapshot.push_back(handler);
        }
        for (auto const& handler: snapshot)
            handler(args...);
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::pair<ConnectionId, Handler>> _handlers;
    ConnectionId _nextId = 0;
};

} // namespace voicecore
