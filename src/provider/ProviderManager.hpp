// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>
#include <provider/CircuitBreaker.hpp>
#include <provider/Provider.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace voicecore
{

enum class ConnectionState : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
};

[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) noexcept -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
    }
    return "unknown";
}

/// @brief Health snapshot of one provider instance.
struct ProviderStatus
{
    std::string name;
    ConnectionState connection = ConnectionState::Disconnected;
    BreakerState breaker = BreakerState::Closed;
    int consecutiveFailures = 0;
    std::optional<TimePoint> lastFailure;
    bool enabled = true;
    std::string disabledReason;
    std::string lastError;
};

/// @brief Health snapshot of all providers of one kind, in priority order.
struct ProviderKindStatus
{
    ProviderKind kind = ProviderKind::Transcription;
    std::string active; ///< Name of the provider that served the last request, if any.
    std::vector<ProviderStatus> providers;
};

struct ProviderManagerConfig
{
    CircuitBreakerConfig breaker;

    /// Maximum wait for the first output chunk of an attempt before falling back.
    std::chrono::milliseconds firstChunkTimeout { 10'000 };
};

/// @brief Routes requests of one provider kind across priority-ordered providers.
///
/// Each provider has its own circuit breaker. A request goes to the highest
/// priority provider whose breaker admits it. Transient failures retry the same
/// provider while its breaker stays closed; a missed first-chunk deadline falls
/// back to the next provider immediately. Once output has been delivered to the
/// caller the request is never moved to another provider. When no provider
/// admits the request, it fails with ErrorCode::ProviderExhausted.
///
/// Each attempt runs on its own worker thread so that the first-chunk deadline
/// holds even when a provider blocks. Output chunks are delivered on that worker
/// thread; an abandoned attempt delivers nothing further and is joined on stop().
template <ProviderKind Kind>
class ProviderManager
{
  public:
    using ProviderType = Provider<Kind>;
    using Request = typename ProviderType::Request;
    using Chunk = typename ProviderType::Chunk;
    using ChunkCallback = typename ProviderType::ChunkCallback;
    using ClockFunction = CircuitBreaker::ClockFunction;

    explicit ProviderManager(ProviderManagerConfig config = {}, ClockFunction clock = {}):
        _config(config), _clock(std::move(clock))
    {
    }

    ~ProviderManager() { stop(); }

    ProviderManager(const ProviderManager&) = delete;
    auto operator=(const ProviderManager&) -> ProviderManager& = delete;

    /// @brief Appends a provider. Earlier providers have higher priority.
    void addProvider(std::shared_ptr<ProviderType> provider)
    {
        auto const lock = std::lock_guard { _mutex };
        auto entry = std::make_unique<Entry>(CircuitBreaker(_config.breaker, _clock));
        entry->name = provider->name();
        entry->provider = std::move(provider);
        _entries.push_back(std::move(entry));
    }

    /// @brief Lists a provider that could not be created, e.g. for a missing credential.
    ///
    /// It appears in status() as disabled and is never selected.
    void addUnavailable(std::string name, std::string reason)
    {
        auto const lock = std::lock_guard { _mutex };
        auto entry = std::make_unique<Entry>(CircuitBreaker(_config.breaker, _clock));
        entry->name = std::move(name);
        entry->enabled = false;
        entry->disabledReason = std::move(reason);
        _entries.push_back(std::move(entry));
    }

    /// @brief Excludes a provider from selection until the process restarts.
    void disableProvider(std::string_view name, std::string reason)
    {
        auto const lock = std::lock_guard { _mutex };
        for (auto& entry: _entries)
        {
            if (entry->name == name)
            {
                entry->enabled = false;
                entry->disabledReason = std::move(reason);
                log::warning("{} provider '{}' disabled: {}", providerKindName(Kind), name, entry->disabledReason);
                return;
            }
        }
    }

    /// @brief Connects all enabled providers. Providers that fail stay disconnected
    /// and are retried on first use.
    /// @return An error only if no enabled provider is configured.
    [[nodiscard]] auto start() -> VoidResult
    {
        auto candidates = std::vector<Entry*> {};
        {
            auto const lock = std::lock_guard { _mutex };
            for (auto& entry: _entries)
            {
                if (entry->enabled && entry->provider)
                {
                    entry->connection = ConnectionState::Connecting;
                    candidates.push_back(entry.get());
                }
            }
        }

        if (candidates.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("No {} provider available", providerKindName(Kind)));

        auto connected = 0;
        for (auto* entry: candidates)
        {
            if (connect(*entry))
                ++connected;
        }
        if (connected == 0)
            log::warning("No {} provider could be started, retrying on first request", providerKindName(Kind));
        return {};
    }

    /// @brief Cancels abandoned attempts, waits for them, and stops all providers.
    void stop()
    {
        auto retired = std::vector<RetiredAttempt> {};
        {
            auto const lock = std::lock_guard { _retiredMutex };
            retired.swap(_retired);
        }
        for (auto& attempt: retired)
            attempt.thread.request_stop();
        retired.clear();

        auto const lock = std::lock_guard { _mutex };
        for (auto& entry: _entries)
        {
            if (entry->provider && entry->connection != ConnectionState::Disconnected)
            {
                entry->provider->stop();
                entry->connection = ConnectionState::Disconnected;
            }
        }
    }

    [[nodiscard]] auto status() const -> ProviderKindStatus
    {
        auto const lock = std::lock_guard { _mutex };
        auto result = ProviderKindStatus { .kind = Kind, .active = _active, .providers = {} };
        for (auto const& entry: _entries)
        {
            auto connection = entry->connection;
            if (connection == ConnectionState::Connected && entry->provider && !entry->provider->isConnected())
                connection = ConnectionState::Disconnected;

            result.providers.push_back(ProviderStatus {
                .name = entry->name,
                .connection = connection,
                .breaker = entry->breaker.state(),
                .consecutiveFailures = entry->breaker.consecutiveFailures(),
                .lastFailure = entry->breaker.lastFailure(),
                .enabled = entry->enabled,
                .disabledReason = entry->disabledReason,
                .lastError = entry->lastError,
            });
        }
        return result;
    }

    /// @brief Emitted when a different provider starts serving requests: (from, to, reason).
    [[nodiscard]] auto onProviderSwitch() -> Signal<std::string, std::string, std::string>& { return _providerSwitch; }

    /// @brief Runs a request with fallback.
    /// @param request The input, copied for the worker thread.
    /// @param onChunk Receives output chunks in order. Called from a worker thread.
    /// @param stop Cancels the request; the result is then ErrorCode::Cancelled.
    [[nodiscard]] auto streamRequest(const Request& request, const ChunkCallback& onChunk, std::stop_token stop)
        -> VoidResult
    {
        pruneRetired();

        auto excluded = std::set<Entry*> {};
        auto attempts = std::map<Entry*, int> {};
        auto lastError = std::optional<Error> {};
        auto switchReason = std::string { "initial" };

        while (true)
        {
            if (stop.stop_requested())
                return makeError(ErrorCode::Cancelled, "Request cancelled");

            auto* entry = select(excluded, switchReason);
            if (!entry)
            {
                auto const detail = lastError ? std::format("{}", *lastError) : std::string { "no usable provider" };
                log::error("All {} providers exhausted: {}", providerKindName(Kind), detail);
                return makeError(ErrorCode::ProviderExhausted,
                                 std::format("All {} providers failed: {}", providerKindName(Kind), detail));
            }

            if (!entry->provider->isConnected())
            {
                if (auto connected = connect(*entry); !connected)
                {
                    recordFailure(*entry, connected.error());
                    excludeIfSpent(*entry, attempts, excluded);
                    lastError = connected.error();
                    switchReason = "connect failed";
                    continue;
                }
            }

            auto const outcome = attempt(*entry, request, onChunk, stop);
            switch (outcome.kind)
            {
                case AttemptKind::Succeeded: recordSuccess(*entry); return {};
                case AttemptKind::Cancelled:
                    release(*entry);
                    return makeError(ErrorCode::Cancelled, "Request cancelled");
                case AttemptKind::TimedOut:
                    log::warning("{} provider '{}' produced no output within {} ms, falling back",
                                 providerKindName(Kind),
                                 entry->name,
                                 _config.firstChunkTimeout.count());
                    recordFailure(*entry, *outcome.error);
                    excluded.insert(entry);
                    lastError = outcome.error;
                    switchReason = "first-chunk timeout";
                    break;
                case AttemptKind::FailedAfterOutput:
                    recordFailure(*entry, *outcome.error);
                    return std::unexpected(*outcome.error);
                case AttemptKind::Failed:
                    log::warning("{} provider '{}' failed: {}", providerKindName(Kind), entry->name, *outcome.error);
                    recordFailure(*entry, *outcome.error);
                    excludeIfSpent(*entry, attempts, excluded);
                    lastError = outcome.error;
                    switchReason = outcome.error->message;
                    break;
            }
        }
    }

  private:
    struct Entry
    {
        explicit Entry(CircuitBreaker b): breaker(std::move(b)) {}

        std::string name;
        std::shared_ptr<ProviderType> provider;
        CircuitBreaker breaker;
        ConnectionState connection = ConnectionState::Disconnected;
        bool enabled = true;
        std::string disabledReason;
        std::string lastError;
    };

    enum class AttemptKind : std::uint8_t
    {
        Succeeded,
        Cancelled,
        TimedOut,
        Failed,
        FailedAfterOutput,
    };

    struct AttemptOutcome
    {
        AttemptKind kind = AttemptKind::Succeeded;
        std::optional<Error> error;
    };

    /// State shared between the waiting caller and the attempt's worker thread.
    struct AttemptState
    {
        std::mutex mutex;
        std::condition_variable_any cv;
        bool delivered = false;
        bool done = false;
        bool abandoned = false;
        VoidResult result;
    };

    struct RetiredAttempt
    {
        std::shared_ptr<AttemptState> state;
        std::jthread thread;
    };

    auto select(const std::set<Entry*>& excluded, const std::string& reason) -> Entry*
    {
        auto* chosen = static_cast<Entry*>(nullptr);
        auto previous = std::string {};
        {
            auto const lock = std::lock_guard { _mutex };
            for (auto& entry: _entries)
            {
                if (!entry->enabled || !entry->provider || excluded.contains(entry.get()))
                    continue;
                if (entry->breaker.allowRequest())
                {
                    chosen = entry.get();
                    break;
                }
            }
            if (!chosen || chosen->name == _active)
                return chosen;
            previous = std::exchange(_active, chosen->name);
        }

        if (!previous.empty())
        {
            log::info("{} provider switched from '{}' to '{}' ({})", providerKindName(Kind), previous, chosen->name, reason);
            _providerSwitch.emit(previous, chosen->name, reason);
        }
        return chosen;
    }

    auto connect(Entry& entry) -> VoidResult
    {
        {
            auto const lock = std::lock_guard { _mutex };
            entry.connection = ConnectionState::Connecting;
        }
        auto result = entry.provider->start();

        auto const lock = std::lock_guard { _mutex };
        if (!result)
        {
            entry.connection = ConnectionState::Disconnected;
            entry.lastError = result.error().message;
            log::warning("Failed to start {} provider '{}': {}", providerKindName(Kind), entry.name, result.error());
            return result;
        }
        entry.connection = ConnectionState::Connected;
        log::debug("{} provider '{}' connected", providerKindName(Kind), entry.name);
        return {};
    }

    auto attempt(Entry& entry, const Request& request, const ChunkCallback& onChunk, std::stop_token stop)
        -> AttemptOutcome
    {
        auto state = std::make_shared<AttemptState>();

        auto worker = std::jthread(
            [state, provider = entry.provider, request, &onChunk](std::stop_token workerStop) {
                auto deliver = [&](const Chunk& chunk) {
                    auto const lock = std::lock_guard { state->mutex };
                    if (state->abandoned)
                        return;
                    state->delivered = true;
                    state->cv.notify_all();
                    onChunk(chunk);
                };

                auto result = VoidResult {};
                try
                {
                    result = provider->streamRequest(request, deliver, workerStop);
                }
                catch (const std::exception& e)
                {
                    result = makeError(ErrorCode::InternalError,
                                       std::format("Provider '{}' threw: {}", provider->name(), e.what()));
                }

                auto const lock = std::lock_guard { state->mutex };
                state->result = std::move(result);
                state->done = true;
                state->cv.notify_all();
            });

        auto lock = std::unique_lock { state->mutex };
        auto const deadline = std::chrono::steady_clock::now() + _config.firstChunkTimeout;
        auto const started =
            state->cv.wait_until(lock, stop, deadline, [&] { return state->done || state->delivered; });

        auto const abandon = [&] {
            state->abandoned = true;
            lock.unlock();
            worker.request_stop();
            auto const retiredLock = std::lock_guard { _retiredMutex };
            _retired.push_back(RetiredAttempt { .state = state, .thread = std::move(worker) });
        };

        if (!started)
        {
            auto const timedOut = !stop.stop_requested();
            abandon();
            if (timedOut)
                return { AttemptKind::TimedOut,
                         Error { ErrorCode::TimeoutError,
                                 std::format("Provider '{}' produced no output within {} ms",
                                             entry.name,
                                             _config.firstChunkTimeout.count()) } };
            return { AttemptKind::Cancelled, std::nullopt };
        }

        if (!state->cv.wait(lock, stop, [&] { return state->done; }))
        {
            abandon();
            return { AttemptKind::Cancelled, std::nullopt };
        }

        auto const delivered = state->delivered;
        auto result = std::move(state->result);
        lock.unlock();
        worker.join();

        if (result)
            return { AttemptKind::Succeeded, std::nullopt };
        if (result.error().code == ErrorCode::Cancelled && stop.stop_requested())
            return { AttemptKind::Cancelled, std::nullopt };
        return { delivered ? AttemptKind::FailedAfterOutput : AttemptKind::Failed, result.error() };
    }

    void recordSuccess(Entry& entry)
    {
        auto const lock = std::lock_guard { _mutex };
        entry.breaker.recordSuccess();
        entry.connection = ConnectionState::Connected;
    }

    void recordFailure(Entry& entry, const Error& error)
    {
        auto const lock = std::lock_guard { _mutex };
        auto const before = entry.breaker.state();
        entry.breaker.recordFailure();
        entry.lastError = error.message;
        if (!entry.provider->isConnected())
            entry.connection = ConnectionState::Disconnected;
        if (before != BreakerState::Open && entry.breaker.state() == BreakerState::Open)
            log::warning("{} provider '{}' circuit opened after {} consecutive failures",
                         providerKindName(Kind),
                         entry.name,
                         entry.breaker.consecutiveFailures());
    }

    /// Bounds the retries one request spends on a provider, even with a zero cooldown.
    void excludeIfSpent(Entry& entry, std::map<Entry*, int>& attempts, std::set<Entry*>& excluded)
    {
        auto const lock = std::lock_guard { _mutex };
        if (++attempts[&entry] >= entry.breaker.config().failureThreshold
            || entry.breaker.state() != BreakerState::Closed)
            excluded.insert(&entry);
    }

    void release(Entry& entry)
    {
        auto const lock = std::lock_guard { _mutex };
        entry.breaker.releaseRequest();
    }

    void pruneRetired()
    {
        auto finished = std::vector<RetiredAttempt> {};
        {
            auto const lock = std::lock_guard { _retiredMutex };
            auto it = _retired.begin();
            while (it != _retired.end())
            {
                auto const done = [&] {
                    auto const stateLock = std::lock_guard { it->state->mutex };
                    return it->state->done;
                }();
                if (done)
                {
                    finished.push_back(std::move(*it));
                    it = _retired.erase(it);
                }
                else
                    ++it;
            }
        }
        // Joined here, outside the lock.
        finished.clear();
    }

    ProviderManagerConfig _config;
    ClockFunction _clock;

    mutable std::mutex _mutex;
    std::vector<std::unique_ptr<Entry>> _entries;
    std::string _active;

    Signal<std::string, std::string, std::string> _providerSwitch;

    // Declared last: retired workers are joined before the providers they use are released.
    std::mutex _retiredMutex;
    std::vector<RetiredAttempt> _retired;
};

using TranscriptionManager = ProviderManager<ProviderKind::Transcription>;
using GenerationManager = ProviderManager<ProviderKind::Generation>;
using SynthesisManager = ProviderManager<ProviderKind::Synthesis>;

} // namespace voicecore
