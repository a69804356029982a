// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace voicecore
{

enum class BreakerState : std::uint8_t
{
    Closed,
    Open,
    HalfOpen,
};

[[nodiscard]] constexpr auto breakerStateName(BreakerState state) noexcept -> std::string_view
{
    switch (state)
    {
        case BreakerState::Closed: return "closed";
        case BreakerState::Open: return "open";
        case BreakerState::HalfOpen: return "half-open";
    }
    return "unknown";
}

struct CircuitBreakerConfig
{
    int failureThreshold = 3;
    std::chrono::milliseconds cooldown { 60'000 };
};

/// @brief Per-provider failure tracker.
///
/// Closed: requests flow, consecutive failures are counted.
/// Open: no requests until the cooldown has elapsed since the last failure.
/// Half-open: exactly one probe request is admitted; its success closes the
/// breaker, its failure reopens it and restarts the cooldown.
///
/// Not thread-safe; the owning manager serializes access.
class CircuitBreaker
{
  public:
    using ClockFunction = std::function<TimePoint()>;

    explicit CircuitBreaker(CircuitBreakerConfig config = {}, ClockFunction clock = {});

    /// @brief Asks for permission to send a request.
    ///
    /// An open breaker whose cooldown elapsed becomes half-open and grants the probe.
    /// @return true if the caller may send a request now.
    [[nodiscard]] auto allowRequest() -> bool;

    /// @brief Returns whether allowRequest() would currently grant a request, without changing state.
    [[nodiscard]] auto isUsable() const -> bool;

    void recordSuccess();
    void recordFailure();

    /// @brief Returns a granted request without an outcome (e.g. cancelled), freeing the probe slot.
    void releaseRequest();

    [[nodiscard]] auto state() const noexcept -> BreakerState { return _state; }
    [[nodiscard]] auto consecutiveFailures() const noexcept -> int { return _consecutiveFailures; }
    [[nodiscard]] auto lastFailure() const noexcept -> std::optional<TimePoint> { return _lastFailure; }
    [[nodiscard]] auto config() const noexcept -> const CircuitBreakerConfig& { return _config; }

  private:
    [[nodiscard]] auto now() const -> TimePoint;
    [[nodiscard]] auto cooldownElapsed() const -> bool;

    CircuitBreakerConfig _config;
    ClockFunction _clock;
    BreakerState _state = BreakerState::Closed;
    int _consecutiveFailures = 0;
    std::optional<TimePoint> _lastFailure;
    std::optional<TimePoint> _openedAt;
    bool _probeInFlight = false;
};

} // namespace voicecore
