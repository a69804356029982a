// SPDX-License-Identifier: Apache-2.0
#include "CircuitBreaker.hpp"

#include <algorithm>

namespace voicecore
{

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, ClockFunction clock):
    _config(config), _clock(std::move(clock))
{
    _config.failureThreshold = std::max(1, _config.failureThreshold);
}

auto CircuitBreaker::now() const -> TimePoint
{
    return _clock ? _clock() : Clock::now();
}

auto CircuitBreaker::cooldownElapsed() const -> bool
{
    return _openedAt && now() - *_openedAt >= _config.cooldown;
}

auto CircuitBreaker::allowRequest() -> bool
{
    switch (_state)
    {
        case BreakerState::Closed: return true;
        case BreakerState::Open:
            if (!cooldownElapsed())
                return false;
            _state = BreakerState::HalfOpen;
            _probeInFlight = true;
            return true;
        case BreakerState::HalfOpen:
            if (_probeInFlight)
                return false;
            _probeInFlight = true;
            return true;
    }
    return false;
}

auto CircuitBreaker::isUsable() const -> bool
{
    switch (_state)
    {
        case BreakerState::Closed: return true;
        case BreakerState::Open: return cooldownElapsed();
        case BreakerState::HalfOpen: return !_probeInFlight;
    }
    return false;
}

void CircuitBreaker::recordSuccess()
{
    _state = BreakerState::Closed;
    _consecutiveFailures = 0;
    _openedAt.reset();
    _probeInFlight = false;
}

void CircuitBreaker::recordFailure()
{
    auto const t = now();
    _lastFailure = t;
    ++_consecutiveFailures;
    _probeInFlight = false;

    if (_state == BreakerState::HalfOpen || _consecutiveFailures >= _config.failureThreshold)
    {
        _state = BreakerState::Open;
        _openedAt = t;
    }
}

void CircuitBreaker::releaseRequest()
{
    _probeInFlight = false;
}

} // namespace voicecore
