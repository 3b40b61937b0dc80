#include "gwlb/circuit_breaker.hpp"

namespace gwlb {

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config, double half_open_weight)
    : config_(config), half_open_weight_(half_open_weight) {}

CircuitTransition CircuitBreaker::on_outcome(InstanceState& state, bool success,
                                             Clock::time_point now) const {
    switch (state.circuit) {
        case CircuitState::Closed:
            if (!success && state.consecutive_failures >= config_.failure_threshold) {
                open(state, now);
                return CircuitTransition::Opened;
            }
            return CircuitTransition::None;

        case CircuitState::HalfOpen:
            if (!success) {
                open(state, now);
                return CircuitTransition::Opened;
            }
            if (state.consecutive_successes >= config_.recovery_threshold) {
                state.circuit = CircuitState::Closed;
                state.recovery_weight = 1.0;
                state.circuit_changed_at = now;
                return CircuitTransition::Closed;
            }
            return CircuitTransition::None;

        case CircuitState::Open:
            // Late completions of requests routed before the trip.
            return CircuitTransition::None;
    }
    return CircuitTransition::None;
}

CircuitTransition CircuitBreaker::try_half_open(InstanceState& state, Clock::time_point now) const {
    if (state.circuit != CircuitState::Open || now - state.circuit_changed_at < config_.cooldown) {
        return CircuitTransition::None;
    }
    state.circuit = CircuitState::HalfOpen;
    state.recovery_weight = half_open_weight_;
    state.consecutive_successes = 0;
    state.consecutive_failures = 0;
    state.circuit_changed_at = now;
    return CircuitTransition::HalfOpened;
}

void CircuitBreaker::force_close(InstanceState& state, Clock::time_point now) const {
    state.circuit = CircuitState::Closed;
    state.recovery_weight = 1.0;
    state.consecutive_successes = 0;
    state.consecutive_failures = 0;
    state.circuit_changed_at = now;
}

void CircuitBreaker::open(InstanceState& state, Clock::time_point now) const {
    state.circuit = CircuitState::Open;
    state.recovery_weight = 0.0;
    state.circuit_changed_at = now;
}

} // namespace gwlb
