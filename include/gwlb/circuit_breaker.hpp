#pragma once

#include "gwlb/config_loader.hpp"
#include "gwlb/service_instance.hpp"

namespace gwlb {

enum class CircuitTransition {
    None,
    Opened,
    HalfOpened,
    Closed
};

// Per-instance Closed -> Open -> HalfOpen -> Closed state machine, driven by
// the run counters the HealthScorer maintains. Transitions never fail.
class CircuitBreaker {
public:
    CircuitBreaker(const CircuitBreakerConfig& config, double half_open_weight);

    // Call after HealthScorer::record for the same outcome.
    CircuitTransition on_outcome(InstanceState& state, bool success, Clock::time_point now) const;

    // Open -> HalfOpen once the cooldown has elapsed.
    CircuitTransition try_half_open(InstanceState& state, Clock::time_point now) const;

    // Operator override: close the circuit and restore full weight.
    void force_close(InstanceState& state, Clock::time_point now) const;

    const CircuitBreakerConfig& config() const { return config_; }

private:
    void open(InstanceState& state, Clock::time_point now) const;

    CircuitBreakerConfig config_;
    double half_open_weight_;
};

} // namespace gwlb
