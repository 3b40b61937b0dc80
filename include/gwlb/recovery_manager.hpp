#pragma once

#include "gwlb/circuit_breaker.hpp"
#include "gwlb/config_loader.hpp"
#include "gwlb/error.hpp"
#include "gwlb/instance_registry.hpp"
#include <expected>
#include <string>
#include <vector>

namespace gwlb {

struct RecoveryStatus {
    std::string service;
    std::string host;
    CircuitState circuit = CircuitState::Open;
    double recovery_weight = 0.0;
    uint32_t consecutive_successes = 0;
    bool probe_passing = true;
    Clock::time_point since{};
};

// Periodic ramp of instances coming back from an open circuit. Each tick
// promotes cooled-down Open circuits to HalfOpen and raises the RecoveryWeight
// of HalfOpen instances with passing checks by one step, capped at 1.0.
class RecoveryManager {
public:
    RecoveryManager(const InstanceRegistry& registry, const CircuitBreaker& breaker,
                    const RecoveryConfig& config);

    struct TickResult {
        size_t half_opened = 0;
        size_t ramped = 0;
    };

    TickResult tick(Clock::time_point now);

    // Instances whose circuit is not Closed.
    std::vector<RecoveryStatus> status() const;

    std::expected<void, Error> force_recovery(const std::string& service, const std::string& host,
                                              Clock::time_point now);

    const RecoveryConfig& config() const { return config_; }

private:
    const InstanceRegistry& registry_;
    const CircuitBreaker& breaker_;
    RecoveryConfig config_;
};

} // namespace gwlb
