#pragma once

#include "gwlb/config_loader.hpp"
#include "gwlb/service_instance.hpp"
#include <chrono>

namespace gwlb {

// Folds request outcomes into an instance's smoothed health score and
// performance counters. Sole writer of those fields.
class HealthScorer {
public:
    explicit HealthScorer(const HealthConfig& config);

    void record(InstanceState& state, bool success,
                std::chrono::nanoseconds latency, Clock::time_point now) const;

    // 0 on failure; on success 1 scaled down by min(1, baseline / latency).
    double instant_signal(bool success, std::chrono::nanoseconds latency) const;

    const HealthConfig& config() const { return config_; }

private:
    HealthConfig config_;
};

} // namespace gwlb
