#include "gwlb/health_scorer.hpp"
#include <algorithm>

namespace gwlb {

HealthScorer::HealthScorer(const HealthConfig& config)
    : config_(config) {}

void HealthScorer::record(InstanceState& state, bool success,
                          std::chrono::nanoseconds latency, Clock::time_point now) const {
    latency = std::max(latency, std::chrono::nanoseconds::zero());

    ++state.total_requests;
    if (success) {
        ++state.success_requests;
        ++state.consecutive_successes;
        state.consecutive_failures = 0;
    } else {
        ++state.failed_requests;
        ++state.consecutive_failures;
        state.consecutive_successes = 0;
    }

    state.last_response_time = latency;
    state.last_used = now;

    if (state.total_requests == 1) {
        state.avg_response_time = latency;
    } else {
        const double a = config_.response_time_alpha;
        state.avg_response_time = std::chrono::nanoseconds(static_cast<int64_t>(
            (1.0 - a) * static_cast<double>(state.avg_response_time.count()) +
            a * static_cast<double>(latency.count())));
    }

    const double signal = instant_signal(success, latency);
    state.health_score = std::clamp(
        (1.0 - config_.alpha) * state.health_score + config_.alpha * signal, 0.0, 1.0);
}

double HealthScorer::instant_signal(bool success, std::chrono::nanoseconds latency) const {
    if (!success) {
        return 0.0;
    }
    if (latency.count() <= 0) {
        return 1.0;
    }
    const auto baseline = std::chrono::duration_cast<std::chrono::nanoseconds>(config_.baseline_latency);
    return std::min(1.0, static_cast<double>(baseline.count()) / static_cast<double>(latency.count()));
}

} // namespace gwlb
