#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace gwlb {

using Clock = std::chrono::steady_clock;

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string_view to_string(CircuitState state);

// Static configuration supplied by service discovery.
struct InstanceSpec {
    std::string host;
    int weight = 100;
    bool enabled = true;
};

// Runtime state of one upstream. Guarded by the owning ServiceInstance's mutex.
struct InstanceState {
    int weight = 100;
    bool enabled = true;
    bool draining = false;

    uint64_t total_requests = 0;
    uint64_t success_requests = 0;
    uint64_t failed_requests = 0;
    std::chrono::nanoseconds avg_response_time{0};
    std::chrono::nanoseconds last_response_time{0};
    Clock::time_point last_used{};

    double health_score = 1.0;
    double recovery_weight = 1.0;
    uint32_t consecutive_failures = 0;
    uint32_t consecutive_successes = 0;

    CircuitState circuit = CircuitState::Closed;
    Clock::time_point circuit_changed_at{};
    bool probe_passing = true;

    bool healthy() const { return circuit != CircuitState::Open; }

    // May serve a request already bound to it by affinity.
    bool serviceable() const { return enabled && healthy(); }

    // May be picked by an algorithm for a fresh request.
    bool eligible() const { return serviceable() && !draining; }

    double effective_weight() const {
        return static_cast<double>(weight) * recovery_weight;
    }

    double success_rate() const {
        if (total_requests == 0) {
            return 1.0;
        }
        return static_cast<double>(success_requests) / static_cast<double>(total_requests);
    }
};

// Copy of an instance taken under its lock; what algorithms and stats read.
struct InstanceSnapshot {
    std::string service;
    std::string host;
    int64_t active_connections = 0;
    InstanceState state;
};

class ServiceInstance {
public:
    ServiceInstance(std::string service, const InstanceSpec& spec);

    ServiceInstance(const ServiceInstance&) = delete;
    ServiceInstance& operator=(const ServiceInstance&) = delete;

    const std::string& service() const { return service_; }
    const std::string& host() const { return host_; }

    InstanceSnapshot snapshot() const;

    // Run fn against the mutable state under the exclusive instance lock.
    template<typename Fn>
    decltype(auto) update(Fn&& fn) {
        std::unique_lock lock(mutex_);
        return std::forward<Fn>(fn)(state_);
    }

    template<typename Fn>
    decltype(auto) inspect(Fn&& fn) const {
        std::shared_lock lock(mutex_);
        return std::forward<Fn>(fn)(std::as_const(state_));
    }

    void acquire_connection();

    // Returns false when there was no connection to release.
    bool release_connection();

    int64_t active_connections() const;

private:
    const std::string service_;
    const std::string host_;
    std::atomic<int64_t> active_connections_{0};
    mutable std::shared_mutex mutex_;
    InstanceState state_;
};

} // namespace gwlb
