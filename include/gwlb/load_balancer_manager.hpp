#pragma once

#include "gwlb/circuit_breaker.hpp"
#include "gwlb/config_loader.hpp"
#include "gwlb/error.hpp"
#include "gwlb/health_scorer.hpp"
#include "gwlb/instance_registry.hpp"
#include "gwlb/recovery_manager.hpp"
#include "gwlb/routing_policy.hpp"
#include "gwlb/session_affinity.hpp"
#include <chrono>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace gwlb {

struct ServiceStats {
    std::string service;
    std::string algorithm;
    bool session_affinity = false;

    size_t total_instances = 0;
    size_t healthy_instances = 0;
    size_t eligible_instances = 0;
    size_t draining_instances = 0;
    size_t disabled_instances = 0;
    size_t open_circuits = 0;
    size_t half_open_circuits = 0;

    uint64_t total_requests = 0;
    uint64_t success_requests = 0;
    uint64_t failed_requests = 0;
    int64_t active_connections = 0;
    std::chrono::nanoseconds average_response_time{0};
    double success_rate = 1.0;
    double average_health_score = 1.0;
    size_t affinity_entries = 0;

    std::vector<InstanceSnapshot> instances;
};

struct GlobalStats {
    std::vector<ServiceStats> services;
    uint64_t total_requests = 0;
    uint64_t success_requests = 0;
    uint64_t failed_requests = 0;
    int64_t active_connections = 0;
    size_t total_instances = 0;
    size_t healthy_instances = 0;
    AffinityStats affinity;
};

// Per-gateway facade over registry, health, circuit, recovery and affinity state.
// SelectInstance and ReportOutcome are safe to call from any number of request
// threads; recovery ticks and affinity sweeps run on one background thread.
class LoadBalancerManager {
public:
    explicit LoadBalancerManager(const Config& config);
    ~LoadBalancerManager();

    LoadBalancerManager(const LoadBalancerManager&) = delete;
    LoadBalancerManager& operator=(const LoadBalancerManager&) = delete;

    // Service discovery feeds instances through the registry.
    InstanceRegistry& registry() { return registry_; }
    const InstanceRegistry& registry() const { return registry_; }

    void start();
    void stop();

    // The chosen instance has its active connection count raised; the caller
    // must answer with report_outcome, including on timeout.
    std::expected<InstancePtr, Error> select_instance(const std::string& service,
                                                      const std::string& affinity_key = {},
                                                      const std::string& client_address = {});

    std::expected<void, Error> report_outcome(const std::string& service, const std::string& host,
                                              bool success, std::chrono::nanoseconds latency);

    // Latest external probe result; gates the recovery ramp.
    std::expected<void, Error> report_health_check(const std::string& service,
                                                   const std::string& host, bool passing);

    std::expected<void, Error> set_algorithm(const std::string& service, const std::string& name);
    std::string algorithm(const std::string& service) const;

    // Services holding a routing policy, sorted.
    std::vector<std::string> routed_services() const;

    void set_session_affinity(const std::string& service, bool enabled);
    bool session_affinity_enabled(const std::string& service) const;

    std::expected<void, Error> drain_instance(const std::string& service, const std::string& host);
    std::expected<void, Error> enable_instance(const std::string& service, const std::string& host);
    std::expected<void, Error> disable_instance(const std::string& service, const std::string& host);

    std::expected<ServiceStats, Error> get_stats(const std::string& service) const;
    GlobalStats global_stats() const;

    std::expected<std::vector<InstanceSnapshot>, Error> instances(const std::string& service) const;
    std::vector<InstanceSnapshot> all_instances() const;
    std::expected<InstanceSnapshot, Error> instance(const std::string& service,
                                                    const std::string& host) const;

    std::vector<AffinityEntry> affinity_entries() const;
    AffinityStats affinity_stats() const;
    size_t remove_affinity(const std::string& key);
    void clear_affinity();

    std::vector<RecoveryStatus> recovery_status() const;
    std::expected<void, Error> force_recovery(const std::string& service, const std::string& host);

    // Single maintenance passes; the background thread calls these on its timers.
    RecoveryManager::TickResult run_recovery_tick();
    size_t sweep_affinity();

    const Config& config() const { return config_; }

private:
    struct ServiceRouting {
        Algorithm algorithm;
        std::shared_ptr<RoutingPolicy> policy;
        bool session_affinity;
    };

    ServiceRouting routing_for(const std::string& service);
    ServiceRouting make_routing(Algorithm algorithm, bool session_affinity) const;
    void maintenance_loop(std::stop_token stop_token);

    template<typename Fn>
    std::expected<void, Error> with_instance(const std::string& service, const std::string& host,
                                             Fn&& fn);

    Config config_;
    InstanceRegistry registry_;
    HealthScorer scorer_;
    CircuitBreaker breaker_;
    RecoveryManager recovery_;
    SessionAffinityTable affinity_;

    mutable std::shared_mutex routing_mutex_;
    std::unordered_map<std::string, ServiceRouting> routing_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::jthread maintenance_thread_;
};

} // namespace gwlb
