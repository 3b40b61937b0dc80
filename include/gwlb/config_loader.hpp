#pragma once

#include "gwlb/service_instance.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace gwlb {

struct AdminConfig {
    uint16_t port = 9090;
    std::string log_file = "logs/gwlb.log";
    std::string log_level = "INFO";
};

struct AlgorithmConfig {
    std::string default_algorithm = "adaptive";
    size_t virtual_nodes = 150;     // consistent-hash ring replicas per host
    uint64_t random_seed = 0;       // 0 seeds from std::random_device
};

struct SessionAffinityConfig {
    bool enabled = true;
    std::chrono::seconds ttl{1800};
    std::chrono::seconds sweep_interval{300};
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    uint32_t recovery_threshold = 3;
    std::chrono::milliseconds cooldown{30000};
};

struct RecoveryConfig {
    bool enabled = true;
    std::chrono::milliseconds interval{30000};
    double step = 0.1;
    double initial_weight = 0.1;
};

struct HealthConfig {
    double alpha = 0.1;
    std::chrono::milliseconds baseline_latency{50};
    double response_time_alpha = 0.3;
};

struct ServiceConfig {
    std::string name;
    std::string algorithm;                  // empty: use the default algorithm
    std::optional<bool> session_affinity;   // unset: use the global setting
    std::vector<InstanceSpec> instances;
};

struct Config {
    AdminConfig admin;
    AlgorithmConfig load_balancer;
    SessionAffinityConfig session_affinity;
    CircuitBreakerConfig circuit_breaker;
    RecoveryConfig recovery;
    HealthConfig health;
    std::vector<ServiceConfig> services;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace gwlb
