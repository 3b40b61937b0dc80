#include "gwlb/config_loader.hpp"
#include "gwlb/routing_policy.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace gwlb {

namespace {

// Counts are read signed so a negative value is rejected instead of wrapping around.
template<typename T>
std::expected<T, std::string> read_count(const json& section, const char* key, T fallback) {
    const int64_t value = section.value(key, static_cast<int64_t>(fallback));
    if (value <= 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        return std::unexpected(fmt::format("{} must be a positive integer, got {}", key, value));
    }
    return static_cast<T>(value);
}

} // namespace

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        if (j.contains("admin")) {
            const auto& admin = j["admin"];
            config.admin.port = admin.value("port", config.admin.port);
            config.admin.log_file = admin.value("log_file", config.admin.log_file);
            config.admin.log_level = admin.value("log_level", config.admin.log_level);
        }

        if (j.contains("load_balancer")) {
            const auto& lb = j["load_balancer"];
            config.load_balancer.default_algorithm =
                lb.value("default_algorithm", config.load_balancer.default_algorithm);
            auto virtual_nodes = read_count(lb, "virtual_nodes", config.load_balancer.virtual_nodes);
            if (!virtual_nodes) {
                return std::unexpected("Configuration validation failed: " + virtual_nodes.error());
            }
            config.load_balancer.virtual_nodes = *virtual_nodes;
            config.load_balancer.random_seed =
                lb.value("random_seed", config.load_balancer.random_seed);
        }

        if (j.contains("session_affinity")) {
            const auto& sa = j["session_affinity"];
            config.session_affinity.enabled = sa.value("enabled", config.session_affinity.enabled);
            config.session_affinity.ttl = std::chrono::seconds(
                sa.value("ttl_seconds", static_cast<int64_t>(config.session_affinity.ttl.count())));
            config.session_affinity.sweep_interval = std::chrono::seconds(
                sa.value("sweep_interval_seconds",
                         static_cast<int64_t>(config.session_affinity.sweep_interval.count())));
        }

        if (j.contains("circuit_breaker")) {
            const auto& cb = j["circuit_breaker"];
            auto failure_threshold =
                read_count(cb, "failure_threshold", config.circuit_breaker.failure_threshold);
            if (!failure_threshold) {
                return std::unexpected("Configuration validation failed: " + failure_threshold.error());
            }
            auto recovery_threshold =
                read_count(cb, "recovery_threshold", config.circuit_breaker.recovery_threshold);
            if (!recovery_threshold) {
                return std::unexpected("Configuration validation failed: " + recovery_threshold.error());
            }
            config.circuit_breaker.failure_threshold = *failure_threshold;
            config.circuit_breaker.recovery_threshold = *recovery_threshold;
            config.circuit_breaker.cooldown = std::chrono::milliseconds(
                cb.value("cooldown_ms", static_cast<int64_t>(config.circuit_breaker.cooldown.count())));
        }

        if (j.contains("recovery")) {
            const auto& rc = j["recovery"];
            config.recovery.enabled = rc.value("enabled", config.recovery.enabled);
            config.recovery.interval = std::chrono::milliseconds(
                rc.value("interval_ms", static_cast<int64_t>(config.recovery.interval.count())));
            config.recovery.step = rc.value("step", config.recovery.step);
            config.recovery.initial_weight = rc.value("initial_weight", config.recovery.initial_weight);
        }

        if (j.contains("health")) {
            const auto& hc = j["health"];
            config.health.alpha = hc.value("alpha", config.health.alpha);
            config.health.baseline_latency = std::chrono::milliseconds(
                hc.value("baseline_latency_ms",
                         static_cast<int64_t>(config.health.baseline_latency.count())));
            config.health.response_time_alpha =
                hc.value("response_time_alpha", config.health.response_time_alpha);
        }

        if (j.contains("services")) {
            for (const auto& service : j["services"]) {
                ServiceConfig sc;
                sc.name = service.value("name", "");
                sc.algorithm = service.value("algorithm", "");
                if (service.contains("session_affinity")) {
                    sc.session_affinity = service["session_affinity"].get<bool>();
                }
                if (service.contains("instances")) {
                    for (const auto& instance : service["instances"]) {
                        InstanceSpec spec;
                        spec.host = instance.value("host", "");
                        spec.weight = instance.value("weight", 100);
                        spec.enabled = instance.value("enabled", true);
                        sc.instances.push_back(spec);
                    }
                }
                config.services.push_back(std::move(sc));
            }
        }

        if (auto valid = validate_config(config); !valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (!parse_algorithm(config.load_balancer.default_algorithm)) {
        return std::unexpected(fmt::format("unknown default algorithm '{}'",
                                           config.load_balancer.default_algorithm));
    }
    if (config.load_balancer.virtual_nodes == 0 || config.load_balancer.virtual_nodes > kMaxVirtualNodes) {
        return std::unexpected(fmt::format("virtual_nodes must be in [1, {}]", kMaxVirtualNodes));
    }
    if (config.session_affinity.ttl.count() <= 0 ||
        config.session_affinity.sweep_interval.count() <= 0) {
        return std::unexpected("session affinity ttl and sweep interval must be positive");
    }
    if (config.circuit_breaker.failure_threshold == 0 ||
        config.circuit_breaker.recovery_threshold == 0) {
        return std::unexpected("circuit breaker thresholds must be positive");
    }
    if (config.circuit_breaker.cooldown.count() < 0) {
        return std::unexpected("circuit breaker cooldown must not be negative");
    }
    if (config.recovery.interval.count() <= 0) {
        return std::unexpected("recovery interval must be positive");
    }
    if (config.recovery.step <= 0.0 || config.recovery.step > 1.0 ||
        config.recovery.initial_weight <= 0.0 || config.recovery.initial_weight > 1.0) {
        return std::unexpected("recovery step and initial weight must be in (0, 1]");
    }
    if (config.health.alpha <= 0.0 || config.health.alpha > 1.0 ||
        config.health.response_time_alpha <= 0.0 || config.health.response_time_alpha > 1.0) {
        return std::unexpected("smoothing factors must be in (0, 1]");
    }
    if (config.health.baseline_latency.count() <= 0) {
        return std::unexpected("baseline latency must be positive");
    }

    std::set<std::string> names;
    for (const auto& service : config.services) {
        if (service.name.empty()) {
            return std::unexpected("service without name");
        }
        if (!names.insert(service.name).second) {
            return std::unexpected(fmt::format("duplicate service '{}'", service.name));
        }
        if (!service.algorithm.empty() && !parse_algorithm(service.algorithm)) {
            return std::unexpected(fmt::format("service '{}' uses unknown algorithm '{}'",
                                               service.name, service.algorithm));
        }
        for (const auto& instance : service.instances) {
            if (instance.host.empty()) {
                return std::unexpected(fmt::format("service '{}' has an instance without host",
                                                   service.name));
            }
            if (instance.weight < 0) {
                return std::unexpected(fmt::format("instance {} has a negative weight",
                                                   instance.host));
            }
        }
    }

    return {};
}

} // namespace gwlb
