#include "gwlb/json_views.hpp"
#include "gwlb/routing_policy.hpp"

using json = nlohmann::json;

namespace gwlb {

namespace {

template<typename Rep, typename Period>
double millis(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

json to_json(const InstanceSnapshot& snapshot) {
    const auto& s = snapshot.state;
    return json{
        {"service", snapshot.service},
        {"host", snapshot.host},
        {"weight", s.weight},
        {"healthy", s.healthy()},
        {"enabled", s.enabled},
        {"draining", s.draining},
        {"eligible", s.eligible()},
        {"circuit", std::string(to_string(s.circuit))},
        {"active_connections", snapshot.active_connections},
        {"total_requests", s.total_requests},
        {"success_requests", s.success_requests},
        {"failed_requests", s.failed_requests},
        {"success_rate", s.success_rate()},
        {"avg_response_time_ms", millis(s.avg_response_time)},
        {"last_response_time_ms", millis(s.last_response_time)},
        {"health_score", s.health_score},
        {"recovery_weight", s.recovery_weight},
        {"consecutive_failures", s.consecutive_failures},
        {"consecutive_successes", s.consecutive_successes},
        {"probe_passing", s.probe_passing},
    };
}

json to_json(const ServiceStats& stats, bool include_instances) {
    json j{
        {"service", stats.service},
        {"algorithm", stats.algorithm},
        {"session_affinity", stats.session_affinity},
        {"total_instances", stats.total_instances},
        {"healthy_instances", stats.healthy_instances},
        {"eligible_instances", stats.eligible_instances},
        {"draining_instances", stats.draining_instances},
        {"disabled_instances", stats.disabled_instances},
        {"open_circuits", stats.open_circuits},
        {"half_open_circuits", stats.half_open_circuits},
        {"total_requests", stats.total_requests},
        {"success_requests", stats.success_requests},
        {"failed_requests", stats.failed_requests},
        {"active_connections", stats.active_connections},
        {"average_response_time_ms", millis(stats.average_response_time)},
        {"success_rate", stats.success_rate * 100.0},
        {"average_health_score", stats.average_health_score},
        {"affinity_entries", stats.affinity_entries},
    };
    if (include_instances) {
        json instances = json::array();
        for (const auto& snapshot : stats.instances) {
            instances.push_back(to_json(snapshot));
        }
        j["instances"] = std::move(instances);
    }
    return j;
}

json to_json(const GlobalStats& stats) {
    json services = json::object();
    for (const auto& service : stats.services) {
        services[service.service] = to_json(service, false);
    }
    return json{
        {"services", std::move(services)},
        {"total_requests", stats.total_requests},
        {"success_requests", stats.success_requests},
        {"failed_requests", stats.failed_requests},
        {"active_connections", stats.active_connections},
        {"total_instances", stats.total_instances},
        {"healthy_instances", stats.healthy_instances},
        {"session_affinity", to_json(stats.affinity)},
    };
}

json to_json(const AffinityStats& stats) {
    const uint64_t lookups = stats.hits + stats.misses;
    return json{
        {"entries", stats.entries},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", lookups == 0 ? 0.0 : 100.0 * static_cast<double>(stats.hits) / static_cast<double>(lookups)},
    };
}

json to_json(const AffinityEntry& entry, Clock::time_point now) {
    return json{
        {"service", entry.service},
        {"session", entry.key},
        {"host", entry.host},
        {"age_seconds", seconds_between(entry.created_at, now)},
        {"expires_in_seconds", seconds_between(now, entry.expires_at)},
    };
}

json to_json(const RecoveryStatus& status, Clock::time_point now) {
    return json{
        {"service", status.service},
        {"host", status.host},
        {"circuit", std::string(to_string(status.circuit))},
        {"recovery_weight", status.recovery_weight},
        {"consecutive_successes", status.consecutive_successes},
        {"probe_passing", status.probe_passing},
        {"seconds_in_state", seconds_between(status.since, now)},
    };
}

json to_json(const Config& config) {
    return json{
        {"default_algorithm", config.load_balancer.default_algorithm},
        {"virtual_nodes", config.load_balancer.virtual_nodes},
        {"session_affinity_enabled", config.session_affinity.enabled},
        {"session_affinity_ttl_seconds", config.session_affinity.ttl.count()},
        {"session_affinity_sweep_interval_seconds", config.session_affinity.sweep_interval.count()},
        {"failure_threshold", config.circuit_breaker.failure_threshold},
        {"recovery_threshold", config.circuit_breaker.recovery_threshold},
        {"circuit_cooldown_ms", config.circuit_breaker.cooldown.count()},
        {"gradual_recovery_enabled", config.recovery.enabled},
        {"recovery_step_size", config.recovery.step},
        {"recovery_initial_weight", config.recovery.initial_weight},
        {"recovery_check_interval_ms", config.recovery.interval.count()},
        {"health_alpha", config.health.alpha},
        {"baseline_latency_ms", config.health.baseline_latency.count()},
        {"response_time_alpha", config.health.response_time_alpha},
    };
}

json error_to_json(const Error& error) {
    return json{
        {"success", false},
        {"error", std::string(to_string(error.code))},
        {"message", error.message},
    };
}

json algorithms_json() {
    json list = json::array();
    for (const auto& info : algorithm_catalogue()) {
        list.push_back(json{
            {"name", std::string(info.name)},
            {"description", std::string(info.description)},
            {"type", std::string(info.category)},
        });
    }
    return list;
}

} // namespace gwlb
