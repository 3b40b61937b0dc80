#include "gwlb/load_balancer_manager.hpp"
#include "gwlb/logger.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/fmt/fmt.h>

namespace gwlb {

namespace {

std::chrono::nanoseconds to_ns(std::chrono::milliseconds ms) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(ms);
}

ServiceStats build_stats(const std::string& service, std::vector<InstanceSnapshot> snapshots) {
    ServiceStats stats;
    stats.service = service;
    stats.total_instances = snapshots.size();

    std::chrono::nanoseconds latency_sum{0};
    double health_sum = 0.0;
    for (const auto& snap : snapshots) {
        const auto& state = snap.state;
        if (state.healthy()) ++stats.healthy_instances;
        if (state.eligible()) ++stats.eligible_instances;
        if (state.draining) ++stats.draining_instances;
        if (!state.enabled) ++stats.disabled_instances;
        if (state.circuit == CircuitState::Open) ++stats.open_circuits;
        if (state.circuit == CircuitState::HalfOpen) ++stats.half_open_circuits;

        stats.total_requests += state.total_requests;
        stats.success_requests += state.success_requests;
        stats.failed_requests += state.failed_requests;
        stats.active_connections += snap.active_connections;
        latency_sum += state.avg_response_time;
        health_sum += state.health_score;
    }

    if (!snapshots.empty()) {
        stats.average_response_time = latency_sum / static_cast<int64_t>(snapshots.size());
        stats.average_health_score = health_sum / static_cast<double>(snapshots.size());
    }
    if (stats.total_requests > 0) {
        stats.success_rate = static_cast<double>(stats.success_requests) /
                             static_cast<double>(stats.total_requests);
    }
    stats.instances = std::move(snapshots);
    return stats;
}

std::vector<InstanceSnapshot> snapshot_all(const std::vector<InstancePtr>& instances) {
    std::vector<InstanceSnapshot> result;
    result.reserve(instances.size());
    for (const auto& instance : instances) {
        result.push_back(instance->snapshot());
    }
    return result;
}

} // namespace

template<typename Fn>
std::expected<void, Error> LoadBalancerManager::with_instance(const std::string& service,
                                                              const std::string& host, Fn&& fn) {
    auto instance = registry_.find(service, host);
    if (!instance) {
        return std::unexpected(instance_not_found(service, host));
    }
    instance->update(std::forward<Fn>(fn));
    return {};
}

LoadBalancerManager::LoadBalancerManager(const Config& config)
    : config_(config),
      scorer_(config_.health),
      breaker_(config_.circuit_breaker, config_.recovery.initial_weight),
      recovery_(registry_, breaker_, config_.recovery),
      affinity_(config_.session_affinity.ttl) {
    registry_.set_removal_listener([this](const std::string& service, const std::string& host) {
        const size_t dropped = affinity_.remove_host(service, host);
        if (dropped > 0) {
            Logger::info(Logger::Component::Affinity,
                fmt::format("Dropped {} bindings to removed instance {}/{}", dropped, service, host));
        }
    });

    for (const auto& service : config_.services) {
        auto algorithm = parse_algorithm(service.algorithm.empty()
            ? config_.load_balancer.default_algorithm : service.algorithm);
        routing_.emplace(service.name,
            make_routing(algorithm.value_or(Algorithm::Adaptive),
                         service.session_affinity.value_or(config_.session_affinity.enabled)));

        for (const auto& spec : service.instances) {
            registry_.upsert(service.name, spec);
        }

        Logger::info(Logger::Component::LB,
            fmt::format("Initialized service {} with {} instances (algorithm {})",
                service.name, service.instances.size(),
                to_string(algorithm.value_or(Algorithm::Adaptive))));
    }
}

LoadBalancerManager::~LoadBalancerManager() {
    stop();
}

void LoadBalancerManager::start() {
    if (maintenance_thread_.joinable()) {
        return;
    }
    maintenance_thread_ = std::jthread([this](std::stop_token stop_token) {
        maintenance_loop(stop_token);
    });
}

void LoadBalancerManager::stop() {
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_thread_.join();
    }
}

void LoadBalancerManager::maintenance_loop(std::stop_token stop_token) {
    Logger::info(Logger::Component::LB, "Maintenance thread started");

    auto next_recovery = Clock::now() + config_.recovery.interval;
    auto next_sweep = Clock::now() + config_.session_affinity.sweep_interval;

    while (!stop_token.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_.wait_until(lock, stop_token, std::min(next_recovery, next_sweep),
                             [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }

        const auto now = Clock::now();
        if (now >= next_recovery) {
            recovery_.tick(now);
            next_recovery = now + config_.recovery.interval;
        }
        if (now >= next_sweep) {
            const size_t purged = affinity_.sweep(now);
            Logger::debug(Logger::Component::Affinity,
                fmt::format("Sweep removed {} expired bindings", purged));
            next_sweep = now + config_.session_affinity.sweep_interval;
        }
    }

    Logger::info(Logger::Component::LB, "Maintenance thread stopped");
}

std::expected<InstancePtr, Error> LoadBalancerManager::select_instance(const std::string& service,
                                                                       const std::string& affinity_key,
                                                                       const std::string& client_address) {
    const auto now = Clock::now();
    const ServiceRouting routing = routing_for(service);
    const bool sticky = routing.session_affinity && !affinity_key.empty();

    if (sticky) {
        auto bound = affinity_.get(service, affinity_key, now, [&](const std::string& host) {
            auto instance = registry_.find(service, host);
            return instance && instance->inspect([](const InstanceState& s) { return s.serviceable(); });
        });
        if (bound) {
            if (auto instance = registry_.find(service, *bound)) {
                instance->acquire_connection();
                return instance;
            }
        }
    }

    const auto instances = registry_.instances(service);
    if (instances.empty()) {
        return std::unexpected(no_eligible_instances(service));
    }

    std::vector<InstanceSnapshot> candidates;
    std::vector<InstancePtr> owners;
    candidates.reserve(instances.size());
    owners.reserve(instances.size());

    for (const auto& instance : instances) {
        InstanceSnapshot snap = instance->snapshot();
        if (snap.state.circuit == CircuitState::Open &&
            now - snap.state.circuit_changed_at >= config_.circuit_breaker.cooldown) {
            const auto transition = instance->update([&](InstanceState& state) {
                return breaker_.try_half_open(state, now);
            });
            if (transition == CircuitTransition::HalfOpened) {
                Logger::info(Logger::Component::Circuit,
                    fmt::format("{}/{}: circuit OPEN → HALF_OPEN", service, instance->host()));
            }
            snap = instance->snapshot();
        }
        if (snap.state.eligible()) {
            candidates.push_back(std::move(snap));
            owners.push_back(instance);
        }
    }

    if (candidates.empty()) {
        return std::unexpected(no_eligible_instances(service));
    }

    SelectionContext context{affinity_key, client_address};
    auto index = routing.policy->select(candidates, context);
    if (!index) {
        Error error = index.error();
        error.message = fmt::format("{} (service {})", error.message, service);
        return std::unexpected(std::move(error));
    }

    InstancePtr chosen = owners.at(*index);
    chosen->acquire_connection();

    if (sticky) {
        affinity_.set(service, affinity_key, chosen->host(), now);
    }

    return chosen;
}

std::expected<void, Error> LoadBalancerManager::report_outcome(const std::string& service,
                                                               const std::string& host,
                                                               bool success,
                                                               std::chrono::nanoseconds latency) {
    auto instance = registry_.find(service, host);
    if (!instance) {
        return std::unexpected(instance_not_found(service, host));
    }

    instance->release_connection();

    const auto now = Clock::now();
    uint32_t failures = 0;
    const auto transition = instance->update([&](InstanceState& state) {
        scorer_.record(state, success, latency, now);
        failures = state.consecutive_failures;
        return breaker_.on_outcome(state, success, now);
    });

    switch (transition) {
        case CircuitTransition::Opened:
            Logger::warn(Logger::Component::Circuit,
                fmt::format("{}/{}: circuit OPEN ({} consecutive failures)", service, host, failures));
            break;
        case CircuitTransition::Closed:
            Logger::info(Logger::Component::Circuit,
                fmt::format("{}/{}: circuit HALF_OPEN → CLOSED", service, host));
            break;
        default:
            break;
    }
    return {};
}

std::expected<void, Error> LoadBalancerManager::report_health_check(const std::string& service,
                                                                    const std::string& host,
                                                                    bool passing) {
    return with_instance(service, host, [&](InstanceState& state) {
        if (state.probe_passing != passing) {
            Logger::debug(Logger::Component::Health,
                fmt::format("{}/{}: probe {}", service, host, passing ? "passing" : "failing"));
        }
        state.probe_passing = passing;
    });
}

std::expected<void, Error> LoadBalancerManager::set_algorithm(const std::string& service,
                                                              const std::string& name) {
    auto algorithm = parse_algorithm(name);
    if (!algorithm) {
        Logger::warn(Logger::Component::Algorithm,
            fmt::format("Rejected algorithm '{}' for service {}", name, service));
        return std::unexpected(unknown_algorithm(name));
    }

    {
        std::unique_lock lock(routing_mutex_);
        auto it = routing_.find(service);
        if (it != routing_.end() && it->second.algorithm == *algorithm) {
            // Keep the cursor, credits and ring of the running policy.
            return {};
        }
        const bool sticky = it != routing_.end() ? it->second.session_affinity
                                                 : config_.session_affinity.enabled;
        routing_.insert_or_assign(service, make_routing(*algorithm, sticky));
    }

    Logger::info(Logger::Component::Algorithm,
        fmt::format("Service {} now uses {}", service, name));
    return {};
}

std::string LoadBalancerManager::algorithm(const std::string& service) const {
    {
        std::shared_lock lock(routing_mutex_);
        if (auto it = routing_.find(service); it != routing_.end()) {
            return std::string(to_string(it->second.algorithm));
        }
    }
    return config_.load_balancer.default_algorithm;
}

std::vector<std::string> LoadBalancerManager::routed_services() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(routing_mutex_);
        names.reserve(routing_.size());
        for (const auto& [name, routing] : routing_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void LoadBalancerManager::set_session_affinity(const std::string& service, bool enabled) {
    std::unique_lock lock(routing_mutex_);
    auto it = routing_.find(service);
    if (it == routing_.end()) {
        auto algorithm = parse_algorithm(config_.load_balancer.default_algorithm);
        routing_.emplace(service, make_routing(algorithm.value_or(Algorithm::Adaptive), enabled));
        return;
    }
    it->second.session_affinity = enabled;
}

bool LoadBalancerManager::session_affinity_enabled(const std::string& service) const {
    std::shared_lock lock(routing_mutex_);
    if (auto it = routing_.find(service); it != routing_.end()) {
        return it->second.session_affinity;
    }
    return config_.session_affinity.enabled;
}

std::expected<void, Error> LoadBalancerManager::drain_instance(const std::string& service,
                                                               const std::string& host) {
    auto result = with_instance(service, host, [](InstanceState& state) { state.draining = true; });
    if (result) {
        Logger::info(Logger::Component::Admin, fmt::format("{}/{}: draining", service, host));
    }
    return result;
}

std::expected<void, Error> LoadBalancerManager::enable_instance(const std::string& service,
                                                                const std::string& host) {
    auto result = with_instance(service, host, [](InstanceState& state) {
        state.enabled = true;
        state.draining = false;
    });
    if (result) {
        Logger::info(Logger::Component::Admin, fmt::format("{}/{}: enabled", service, host));
    }
    return result;
}

std::expected<void, Error> LoadBalancerManager::disable_instance(const std::string& service,
                                                                 const std::string& host) {
    auto result = with_instance(service, host, [](InstanceState& state) { state.enabled = false; });
    if (result) {
        Logger::info(Logger::Component::Admin, fmt::format("{}/{}: disabled", service, host));
    }
    return result;
}

std::expected<ServiceStats, Error> LoadBalancerManager::get_stats(const std::string& service) const {
    if (!registry_.has_service(service)) {
        return std::unexpected(service_not_found(service));
    }
    ServiceStats stats = build_stats(service, snapshot_all(registry_.instances(service)));
    stats.algorithm = algorithm(service);
    stats.session_affinity = session_affinity_enabled(service);
    stats.affinity_entries = affinity_.size(service);
    return stats;
}

GlobalStats LoadBalancerManager::global_stats() const {
    GlobalStats global;
    for (const auto& service : registry_.services()) {
        auto stats = get_stats(service);
        if (!stats) {
            continue;   // removed between listing and reading
        }
        global.total_requests += stats->total_requests;
        global.success_requests += stats->success_requests;
        global.failed_requests += stats->failed_requests;
        global.active_connections += stats->active_connections;
        global.total_instances += stats->total_instances;
        global.healthy_instances += stats->healthy_instances;
        global.services.push_back(std::move(*stats));
    }
    global.affinity = affinity_.stats();
    return global;
}

std::expected<std::vector<InstanceSnapshot>, Error> LoadBalancerManager::instances(const std::string& service) const {
    if (!registry_.has_service(service)) {
        return std::unexpected(service_not_found(service));
    }
    return snapshot_all(registry_.instances(service));
}

std::vector<InstanceSnapshot> LoadBalancerManager::all_instances() const {
    std::vector<InstanceSnapshot> result;
    for (const auto& service : registry_.services()) {
        auto snaps = snapshot_all(registry_.instances(service));
        std::move(snaps.begin(), snaps.end(), std::back_inserter(result));
    }
    return result;
}

std::expected<InstanceSnapshot, Error> LoadBalancerManager::instance(const std::string& service,
                                                                     const std::string& host) const {
    auto found = registry_.find(service, host);
    if (!found) {
        return std::unexpected(instance_not_found(service, host));
    }
    return found->snapshot();
}

std::vector<AffinityEntry> LoadBalancerManager::affinity_entries() const {
    return affinity_.entries();
}

AffinityStats LoadBalancerManager::affinity_stats() const {
    return affinity_.stats();
}

size_t LoadBalancerManager::remove_affinity(const std::string& key) {
    const size_t removed = affinity_.remove(key);
    Logger::info(Logger::Component::Affinity,
        fmt::format("Removed {} bindings for key {}", removed, key));
    return removed;
}

void LoadBalancerManager::clear_affinity() {
    affinity_.clear();
    Logger::info(Logger::Component::Affinity, "Cleared all session bindings");
}

std::vector<RecoveryStatus> LoadBalancerManager::recovery_status() const {
    return recovery_.status();
}

std::expected<void, Error> LoadBalancerManager::force_recovery(const std::string& service,
                                                               const std::string& host) {
    return recovery_.force_recovery(service, host, Clock::now());
}

RecoveryManager::TickResult LoadBalancerManager::run_recovery_tick() {
    return recovery_.tick(Clock::now());
}

size_t LoadBalancerManager::sweep_affinity() {
    return affinity_.sweep(Clock::now());
}

LoadBalancerManager::ServiceRouting LoadBalancerManager::routing_for(const std::string& service) {
    {
        std::shared_lock lock(routing_mutex_);
        if (auto it = routing_.find(service); it != routing_.end()) {
            return it->second;
        }
    }

    auto algorithm = parse_algorithm(config_.load_balancer.default_algorithm);
    ServiceRouting routing = make_routing(algorithm.value_or(Algorithm::Adaptive),
                                          config_.session_affinity.enabled);

    // Only services known to the registry are stored.
    if (!registry_.has_service(service)) {
        return routing;
    }

    std::unique_lock lock(routing_mutex_);
    return routing_.try_emplace(service, std::move(routing)).first->second;
}

LoadBalancerManager::ServiceRouting LoadBalancerManager::make_routing(Algorithm algorithm,
                                                                      bool session_affinity) const {
    return ServiceRouting{
        algorithm,
        std::shared_ptr<RoutingPolicy>(make_policy(algorithm, config_.load_balancer,
                                                   to_ns(config_.health.baseline_latency))),
        session_affinity};
}

} // namespace gwlb
