#include "gwlb/routing_policy.hpp"
#include <xxhash.h>
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace gwlb {

namespace {

Error empty_candidates() {
    return Error{ErrorCode::NoEligibleInstances, "No eligible instances available"};
}

// Lower score wins; equal scores go to the lexicographically lowest host.
template<typename Key>
size_t argmin_by_host(const std::vector<InstanceSnapshot>& candidates, Key key) {
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        const auto lhs = key(candidates[i]);
        const auto rhs = key(candidates[best]);
        if (lhs < rhs || (lhs == rhs && candidates[i].host < candidates[best].host)) {
            best = i;
        }
    }
    return best;
}

} // namespace

std::string_view to_string(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::RoundRobin: return "round_robin";
        case Algorithm::WeightedRoundRobin: return "weighted_round_robin";
        case Algorithm::LeastConnections: return "least_connections";
        case Algorithm::LeastResponseTime: return "least_response_time";
        case Algorithm::HealthAware: return "health_aware";
        case Algorithm::ConsistentHash: return "consistent_hash";
        case Algorithm::Adaptive: return "adaptive";
    }
    return "unknown";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    for (const auto& info : algorithm_catalogue()) {
        if (info.name == name) {
            return info.algorithm;
        }
    }
    return std::nullopt;
}

const std::vector<AlgorithmInfo>& algorithm_catalogue() {
    static const std::vector<AlgorithmInfo> catalogue = {
        {Algorithm::RoundRobin, "round_robin",
         "Simple round-robin distribution", "basic"},
        {Algorithm::WeightedRoundRobin, "weighted_round_robin",
         "Weighted round-robin based on instance weights", "weighted"},
        {Algorithm::LeastConnections, "least_connections",
         "Route to instance with least active connections", "connection_based"},
        {Algorithm::LeastResponseTime, "least_response_time",
         "Route to instance with fastest response time", "performance_based"},
        {Algorithm::HealthAware, "health_aware",
         "Weighted selection based on health scores", "health_based"},
        {Algorithm::ConsistentHash, "consistent_hash",
         "Consistent hashing for session affinity", "hash_based"},
        {Algorithm::Adaptive, "adaptive",
         "Adaptive algorithm based on multiple metrics", "intelligent"},
    };
    return catalogue;
}

std::unique_ptr<RoutingPolicy> make_policy(Algorithm algorithm,
                                           const AlgorithmConfig& config,
                                           std::chrono::nanoseconds latency_baseline) {
    switch (algorithm) {
        case Algorithm::RoundRobin:
            return std::make_unique<RoundRobinPolicy>();
        case Algorithm::WeightedRoundRobin:
            return std::make_unique<WeightedRoundRobinPolicy>();
        case Algorithm::LeastConnections:
            return std::make_unique<LeastConnectionsPolicy>();
        case Algorithm::LeastResponseTime:
            return std::make_unique<LeastResponseTimePolicy>();
        case Algorithm::HealthAware: {
            uint64_t seed = config.random_seed;
            if (seed == 0) {
                seed = std::random_device{}();
            }
            return std::make_unique<HealthAwarePolicy>(seed);
        }
        case Algorithm::ConsistentHash:
            return std::make_unique<ConsistentHashPolicy>(config.virtual_nodes);
        case Algorithm::Adaptive:
            return std::make_unique<AdaptivePolicy>(latency_baseline);
    }
    return std::make_unique<AdaptivePolicy>(latency_baseline);
}

std::expected<size_t, Error> RoundRobinPolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                      const SelectionContext&) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }

    // Get current index and increment atomically
    return counter_.fetch_add(1, std::memory_order_relaxed) % candidates.size();
}

std::expected<size_t, Error> WeightedRoundRobinPolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                              const SelectionContext&) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }

    std::lock_guard lock(mutex_);

    double total = 0.0;
    for (const auto& candidate : candidates) {
        total += candidate.state.effective_weight();
    }
    if (total <= 0.0) {
        return fallback_++ % candidates.size();
    }

    // Carry credits over only for hosts still in the candidate set.
    std::unordered_map<std::string, double> next;
    next.reserve(candidates.size());

    size_t selected = 0;
    double best = 0.0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& host = candidates[i].host;
        double credit = 0.0;
        if (auto it = credits_.find(host); it != credits_.end()) {
            credit = it->second;
        }
        credit += candidates[i].state.effective_weight();
        next[host] = credit;
        if (i == 0 || credit > best) {
            best = credit;
            selected = i;
        }
    }

    next[candidates[selected].host] -= total;
    credits_ = std::move(next);
    return selected;
}

std::expected<size_t, Error> LeastConnectionsPolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                            const SelectionContext&) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }
    return argmin_by_host(candidates, [](const InstanceSnapshot& c) { return c.active_connections; });
}

std::expected<size_t, Error> LeastResponseTimePolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                             const SelectionContext&) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }
    // An instance without samples has an average of zero and is tried first.
    return argmin_by_host(candidates, [](const InstanceSnapshot& c) { return c.state.avg_response_time; });
}

HealthAwarePolicy::HealthAwarePolicy(uint64_t seed)
    : rng_(seed) {}

std::expected<size_t, Error> HealthAwarePolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                       const SelectionContext&) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }

    std::vector<double> weights;
    weights.reserve(candidates.size());
    double total = 0.0;
    for (const auto& candidate : candidates) {
        const double w = candidate.state.health_score * candidate.state.effective_weight();
        weights.push_back(w);
        total += w;
    }

    std::lock_guard lock(mutex_);

    if (total <= 0.0) {
        std::uniform_int_distribution<size_t> uniform(0, candidates.size() - 1);
        return uniform(rng_);
    }

    std::uniform_real_distribution<double> draw(0.0, total);
    const double threshold = draw(rng_);
    double sum = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        sum += weights[i];
        if (weights[i] > 0.0 && threshold < sum) {
            return i;
        }
    }

    // Rounding at the top of the range: last candidate with a positive weight.
    for (size_t i = weights.size(); i-- > 0;) {
        if (weights[i] > 0.0) {
            return i;
        }
    }
    return candidates.size() - 1;
}

ConsistentHashPolicy::ConsistentHashPolicy(size_t virtual_nodes)
    : virtual_nodes_(std::clamp<size_t>(virtual_nodes, 1, kMaxVirtualNodes)) {}

uint64_t ConsistentHashPolicy::hash(std::string_view key) {
    return XXH64(key.data(), key.size(), 0);
}

std::expected<size_t, Error> ConsistentHashPolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                          const SelectionContext& context) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }

    std::string_view key = context.affinity_key.empty() ? context.client_address : context.affinity_key;
    if (key.empty()) {
        // Nothing to hash on: spread like round-robin.
        return fallback_.fetch_add(1, std::memory_order_relaxed) % candidates.size();
    }

    std::string owner;
    {
        std::lock_guard lock(mutex_);

        bool changed = ring_hosts_.size() != candidates.size();
        for (size_t i = 0; !changed && i < candidates.size(); ++i) {
            changed = ring_hosts_[i] != candidates[i].host;
        }
        if (changed) {
            std::vector<std::string> hosts;
            hosts.reserve(candidates.size());
            for (const auto& candidate : candidates) {
                hosts.push_back(candidate.host);
            }
            rebuild_ring(std::move(hosts));
        }

        const uint64_t point = hash(key);
        auto it = std::lower_bound(ring_.begin(), ring_.end(), point,
            [](const auto& node, uint64_t value) { return node.first < value; });
        if (it == ring_.end()) {
            it = ring_.begin();
        }
        owner = it->second;
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].host == owner) {
            return i;
        }
    }
    return 0;
}

void ConsistentHashPolicy::rebuild_ring(std::vector<std::string> hosts) {
    ring_.clear();
    ring_.reserve(hosts.size() * virtual_nodes_);
    for (const auto& host : hosts) {
        for (size_t i = 0; i < virtual_nodes_; ++i) {
            ring_.emplace_back(hash(fmt::format("{}#{}", host, i)), host);
        }
    }
    std::sort(ring_.begin(), ring_.end());
    ring_hosts_ = std::move(hosts);
}

AdaptivePolicy::AdaptivePolicy(std::chrono::nanoseconds latency_baseline)
    : latency_baseline_(latency_baseline.count() > 0 ? latency_baseline : std::chrono::milliseconds(50)) {}

double AdaptivePolicy::score(const InstanceSnapshot& candidate) const {
    const auto& state = candidate.state;
    const double normalized_latency =
        static_cast<double>(state.avg_response_time.count()) /
        static_cast<double>(latency_baseline_.count());
    const double connection_penalty =
        1.0 / (1.0 + 0.01 * static_cast<double>(candidate.active_connections));
    return state.health_score * (state.effective_weight() / 100.0) /
           (1.0 + normalized_latency) * connection_penalty;
}

std::expected<size_t, Error> AdaptivePolicy::select(const std::vector<InstanceSnapshot>& candidates,
                                                    const SelectionContext&) {
    if (candidates.empty()) {
        return std::unexpected(empty_candidates());
    }
    // argmax(score) == argmin(-score)
    return argmin_by_host(candidates, [this](const InstanceSnapshot& c) { return -score(c); });
}

} // namespace gwlb
