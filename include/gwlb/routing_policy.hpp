#pragma once

#include "gwlb/config_loader.hpp"
#include "gwlb/error.hpp"
#include "gwlb/service_instance.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gwlb {

enum class Algorithm {
    RoundRobin,
    WeightedRoundRobin,
    LeastConnections,
    LeastResponseTime,
    HealthAware,
    ConsistentHash,
    Adaptive
};

std::string_view to_string(Algorithm algorithm);
std::optional<Algorithm> parse_algorithm(std::string_view name);

struct AlgorithmInfo {
    Algorithm algorithm;
    std::string_view name;
    std::string_view description;
    std::string_view category;
};

const std::vector<AlgorithmInfo>& algorithm_catalogue();

// Upper bound on consistent-hash ring replicas per host.
inline constexpr size_t kMaxVirtualNodes = 10000;

// Request attributes a policy may route on.
struct SelectionContext {
    std::string_view affinity_key;
    std::string_view client_address;
};

// A selection strategy. Policies only read the candidates they are handed;
// the only state they own is their cursor, credits, ring or RNG.
class RoutingPolicy {
public:
    virtual ~RoutingPolicy() = default;

    // Returns the index of the chosen candidate, or NoEligibleInstances when empty.
    virtual std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                                const SelectionContext& context) = 0;

    virtual Algorithm algorithm() const = 0;
};

std::unique_ptr<RoutingPolicy> make_policy(Algorithm algorithm,
                                           const AlgorithmConfig& config,
                                           std::chrono::nanoseconds latency_baseline);

// Cyclic cursor; fair over any window of N selections.
class RoundRobinPolicy : public RoutingPolicy {
public:
    RoundRobinPolicy() : counter_(0) {}

    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::RoundRobin; }

    void reset() {
        counter_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<size_t> counter_;
};

// Smooth weighted round-robin over Weight x RecoveryWeight. Each host carries a
// running credit; every pick adds the effective weight to all credits, takes the
// largest and charges it the total.
class WeightedRoundRobinPolicy : public RoutingPolicy {
public:
    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::WeightedRoundRobin; }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, double> credits_;
    size_t fallback_ = 0;
};

class LeastConnectionsPolicy : public RoutingPolicy {
public:
    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::LeastConnections; }
};

class LeastResponseTimePolicy : public RoutingPolicy {
public:
    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::LeastResponseTime; }
};

// Weighted random draw, P(i) proportional to HealthScore x Weight x RecoveryWeight.
class HealthAwarePolicy : public RoutingPolicy {
public:
    explicit HealthAwarePolicy(uint64_t seed);

    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::HealthAware; }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

// Hash ring with virtual nodes per host, keyed by the affinity key or,
// failing that, the client address.
class ConsistentHashPolicy : public RoutingPolicy {
public:
    explicit ConsistentHashPolicy(size_t virtual_nodes);

    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::ConsistentHash; }

    static uint64_t hash(std::string_view key);

private:
    void rebuild_ring(std::vector<std::string> hosts);

    size_t virtual_nodes_;
    std::mutex mutex_;
    std::vector<std::string> ring_hosts_;
    std::vector<std::pair<uint64_t, std::string>> ring_;
    std::atomic<size_t> fallback_{0};
};

// argmax of HealthScore x (Weight/100) x RecoveryWeight / (1 + latency/baseline),
// damped by 1 / (1 + 0.01 x ActiveConnections).
class AdaptivePolicy : public RoutingPolicy {
public:
    explicit AdaptivePolicy(std::chrono::nanoseconds latency_baseline);

    std::expected<size_t, Error> select(const std::vector<InstanceSnapshot>& candidates,
                                        const SelectionContext& context) override;

    Algorithm algorithm() const override { return Algorithm::Adaptive; }

    double score(const InstanceSnapshot& candidate) const;

private:
    std::chrono::nanoseconds latency_baseline_;
};

} // namespace gwlb
