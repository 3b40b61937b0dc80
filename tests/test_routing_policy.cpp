#include <gtest/gtest.h>
#include "gwlb/routing_policy.hpp"
#include <map>
#include <string>
#include <vector>

using namespace gwlb;
using namespace std::chrono_literals;

class RoutingPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        candidates = {
            make_candidate("10.0.0.1:8080"),
            make_candidate("10.0.0.2:8080"),
            make_candidate("10.0.0.3:8080"),
        };
    }

    static InstanceSnapshot make_candidate(const std::string& host, int weight = 100) {
        InstanceSnapshot snapshot;
        snapshot.service = "catalog";
        snapshot.host = host;
        snapshot.state.weight = weight;
        return snapshot;
    }

    std::string pick(RoutingPolicy& policy, const SelectionContext& context = {}) {
        auto result = policy.select(candidates, context);
        EXPECT_TRUE(result.has_value());
        return result ? candidates[*result].host : std::string{};
    }

    std::vector<InstanceSnapshot> candidates;
};

TEST_F(RoutingPolicyTest, RoundRobinDistribution) {
    RoundRobinPolicy policy;

    std::vector<std::string> hosts;
    for (int i = 0; i < 9; ++i) {
        hosts.push_back(pick(policy));
    }

    // Verify round-robin pattern: .1, .2, .3, .1, .2, .3, ...
    for (int i = 0; i < 9; ++i) {
        EXPECT_EQ(hosts[i], candidates[i % 3].host);
    }
}

TEST_F(RoutingPolicyTest, RoundRobinIsFairOverAnyWindow) {
    RoundRobinPolicy policy;
    pick(policy);   // start mid-cycle

    std::map<std::string, int> counts;
    for (int i = 0; i < 300; ++i) {
        ++counts[pick(policy)];
    }
    for (const auto& candidate : candidates) {
        EXPECT_EQ(counts[candidate.host], 100);
    }
}

TEST_F(RoutingPolicyTest, NoCandidates) {
    std::vector<InstanceSnapshot> empty;
    for (auto algorithm : {Algorithm::RoundRobin, Algorithm::WeightedRoundRobin,
                           Algorithm::LeastConnections, Algorithm::LeastResponseTime,
                           Algorithm::HealthAware, Algorithm::ConsistentHash, Algorithm::Adaptive}) {
        auto policy = make_policy(algorithm, AlgorithmConfig{}, 50ms);
        auto result = policy->select(empty, SelectionContext{"key", "10.1.1.1"});
        ASSERT_FALSE(result.has_value()) << to_string(algorithm);
        EXPECT_EQ(result.error().code, ErrorCode::NoEligibleInstances);
        EXPECT_EQ(result.error().message, "No eligible instances available");
    }
}

TEST_F(RoutingPolicyTest, SingleCandidate) {
    candidates.resize(1);
    RoundRobinPolicy policy;
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(pick(policy), "10.0.0.1:8080");
    }
}

TEST_F(RoutingPolicyTest, ResetCounter) {
    RoundRobinPolicy policy;

    // Select a few instances
    pick(policy);
    pick(policy);
    pick(policy);
    pick(policy);

    // Reset and verify it starts from beginning
    policy.reset();
    EXPECT_EQ(pick(policy), "10.0.0.1:8080");
}

TEST_F(RoutingPolicyTest, WeightedRoundRobinFollowsWeights) {
    candidates = {make_candidate("a", 300), make_candidate("b", 100)};
    WeightedRoundRobinPolicy policy;

    std::map<std::string, int> counts;
    for (int i = 0; i < 400; ++i) {
        ++counts[pick(policy)];
    }
    EXPECT_EQ(counts["a"], 300);
    EXPECT_EQ(counts["b"], 100);
}

TEST_F(RoutingPolicyTest, WeightedRoundRobinIsSmooth) {
    candidates = {make_candidate("a", 500), make_candidate("b", 100), make_candidate("c", 100)};
    WeightedRoundRobinPolicy policy;

    // Smooth WRR interleaves instead of bursting: a a b a c a a
    std::vector<std::string> expected = {"a", "a", "b", "a", "c", "a", "a"};
    for (const auto& host : expected) {
        EXPECT_EQ(pick(policy), host);
    }
}

TEST_F(RoutingPolicyTest, WeightedRoundRobinHonorsRecoveryWeight) {
    candidates = {make_candidate("a", 100), make_candidate("b", 100)};
    candidates[1].state.recovery_weight = 0.25;
    WeightedRoundRobinPolicy policy;

    std::map<std::string, int> counts;
    for (int i = 0; i < 500; ++i) {
        ++counts[pick(policy)];
    }
    EXPECT_EQ(counts["a"], 400);
    EXPECT_EQ(counts["b"], 100);
}

TEST_F(RoutingPolicyTest, WeightedRoundRobinZeroWeightsFallBack) {
    candidates = {make_candidate("a", 0), make_candidate("b", 0)};
    WeightedRoundRobinPolicy policy;
    EXPECT_EQ(pick(policy), "a");
    EXPECT_EQ(pick(policy), "b");
    EXPECT_EQ(pick(policy), "a");
}

TEST_F(RoutingPolicyTest, LeastConnections) {
    candidates[0].active_connections = 4;
    candidates[1].active_connections = 1;
    candidates[2].active_connections = 2;
    LeastConnectionsPolicy policy;
    EXPECT_EQ(pick(policy), "10.0.0.2:8080");

    candidates[1].active_connections = 2;
    // Tie between .2 and .3 goes to the lowest host.
    EXPECT_EQ(pick(policy), "10.0.0.2:8080");
}

TEST_F(RoutingPolicyTest, LeastResponseTime) {
    candidates[0].state.avg_response_time = 40ms;
    candidates[1].state.avg_response_time = 25ms;
    candidates[2].state.avg_response_time = 90ms;
    LeastResponseTimePolicy policy;
    EXPECT_EQ(pick(policy), "10.0.0.2:8080");

    // An instance without samples is tried first.
    candidates[2].state.avg_response_time = 0ms;
    EXPECT_EQ(pick(policy), "10.0.0.3:8080");
}

TEST_F(RoutingPolicyTest, HealthAwareFollowsScores) {
    candidates = {make_candidate("a"), make_candidate("b")};
    candidates[0].state.health_score = 0.9;
    candidates[1].state.health_score = 0.1;
    HealthAwarePolicy policy(42);

    std::map<std::string, int> counts;
    for (int i = 0; i < 10000; ++i) {
        ++counts[pick(policy)];
    }
    EXPECT_GT(counts["a"], 8500);
    EXPECT_LT(counts["a"], 9500);
}

TEST_F(RoutingPolicyTest, HealthAwareSkipsZeroWeight) {
    candidates[1].state.health_score = 0.0;
    candidates[2].state.recovery_weight = 0.0;
    HealthAwarePolicy policy(7);
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(pick(policy), "10.0.0.1:8080");
    }
}

TEST_F(RoutingPolicyTest, HealthAwareIsReproducibleWithSeed) {
    HealthAwarePolicy first(99);
    HealthAwarePolicy second(99);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(pick(first), pick(second));
    }
}

TEST_F(RoutingPolicyTest, ConsistentHashIsStable) {
    ConsistentHashPolicy policy(150);
    for (int user = 0; user < 20; ++user) {
        std::string key = "user-" + std::to_string(user);
        std::string first = pick(policy, SelectionContext{key, {}});
        for (int i = 0; i < 5; ++i) {
            EXPECT_EQ(pick(policy, SelectionContext{key, {}}), first);
        }
    }
}

TEST_F(RoutingPolicyTest, ConsistentHashFallsBackToClientAddress) {
    ConsistentHashPolicy policy(150);
    std::string first = pick(policy, SelectionContext{{}, "192.168.1.20"});
    EXPECT_EQ(pick(policy, SelectionContext{{}, "192.168.1.20"}), first);
}

TEST_F(RoutingPolicyTest, ConsistentHashRemapsOnlyRemovedHost) {
    ConsistentHashPolicy policy(150);

    std::map<std::string, std::string> before;
    for (int user = 0; user < 300; ++user) {
        std::string key = "session-" + std::to_string(user);
        before[key] = pick(policy, SelectionContext{key, {}});
    }

    const std::string removed = candidates[1].host;
    candidates.erase(candidates.begin() + 1);

    for (const auto& [key, host] : before) {
        std::string after = pick(policy, SelectionContext{key, {}});
        EXPECT_NE(after, removed);
        if (host != removed) {
            EXPECT_EQ(after, host) << key;
        }
    }
}

TEST_F(RoutingPolicyTest, ConsistentHashCapsVirtualNodes) {
    ConsistentHashPolicy policy(static_cast<size_t>(-1));
    auto result = policy.select(candidates, SelectionContext{"user-1", {}});
    ASSERT_TRUE(result.has_value());
    EXPECT_LT(*result, candidates.size());
}

TEST_F(RoutingPolicyTest, AdaptivePrefersHealthyFastInstances) {
    AdaptivePolicy policy(50ms);
    candidates[0].state.health_score = 0.6;
    candidates[0].state.avg_response_time = 20ms;
    candidates[1].state.health_score = 1.0;
    candidates[1].state.avg_response_time = 20ms;
    candidates[2].state.health_score = 1.0;
    candidates[2].state.avg_response_time = 150ms;
    EXPECT_EQ(pick(policy), "10.0.0.2:8080");

    EXPECT_GT(policy.score(candidates[1]), policy.score(candidates[0]));
    EXPECT_GT(policy.score(candidates[1]), policy.score(candidates[2]));
}

TEST_F(RoutingPolicyTest, AdaptivePenalizesConnections) {
    AdaptivePolicy policy(50ms);
    candidates[0].active_connections = 50;
    EXPECT_NEAR(policy.score(candidates[0]), 1.0 / 1.5, 1e-9);
    EXPECT_EQ(pick(policy), "10.0.0.2:8080");
}

TEST_F(RoutingPolicyTest, AdaptiveTieGoesToLowestHost) {
    AdaptivePolicy policy(50ms);
    std::swap(candidates[0], candidates[2]);
    EXPECT_EQ(pick(policy), "10.0.0.1:8080");
}

TEST_F(RoutingPolicyTest, AlgorithmNames) {
    EXPECT_EQ(algorithm_catalogue().size(), 7u);
    for (const auto& info : algorithm_catalogue()) {
        auto parsed = parse_algorithm(info.name);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, info.algorithm);
        EXPECT_EQ(to_string(info.algorithm), info.name);
    }
    EXPECT_FALSE(parse_algorithm("random").has_value());
    EXPECT_FALSE(parse_algorithm("").has_value());
}

TEST_F(RoutingPolicyTest, FactoryBuildsRequestedPolicy) {
    AlgorithmConfig config;
    config.random_seed = 1;
    for (const auto& info : algorithm_catalogue()) {
        auto policy = make_policy(info.algorithm, config, 50ms);
        ASSERT_NE(policy, nullptr);
        EXPECT_EQ(policy->algorithm(), info.algorithm);
    }
}
