#include <gtest/gtest.h>
#include "gwlb/json_views.hpp"
#include "gwlb/routing_policy.hpp"

using namespace gwlb;
using namespace std::chrono_literals;

class JsonViewsTest : public ::testing::Test {};

TEST_F(JsonViewsTest, InstanceSnapshot) {
    InstanceSnapshot snapshot;
    snapshot.service = "catalog";
    snapshot.host = "10.0.0.1:8080";
    snapshot.active_connections = 3;
    snapshot.state.weight = 200;
    snapshot.state.draining = true;
    snapshot.state.circuit = CircuitState::HalfOpen;
    snapshot.state.recovery_weight = 0.3;
    snapshot.state.avg_response_time = 12500us;

    auto j = to_json(snapshot);
    EXPECT_EQ(j["service"], "catalog");
    EXPECT_EQ(j["host"], "10.0.0.1:8080");
    EXPECT_EQ(j["weight"], 200);
    EXPECT_EQ(j["active_connections"], 3);
    EXPECT_EQ(j["circuit"], "half_open");
    EXPECT_TRUE(j["healthy"].get<bool>());
    EXPECT_FALSE(j["eligible"].get<bool>());
    EXPECT_DOUBLE_EQ(j["avg_response_time_ms"].get<double>(), 12.5);
    EXPECT_DOUBLE_EQ(j["recovery_weight"].get<double>(), 0.3);
}

TEST_F(JsonViewsTest, ServiceStatsReportsPercent) {
    ServiceStats stats;
    stats.service = "catalog";
    stats.algorithm = "adaptive";
    stats.total_requests = 4;
    stats.success_requests = 3;
    stats.success_rate = 0.75;
    stats.instances.resize(2);

    auto j = to_json(stats);
    EXPECT_DOUBLE_EQ(j["success_rate"].get<double>(), 75.0);
    EXPECT_EQ(j["instances"].size(), 2u);

    auto summary = to_json(stats, false);
    EXPECT_FALSE(summary.contains("instances"));
}

TEST_F(JsonViewsTest, AffinityHitRate) {
    AffinityStats stats{5, 3, 1};
    auto j = to_json(stats);
    EXPECT_EQ(j["entries"], 5);
    EXPECT_DOUBLE_EQ(j["hit_rate"].get<double>(), 75.0);

    EXPECT_DOUBLE_EQ(to_json(AffinityStats{})["hit_rate"].get<double>(), 0.0);
}

TEST_F(JsonViewsTest, AffinityEntryIsRelativeToNow) {
    auto now = Clock::now();
    AffinityEntry entry{"cart", "user-1", "10.0.0.1:8080", now - 10s, now + 50s};
    auto j = to_json(entry, now);
    EXPECT_EQ(j["session"], "user-1");
    EXPECT_DOUBLE_EQ(j["age_seconds"].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(j["expires_in_seconds"].get<double>(), 50.0);
}

TEST_F(JsonViewsTest, ErrorBody) {
    auto j = error_to_json(no_eligible_instances("catalog"));
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["error"], "no_eligible_instances");
    EXPECT_NE(j["message"].get<std::string>().find("catalog"), std::string::npos);
}

TEST_F(JsonViewsTest, ErrorStatusCodes) {
    EXPECT_EQ(http_status(ErrorCode::NoEligibleInstances), 503);
    EXPECT_EQ(http_status(ErrorCode::UnknownAlgorithm), 400);
    EXPECT_EQ(http_status(ErrorCode::InstanceNotFound), 404);
    EXPECT_EQ(http_status(ErrorCode::ServiceNotFound), 404);
}

TEST_F(JsonViewsTest, AlgorithmList) {
    auto list = algorithms_json();
    ASSERT_EQ(list.size(), algorithm_catalogue().size());
    EXPECT_EQ(list[0]["name"], "round_robin");
    EXPECT_TRUE(list[0].contains("description"));
    EXPECT_TRUE(list[0].contains("type"));
}

TEST_F(JsonViewsTest, ConfigDefaults) {
    auto j = to_json(Config{});
    EXPECT_EQ(j["default_algorithm"], "adaptive");
    EXPECT_EQ(j["failure_threshold"], 5);
    EXPECT_EQ(j["session_affinity_ttl_seconds"], 1800);
    EXPECT_DOUBLE_EQ(j["recovery_step_size"].get<double>(), 0.1);
}
