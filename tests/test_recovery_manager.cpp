#include <gtest/gtest.h>
#include "gwlb/recovery_manager.hpp"
#include "gwlb/health_scorer.hpp"

using namespace gwlb;
using namespace std::chrono_literals;

class RecoveryManagerTest : public ::testing::Test {
protected:
    static CircuitBreakerConfig short_cooldown() {
        CircuitBreakerConfig config;
        config.cooldown = 10s;
        return config;
    }

    void SetUp() override {
        registry.upsert("orders", InstanceSpec{"10.0.0.1:8080", 100, true});
        registry.upsert("orders", InstanceSpec{"10.0.0.2:8080", 100, true});
        instance = registry.find("orders", "10.0.0.1:8080");
    }

    void record(bool success, Clock::time_point at) {
        instance->update([&](InstanceState& state) {
            scorer.record(state, success, 10ms, at);
            breaker.on_outcome(state, success, at);
        });
    }

    void trip(Clock::time_point at) {
        for (uint32_t i = 0; i < breaker_config.failure_threshold; ++i) {
            record(false, at);
        }
    }

    double recovery_weight() const {
        return instance->inspect([](const InstanceState& s) { return s.recovery_weight; });
    }

    CircuitState circuit() const {
        return instance->inspect([](const InstanceState& s) { return s.circuit; });
    }

    InstanceRegistry registry;
    CircuitBreakerConfig breaker_config = short_cooldown();
    RecoveryConfig recovery_config;
    HealthScorer scorer{HealthConfig{}};
    CircuitBreaker breaker{breaker_config, recovery_config.initial_weight};
    InstancePtr instance;
    Clock::time_point t0 = Clock::now();
};

TEST_F(RecoveryManagerTest, TickPromotesCooledDownCircuits) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    trip(t0);

    auto early = recovery.tick(t0 + 5s);
    EXPECT_EQ(early.half_opened, 0u);
    EXPECT_EQ(circuit(), CircuitState::Open);

    auto late = recovery.tick(t0 + 10s);
    EXPECT_EQ(late.half_opened, 1u);
    EXPECT_EQ(circuit(), CircuitState::HalfOpen);
    EXPECT_DOUBLE_EQ(recovery_weight(), 0.1);
}

TEST_F(RecoveryManagerTest, RecoveryWeightRampsMonotonically) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    trip(t0);
    recovery.tick(t0 + 10s);

    double previous = recovery_weight();
    int ticks = 0;
    while (recovery_weight() < 1.0 && ticks < 20) {
        recovery.tick(t0 + 10s + std::chrono::seconds(++ticks));
        EXPECT_GE(recovery_weight(), previous);
        EXPECT_LE(recovery_weight(), 1.0);
        previous = recovery_weight();
    }
    EXPECT_DOUBLE_EQ(recovery_weight(), 1.0);
    EXPECT_LE(ticks, 10);

    auto idle = recovery.tick(t0 + 1min);
    EXPECT_EQ(idle.ramped, 0u);
    EXPECT_DOUBLE_EQ(recovery_weight(), 1.0);
}

TEST_F(RecoveryManagerTest, FailingProbeHoldsRamp) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    trip(t0);
    recovery.tick(t0 + 10s);
    instance->update([](InstanceState& s) { s.probe_passing = false; });

    auto result = recovery.tick(t0 + 11s);
    EXPECT_EQ(result.ramped, 0u);
    EXPECT_DOUBLE_EQ(recovery_weight(), 0.1);
}

TEST_F(RecoveryManagerTest, HalfOpenFailureResetsRecoveryWeight) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    trip(t0);
    recovery.tick(t0 + 10s);
    recovery.tick(t0 + 11s);
    recovery.tick(t0 + 12s);
    EXPECT_NEAR(recovery_weight(), 0.3, 1e-9);

    record(false, t0 + 13s);
    EXPECT_EQ(circuit(), CircuitState::Open);
    EXPECT_DOUBLE_EQ(recovery_weight(), 0.0);

    // No ramp while open.
    auto result = recovery.tick(t0 + 14s);
    EXPECT_EQ(result.ramped, 0u);
    EXPECT_DOUBLE_EQ(recovery_weight(), 0.0);
}

TEST_F(RecoveryManagerTest, DisabledRecoveryStillHalfOpens) {
    recovery_config.enabled = false;
    RecoveryManager recovery(registry, breaker, recovery_config);
    trip(t0);

    auto first = recovery.tick(t0 + 10s);
    EXPECT_EQ(first.half_opened, 1u);
    auto second = recovery.tick(t0 + 11s);
    EXPECT_EQ(second.ramped, 0u);
    EXPECT_DOUBLE_EQ(recovery_weight(), 0.1);
}

TEST_F(RecoveryManagerTest, StatusListsUnclosedInstances) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    EXPECT_TRUE(recovery.status().empty());

    trip(t0);
    auto status = recovery.status();
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].service, "orders");
    EXPECT_EQ(status[0].host, "10.0.0.1:8080");
    EXPECT_EQ(status[0].circuit, CircuitState::Open);
    EXPECT_EQ(status[0].since, t0);
}

TEST_F(RecoveryManagerTest, ForceRecovery) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    trip(t0);

    auto result = recovery.force_recovery("orders", "10.0.0.1:8080", t0 + 1s);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(circuit(), CircuitState::Closed);
    EXPECT_DOUBLE_EQ(recovery_weight(), 1.0);
    EXPECT_TRUE(recovery.status().empty());
}

TEST_F(RecoveryManagerTest, ForceRecoveryUnknownInstance) {
    RecoveryManager recovery(registry, breaker, recovery_config);
    auto result = recovery.force_recovery("orders", "10.0.0.9:8080", t0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InstanceNotFound);
}
