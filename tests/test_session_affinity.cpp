#include <gtest/gtest.h>
#include "gwlb/session_affinity.hpp"
#include <string>

using namespace gwlb;
using namespace std::chrono_literals;

class SessionAffinityTest : public ::testing::Test {
protected:
    SessionAffinityTable table{60s};
    Clock::time_point t0 = Clock::now();
    SessionAffinityTable::HostCheck any = [](const std::string&) { return true; };
};

TEST_F(SessionAffinityTest, BindingIsReturned) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);

    auto host = table.get("cart", "user-1", t0 + 1s, any);
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(*host, "10.0.0.1:8080");

    EXPECT_FALSE(table.get("cart", "user-2", t0 + 1s, any).has_value());
    EXPECT_FALSE(table.get("billing", "user-1", t0 + 1s, any).has_value());
}

TEST_F(SessionAffinityTest, ExpiredBindingIsDropped) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    EXPECT_FALSE(table.get("cart", "user-1", t0 + 60s, any).has_value());
    EXPECT_EQ(table.size("cart"), 0u);
}

TEST_F(SessionAffinityTest, HitSlidesExpiry) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    ASSERT_TRUE(table.get("cart", "user-1", t0 + 50s, any).has_value());
    ASSERT_TRUE(table.get("cart", "user-1", t0 + 100s, any).has_value());

    auto entries = table.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].expires_at, t0 + 160s);
    EXPECT_EQ(entries[0].created_at, t0);
}

TEST_F(SessionAffinityTest, UnservableHostIsDropped) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    auto host = table.get("cart", "user-1", t0 + 1s,
                          [](const std::string& h) { return h != "10.0.0.1:8080"; });
    EXPECT_FALSE(host.has_value());
    EXPECT_EQ(table.size("cart"), 0u);
}

TEST_F(SessionAffinityTest, RebindingChangesHost) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    table.set("cart", "user-1", "10.0.0.2:8080", t0 + 5s);

    auto entries = table.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].host, "10.0.0.2:8080");
    EXPECT_EQ(entries[0].created_at, t0 + 5s);
}

TEST_F(SessionAffinityTest, ExplicitTtl) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0, 5s);
    EXPECT_TRUE(table.get("cart", "user-1", t0 + 4s, any).has_value());
    EXPECT_FALSE(table.get("cart", "user-1", t0 + 4s + 61s, any).has_value());
}

TEST_F(SessionAffinityTest, RemoveKeyAcrossServices) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    table.set("billing", "user-1", "10.0.1.1:8080", t0);
    table.set("cart", "user-2", "10.0.0.2:8080", t0);

    EXPECT_EQ(table.remove("user-1"), 2u);
    EXPECT_EQ(table.size("cart"), 1u);
    EXPECT_EQ(table.size("billing"), 0u);

    EXPECT_TRUE(table.remove("cart", "user-2"));
    EXPECT_FALSE(table.remove("cart", "user-2"));
}

TEST_F(SessionAffinityTest, RemoveHost) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    table.set("cart", "user-2", "10.0.0.1:8080", t0);
    table.set("cart", "user-3", "10.0.0.2:8080", t0);

    EXPECT_EQ(table.remove_host("cart", "10.0.0.1:8080"), 2u);
    EXPECT_EQ(table.size("cart"), 1u);
    EXPECT_EQ(table.remove_host("billing", "10.0.0.1:8080"), 0u);
}

TEST_F(SessionAffinityTest, SweepPurgesExpired) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    table.set("cart", "user-2", "10.0.0.1:8080", t0 + 30s);

    EXPECT_EQ(table.sweep(t0 + 61s), 1u);
    EXPECT_EQ(table.size("cart"), 1u);
    EXPECT_EQ(table.sweep(t0 + 120s), 1u);
    EXPECT_TRUE(table.entries().empty());
}

TEST_F(SessionAffinityTest, HitAndMissCounters) {
    table.set("cart", "user-1", "10.0.0.1:8080", t0);
    table.get("cart", "user-1", t0, any);
    table.get("cart", "user-1", t0, any);
    table.get("cart", "user-9", t0, any);

    auto stats = table.stats();
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);

    table.clear();
    EXPECT_EQ(table.stats().entries, 0u);
}
