// =============================================================================
// Attention Gate Tests
// =============================================================================

#include <gtest/gtest.h>
#include "engram/attention_gate.hpp"
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace engram;

class AttentionGateTest : public ::testing::Test {
protected:
    static constexpr Timestamp NOW = 1700000000000;

    AttentionConfig salience_only() {
        AttentionConfig c;
        c.recency_weight = 0.0;
        c.capacity_variance = 0;
        c.base_capacity = 7;
        return c;
    }

    MemoryItem item(const std::string& id, double salience, Timestamp age_ms = 0) {
        MemoryItem m;
        m.id = id;
        m.content_ref = "note " + id;
        m.created_at = NOW - age_ms;
        m.salience = salience;
        m.content_hash = "h-" + id;
        return m;
    }
};

// Highest-scored items are admitted up to capacity, the rest wait
TEST_F(AttentionGateTest, AdmitsTopScoredUpToCapacity) {
    AttentionGate gate(salience_only());

    std::vector<MemoryItem> incoming;
    const double scores[] = {0.9, 0.8, 0.7, 0.6, 0.5, 0.4, 0.3, 0.2, 0.1};
    for (int i = 0; i < 9; ++i) {
        incoming.push_back(item("m" + std::to_string(i), scores[i], i * 10000));
    }

    auto result = gate.admit(incoming, {}, NOW, 1);
    ASSERT_EQ(result.capacity, 7);
    ASSERT_EQ(result.entries.size(), 9u);
    EXPECT_EQ(result.active_count(), 7u);

    for (int i = 0; i < 9; ++i) {
        const auto& e = result.entries[static_cast<size_t>(i)];
        EXPECT_EQ(e.item.id, "m" + std::to_string(i));
        EXPECT_EQ(e.admit_rank, i + 1);
        EXPECT_NEAR(e.attention_score, scores[i], 1e-12);
        EXPECT_EQ(e.status, i < 7 ? WmStatus::Active : WmStatus::Pending) << e.item.id;
    }
}

// Capacity stays within Miller's 7 +/- 2 and actually varies
TEST_F(AttentionGateTest, CapacityWithinBounds) {
    AttentionGate gate(AttentionConfig{});
    std::set<int> seen;
    for (uint64_t cycle = 0; cycle < 500; ++cycle) {
        int c = gate.capacity_for_cycle(cycle);
        EXPECT_GE(c, MIN_CAPACITY);
        EXPECT_LE(c, MAX_CAPACITY);
        seen.insert(c);
    }
    EXPECT_GT(seen.size(), 1u);
}

TEST_F(AttentionGateTest, CapacityIsSeeded) {
    AttentionConfig a;
    AttentionGate g1(a);
    AttentionGate g2(a);
    for (uint64_t cycle = 0; cycle < 50; ++cycle) {
        EXPECT_EQ(g1.capacity_for_cycle(cycle), g2.capacity_for_cycle(cycle));
    }
}

TEST_F(AttentionGateTest, SameInputsSameFingerprint) {
    AttentionGate gate(AttentionConfig{});
    std::vector<MemoryItem> incoming;
    for (int i = 0; i < 12; ++i) {
        incoming.push_back(item("x" + std::to_string(i), 0.05 * i, i * 7000));
    }
    auto a = gate.admit(incoming, {}, NOW, 3);
    auto b = gate.admit(incoming, {}, NOW, 3);
    EXPECT_EQ(a.fingerprint(), b.fingerprint());
    EXPECT_EQ(a.active_count(), static_cast<size_t>(a.capacity));
}

// Equal scores fall back to arrival order
TEST_F(AttentionGateTest, TiesBrokenByArrival) {
    AttentionGate gate(salience_only());
    std::vector<MemoryItem> incoming = {item("late", 0.5, 1000), item("early", 0.5, 5000)};
    auto result = gate.admit(incoming, {}, NOW, 0);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].item.id, "early");
    EXPECT_EQ(result.entries[1].item.id, "late");
}

TEST_F(AttentionGateTest, OldItemsExpire) {
    AttentionGate gate(salience_only());
    std::vector<MemoryItem> incoming = {item("fresh", 0.2), item("stale", 0.9, 301000)};
    auto result = gate.admit(incoming, {}, NOW, 0);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].item.id, "fresh");
    EXPECT_EQ(result.entries[0].status, WmStatus::Active);
    EXPECT_EQ(result.entries[1].item.id, "stale");
    EXPECT_EQ(result.entries[1].status, WmStatus::Expired);
    EXPECT_EQ(result.entries[1].admit_rank, 0);
}

// Pool entries compete with new items; a new copy replaces the pooled one
TEST_F(AttentionGateTest, PoolCompetesWithIncoming) {
    AttentionConfig c = salience_only();
    c.base_capacity = 5;
    AttentionGate gate(c);

    std::vector<WorkingMemoryEntry> pool;
    for (int i = 0; i < 5; ++i) {
        WorkingMemoryEntry e;
        e.item = item("p" + std::to_string(i), 0.5 + 0.01 * i);
        e.status = WmStatus::Active;
        pool.push_back(e);
    }
    MemoryItem updated = item("p0", 0.99);
    std::vector<MemoryItem> incoming = {updated, item("n1", 0.1)};

    auto result = gate.admit(incoming, pool, NOW, 0);
    ASSERT_EQ(result.entries.size(), 6u);
    EXPECT_EQ(result.entries[0].item.id, "p0");
    EXPECT_NEAR(result.entries[0].item.salience, 0.99, 1e-12);
    EXPECT_EQ(result.entries.back().item.id, "n1");
    EXPECT_EQ(result.entries.back().status, WmStatus::Pending);
    EXPECT_EQ(result.active_count(), 5u);
}

TEST_F(AttentionGateTest, RecencyDecaysScore) {
    AttentionConfig c;
    c.recency_weight = 1.0;
    AttentionGate gate(c);
    const double fresh = gate.score(item("a", 0.0), NOW);
    const double older = gate.score(item("b", 0.0, 300000), NOW);
    EXPECT_NEAR(fresh, 1.0, 1e-12);
    EXPECT_NEAR(older, std::exp(-1.0), 1e-12);
}

TEST_F(AttentionGateTest, CycleFollowsWindow) {
    AttentionGate gate(AttentionConfig{});
    EXPECT_EQ(gate.cycle_at(0), 0u);
    EXPECT_EQ(gate.cycle_at(299999), 0u);
    EXPECT_EQ(gate.cycle_at(300000), 1u);
}
