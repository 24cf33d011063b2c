// =============================================================================
// Enrichment Collaborator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "engram/enrichment.hpp"
#include "engram/error.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace engram;

namespace {

// Fails the first `failures` feature requests, then answers
class ScriptedClient : public EnrichmentClient {
public:
    explicit ScriptedClient(int failures = 0, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : failures_(failures), delay_(delay) {}

    Features request_features(const std::string& content) override {
        ++calls;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (failures_.fetch_sub(1) > 0) {
            ++completed;
            throw TransientIOError("service unavailable", content);
        }
        ++completed;
        Features f;
        f.category = category;
        f.importance = 1.7;
        f.sentiment = -3.0;
        return f;
    }

    double request_similarity(const std::string&, const std::string&) override {
        ++calls;
        return 0.42;
    }

    std::atomic<int> calls{0};
    std::atomic<int> completed{0};
    std::string category = "research";

private:
    std::atomic<int> failures_;
    std::chrono::milliseconds delay_;
};

class SwitchableProvider : public EnrichmentProvider {
public:
    Features enrich(const MemoryItem& item) override {
        ++calls;
        if (failing) throw TransientIOError("primary down", item.id);
        Features f;
        f.category = "primary";
        return f;
    }
    double similarity(const std::string&, const std::string&) override {
        ++calls;
        if (failing) throw TransientIOError("primary down", "");
        return 0.9;
    }
    const char* name() const override { return "switchable"; }

    bool failing = false;
    int calls = 0;
};

Sleeper no_sleep() {
    return [](std::chrono::milliseconds) {};
}

} // namespace

class EnrichmentTest : public ::testing::Test {
protected:
    static constexpr Timestamp NOW = 1700000000000;

    ManualClock clock{NOW};
    CollaboratorConfig config;

    void SetUp() override {
        config.timeout_ms = 2000;
        config.retry_base_delay_ms = 1;
    }

    MemoryItem item(const std::string& content, const std::string& hash = "") {
        MemoryItem m;
        m.id = "m-" + content.substr(0, 8);
        m.content_ref = content;
        m.created_at = NOW;
        m.content_hash = hash;
        return m;
    }
};

// =============================================================================
// Fallback rules
// =============================================================================

TEST_F(EnrichmentTest, FallbackCategorisesByKeyword) {
    FallbackEnrichmentProvider fallback;
    const auto f = fallback.enrich(item("Prepare the launch strategy for Q3"));
    EXPECT_EQ(f.category, "strategy");
    EXPECT_EQ(f.hierarchy_goal, "Product Launch Strategy");
    EXPECT_NEAR(f.importance, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(f.sentiment, 0.0);
}

TEST_F(EnrichmentTest, FallbackBoostsImportanceAndTone) {
    FallbackEnrichmentProvider fallback;
    const auto urgent = fallback.enrich(item("urgent invoice for the client"));
    EXPECT_EQ(urgent.category, "finance");
    EXPECT_NEAR(urgent.importance, 0.7, 1e-12);

    const auto broken = fallback.enrich(item("the build is broken again"));
    EXPECT_EQ(broken.category, "general");
    EXPECT_NEAR(broken.importance, 0.6, 1e-12);
    EXPECT_DOUBLE_EQ(broken.sentiment, -0.5);
}

TEST_F(EnrichmentTest, FallbackPrefersExplicitFields) {
    FallbackEnrichmentProvider fallback;
    MemoryItem m = item("budget review");
    m.topic = "strategy";
    m.importance = 0.9;
    m.sentiment = 0.8;
    const auto f = fallback.enrich(m);
    EXPECT_EQ(f.category, "strategy");
    EXPECT_DOUBLE_EQ(f.importance, 0.9);
    EXPECT_DOUBLE_EQ(f.sentiment, 0.8);
}

TEST_F(EnrichmentTest, FallbackSimilarityIsWordOverlap) {
    FallbackEnrichmentProvider fallback;
    EXPECT_DOUBLE_EQ(fallback.similarity("Budget review", "budget REVIEW"), 1.0);
    EXPECT_DOUBLE_EQ(fallback.similarity("budget review", "budget plan"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(fallback.similarity("", ""), 0.0);
}

// =============================================================================
// Remote provider
// =============================================================================

TEST_F(EnrichmentTest, RemoteRetriesTransientFailures) {
    auto client = std::make_shared<ScriptedClient>(2);
    RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());
    const auto f = remote.enrich(item("quarterly research notes", "h1"));
    EXPECT_EQ(client->calls.load(), 3);
    EXPECT_EQ(f.category, "research");
    EXPECT_DOUBLE_EQ(f.importance, 1.0);
    EXPECT_DOUBLE_EQ(f.sentiment, -1.0);
}

TEST_F(EnrichmentTest, RemoteGivesUpAfterMaxRetries) {
    auto client = std::make_shared<ScriptedClient>(10);
    config.max_retries = 2;
    RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());
    EXPECT_THROW(remote.enrich(item("anything")), TransientIOError);
    EXPECT_EQ(client->calls.load(), 3);
}

TEST_F(EnrichmentTest, RemoteTimeoutIsTransient) {
    auto client = std::make_shared<ScriptedClient>(0, std::chrono::milliseconds(300));
    config.timeout_ms = 20;
    config.max_retries = 0;
    RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());
    try {
        remote.enrich(item("slow"));
        FAIL() << "expected timeout";
    } catch (const TransientIOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::COLLABORATOR_TIMEOUT);
    }
}

// A call that overran its deadline is finished before the provider is gone
TEST_F(EnrichmentTest, TimedOutCallsAreJoinedOnShutdown) {
    auto client = std::make_shared<ScriptedClient>(0, std::chrono::milliseconds(100));
    config.timeout_ms = 10;
    config.max_retries = 0;
    {
        RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());
        EXPECT_THROW(remote.enrich(item("slow")), TransientIOError);
        EXPECT_EQ(client->completed.load(), 0);
    }
    EXPECT_EQ(client->calls.load(), client->completed.load());
}

// Overrunning calls hold their workers; further calls are refused, not stacked
TEST_F(EnrichmentTest, OverrunningCallsAreBounded) {
    auto client = std::make_shared<ScriptedClient>(0, std::chrono::milliseconds(300));
    config.timeout_ms = 10;
    config.max_retries = 0;
    config.workers = 1;
    config.max_queued_calls = 1;
    RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());

    EXPECT_THROW(remote.enrich(item("first")), TransientIOError);
    EXPECT_THROW(remote.enrich(item("second")), TransientIOError);
    try {
        remote.enrich(item("third"));
        FAIL() << "expected a saturated pool";
    } catch (const TransientIOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::POOL_EXHAUSTED);
    }
    EXPECT_LE(client->calls.load(), 1);
}

TEST_F(EnrichmentTest, RemoteRejectsResponseWithoutCategory) {
    auto client = std::make_shared<ScriptedClient>();
    client->category.clear();
    RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());
    EXPECT_THROW(remote.enrich(item("empty")), DataIntegrityError);
}

TEST_F(EnrichmentTest, RemoteUsesCacheByContentHash) {
    auto client = std::make_shared<ScriptedClient>();
    FeatureCache cache(16, 60000, clock);
    RemoteEnrichmentProvider remote(client, config, &cache, no_sleep());

    remote.enrich(item("notes", "same-hash"));
    remote.enrich(item("notes", "same-hash"));
    EXPECT_EQ(client->calls.load(), 1);
    EXPECT_EQ(cache.hits(), 1u);

    clock.advance_ms(60000);
    remote.enrich(item("notes", "same-hash"));
    EXPECT_EQ(client->calls.load(), 2);
}

TEST_F(EnrichmentTest, RemoteSimilarityIsClamped) {
    auto client = std::make_shared<ScriptedClient>();
    RemoteEnrichmentProvider remote(client, config, nullptr, no_sleep());
    EXPECT_DOUBLE_EQ(remote.similarity("a", "b"), 0.42);
}

// =============================================================================
// Response cache
// =============================================================================

TEST_F(EnrichmentTest, CacheEvictsLeastRecentlyUsed) {
    ResponseCache<std::string, int> cache(2, 1000, clock);
    cache.put("a", 1);
    cache.put("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());
    cache.put("c", 3);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_EQ(*cache.get("c"), 3);
}

TEST_F(EnrichmentTest, CacheEntriesExpire) {
    ResponseCache<std::string, int> cache(4, 1000, clock);
    cache.put("a", 1);
    clock.advance_ms(999);
    EXPECT_TRUE(cache.get("a").has_value());
    clock.advance_ms(1);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

// =============================================================================
// Circuit breaker
// =============================================================================

TEST_F(EnrichmentTest, BreakerOpensAfterThreshold) {
    SwitchableProvider primary;
    FallbackEnrichmentProvider fallback;
    CircuitBreakerProvider breaker(primary, fallback, 3, 60000, clock);

    primary.failing = true;
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(breaker.enrich(item("launch plan")).category, "strategy");
    }
    EXPECT_EQ(breaker.state(), CircuitBreakerProvider::State::Open);
    EXPECT_EQ(primary.calls, 3);

    // Open: primary is not called
    breaker.enrich(item("launch plan"));
    EXPECT_EQ(primary.calls, 3);
}

TEST_F(EnrichmentTest, BreakerHalfOpensAfterCooldown) {
    SwitchableProvider primary;
    FallbackEnrichmentProvider fallback;
    CircuitBreakerProvider breaker(primary, fallback, 2, 60000, clock);

    primary.failing = true;
    breaker.enrich(item("x"));
    breaker.enrich(item("x"));
    ASSERT_EQ(breaker.state(), CircuitBreakerProvider::State::Open);

    // A failed trial call reopens immediately
    clock.advance_ms(60000);
    breaker.enrich(item("x"));
    EXPECT_EQ(breaker.state(), CircuitBreakerProvider::State::Open);
    EXPECT_EQ(primary.calls, 3);

    clock.advance_ms(60000);
    primary.failing = false;
    EXPECT_EQ(breaker.enrich(item("x")).category, "primary");
    EXPECT_EQ(breaker.state(), CircuitBreakerProvider::State::Closed);
    EXPECT_EQ(breaker.consecutive_failures(), 0);
}

TEST_F(EnrichmentTest, BreakerSuccessResetsFailureCount) {
    SwitchableProvider primary;
    FallbackEnrichmentProvider fallback;
    CircuitBreakerProvider breaker(primary, fallback, 3, 60000, clock);

    primary.failing = true;
    breaker.similarity("a", "b");
    breaker.similarity("a", "b");
    EXPECT_EQ(breaker.consecutive_failures(), 2);
    primary.failing = false;
    EXPECT_DOUBLE_EQ(breaker.similarity("a", "b"), 0.9);
    EXPECT_EQ(breaker.consecutive_failures(), 0);
    EXPECT_EQ(breaker.state(), CircuitBreakerProvider::State::Closed);
}
