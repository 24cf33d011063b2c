#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include "engram/clock.hpp"
#include "engram/config.hpp"
#include "engram/response_cache.hpp"
#include "engram/retry.hpp"
#include "engram/thread_pool.hpp"
#include "engram/types.hpp"

namespace engram {

// =============================================================================
// Cognitive enrichment collaborator
// =============================================================================

/**
 * Provider of structured features and pairwise similarity.
 * Failures are reported as TransientIOError (timeouts, transport) or
 * DataIntegrityError (unusable response).
 */
class EnrichmentProvider {
public:
    virtual ~EnrichmentProvider() = default;

    virtual Features enrich(const MemoryItem& item) = 0;
    virtual double similarity(const std::string& a, const std::string& b) = 0;
    virtual const char* name() const = 0;
};

/**
 * Transport to a remote enrichment service. Implementations perform
 * the actual request; timeouts, retries and caching are layered on top
 * by RemoteEnrichmentProvider.
 */
class EnrichmentClient {
public:
    virtual ~EnrichmentClient() = default;

    virtual Features request_features(const std::string& content) = 0;
    virtual double request_similarity(const std::string& a, const std::string& b) = 0;
};

// Rule-based keyword extraction, never fails.
class FallbackEnrichmentProvider : public EnrichmentProvider {
public:
    Features enrich(const MemoryItem& item) override;
    // Jaccard overlap of lower-cased word sets
    double similarity(const std::string& a, const std::string& b) override;
    const char* name() const override { return "fallback"; }
};

using FeatureCache = ResponseCache<std::string, Features>;

class RemoteEnrichmentProvider : public EnrichmentProvider {
public:
    RemoteEnrichmentProvider(std::shared_ptr<EnrichmentClient> client,
                             const CollaboratorConfig& config,
                             FeatureCache* cache,
                             Sleeper sleeper = thread_sleeper());

    Features enrich(const MemoryItem& item) override;
    double similarity(const std::string& a, const std::string& b) override;
    const char* name() const override { return "remote"; }

private:
    std::shared_ptr<EnrichmentClient> client_;
    std::chrono::milliseconds timeout_;
    RetryPolicy retry_;
    FeatureCache* cache_;
    Sleeper sleeper_;
    // Last member: joined before anything its calls could reach
    ThreadPool pool_;
};

/**
 * Routes calls to the primary provider while it is healthy and to the
 * fallback once consecutive failures reach the threshold. After the
 * cooldown one trial call is allowed through to the primary.
 */
class CircuitBreakerProvider : public EnrichmentProvider {
public:
    enum class State { Closed, Open, HalfOpen };

    CircuitBreakerProvider(EnrichmentProvider& primary, EnrichmentProvider& fallback,
                           int failure_threshold, Timestamp cooldown_ms, const Clock& clock);

    Features enrich(const MemoryItem& item) override;
    double similarity(const std::string& a, const std::string& b) override;
    const char* name() const override { return "circuit_breaker"; }

    State state() const;
    int consecutive_failures() const;

private:
    bool allow_primary();
    void record_success();
    void record_failure();

    EnrichmentProvider& primary_;
    EnrichmentProvider& fallback_;
    int failure_threshold_;
    Timestamp cooldown_ms_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    State state_ = State::Closed;
    int failures_ = 0;
    Timestamp opened_at_ = 0;
};

// Run fn on the pool and wait at most timeout; throws
// TransientIOError(COLLABORATOR_TIMEOUT) when the deadline passes. A call
// that overruns keeps its worker until it returns, so fn must own
// everything it touches.
template<typename T>
T call_with_timeout(ThreadPool& pool, std::function<T()> fn, std::chrono::milliseconds timeout,
                    const char* what) {
    std::future<T> result = pool.submit(std::move(fn));
    if (result.wait_for(timeout) != std::future_status::ready) {
        throw TransientIOError(std::string(what) + " timed out after " +
                               std::to_string(timeout.count()) + " ms",
                               what, ErrorCode::COLLABORATOR_TIMEOUT);
    }
    return result.get();
}

// =============================================================================
// Embedding collaborator (optional)
// =============================================================================

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // Fixed-length vector; throws TransientIOError when unavailable.
    virtual Embedding embed(const ConsolidatedMemory& memory) = 0;
};

} // namespace engram
