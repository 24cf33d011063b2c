#include "engram/enrichment.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "engram/hash.hpp"
#include "engram/logging.hpp"

namespace engram {

namespace {

struct KeywordRule {
    std::vector<const char*> keywords;
    const char* category;
    const char* goal;
};

const std::vector<KeywordRule>& category_rules() {
    static const std::vector<KeywordRule> rules = {
        {{"launch", "strategy", "planning"}, "strategy", "Product Launch Strategy"},
        {{"presentation", "meeting", "slides"}, "communication", "Communication and Collaboration"},
        {{"budget", "financial", "invoice"}, "finance", "Financial Planning and Management"},
        {{"project", "deadline", "milestone"}, "project", "Project Management and Execution"},
        {{"client", "customer"}, "client", "Client Relations and Service"},
        {{"maintenance", "fix", "repair"}, "operations", "Operations and Maintenance"},
    };
    return rules;
}

struct BoostRule {
    std::vector<const char*> keywords;
    double importance;
    double sentiment;
};

const std::vector<BoostRule>& boost_rules() {
    static const std::vector<BoostRule> rules = {
        {{"important", "critical", "urgent"}, 0.30, 0.0},
        {{"success", "achievement", "completed"}, 0.25, 0.5},
        {{"problem", "issue", "broken"}, 0.20, -0.5},
        {{"deadline", "due", "pending"}, 0.15, -0.1},
    };
    return rules;
}

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(const std::string& text, const std::vector<const char*>& words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

std::set<std::string> word_set(const std::string& text) {
    std::set<std::string> words;
    std::string word;
    for (char c : lower(text)) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            word += c;
        } else if (!word.empty()) {
            words.insert(word);
            word.clear();
        }
    }
    if (!word.empty()) words.insert(word);
    return words;
}

} // namespace

// =============================================================================
// FallbackEnrichmentProvider
// =============================================================================

Features FallbackEnrichmentProvider::enrich(const MemoryItem& item) {
    const std::string text = lower(item.content_ref);
    Features f;
    f.category = "general";
    f.hierarchy_goal = "General Task Processing";

    for (const auto& rule : category_rules()) {
        if (contains_any(text, rule.keywords)) {
            f.category = rule.category;
            f.hierarchy_goal = rule.goal;
            break;
        }
    }
    if (!item.topic.empty()) {
        f.category = item.topic;
    }

    double boost = 0.1;
    double tone = 0.0;
    for (const auto& rule : boost_rules()) {
        if (contains_any(text, rule.keywords)) {
            boost = rule.importance;
            tone = rule.sentiment;
            break;
        }
    }

    for (const auto& rule : category_rules()) {
        for (const char* kw : rule.keywords) {
            if (text.find(kw) != std::string::npos) f.topics.emplace_back(kw);
        }
    }

    f.importance = item.importance > 0.0 ? clamp01(item.importance) : clamp01(0.4 + boost);
    f.sentiment = item.sentiment != 0.0 ? std::clamp(item.sentiment, -1.0, 1.0) : tone;

    if (text.find("office") != std::string::npos || text.find("meeting room") != std::string::npos) {
        f.spatial_context = "professional_environment";
    } else if (text.find("home") != std::string::npos || text.find("remote") != std::string::npos) {
        f.spatial_context = "personal_environment";
    } else {
        f.spatial_context = "unspecified";
    }
    return f;
}

double FallbackEnrichmentProvider::similarity(const std::string& a, const std::string& b) {
    auto wa = word_set(a);
    auto wb = word_set(b);
    if (wa.empty() && wb.empty()) return 0.0;
    size_t common = 0;
    for (const auto& w : wa) common += wb.count(w);
    size_t total = wa.size() + wb.size() - common;
    return total == 0 ? 0.0 : static_cast<double>(common) / static_cast<double>(total);
}

// =============================================================================
// RemoteEnrichmentProvider
// =============================================================================

RemoteEnrichmentProvider::RemoteEnrichmentProvider(std::shared_ptr<EnrichmentClient> client,
                                                   const CollaboratorConfig& config,
                                                   FeatureCache* cache,
                                                   Sleeper sleeper)
    : client_(std::move(client))
    , timeout_(config.timeout_ms)
    , cache_(cache)
    , sleeper_(std::move(sleeper))
    , pool_(static_cast<size_t>(config.workers), static_cast<size_t>(config.max_queued_calls)) {
    ENGRAM_CHECK_POINTER(client_.get(), "enrichment client");
    retry_.max_retries = config.max_retries;
    retry_.base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
    retry_.max_delay = std::chrono::milliseconds(config.retry_base_delay_ms * 16);
}

Features RemoteEnrichmentProvider::enrich(const MemoryItem& item) {
    const std::string key = item.content_hash.empty() ? to_hex(stable_hash(item.content_ref))
                                                      : item.content_hash;
    if (cache_) {
        if (auto hit = cache_->get(key)) return *hit;
    }

    auto client = client_;
    std::string content = item.content_ref;
    Features f = retry_with_backoff(retry_, sleeper_, "enrichment", [&]() {
        return call_with_timeout<Features>(
            pool_, [client, content]() { return client->request_features(content); },
            timeout_, "enrichment");
    });

    if (f.category.empty()) {
        throw DataIntegrityError("enrichment response without category", item.id);
    }
    f.importance = clamp01(f.importance);
    f.sentiment = std::clamp(f.sentiment, -1.0, 1.0);
    if (!item.topic.empty()) f.category = item.topic;

    if (cache_) cache_->put(key, f);
    return f;
}

double RemoteEnrichmentProvider::similarity(const std::string& a, const std::string& b) {
    auto client = client_;
    double s = retry_with_backoff(retry_, sleeper_, "similarity", [&]() {
        return call_with_timeout<double>(
            pool_, [client, a, b]() { return client->request_similarity(a, b); },
            timeout_, "similarity");
    });
    return clamp01(s);
}

// =============================================================================
// CircuitBreakerProvider
// =============================================================================

CircuitBreakerProvider::CircuitBreakerProvider(EnrichmentProvider& primary,
                                               EnrichmentProvider& fallback,
                                               int failure_threshold,
                                               Timestamp cooldown_ms,
                                               const Clock& clock)
    : primary_(primary)
    , fallback_(fallback)
    , failure_threshold_(failure_threshold)
    , cooldown_ms_(cooldown_ms)
    , clock_(clock) {}

bool CircuitBreakerProvider::allow_primary() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Open && clock_.now() - opened_at_ >= cooldown_ms_) {
        state_ = State::HalfOpen;
        LOG_INFO("enrichment circuit half-open, trying primary");
    }
    return state_ != State::Open;
}

void CircuitBreakerProvider::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Closed) {
        LOG_INFO("enrichment circuit closed");
    }
    state_ = State::Closed;
    failures_ = 0;
}

void CircuitBreakerProvider::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
    if (state_ == State::HalfOpen || failures_ >= failure_threshold_) {
        if (state_ != State::Open) {
            LOG_WARN("enrichment circuit open", kv("failures", failures_));
        }
        state_ = State::Open;
        opened_at_ = clock_.now();
    }
}

Features CircuitBreakerProvider::enrich(const MemoryItem& item) {
    if (allow_primary()) {
        try {
            Features f = primary_.enrich(item);
            record_success();
            return f;
        } catch (const TransientIOError& e) {
            LOG_WARN("primary enrichment failed, using fallback: ", e.message(), kv("item", item.id));
            record_failure();
        } catch (const DataIntegrityError& e) {
            LOG_WARN("unusable enrichment response, using fallback: ", e.message());
        }
    }
    return fallback_.enrich(item);
}

double CircuitBreakerProvider::similarity(const std::string& a, const std::string& b) {
    if (allow_primary()) {
        try {
            double s = primary_.similarity(a, b);
            record_success();
            return s;
        } catch (const TransientIOError& e) {
            LOG_WARN("primary similarity failed, using fallback: ", e.message());
            record_failure();
        }
    }
    return fallback_.similarity(a, b);
}

CircuitBreakerProvider::State CircuitBreakerProvider::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreakerProvider::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

} // namespace engram
