#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>
#include <utility>

#include "engram/error.hpp"
#include "engram/logging.hpp"

namespace engram {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{5000};

    std::chrono::milliseconds delay_for(int attempt) const {
        std::chrono::milliseconds d = base_delay * (int64_t{1} << std::min(attempt, 20));
        return std::min(d, max_delay);
    }
};

/**
 * Run fn, retrying TransientIOError up to policy.max_retries times with
 * exponential backoff. The last TransientIOError is rethrown. Other
 * exceptions propagate immediately.
 */
template<typename Fn>
auto retry_with_backoff(const RetryPolicy& policy, const Sleeper& sleep, const char* what, Fn&& fn)
    -> decltype(fn()) {
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const TransientIOError& e) {
            if (attempt >= policy.max_retries) {
                LOG_WARN(what, " failed after ", attempt + 1, " attempts: ", e.message());
                throw;
            }
            auto delay = policy.delay_for(attempt);
            LOG_DEBUG(what, " transient failure, retrying", kv("attempt", attempt + 1),
                      kv("delay_ms", delay.count()));
            if (sleep) sleep(delay);
        }
    }
}

} // namespace engram
