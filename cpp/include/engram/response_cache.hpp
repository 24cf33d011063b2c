#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include "engram/clock.hpp"

namespace engram {

/**
 * Bounded LRU cache with per-entry time-to-live. Owned by whoever
 * constructs it and injected into the providers that use it.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class ResponseCache {
public:
    ResponseCache(size_t capacity, Timestamp ttl_ms, const Clock& clock)
        : capacity_(capacity), ttl_ms_(ttl_ms), clock_(clock) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        if (clock_.now() >= it->second->expires_at) {
            order_.erase(it->second);
            index_.erase(it);
            ++misses_;
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        ++hits_;
        return it->second->value;
    }

    void put(const Key& key, Value value) {
        if (capacity_ == 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp expires = clock_.now() + ttl_ms_;
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expires_at = expires;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        order_.push_front(Entry{key, std::move(value), expires});
        index_[key] = order_.begin();
        while (index_.size() > capacity_) {
            index_.erase(order_.back().key);
            order_.pop_back();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t hits() const { std::lock_guard<std::mutex> lock(mutex_); return hits_; }
    size_t misses() const { std::lock_guard<std::mutex> lock(mutex_); return misses_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
    }

private:
    struct Entry {
        Key key;
        Value value;
        Timestamp expires_at;
    };

    size_t capacity_;
    Timestamp ttl_ms_;
    const Clock& clock_;
    std::list<Entry> order_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace engram
