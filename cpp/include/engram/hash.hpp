#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace engram {

// FNV-1a, 64 bit. Stable across processes and platforms.
constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

inline uint64_t fnv1a64(std::string_view data, uint64_t h = FNV_OFFSET) {
    for (unsigned char c : data) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return h;
}

inline uint64_t stable_hash(std::string_view s) { return fnv1a64(s); }

inline std::string to_hex(uint64_t v) {
    static const char hex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[v & 0xF];
        v >>= 4;
    }
    return out;
}

/**
 * Incremental content hasher. Fields are length-prefixed so that
 * ("ab","c") and ("a","bc") hash differently.
 */
class ContentHasher {
public:
    ContentHasher& add(std::string_view field) {
        uint64_t len = field.size();
        char buf[sizeof(len)];
        std::memcpy(buf, &len, sizeof(len));
        h_ = fnv1a64(std::string_view(buf, sizeof(buf)), h_);
        h_ = fnv1a64(field, h_);
        return *this;
    }

    ContentHasher& add(int64_t v) { return add(std::to_string(v)); }
    ContentHasher& add(uint64_t v) { return add(std::to_string(v)); }
    ContentHasher& add(int v) { return add(std::to_string(v)); }
    ContentHasher& add(double v);

    uint64_t value() const { return h_; }
    std::string hex() const { return to_hex(h_); }

private:
    uint64_t h_ = FNV_OFFSET;
};

// Round-trip exact text form of a double; used for hashing and for
// storage so that persisted values reload bit for bit.
std::string format_double(double v);

inline ContentHasher& ContentHasher::add(double v) { return add(format_double(v)); }

} // namespace engram
