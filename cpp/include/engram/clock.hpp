#pragma once

#include <atomic>
#include <chrono>

#include "engram/types.hpp"

namespace engram {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// Test clock, only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(); }
    void set(Timestamp t) { now_.store(t); }
    void advance_ms(Timestamp ms) { now_.fetch_add(ms); }
    void advance_seconds(double s) { now_.fetch_add(static_cast<Timestamp>(s * 1000.0)); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace engram
