// clock.hpp - Wall clock abstraction (real and manual)

#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>

namespace hashfleet {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Millis now() const = 0;
};

class SystemClock : public Clock {
public:
    Millis now() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * Clock that only moves when told to. Used by tests and by script replays.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Millis start = 1'700'000'000'000) : now_(start) {}

    Millis now() const override { return now_.load(); }

    void set(Millis t) { now_.store(t); }
    void advance_ms(Millis ms) { now_.fetch_add(ms); }
    void advance_seconds(int64_t s) { now_.fetch_add(s * MS_PER_SECOND); }

private:
    std::atomic<Millis> now_;
};

}  // namespace hashfleet
