#pragma once
#include <chrono>

// Time source for capture sessions. The session never reads steady_clock
// directly so termination timing and rate detection can run in virtual time.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration  = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

// Manually advanced clock, owned by SyntheticAudioCapture and by tests.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{}) : now_(start) {}

    TimePoint now() const override { return now_; }

    void advance(Duration d) { now_ += d; }
    void set(TimePoint t) { now_ = t; }

private:
    TimePoint now_;
};

// Seconds elapsed between two clock readings, as a double.
inline double secondsBetween(Clock::TimePoint from, Clock::TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}
