#pragma once
#include "audio/Clock.hpp"
#include <chrono>
#include <functional>

// How a capture session ends. Both kinds carry a hard upper bound.
struct TerminationPolicy {
    enum class Kind {
        FixedDuration,   // stop once maxSecs have elapsed, no grace
        ExternalSignal   // stop grace period after the stop predicate fires,
                         // or at maxSecs if it never does
    };

    Kind   kind    = Kind::FixedDuration;
    double maxSecs = 0.0;

    static TerminationPolicy fixedDuration(double secs) {
        return {Kind::FixedDuration, secs};
    }
    static TerminationPolicy externalSignal(double maxSecs) {
        return {Kind::ExternalSignal, maxSecs};
    }
};

// Decides, once per frame callback or timer tick, whether the capture must
// end. Recording → StopRequested → Stopped, plus Recording → Stopped when the
// duration / safety bound is hit. Stopped is terminal.
//
// It never touches the sample buffer; frames that arrive during the grace
// window are still appended by the session.
class TerminationController {
public:
    enum class State {
        Recording,
        StopRequested,
        Stopped
    };

    enum class StopReason {
        None,
        DurationElapsed,   // FixedDuration reached maxSecs
        SignalGrace,       // stop predicate fired and the grace window passed
        SafetyBound        // ExternalSignal reached maxSecs
    };

    using StopPredicate = std::function<bool()>;

    TerminationController(const TerminationPolicy& policy,
                          Clock::TimePoint start,
                          StopPredicate stopRequested = {},
                          Clock::Duration gracePeriod = std::chrono::seconds(1));

    // Both return true once the session is Stopped and the loop should exit.
    bool onFrame(Clock::TimePoint now) { return evaluate(now); }
    bool onTick(Clock::TimePoint now) { return evaluate(now); }

    State      state() const { return state_; }
    StopReason reason() const { return reason_; }
    bool       stopped() const { return state_ == State::Stopped; }

    // Valid once state() has left Recording / reached Stopped respectively.
    Clock::TimePoint requestedAt() const { return requestedAt_; }
    Clock::TimePoint stoppedAt() const { return stoppedAt_; }

    const TerminationPolicy& policy() const { return policy_; }
    Clock::Duration gracePeriod() const { return grace_; }

    static const char* stateName(State s);
    static const char* reasonName(StopReason r);

private:
    bool evaluate(Clock::TimePoint now);
    void stop(Clock::TimePoint now, StopReason why);

    TerminationPolicy policy_;
    Clock::TimePoint  start_;
    StopPredicate     stopRequested_;
    Clock::Duration   grace_;

    State            state_  = State::Recording;
    StopReason       reason_ = StopReason::None;
    Clock::TimePoint requestedAt_{};
    Clock::TimePoint stoppedAt_{};
};
