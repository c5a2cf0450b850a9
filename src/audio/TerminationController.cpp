#include "audio/TerminationController.hpp"
#include <spdlog/spdlog.h>
#include <utility>

TerminationController::TerminationController(const TerminationPolicy& policy,
                                             Clock::TimePoint start,
                                             StopPredicate stopRequested,
                                             Clock::Duration gracePeriod)
    : policy_(policy)
    , start_(start)
    , stopRequested_(std::move(stopRequested))
    , grace_(gracePeriod)
{
}

bool TerminationController::evaluate(Clock::TimePoint now) {
    if (state_ == State::Stopped)
        return true;

    // The upper bound always wins over the signal path.
    if (secondsBetween(start_, now) >= policy_.maxSecs) {
        if (policy_.kind == TerminationPolicy::Kind::FixedDuration) {
            stop(now, StopReason::DurationElapsed);
        } else {
            spdlog::info("Max duration reached ({}s)", policy_.maxSecs);
            stop(now, StopReason::SafetyBound);
        }
        return true;
    }

    if (policy_.kind == TerminationPolicy::Kind::FixedDuration)
        return false;

    if (state_ == State::Recording && stopRequested_ && stopRequested_()) {
        state_       = State::StopRequested;
        requestedAt_ = now;
        spdlog::info("Stop signal received");
        spdlog::info("Buffering trailing audio ({}ms)...",
                     std::chrono::duration_cast<std::chrono::milliseconds>(grace_).count());
    }

    if (state_ == State::StopRequested && now - requestedAt_ >= grace_) {
        stop(now, StopReason::SignalGrace);
        return true;
    }

    return false;
}

void TerminationController::stop(Clock::TimePoint now, StopReason why) {
    state_     = State::Stopped;
    reason_    = why;
    stoppedAt_ = now;
    spdlog::debug("Capture stopped after {:.3f}s ({})",
                  secondsBetween(start_, now), reasonName(why));
}

const char* TerminationController::stateName(State s) {
    switch (s) {
        case State::Recording:     return "recording";
        case State::StopRequested: return "stop_requested";
        case State::Stopped:       return "stopped";
    }
    return "unknown";
}

const char* TerminationController::reasonName(StopReason r) {
    switch (r) {
        case StopReason::None:            return "none";
        case StopReason::DurationElapsed: return "duration elapsed";
        case StopReason::SignalGrace:     return "stop signal + grace";
        case StopReason::SafetyBound:     return "safety bound";
    }
    return "unknown";
}
