#pragma once
#include "audio/Clock.hpp"
#include "audio/IAudioCapture.hpp"
#include "audio/Resampler.hpp"
#include "audio/SampleAccumulator.hpp"
#include "audio/TerminationController.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// The audio stream could not be opened, negotiated or started. Nothing was
// captured; the message says which backend/device and why.
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

struct CaptureOptions {
    int targetRateHz = 16000;

    // Trailing window kept after the stop predicate fires.
    std::chrono::milliseconds gracePeriod{1000};

    // Termination check period, independent of frame arrival.
    std::chrono::milliseconds tickInterval{100};

    // Buffer pre-size for toggle captures, whose length is unknown.
    int defaultExpectedSecs = SampleAccumulator::defaultExpectedSecs;

    Resampler::Options    resample;
    IAudioCapture::Config stream;
};

// Records one utterance from an IAudioCapture into 16 kHz (targetRateHz)
// mono float PCM.
//
//   frame callback: decode → downmix → accumulate → termination check
//   timer tick:     termination check
//   loop exit:      measure source rate → resample → return
//
// capture() and captureToggle() are thin wrappers over run() with a
// FixedDuration or ExternalSignal policy. All per-recording state lives in a
// struct owned by run() and referenced by the callbacks; nothing outlives
// the call.
class CaptureSession {
public:
    using StopPredicate = TerminationController::StopPredicate;

    struct Stats {
        size_t callbacks        = 0;   // frame callbacks seen
        size_t droppedCallbacks = 0;   // undecodable byte buffers
        size_t ignoredCallbacks = 0;   // arrived after Stopped
        size_t graceSamples     = 0;   // appended while StopRequested
        size_t rawSamples       = 0;   // mono samples at device rate
        size_t outputSamples    = 0;
        double elapsedSecs      = 0.0;
        int    detectedRateHz   = 0;
        Resampler::Method method = Resampler::Method::Skipped;
        TerminationController::StopReason reason =
            TerminationController::StopReason::None;
    };

    CaptureSession(IAudioCapture& capture, Clock& clock,
                   CaptureOptions options = {});

    // Fixed-duration capture. Throws CaptureError if the stream cannot be
    // opened or started.
    std::vector<float> capture(int durationSecs, int targetRateHz);
    std::vector<float> capture(int durationSecs) {
        return capture(durationSecs, options_.targetRateHz);
    }

    // Toggle capture: runs until stopRequested() turns true plus the grace
    // period, or maxDurationSecs, whichever comes first.
    std::vector<float> captureToggle(int maxDurationSecs, int targetRateHz,
                                     StopPredicate stopRequested);
    std::vector<float> captureToggle(int maxDurationSecs, StopPredicate stopRequested) {
        return captureToggle(maxDurationSecs, options_.targetRateHz,
                             std::move(stopRequested));
    }

    // Shared path behind both entry points. expectedSecs sizes the sample
    // buffer (<= 0 → SampleAccumulator default).
    std::vector<float> run(const TerminationPolicy& policy, int targetRateHz,
                           StopPredicate stopRequested, int expectedSecs);

    const Stats& lastStats() const { return stats_; }
    const CaptureOptions& options() const { return options_; }

private:
    struct Active;

    void onFrame(Active& a, const uint8_t* data, size_t byteCount);
    void onTick(Active& a);
    std::vector<float> finalize(Active& a, double elapsedSecs);
    void teardown();

    IAudioCapture& capture_;
    Clock&         clock_;
    CaptureOptions options_;
    Resampler      resampler_;
    Stats          stats_;
};
