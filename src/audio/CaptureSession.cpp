#include "audio/CaptureSession.hpp"
#include "audio/Downmixer.hpp"
#include "audio/PcmDecoder.hpp"
#include "audio/SampleAccumulator.hpp"
#include "audio/SignalStats.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

// Everything one recording touches. Owned by run(); the frame callback and
// the timer only ever see it by reference, on the loop thread.
struct CaptureSession::Active {
    Active(const TerminationPolicy& policy, Clock::TimePoint start,
           StopPredicate stopRequested, Clock::Duration grace,
           int targetRateHz, int expectedSecs,
           const IAudioCapture::StreamFormat& fmt)
        : controller(policy, start, std::move(stopRequested), grace)
        , samples(targetRateHz, expectedSecs)
        , format(fmt)
        , startedAt(start)
        , targetRateHz(targetRateHz)
    {
    }

    TerminationController       controller;
    SampleAccumulator           samples;
    IAudioCapture::StreamFormat format;
    Clock::TimePoint            startedAt;
    int                         targetRateHz;

    // Per-callback scratch, reused to keep the callback allocation-free
    std::vector<float> decoded;
    std::vector<float> mono;

    bool firstFrame    = true;
    bool quitRequested = false;
};

CaptureSession::CaptureSession(IAudioCapture& capture, Clock& clock,
                               CaptureOptions options)
    : capture_(capture)
    , clock_(clock)
    , options_(std::move(options))
    , resampler_(options_.resample)
{
}

std::vector<float> CaptureSession::capture(int durationSecs, int targetRateHz) {
    spdlog::info("Starting audio capture: {}s", durationSecs);
    return run(TerminationPolicy::fixedDuration(durationSecs), targetRateHz,
               StopPredicate{}, durationSecs);
}

std::vector<float> CaptureSession::captureToggle(int maxDurationSecs, int targetRateHz,
                                                 StopPredicate stopRequested) {
    spdlog::info("Starting toggle mode capture (max {}s)", maxDurationSecs);
    if (!stopRequested)
        spdlog::warn("Toggle capture without a stop predicate; it will run "
                     "for the full {}s", maxDurationSecs);
    return run(TerminationPolicy::externalSignal(maxDurationSecs), targetRateHz,
               std::move(stopRequested), options_.defaultExpectedSecs);
}

std::vector<float> CaptureSession::run(const TerminationPolicy& policy, int targetRateHz,
                                       StopPredicate stopRequested, int expectedSecs) {
    stats_ = Stats{};

    if (targetRateHz <= 0)
        throw std::invalid_argument("target sample rate must be positive, got " +
                                    std::to_string(targetRateHz));
    if (policy.maxSecs <= 0)
        throw std::invalid_argument("capture duration must be positive");

    if (!capture_.open(options_.stream))
        throw CaptureError("Failed to open " + capture_.backendName() +
                           " input stream" +
                           (options_.stream.device.empty()
                                ? std::string(" on the default device")
                                : " on device '" + options_.stream.device + "'"));

    auto fmt = capture_.format();
    if (fmt.sampleFormat == PcmDecoder::Format::Undecodable || fmt.channels < 1) {
        capture_.stop();
        throw CaptureError("Unsupported stream format from " + capture_.backendName() +
                           " device '" + capture_.deviceName() + "'");
    }

    if (!capture_.start()) {
        capture_.stop();
        throw CaptureError("Failed to start " + capture_.backendName() +
                           " stream on '" + capture_.deviceName() + "'");
    }

    Active a(policy, clock_.now(), std::move(stopRequested),
             options_.gracePeriod, targetRateHz, expectedSecs, fmt);

    capture_.setFrameCallback([this, &a](const uint8_t* data, size_t byteCount) {
        onFrame(a, data, byteCount);
    });
    capture_.addTimer(options_.tickInterval, [this, &a] { onTick(a); });

    try {
        capture_.run();
    } catch (...) {
        teardown();
        throw;
    }

    Clock::TimePoint endedAt = a.controller.stopped()
        ? a.controller.stoppedAt() : clock_.now();
    teardown();

    stats_.reason = a.controller.reason();
    return finalize(a, secondsBetween(a.startedAt, endedAt));
}

void CaptureSession::onFrame(Active& a, const uint8_t* data, size_t byteCount) {
    stats_.callbacks++;

    if (a.controller.stopped()) {
        stats_.ignoredCallbacks++;
        return;
    }

    // Float streams go through length/alignment detection; an int16 stream
    // is decoded as int16 regardless of how the byte count divides.
    if (a.format.sampleFormat == PcmDecoder::Format::Int16)
        PcmDecoder::decodeAs(PcmDecoder::Format::Int16, data, byteCount, a.decoded);
    else
        PcmDecoder::decodeInto(data, byteCount, a.decoded);

    if (a.decoded.empty()) {
        stats_.droppedCallbacks++;
        spdlog::debug("Dropped undecodable frame buffer ({} bytes)", byteCount);
    } else {
        if (a.firstFrame) {
            a.firstFrame = false;
            spdlog::info("Recording started - speak now!");
        }

        Downmixer::mixInto(a.decoded.data(), a.decoded.size(), a.format.channels, a.mono);
        a.samples.append(a.mono);

        if (a.controller.state() == TerminationController::State::StopRequested)
            stats_.graceSamples += a.mono.size();
    }

    if (a.controller.onFrame(clock_.now()) && !a.quitRequested) {
        a.quitRequested = true;
        capture_.quit();
    }
}

void CaptureSession::onTick(Active& a) {
    if (a.controller.onTick(clock_.now()) && !a.quitRequested) {
        a.quitRequested = true;
        capture_.quit();
    }
}

std::vector<float> CaptureSession::finalize(Active& a, double elapsedSecs) {
    std::vector<float> raw = a.samples.release();

    stats_.rawSamples  = raw.size();
    stats_.elapsedSecs = elapsedSecs;

    if (a.samples.growCount() > 0)
        spdlog::debug("Sample buffer grew {} times past its initial {} samples",
                      a.samples.growCount(), a.samples.initialCapacity());

    if (raw.empty()) {
        spdlog::warn("No audio captured - check microphone permissions");
        return {};
    }

    auto level = SignalStats::measure(raw);
    spdlog::info("Captured {} samples ({:.2f}s, ~{}Hz measured, {}Hz nominal), "
                 "rms {:.1f} dBFS, peak {:.1f} dBFS",
                 raw.size(), elapsedSecs, Resampler::detectRate(raw.size(), elapsedSecs),
                 a.format.nominalRate, level.rmsDB, level.peakDB);

    auto result = resampler_.finalize(raw, elapsedSecs, a.targetRateHz);

    stats_.detectedRateHz = result.sourceRateHz;
    stats_.method         = result.method;
    stats_.outputSamples  = result.samples.size();

    spdlog::info("Final audio: {} samples ({:.2f}s, {})",
                 result.samples.size(),
                 (double)result.samples.size() / a.targetRateHz,
                 Resampler::methodName(result.method));

    return std::move(result.samples);
}

void CaptureSession::teardown() {
    capture_.stop();
    capture_.setFrameCallback(nullptr);
    capture_.clearTimers();
}
