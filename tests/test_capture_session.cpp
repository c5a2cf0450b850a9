#include <gtest/gtest.h>
#include "audio/CaptureSession.hpp"
#include "audio/SyntheticAudioCapture.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using Reason = TerminationController::StopReason;

class CaptureSessionTest : public ::testing::Test {
protected:
    ManualClock clock;

    SyntheticAudioCapture::Options device(double rate, int framesPerBlock) {
        SyntheticAudioCapture::Options o;
        o.sampleRate     = rate;
        o.framesPerBlock = framesPerBlock;
        return o;
    }

    // True once `after` of virtual time has passed since the call.
    std::function<bool()> stopAfter(Clock::Duration after) {
        auto at = clock.now() + after;
        return [this, at] { return clock.now() >= at; };
    }
};

TEST_F(CaptureSessionTest, FixedDurationAt48kResamplesTo16k) {
    SyntheticAudioCapture mic(clock, device(48000, 480));
    CaptureSession session(mic, clock);

    auto audio = session.capture(5);
    const auto& stats = session.lastStats();

    EXPECT_EQ(stats.reason, Reason::DurationElapsed);
    EXPECT_DOUBLE_EQ(stats.elapsedSecs, 5.0);
    EXPECT_EQ(stats.rawSamples, 240000u);
    EXPECT_EQ(stats.detectedRateHz, 48000);
    EXPECT_EQ(stats.method, Resampler::Method::Sinc);
    EXPECT_NEAR((double)audio.size(), 80000.0, 1.0);
    EXPECT_EQ(stats.graceSamples, 0u);
    EXPECT_FALSE(mic.isRunning());
}

TEST_F(CaptureSessionTest, NativeRateIsNotResampled) {
    SyntheticAudioCapture mic(clock, device(16000, 160));
    CaptureSession session(mic, clock);

    auto audio = session.capture(2);
    EXPECT_EQ(session.lastStats().method, Resampler::Method::Skipped);
    EXPECT_EQ(audio.size(), 32000u);
}

TEST_F(CaptureSessionTest, ToggleStopsOneGracePeriodAfterSignal) {
    SyntheticAudioCapture mic(clock, device(16000, 160));
    CaptureSession session(mic, clock);

    auto audio = session.captureToggle(300, stopAfter(10s));
    const auto& stats = session.lastStats();

    EXPECT_EQ(stats.reason, Reason::SignalGrace);
    EXPECT_DOUBLE_EQ(stats.elapsedSecs, 11.0);
    EXPECT_EQ(audio.size(), 176000u);

    // Everything recorded after the signal is kept
    EXPECT_EQ(stats.graceSamples, 16000u);
}

TEST_F(CaptureSessionTest, ToggleWithoutSignalHitsSafetyBound) {
    SyntheticAudioCapture mic(clock, device(16000, 160));
    CaptureSession session(mic, clock);

    auto audio = session.captureToggle(10, [] { return false; });
    const auto& stats = session.lastStats();

    EXPECT_EQ(stats.reason, Reason::SafetyBound);
    EXPECT_DOUBLE_EQ(stats.elapsedSecs, 10.0);
    EXPECT_EQ(audio.size(), 160000u);
}

TEST_F(CaptureSessionTest, SignalInsideGraceOfBoundStopsAtBound) {
    SyntheticAudioCapture mic(clock, device(16000, 160));
    CaptureSession session(mic, clock);

    session.captureToggle(10, stopAfter(9500ms));
    EXPECT_EQ(session.lastStats().reason, Reason::SafetyBound);
    EXPECT_DOUBLE_EQ(session.lastStats().elapsedSecs, 10.0);
}

TEST_F(CaptureSessionTest, CustomGracePeriod) {
    SyntheticAudioCapture mic(clock, device(16000, 160));
    CaptureOptions opts;
    opts.gracePeriod = 250ms;
    CaptureSession session(mic, clock, opts);

    auto audio = session.captureToggle(60, stopAfter(2s));
    EXPECT_DOUBLE_EQ(session.lastStats().elapsedSecs, 2.25);
    EXPECT_EQ(audio.size(), 36000u);
}

TEST_F(CaptureSessionTest, NoFramesReturnsEmpty) {
    auto o = device(48000, 480);
    o.maxFrames = 0;
    SyntheticAudioCapture mic(clock, o);
    CaptureSession session(mic, clock);

    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
    sink->set_pattern("%l|%v");
    auto logger = spdlog::default_logger();
    logger->sinks().push_back(sink);

    auto audio = session.capture(2);
    logger->sinks().pop_back();

    EXPECT_TRUE(audio.empty());
    EXPECT_EQ(session.lastStats().callbacks, 0u);
    EXPECT_EQ(session.lastStats().reason, Reason::DurationElapsed);

    int warnings = 0;
    for (const auto& line : sink->last_formatted()) {
        if (line.rfind("warning|No audio captured", 0) == 0) warnings++;
    }
    EXPECT_EQ(warnings, 1);
}

TEST_F(CaptureSessionTest, StalledDeviceStillStopsOnTime) {
    auto o = device(16000, 160);
    o.stallAtSecs  = 1.5;
    o.stallForSecs = 60;
    SyntheticAudioCapture mic(clock, o);
    CaptureSession session(mic, clock);

    auto audio = session.capture(2);
    const auto& stats = session.lastStats();

    EXPECT_EQ(stats.reason, Reason::DurationElapsed);
    EXPECT_DOUBLE_EQ(stats.elapsedSecs, 2.0);
    EXPECT_EQ(stats.rawSamples, 23840u);

    // Fewer samples than wall-clock time reads as a slower device, so the
    // output is stretched to cover the elapsed 2 s.
    EXPECT_EQ(stats.detectedRateHz, 11920);
    EXPECT_NEAR((double)audio.size(), 32000.0, 1.0);
}

TEST_F(CaptureSessionTest, StereoInt16IsDecodedAndDownmixed) {
    auto o = device(48000, 480);
    o.channels     = 2;
    o.sampleFormat = PcmDecoder::Format::Int16;
    SyntheticAudioCapture mic(clock, o);
    CaptureSession session(mic, clock);

    auto audio = session.capture(1);

    EXPECT_EQ(session.lastStats().rawSamples, 48000u);
    EXPECT_EQ(session.lastStats().droppedCallbacks, 0u);
    ASSERT_NEAR((double)audio.size(), 16000.0, 1.0);

    float peak = 0.0f;
    for (size_t i = 1000; i < 15000; i++)
        peak = std::max(peak, std::abs(audio[i]));
    EXPECT_NEAR(peak, 0.5f, 0.02f);
}

TEST_F(CaptureSessionTest, OpenFailureThrowsCaptureError) {
    auto o = device(48000, 480);
    o.failOpen = true;
    SyntheticAudioCapture mic(clock, o);
    CaptureSession session(mic, clock);

    EXPECT_THROW(session.capture(1), CaptureError);
}

TEST_F(CaptureSessionTest, StartFailureThrowsCaptureError) {
    auto o = device(48000, 480);
    o.failStart = true;
    SyntheticAudioCapture mic(clock, o);
    CaptureSession session(mic, clock);

    EXPECT_THROW(session.captureToggle(5, [] { return false; }), CaptureError);
    EXPECT_FALSE(mic.isRunning());
}

TEST_F(CaptureSessionTest, RejectsInvalidArguments) {
    SyntheticAudioCapture mic(clock, device(48000, 480));
    CaptureSession session(mic, clock);

    EXPECT_THROW(session.capture(0), std::invalid_argument);
    EXPECT_THROW(session.capture(1, 0), std::invalid_argument);
}

TEST_F(CaptureSessionTest, SessionCanRecordTwice) {
    SyntheticAudioCapture mic(clock, device(16000, 160));
    CaptureSession session(mic, clock);

    auto first  = session.capture(1);
    auto second = session.capture(1);
    EXPECT_EQ(first.size(), 16000u);
    EXPECT_EQ(second.size(), 16000u);
}

// Delivers a fixed script of byte buffers, one per 10 ms of virtual time,
// and keeps going after quit() so late callbacks can be observed.
class ScriptedCapture : public IAudioCapture {
public:
    ScriptedCapture(ManualClock& clock, std::vector<std::vector<uint8_t>> script)
        : clock_(clock), script_(std::move(script)) {}

    bool open(const Config&) override { return true; }
    bool start() override { running_ = true; return true; }
    void stop() override { running_ = false; }
    bool isRunning() const override { return running_; }

    void setFrameCallback(FrameCallback cb) override { callback_ = std::move(cb); }
    void addTimer(std::chrono::milliseconds, TimerCallback) override {}
    void clearTimers() override {}

    void run() override {
        for (auto& bytes : script_) {
            clock_.advance(10ms);
            if (callback_) callback_(bytes.data(), bytes.size());
        }
    }
    void quit() override { quits++; }

    StreamFormat format() const override {
        StreamFormat f;
        f.nominalRate = 1000;
        return f;
    }
    std::string deviceName() const override { return "scripted"; }
    std::vector<DeviceInfo> listDevices() const override { return {}; }
    std::string backendName() const override { return "scripted"; }

    int quits = 0;

private:
    ManualClock& clock_;
    std::vector<std::vector<uint8_t>> script_;
    FrameCallback callback_;
    bool running_ = false;
};

TEST_F(CaptureSessionTest, UndecodableAndLateBuffersAreSkipped) {
    // 10 float32 samples per buffer
    std::vector<uint8_t> good(40, 0);
    std::vector<uint8_t> odd(7, 0);

    // 3 good, 1 odd, then enough good buffers to pass the 1 s bound
    std::vector<std::vector<uint8_t>> script = {good, good, good, odd};
    for (int i = 0; i < 100; i++) script.push_back(good);

    ScriptedCapture cap(clock, script);
    CaptureSession session(cap, clock);
    auto audio = session.capture(1);
    const auto& stats = session.lastStats();

    EXPECT_EQ(stats.callbacks, 104u);
    EXPECT_EQ(stats.droppedCallbacks, 1u);

    // Stopped on the buffer delivered at 1.00 s (the 100th)
    EXPECT_EQ(stats.ignoredCallbacks, 4u);
    EXPECT_EQ(stats.rawSamples, 99u * 10);
    EXPECT_EQ(cap.quits, 1);
    EXPECT_FALSE(audio.empty());
}
