#pragma once
#include "IAudioCapture.hpp"
#include "Clock.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Simulated input device running in virtual time.
//
// run() advances a ManualClock event by event: a block of framesPerBlock
// frames is delivered when its last frame would have been captured, and each
// timer fires at its deadline. No real time passes, so a 300 s toggle
// capture completes instantly and deterministically. Used by the tests and by
// `voxcap --synthetic`.
class SyntheticAudioCapture : public IAudioCapture {
public:
    struct Signal {
        enum class Shape {
            Sine,
            Silence,
            Ramp       // sample n = (n % rampPeriod) / rampPeriod
        };
        Shape shape       = Shape::Sine;
        float frequencyHz = 440.0f;
        float amplitude   = 0.5f;
        int   rampPeriod  = 1000;
    };

    struct Options {
        double             sampleRate     = 48000;
        int                channels       = 1;
        PcmDecoder::Format sampleFormat   = PcmDecoder::Format::Float32;
        int                framesPerBlock = 480;
        long long          maxFrames      = -1;     // -1 = endless
        Signal             signal;

        // Frames due in [stallAtSecs, stallAtSecs + stallForSecs) are held
        // back and delivered as one burst when the stall ends.
        double stallAtSecs  = -1;
        double stallForSecs = 0;

        bool failOpen  = false;
        bool failStart = false;

        // run() gives up after this much virtual time even without quit().
        double maxVirtualSecs = 24 * 3600;

        std::string name = "Synthetic Microphone";
    };

    // Default Options: 48 kHz mono float32 sine, endless.
    explicit SyntheticAudioCapture(ManualClock& clock);
    SyntheticAudioCapture(ManualClock& clock, Options options)
        : clock_(clock), options_(std::move(options)) {}

    bool open(const Config& config) override;
    bool start() override;
    void stop() override { running_ = false; }
    bool isRunning() const override { return running_; }

    void setFrameCallback(FrameCallback cb) override { callback_ = std::move(cb); }
    void addTimer(std::chrono::milliseconds period, TimerCallback cb) override;
    void clearTimers() override { timers_.clear(); }

    void run() override;
    void quit() override { quit_ = true; }

    StreamFormat format() const override { return format_; }
    std::string deviceName() const override { return options_.name; }

    std::vector<DeviceInfo> listDevices() const override;
    std::string backendName() const override { return "synthetic"; }

    long long framesDelivered() const { return framesDelivered_; }
    int       blocksDelivered() const { return blocksDelivered_; }
    int       timerFires() const { return timerFires_; }
    Clock::TimePoint runStartedAt() const { return runStartedAt_; }

    Options& options() { return options_; }

private:
    struct Timer {
        Clock::Duration  period;
        Clock::TimePoint next;
        TimerCallback    callback;
    };

    Clock::Duration framesToDuration(long long frames) const;
    Clock::TimePoint deliveryTime(long long blockEndFrame) const;
    size_t framesInNextBlock() const;
    void encodeBlock(size_t frames);
    float sampleAt(long long frameIndex) const;

    ManualClock&  clock_;
    Options       options_;
    StreamFormat  format_;
    FrameCallback callback_;
    std::vector<Timer> timers_;

    std::vector<uint8_t> block_;
    bool      opened_  = false;
    bool      running_ = false;
    bool      quit_    = false;
    long long framesDelivered_ = 0;
    int       blocksDelivered_ = 0;
    int       timerFires_      = 0;
    Clock::TimePoint runStartedAt_{};
};
