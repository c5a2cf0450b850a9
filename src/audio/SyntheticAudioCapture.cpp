#include "audio/SyntheticAudioCapture.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstring>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

SyntheticAudioCapture::SyntheticAudioCapture(ManualClock& clock)
    : SyntheticAudioCapture(clock, Options{}) {}

bool SyntheticAudioCapture::open(const Config& config) {
    if (options_.failOpen) {
        spdlog::error("Synthetic device '{}' refused to open", options_.name);
        return false;
    }
    if (options_.sampleRate <= 0 || options_.channels < 1 ||
        options_.framesPerBlock < 1 ||
        options_.sampleFormat == PcmDecoder::Format::Undecodable) {
        spdlog::error("Synthetic device '{}' has an invalid stream format",
                      options_.name);
        return false;
    }

    // The simulated hardware only opens in its native layout, like a
    // stereo-only USB mic; the requested channel count is advisory.
    if (config.channelCount != options_.channels)
        spdlog::debug("Synthetic device delivers {} ch ({} requested)",
                      options_.channels, config.channelCount);
    format_.sampleFormat = options_.sampleFormat;
    format_.channels     = options_.channels;
    format_.nominalRate  = options_.sampleRate;

    framesDelivered_ = 0;
    blocksDelivered_ = 0;
    timerFires_      = 0;
    opened_ = true;

    spdlog::info("Audio device: {} ({}Hz, {} ch, {})", options_.name,
                 format_.nominalRate, format_.channels,
                 PcmDecoder::formatName(format_.sampleFormat));
    return true;
}

bool SyntheticAudioCapture::start() {
    if (!opened_ || options_.failStart) {
        spdlog::error("Synthetic device '{}' failed to start", options_.name);
        return false;
    }
    running_ = true;
    quit_ = false;
    return true;
}

void SyntheticAudioCapture::addTimer(std::chrono::milliseconds period, TimerCallback cb) {
    if (period.count() <= 0) {
        spdlog::warn("Ignoring timer with non-positive period {}ms", period.count());
        return;
    }
    timers_.push_back({period, clock_.now() + period, std::move(cb)});
}

Clock::Duration SyntheticAudioCapture::framesToDuration(long long frames) const {
    auto secs = std::chrono::duration<double>((double)frames / options_.sampleRate);
    return std::chrono::duration_cast<Clock::Duration>(secs);
}

Clock::TimePoint SyntheticAudioCapture::deliveryTime(long long blockEndFrame) const {
    Clock::TimePoint t = runStartedAt_ + framesToDuration(blockEndFrame);
    if (options_.stallAtSecs >= 0 && options_.stallForSecs > 0) {
        auto stallStart = runStartedAt_ + std::chrono::duration_cast<Clock::Duration>(
            std::chrono::duration<double>(options_.stallAtSecs));
        auto stallEnd = stallStart + std::chrono::duration_cast<Clock::Duration>(
            std::chrono::duration<double>(options_.stallForSecs));
        if (t >= stallStart && t < stallEnd)
            return stallEnd;
    }
    return t;
}

size_t SyntheticAudioCapture::framesInNextBlock() const {
    long long frames = options_.framesPerBlock;
    if (options_.maxFrames >= 0)
        frames = std::min(frames, options_.maxFrames - framesDelivered_);
    return frames > 0 ? (size_t)frames : 0;
}

float SyntheticAudioCapture::sampleAt(long long frameIndex) const {
    const auto& sig = options_.signal;
    switch (sig.shape) {
        case Signal::Shape::Sine:
            return sig.amplitude * (float)std::sin(
                2.0 * M_PI * sig.frequencyHz * (double)frameIndex / options_.sampleRate);
        case Signal::Shape::Silence:
            return 0.0f;
        case Signal::Shape::Ramp: {
            int period = std::max(sig.rampPeriod, 1);
            return (float)(frameIndex % period) / (float)period;
        }
    }
    return 0.0f;
}

void SyntheticAudioCapture::encodeBlock(size_t frames) {
    const int channels = format_.channels;
    const bool int16 = format_.sampleFormat == PcmDecoder::Format::Int16;
    const size_t bytesPerSample = int16 ? 2 : 4;

    block_.resize(frames * channels * bytesPerSample);
    uint8_t* p = block_.data();

    for (size_t f = 0; f < frames; f++) {
        float s = sampleAt(framesDelivered_ + (long long)f);
        for (int ch = 0; ch < channels; ch++) {
            if (int16) {
                float clamped = std::max(-1.0f, std::min(1.0f, s));
                auto v = (uint16_t)(int16_t)std::lround(clamped * PcmDecoder::int16Scale);
                *p++ = (uint8_t)(v & 0xff);
                *p++ = (uint8_t)(v >> 8);
            } else {
                uint32_t bits;
                std::memcpy(&bits, &s, sizeof(bits));
                *p++ = (uint8_t)(bits & 0xff);
                *p++ = (uint8_t)((bits >> 8) & 0xff);
                *p++ = (uint8_t)((bits >> 16) & 0xff);
                *p++ = (uint8_t)(bits >> 24);
            }
        }
    }
}

void SyntheticAudioCapture::run() {
    if (!running_) {
        spdlog::warn("run() called on a stream that is not started");
        return;
    }

    runStartedAt_ = clock_.now();
    for (auto& t : timers_)
        t.next = runStartedAt_ + t.period;

    const auto limit = runStartedAt_ + std::chrono::duration_cast<Clock::Duration>(
        std::chrono::duration<double>(options_.maxVirtualSecs));

    while (!quit_) {
        size_t frames = framesInNextBlock();
        bool haveBlock = frames > 0;

        auto nextTimer = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it)
            if (nextTimer == timers_.end() || it->next < nextTimer->next)
                nextTimer = it;

        if (!haveBlock && nextTimer == timers_.end()) {
            spdlog::debug("Synthetic device exhausted after {} frames", framesDelivered_);
            break;
        }

        Clock::TimePoint blockAt = haveBlock
            ? deliveryTime(framesDelivered_ + (long long)frames)
            : Clock::TimePoint::max();

        // A block due at the same instant as a timer is delivered first.
        if (haveBlock && (nextTimer == timers_.end() || blockAt <= nextTimer->next)) {
            if (blockAt > limit) break;
            clock_.set(std::max(blockAt, clock_.now()));
            encodeBlock(frames);
            framesDelivered_ += (long long)frames;
            blocksDelivered_++;
            if (callback_)
                callback_(block_.data(), block_.size());
        } else {
            if (nextTimer->next > limit) break;
            clock_.set(std::max(nextTimer->next, clock_.now()));
            nextTimer->next += nextTimer->period;
            timerFires_++;
            nextTimer->callback();
        }
    }

    if (!quit_)
        spdlog::warn("Synthetic run ended without a quit request at {:.3f}s",
                     secondsBetween(runStartedAt_, clock_.now()));
}

std::vector<IAudioCapture::DeviceInfo> SyntheticAudioCapture::listDevices() const {
    return {{0, options_.name, "synthetic", options_.channels,
             options_.sampleRate, true}};
}
