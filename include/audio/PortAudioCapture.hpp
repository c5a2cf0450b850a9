#pragma once
#include "IAudioCapture.hpp"
#include "EventLoop.hpp"
#include "RingBuffer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// PortAudio-based microphone capture. Core Audio (macOS), ALSA/PulseAudio/
// JACK (Linux), WASAPI (Windows). Link with -lportaudio.
//
// Audio data flows:
//   PortAudio callback (real-time thread)
//       → byte RingBuffer
//           → drain task posted to the EventLoop
//               → frame callback on the thread blocked in run()
//
// The real-time side copies bytes without locking. When no drain is pending
// it also posts one through EventLoop::post, which briefly takes the loop's
// queue mutex and allocates the task; drainPosted_ limits that to once per
// drain. Decoding and everything after it happens on the loop thread.
//
// Format negotiation: mono before stereo, paFloat32 before paInt16.

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;

class PortAudioCapture : public IAudioCapture {
public:
    PortAudioCapture();
    ~PortAudioCapture() override;

    bool open(const Config& config) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override { return running_; }

    void setFrameCallback(FrameCallback cb) override { callback_ = std::move(cb); }
    void addTimer(std::chrono::milliseconds period, TimerCallback cb) override {
        loop_.addTimer(period, std::move(cb));
    }
    void clearTimers() override { loop_.clearTimers(); }

    void run() override;
    void quit() override { loop_.quit(); }

    StreamFormat format() const override { return format_; }
    std::string deviceName() const override { return deviceName_; }

    std::vector<DeviceInfo> listDevices() const override;
    std::string backendName() const override { return "PortAudio"; }

    // Bytes the real-time callback could not fit into the ring buffer.
    size_t overflowBytes() const { return overflowBytes_; }

private:
    // PortAudio stream callback (static → forwards to instance)
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const void* timeInfo,
                          unsigned long statusFlags,
                          void* userData);

    int handleAudio(const void* input, unsigned long frameCount);

    // Loop thread: move every complete frame out of the ring buffer and
    // hand it to the frame callback.
    void drain();

    bool negotiate(int deviceIndex, double sampleRate, int preferredChannels);

    Config              config_;
    StreamFormat        format_;
    std::string         deviceName_;
    PaStream*           stream_    = nullptr;
    std::atomic<bool>   running_{false};
    FrameCallback       callback_;
    EventLoop           loop_;

    std::unique_ptr<RingBuffer<uint8_t>> bytes_;
    std::vector<uint8_t>                 readBuf_;
    size_t                               bytesPerFrame_ = 0;
    std::atomic<bool>                    drainPosted_{false};
    std::atomic<size_t>                  overflowBytes_{0};
    size_t                               overflowReported_ = 0;

    bool paInitialized_ = false;
};
