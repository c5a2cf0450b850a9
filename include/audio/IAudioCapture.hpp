#pragma once
#include "audio/PcmDecoder.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Abstract frame-delivery capability.
// Implementations: PortAudioCapture (live device), SyntheticAudioCapture
// (simulated device in virtual time, used by tests and --synthetic).
//
// Lifecycle: open() → setFrameCallback()/addTimer() → start() → run() …
// quit() from inside a callback … run() returns → stop().
// Frame callbacks and timers all execute on the thread that called run(),
// one at a time.
class IAudioCapture {
public:
    virtual ~IAudioCapture() = default;

    struct DeviceInfo {
        int         id;
        std::string name;
        std::string hostApi;
        int         maxInputChannels;
        double      defaultSampleRate;
        bool        isDefault;
    };

    struct Config {
        std::string device;              // empty = default input device
        int         channelCount   = 1;  // mono preferred, stereo fallback
        double      sampleRate     = 0;  // 0 = device default
        int         framesPerBlock = 512;
    };

    // Negotiated at open() time.
    struct StreamFormat {
        PcmDecoder::Format sampleFormat = PcmDecoder::Format::Float32;
        int                channels     = 1;
        double             nominalRate  = 0;   // as reported by the device
    };

    // Raw interleaved bytes in the negotiated format.
    using FrameCallback = std::function<void(const uint8_t* data, size_t byteCount)>;
    using TimerCallback = std::function<void()>;

    // Lifecycle. open()/start() log the reason and return false on failure.
    virtual bool open(const Config& config) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    virtual void setFrameCallback(FrameCallback cb) = 0;
    virtual void addTimer(std::chrono::milliseconds period, TimerCallback cb) = 0;
    virtual void clearTimers() = 0;

    // Blocks until quit(). quit() is safe to call from any callback.
    virtual void run() = 0;
    virtual void quit() = 0;

    virtual StreamFormat format() const = 0;
    virtual std::string deviceName() const = 0;

    // Device enumeration
    virtual std::vector<DeviceInfo> listDevices() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;

    // Resolve a user-supplied device name: exact name, then "hostApi: name",
    // then case-insensitive substring. Returns the index into devices or -1.
    static int findDevice(const std::vector<DeviceInfo>& devices,
                          const std::string& wanted) {
        if (wanted.empty()) return -1;

        for (size_t i = 0; i < devices.size(); i++)
            if (devices[i].name == wanted) return (int)i;

        for (size_t i = 0; i < devices.size(); i++)
            if (devices[i].hostApi + ": " + devices[i].name == wanted) return (int)i;

        std::string needle = toLower(wanted);
        for (size_t i = 0; i < devices.size(); i++)
            if (toLower(devices[i].name).find(needle) != std::string::npos)
                return (int)i;

        return -1;
    }

private:
    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        return s;
    }
};
