#include "audio/PortAudioCapture.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

#ifdef HAS_PORTAUDIO
namespace {

PaSampleFormat toPaFormat(PcmDecoder::Format f) {
    return f == PcmDecoder::Format::Int16 ? paInt16 : paFloat32;
}

size_t bytesPerSample(PcmDecoder::Format f) {
    return f == PcmDecoder::Format::Int16 ? 2 : 4;
}

}  // namespace
#endif

PortAudioCapture::PortAudioCapture() {
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
#endif
}

PortAudioCapture::~PortAudioCapture() {
    stop();
#ifdef HAS_PORTAUDIO
    if (paInitialized_)
        Pa_Terminate();
#endif
}

bool PortAudioCapture::negotiate(int deviceIndex, double sampleRate, int preferredChannels) {
#ifdef HAS_PORTAUDIO
    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo) return false;

    std::vector<int> channelChoices;
    if (preferredChannels >= 1 && preferredChannels <= devInfo->maxInputChannels)
        channelChoices.push_back(preferredChannels);
    if (preferredChannels != 2 && devInfo->maxInputChannels >= 2)
        channelChoices.push_back(2);
    if (channelChoices.empty() && devInfo->maxInputChannels >= 1)
        channelChoices.push_back(devInfo->maxInputChannels);

    const PcmDecoder::Format formats[] = {
        PcmDecoder::Format::Float32,
        PcmDecoder::Format::Int16
    };

    for (int channels : channelChoices) {
        for (auto fmt : formats) {
            PaStreamParameters params;
            params.device = deviceIndex;
            params.channelCount = channels;
            params.sampleFormat = toPaFormat(fmt);
            params.suggestedLatency = devInfo->defaultLowInputLatency;
            params.hostApiSpecificStreamInfo = nullptr;

            PaError err = Pa_IsFormatSupported(&params, nullptr, sampleRate);
            if (err == paFormatIsSupported) {
                format_.sampleFormat = fmt;
                format_.channels     = channels;
                format_.nominalRate  = sampleRate;
                return true;
            }
            spdlog::debug("Format {} x{} @ {}Hz rejected: {}",
                          PcmDecoder::formatName(fmt), channels, sampleRate,
                          Pa_GetErrorText(err));
        }
    }
    return false;
#else
    (void)deviceIndex;
    (void)sampleRate;
    (void)preferredChannels;
    return false;
#endif
}

bool PortAudioCapture::open(const Config& config) {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_) return false;
    if (stream_) stop();

    config_ = config;

    PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (!config.device.empty()) {
        auto devices = listDevices();
        int idx = findDevice(devices, config.device);
        if (idx < 0) {
            spdlog::error("Audio device '{}' not found ({} input devices available)",
                          config.device, devices.size());
            return false;
        }
        device = devices[idx].id;
    }
    if (device == paNoDevice) {
        spdlog::error("No input device available. Check microphone permissions.");
        return false;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(device);
    if (!devInfo) {
        spdlog::error("Invalid audio device ID {}", device);
        return false;
    }

    double rate = config.sampleRate > 0 ? config.sampleRate : devInfo->defaultSampleRate;
    if (!negotiate(device, rate, config.channelCount)) {
        spdlog::error("Device '{}' supports neither float32 nor int16 input "
                      "at {}Hz", devInfo->name, rate);
        return false;
    }
    deviceName_ = devInfo->name;

    PaStreamParameters inputParams;
    inputParams.device = device;
    inputParams.channelCount = format_.channels;
    inputParams.sampleFormat = toPaFormat(format_.sampleFormat);
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    // 2 seconds of interleaved bytes between the callback and the loop
    bytesPerFrame_ = bytesPerSample(format_.sampleFormat) * format_.channels;
    size_t bufSize = (size_t)(rate * 2) * bytesPerFrame_;
    bytes_ = std::make_unique<RingBuffer<uint8_t>>(bufSize);
    readBuf_.resize(bufSize);
    overflowBytes_ = 0;
    overflowReported_ = 0;

    spdlog::info("Audio device: {} ({}Hz, {} ch, {})",
                 deviceName_, rate, format_.channels,
                 PcmDecoder::formatName(format_.sampleFormat));

    PaError err = Pa_OpenStream(
        &stream_,
        &inputParams,
        nullptr,  // no output
        rate,
        config.framesPerBlock,
        paClipOff,
        &PortAudioCapture::paCallback,
        this
    );

    if (err != paNoError) {
        spdlog::error("Pa_OpenStream failed: {}", Pa_GetErrorText(err));
        stream_ = nullptr;
        return false;
    }

    return true;
#else
    (void)config;
    spdlog::warn("PortAudio not available, built without HAS_PORTAUDIO");
    return false;
#endif
}

bool PortAudioCapture::start() {
#ifdef HAS_PORTAUDIO
    if (!stream_) return false;
    loop_.reset();
    drainPosted_ = false;
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        spdlog::error("Pa_StartStream failed: {}", Pa_GetErrorText(err));
        return false;
    }
    running_ = true;
    spdlog::debug("Audio stream started");
    return true;
#else
    return false;
#endif
}

void PortAudioCapture::run() {
    if (!running_) {
        spdlog::warn("run() called on a stream that is not started");
        return;
    }
    loop_.run();
}

void PortAudioCapture::stop() {
#ifdef HAS_PORTAUDIO
    running_ = false;
    loop_.quit();
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        spdlog::debug("Audio stream closed");
    }
#endif
}

std::vector<IAudioCapture::DeviceInfo> PortAudioCapture::listDevices() const {
    std::vector<DeviceInfo> result;
#ifdef HAS_PORTAUDIO
    if (!paInitialized_) return result;

    PaDeviceIndex defaultInput = Pa_GetDefaultInputDevice();
    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
            result.push_back({
                i,
                info->name,
                api ? api->name : "",
                info->maxInputChannels,
                info->defaultSampleRate,
                i == defaultInput
            });
        }
    }
#endif
    return result;
}

int PortAudioCapture::paCallback(
    const void* input, void* /*output*/,
    unsigned long frameCount,
    const void* /*timeInfo*/,
    unsigned long /*statusFlags*/,
    void* userData)
{
    auto* self = static_cast<PortAudioCapture*>(userData);
    return self->handleAudio(input, frameCount);
}

int PortAudioCapture::handleAudio(const void* input, unsigned long frameCount) {
    if (!input || !bytes_) return 0;  // paContinue

    // Whole frames only; a partial write would misalign every later frame.
    size_t byteCount = frameCount * bytesPerFrame_;
    size_t written = bytes_->writeWhole(static_cast<const uint8_t*>(input),
                                        byteCount, bytesPerFrame_);
    if (written < byteCount)
        overflowBytes_ += byteCount - written;

    // Locks the loop queue, at most once until the posted drain runs.
    if (!drainPosted_.exchange(true))
        loop_.post([this] { drain(); });

    return 0;  // paContinue
}

void PortAudioCapture::drain() {
    drainPosted_ = false;

    size_t overflow = overflowBytes_;
    if (overflow > overflowReported_) {
        spdlog::warn("Audio ring buffer overflow: {} bytes lost so far", overflow);
        overflowReported_ = overflow;
    }

    // Whole frames only so interleaved channels stay paired.
    size_t got = bytes_->readWhole(readBuf_.data(), readBuf_.size(), bytesPerFrame_);
    if (callback_ && got > 0)
        callback_(readBuf_.data(), got);
}
