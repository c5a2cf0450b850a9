#include "audio/Resampler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

double sinc(double x) {
    if (std::abs(x) < 1e-12) return 1.0;
    return std::sin(M_PI * x) / (M_PI * x);
}

// Blackman-Harris, t in [0, 1]
double blackmanHarris(double t) {
    if (t < 0.0 || t > 1.0) return 0.0;
    return 0.35875
         - 0.48829 * std::cos(2.0 * M_PI * t)
         + 0.14128 * std::cos(4.0 * M_PI * t)
         - 0.01168 * std::cos(6.0 * M_PI * t);
}

}  // namespace

// ── FftResampler ─────────────────────────────────────────────────────────

std::pair<int, int> FftResampler::planFftSizes(int inputRate, int outputRate,
                                               int chunkSize, int subChunks) {
    if (inputRate <= 0 || outputRate <= 0)
        throw ResampleError("invalid resample rates " + std::to_string(inputRate) +
                            "Hz -> " + std::to_string(outputRate) + "Hz");
    if (chunkSize <= 0 || subChunks <= 0)
        throw ResampleError("invalid resampler chunking: chunk=" +
                            std::to_string(chunkSize) + " sub_chunks=" +
                            std::to_string(subChunks));

    long long gcd         = std::gcd(inputRate, outputRate);
    long long minChunkIn  = inputRate / gcd;
    long long minChunkOut = outputRate / gcd;

    long long wanted    = (long long)chunkSize * outputRate / inputRate / subChunks;
    long long fftChunks = std::max(1LL, (wanted + minChunkOut - 1) / minChunkOut);

    long long sizeIn  = fftChunks * minChunkIn;
    long long sizeOut = fftChunks * minChunkOut;

    if (sizeIn > maxFftSizeIn || sizeOut > maxFftSizeIn)
        throw ResampleError("resampler FFT too large for " +
                            std::to_string(inputRate) + "Hz -> " +
                            std::to_string(outputRate) + "Hz (" +
                            std::to_string(sizeIn) + " -> " +
                            std::to_string(sizeOut) + " points)");

    return {(int)sizeIn, (int)sizeOut};
}

FftResampler::FftResampler(int inputRate, int outputRate, int chunkSize, int subChunks)
    : FftResampler(inputRate, outputRate, chunkSize,
                   planFftSizes(inputRate, outputRate, chunkSize, subChunks))
{
}

FftResampler::FftResampler(int inputRate, int outputRate, int chunkSize,
                           std::pair<int, int> fftSizes)
    : inputRate_(inputRate)
    , outputRate_(outputRate)
    , chunkSize_(chunkSize)
    , fftSizeIn_(fftSizes.first)
    , fftSizeOut_(fftSizes.second)
    , fftIn_(2 * fftSizes.first)
    , fftOut_(2 * fftSizes.second)
    , specIn_(2 * fftSizes.first)
    , specOut_(2 * fftSizes.second)
    , overlap_(fftSizes.second, 0.0)
{
    buildFilter();
    pending_.reserve((size_t)chunkSize_ + fftSizeIn_);

    spdlog::debug("FftResampler {}Hz -> {}Hz: chunk={} fft {} -> {}",
                  inputRate_, outputRate_, chunkSize_, fftSizeIn_, fftSizeOut_);
}

void FftResampler::buildFilter() {
    const int n = fftSizeIn_;

    // Low-pass at the lower of the two Nyquist rates, rolled off a little
    // below it. Cycles per input sample.
    double rolloff = std::pow(0.4, 16.0 / n);
    double cutoff  = 0.5 * rolloff * std::min(1.0, (double)fftSizeOut_ / fftSizeIn_);

    // Centre the sinc on an input position that maps to a whole number of
    // output samples, so outputDelay() is exact.
    double centre = (double)outputDelay() * fftSizeIn_ / fftSizeOut_;

    // n + 1 taps: linear convolution with an n-sample block fits in 2n points.
    std::vector<double> taps(n + 1);
    double sum = 0.0;
    for (int j = 0; j <= n; j++) {
        double w = blackmanHarris((j - centre) / n + 0.5);
        taps[j] = 2.0 * cutoff * sinc(2.0 * cutoff * (j - centre)) * w * w;
        sum += taps[j];
    }
    if (std::abs(sum) < 1e-12)
        throw ResampleError("degenerate resampler filter for " +
                            std::to_string(inputRate_) + "Hz -> " +
                            std::to_string(outputRate_) + "Hz");

    filterSpectrum_.assign(2 * n, Fft::Complex(0.0, 0.0));
    for (int j = 0; j <= n; j++)
        filterSpectrum_[j] = Fft::Complex(taps[j] / sum, 0.0);
    fftIn_.forward(filterSpectrum_);
}

void FftResampler::process(const double* chunk, size_t count, std::vector<double>& out) {
    if (!chunk || count != (size_t)chunkSize_)
        throw ResampleError("resampler chunk has " + std::to_string(count) +
                            " samples, expected " + std::to_string(chunkSize_));

    for (size_t i = 0; i < count; i++) {
        if (!std::isfinite(chunk[i]))
            throw ResampleError("non-finite sample at offset " + std::to_string(i) +
                                " of chunk " + std::to_string(chunksSeen_));
    }

    pending_.insert(pending_.end(), chunk, chunk + count);
    while (pending_.size() - pendingPos_ >= (size_t)fftSizeIn_) {
        processSubChunk(&pending_[pendingPos_], out);
        pendingPos_ += fftSizeIn_;
    }

    if (pendingPos_ > 0) {
        pending_.erase(pending_.begin(), pending_.begin() + pendingPos_);
        pendingPos_ = 0;
    }
    chunksSeen_++;
}

void FftResampler::processSubChunk(const double* in, std::vector<double>& out) {
    const int nIn  = fftSizeIn_;
    const int nOut = fftSizeOut_;

    for (int i = 0; i < nIn; i++)
        specIn_[i] = Fft::Complex(in[i], 0.0);
    std::fill(specIn_.begin() + nIn, specIn_.end(), Fft::Complex(0.0, 0.0));

    fftIn_.forward(specIn_);
    for (int k = 0; k < 2 * nIn; k++)
        specIn_[k] *= filterSpectrum_[k];

    // Keep the shared band; the filter has already removed everything
    // above it, so the Nyquist bins are left at zero.
    std::fill(specOut_.begin(), specOut_.end(), Fft::Complex(0.0, 0.0));
    const int shared = std::min(nIn, nOut);
    specOut_[0] = specIn_[0];
    for (int k = 1; k < shared; k++) {
        specOut_[k]            = specIn_[k];
        specOut_[2 * nOut - k] = specIn_[2 * nIn - k];
    }

    fftOut_.inverse(specOut_);

    // Inverse over 2·nOut points of a 2·nIn-point spectrum scales the
    // signal by nIn/nOut.
    const double scale = (double)nOut / nIn;
    for (int i = 0; i < nOut; i++) {
        out.push_back(specOut_[i].real() * scale + overlap_[i]);
        overlap_[i] = specOut_[nOut + i].real() * scale;
    }
}

// ── Resampler ────────────────────────────────────────────────────────────

int Resampler::detectRate(size_t sampleCount, double elapsedSecs) {
    if (elapsedSecs <= 0.0) return 0;
    return (int)std::lround((double)sampleCount / elapsedSecs);
}

bool Resampler::needsResample(int sourceRateHz, int targetRateHz) const {
    return std::abs(sourceRateHz - targetRateHz) > options_.skipToleranceHz;
}

size_t Resampler::expectedLength(size_t inputLength, int fromRateHz, int toRateHz) {
    if (fromRateHz <= 0 || toRateHz <= 0) return inputLength;
    return (size_t)std::llround((double)inputLength * toRateHz / fromRateHz);
}

std::vector<float> Resampler::linearRange(const std::vector<float>& samples,
                                          double ratio,
                                          size_t firstIndex, size_t lastIndex) {
    std::vector<float> out;
    if (samples.empty() || lastIndex <= firstIndex) return out;

    out.reserve(lastIndex - firstIndex);
    const size_t n = samples.size();
    for (size_t i = firstIndex; i < lastIndex; i++) {
        double srcPos = (double)i * ratio;
        size_t srcIdx = (size_t)srcPos;
        float  frac   = (float)(srcPos - (double)srcIdx);

        if (srcIdx + 1 < n)
            out.push_back(samples[srcIdx] * (1.0f - frac) + samples[srcIdx + 1] * frac);
        else
            out.push_back(samples[std::min(srcIdx, n - 1)]);
    }
    return out;
}

std::vector<float> Resampler::linear(const std::vector<float>& samples,
                                     int fromRateHz, int toRateHz) {
    if (fromRateHz <= 0 || toRateHz <= 0) return samples;
    double ratio = (double)fromRateHz / toRateHz;
    return linearRange(samples, ratio, 0,
                       expectedLength(samples.size(), fromRateHz, toRateHz));
}

Resampler::Result Resampler::resample(const std::vector<float>& samples,
                                      int sourceRateHz, int targetRateHz) const {
    Result r;
    r.sourceRateHz = sourceRateHz;
    r.targetRateHz = targetRateHz;

    if (samples.empty() || sourceRateHz <= 0 || targetRateHz <= 0 ||
        !needsResample(sourceRateHz, targetRateHz)) {
        r.samples = samples;
        r.method  = Method::Skipped;
        return r;
    }

    const size_t expected = expectedLength(samples.size(), sourceRateHz, targetRateHz);
    const double ratio    = (double)sourceRateHz / targetRateHz;

    std::vector<double> produced;
    size_t delay = 0;
    size_t usable = 0;
    bool   constructed = false;

    try {
        FftResampler fr(sourceRateHz, targetRateHz,
                        options_.chunkSize, options_.subChunks);
        constructed = true;
        delay = fr.outputDelay();

        const size_t chunk = (size_t)fr.chunkSize();
        const size_t need  = delay + expected;
        produced.reserve(need + fr.fftSizeOut());

        auto usableNow = [&]() {
            return produced.size() > delay
                ? std::min(produced.size() - delay, expected) : (size_t)0;
        };

        std::vector<double> buf(chunk);
        for (size_t pos = 0; pos < samples.size(); pos += chunk) {
            size_t len = std::min(chunk, samples.size() - pos);
            for (size_t i = 0; i < len; i++)
                buf[i] = samples[pos + i];
            std::fill(buf.begin() + len, buf.end(), 0.0);

            fr.process(buf.data(), chunk, produced);
            usable = usableNow();
        }

        // Flush the filter tail with silence until the delayed output
        // covers the whole input.
        std::fill(buf.begin(), buf.end(), 0.0);
        size_t maxFlush = 2 + ((need / fr.fftSizeOut() + 2) * (size_t)fr.fftSizeIn()) / chunk;
        size_t flushed = 0;
        while (produced.size() < need) {
            if (++flushed > maxFlush)
                throw ResampleError("resampler flush did not reach " +
                                    std::to_string(need) + " samples");
            fr.process(buf.data(), chunk, produced);
            usable = usableNow();
        }

        r.method = Method::Sinc;
    } catch (const ResampleError& e) {
        if (!constructed) {
            spdlog::warn("Resampler init failed: {}, using linear fallback", e.what());
            r.method = Method::Linear;
            usable = 0;
        } else {
            spdlog::warn("Resample error: {}, using linear fallback for the "
                         "remaining {} samples", e.what(), expected - usable);
            r.method = usable > 0 ? Method::SincThenLinear : Method::Linear;
        }
    } catch (const std::exception& e) {
        // Fft rejects malformed plans with std::invalid_argument.
        spdlog::warn("Resampler failed: {}, using linear fallback", e.what());
        r.method = usable > 0 ? Method::SincThenLinear : Method::Linear;
    }

    r.samples.reserve(expected);
    for (size_t i = 0; i < usable; i++)
        r.samples.push_back((float)produced[delay + i]);
    r.sincSamples = usable;

    if (usable < expected) {
        auto tail = linearRange(samples, ratio, usable, expected);
        r.samples.insert(r.samples.end(), tail.begin(), tail.end());
    }

    return r;
}

Resampler::Result Resampler::finalize(const std::vector<float>& samples,
                                      double elapsedSecs, int targetRateHz) const {
    int detected = detectRate(samples.size(), elapsedSecs);
    if (detected <= 0) {
        if (!samples.empty())
            spdlog::warn("Capture duration {:.3f}s too short to measure the "
                         "source rate, assuming {}Hz", elapsedSecs, targetRateHz);
        detected = targetRateHz;
    }

    if (!samples.empty() && needsResample(detected, targetRateHz))
        spdlog::info("Resampling {}Hz -> {}Hz", detected, targetRateHz);

    return resample(samples, detected, targetRateHz);
}

const char* Resampler::methodName(Method m) {
    switch (m) {
        case Method::Skipped:        return "skipped";
        case Method::Sinc:           return "sinc";
        case Method::SincThenLinear: return "sinc+linear";
        case Method::Linear:         return "linear";
    }
    return "unknown";
}
