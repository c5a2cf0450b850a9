#pragma once
#include "audio/Fft.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Resampler construction or chunk processing failed. Caught inside
// Resampler::resample() and recovered with linear interpolation.
class ResampleError : public std::runtime_error {
public:
    explicit ResampleError(const std::string& what) : std::runtime_error(what) {}
};

// Chunked frequency-domain sinc resampler, single channel, double precision.
//
// Every process() call takes exactly chunkSize input samples. Internally the
// input is cut into sub-chunks of fftSizeIn samples; each sub-chunk is
// zero-padded to 2·fftSizeIn, transformed, multiplied by the spectrum of a
// windowed-sinc low-pass, truncated or zero-extended to 2·fftSizeOut bins,
// transformed back, and overlap-added into the output. The fftSizeIn/fftSizeOut
// pair is the smallest multiple of the reduced rate ratio that yields about
// chunkSize/subChunks input samples per sub-chunk.
//
// Output lags input by outputDelay() samples (half the filter length).
class FftResampler {
public:
    static constexpr int maxFftSizeIn = 1 << 18;

    // Throws ResampleError for non-positive rates or parameters, or when the
    // rate pair reduces to an FFT size above maxFftSizeIn.
    FftResampler(int inputRate, int outputRate, int chunkSize, int subChunks);

    // Feed exactly chunkSize() samples; appends whatever output is ready.
    // Throws ResampleError on a wrong-sized or non-finite chunk.
    void process(const double* chunk, size_t count, std::vector<double>& out);

    int    chunkSize() const { return chunkSize_; }
    int    fftSizeIn() const { return fftSizeIn_; }
    int    fftSizeOut() const { return fftSizeOut_; }
    size_t outputDelay() const { return (size_t)fftSizeOut_ / 2; }

private:
    // {fftSizeIn, fftSizeOut} for the rate pair; throws ResampleError.
    static std::pair<int, int> planFftSizes(int inputRate, int outputRate,
                                            int chunkSize, int subChunks);

    FftResampler(int inputRate, int outputRate, int chunkSize,
                 std::pair<int, int> fftSizes);

    void buildFilter();
    void processSubChunk(const double* in, std::vector<double>& out);

    int inputRate_;
    int outputRate_;
    int chunkSize_;
    int fftSizeIn_;
    int fftSizeOut_;

    Fft fftIn_;
    Fft fftOut_;

    std::vector<Fft::Complex> filterSpectrum_;  // 2·fftSizeIn bins
    std::vector<Fft::Complex> specIn_;
    std::vector<Fft::Complex> specOut_;
    std::vector<double>       overlap_;         // fftSizeOut samples
    std::vector<double>       pending_;         // input not yet consumed
    size_t                    pendingPos_ = 0;
    int                       chunksSeen_ = 0;
};

// Converts a captured mono buffer to the target rate.
//
// The source rate is measured (sample count / wall-clock seconds), not taken
// from the device. Rates within skipToleranceHz of the target pass through
// untouched. Otherwise FftResampler runs chunk by chunk; if it cannot be built
// or a chunk fails, linear interpolation produces the rest of the output.
class Resampler {
public:
    struct Options {
        int chunkSize       = 1024;
        int subChunks       = 2;
        int skipToleranceHz = 1000;
    };

    enum class Method {
        Skipped,        // already close enough to the target rate
        Sinc,           // FftResampler end to end
        SincThenLinear, // FftResampler failed mid-buffer, linear for the rest
        Linear          // FftResampler could not be constructed
    };

    struct Result {
        std::vector<float> samples;
        int    sourceRateHz = 0;
        int    targetRateHz = 0;
        Method method       = Method::Skipped;
        size_t sincSamples  = 0;   // output samples produced by FftResampler
    };

    Resampler() = default;
    explicit Resampler(const Options& options) : options_(options) {}

    // round(sampleCount / elapsedSecs); 0 when elapsedSecs is not positive.
    static int detectRate(size_t sampleCount, double elapsedSecs);

    bool needsResample(int sourceRateHz, int targetRateHz) const;

    Result resample(const std::vector<float>& samples,
                    int sourceRateHz, int targetRateHz) const;

    // Rate detection + resample, the post-capture finalization step.
    Result finalize(const std::vector<float>& samples, double elapsedSecs,
                    int targetRateHz) const;

    // Plain linear interpolation, output index i reads source position
    // i·(from/to). Output samples [firstIndex, lastIndex) only.
    static std::vector<float> linearRange(const std::vector<float>& samples,
                                          double ratio,
                                          size_t firstIndex, size_t lastIndex);

    static std::vector<float> linear(const std::vector<float>& samples,
                                     int fromRateHz, int toRateHz);

    // round(inputLength · to / from)
    static size_t expectedLength(size_t inputLength, int fromRateHz, int toRateHz);

    static const char* methodName(Method m);

    const Options& options() const { return options_; }

private:
    Options options_;
};
