#include "audio/Fft.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

Fft::Fft(int size)
    : n_(size)
    , m_(0)
{
    if (size <= 0)
        throw std::invalid_argument("FFT size must be positive, got " +
                                    std::to_string(size));

    m_ = powerOfTwo(n_) ? n_ : nextPowerOfTwo(2 * n_ - 1);

    twiddles_.resize(m_ / 2 > 0 ? m_ / 2 : 1);
    for (int k = 0; k < (int)twiddles_.size(); k++) {
        double angle = -2.0 * M_PI * k / m_;
        twiddles_[k] = Complex(std::cos(angle), std::sin(angle));
    }

    if (isPowerOfTwo()) return;

    // Bluestein: X_k = w_k · Σ (x_j w_j) conj(w_{k-j}),  w_k = e^{-πik²/n}
    // k² is reduced mod 2n before scaling to keep the angle accurate.
    chirp_.resize(n_);
    const long long period = 2LL * n_;
    for (int k = 0; k < n_; k++) {
        long long k2 = ((long long)k * k) % period;
        double angle = -M_PI * (double)k2 / n_;
        chirp_[k] = Complex(std::cos(angle), std::sin(angle));
    }

    chirpSpectrum_.assign(m_, Complex(0.0, 0.0));
    chirpSpectrum_[0] = std::conj(chirp_[0]);
    for (int k = 1; k < n_; k++) {
        chirpSpectrum_[k]      = std::conj(chirp_[k]);
        chirpSpectrum_[m_ - k] = std::conj(chirp_[k]);
    }
    radix2(chirpSpectrum_.data(), m_, false);

    work_.resize(m_);
}

int Fft::nextPowerOfTwo(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

void Fft::forward(std::vector<Complex>& data) const {
    if ((int)data.size() != n_)
        throw std::invalid_argument("FFT input has " + std::to_string(data.size()) +
                                    " points, plan expects " + std::to_string(n_));
    if (isPowerOfTwo())
        radix2(data.data(), n_, false);
    else
        bluestein(data);
}

void Fft::inverse(std::vector<Complex>& data) const {
    // ifft(x) = conj(fft(conj(x))) / n
    for (auto& c : data) c = std::conj(c);
    forward(data);
    const double scale = 1.0 / n_;
    for (auto& c : data) c = std::conj(c) * scale;
}

void Fft::radix2(Complex* data, int n, bool inverse) const {
    // Bit-reversal permutation
    int j = 0;
    for (int i = 0; i < n - 1; i++) {
        if (i < j)
            std::swap(data[i], data[j]);
        int m = n >> 1;
        while (m >= 1 && j >= m) {
            j -= m;
            m >>= 1;
        }
        j += m;
    }

    // Butterflies. Twiddle table is built for m_; stride into it for
    // smaller stages.
    for (int step = 2; step <= n; step <<= 1) {
        int halfStep = step >> 1;
        int stride = m_ / step;

        for (int group = 0; group < n; group += step) {
            for (int pair = 0; pair < halfStep; pair++) {
                Complex w = twiddles_[pair * stride];
                if (inverse) w = std::conj(w);

                int even = group + pair;
                int odd  = even + halfStep;

                Complex t = w * data[odd];
                data[odd]  = data[even] - t;
                data[even] += t;
            }
        }
    }
}

void Fft::bluestein(std::vector<Complex>& data) const {
    std::fill(work_.begin(), work_.end(), Complex(0.0, 0.0));
    for (int k = 0; k < n_; k++)
        work_[k] = data[k] * chirp_[k];

    radix2(work_.data(), m_, false);
    for (int k = 0; k < m_; k++)
        work_[k] *= chirpSpectrum_[k];
    radix2(work_.data(), m_, true);

    const double scale = 1.0 / m_;
    for (int k = 0; k < n_; k++)
        data[k] = work_[k] * scale * chirp_[k];
}
