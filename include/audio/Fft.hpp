#pragma once
#include <complex>
#include <vector>

// Complex FFT of any length, double precision.
// Power-of-two sizes run the in-place radix-2 Cooley-Tukey transform directly;
// every other size goes through Bluestein's chirp-z algorithm on top of a
// power-of-two transform. Twiddles and the chirp spectrum are computed once
// per plan, so one Fft instance is meant to be reused for many blocks.
class Fft {
public:
    using Complex = std::complex<double>;

    explicit Fft(int size);

    int size() const { return n_; }
    bool isPowerOfTwo() const { return m_ == n_; }

    // In place. data.size() must equal size().
    void forward(std::vector<Complex>& data) const;

    // In place, normalized by 1/size() so inverse(forward(x)) == x.
    void inverse(std::vector<Complex>& data) const;

    static bool powerOfTwo(int n) { return n > 0 && (n & (n - 1)) == 0; }
    static int  nextPowerOfTwo(int n);

private:
    void radix2(Complex* data, int n, bool inverse) const;
    void bluestein(std::vector<Complex>& data) const;

    int n_;
    int m_;                            // radix-2 working size (== n_ if pow2)
    std::vector<Complex> twiddles_;    // e^{-2πik/m_}, k < m_/2
    std::vector<Complex> chirp_;       // e^{-πik²/n_}, Bluestein only
    std::vector<Complex> chirpSpectrum_;
    mutable std::vector<Complex> work_;
};
