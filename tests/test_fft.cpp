#include <gtest/gtest.h>
#include "audio/Fft.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using Complex = Fft::Complex;

namespace {

std::vector<Complex> directDft(const std::vector<Complex>& x) {
    const size_t n = x.size();
    std::vector<Complex> out(n);
    for (size_t k = 0; k < n; k++) {
        Complex sum(0.0, 0.0);
        for (size_t j = 0; j < n; j++) {
            double angle = -2.0 * M_PI * (double)(k * j % n) / n;
            sum += x[j] * Complex(std::cos(angle), std::sin(angle));
        }
        out[k] = sum;
    }
    return out;
}

std::vector<Complex> testSignal(int n) {
    std::vector<Complex> x(n);
    for (int i = 0; i < n; i++)
        x[i] = Complex(std::sin(0.37 * i) + 0.25 * (i % 3), 0.1 * std::cos(1.3 * i));
    return x;
}

}  // namespace

class FftSizeTest : public ::testing::TestWithParam<int> {};

TEST_P(FftSizeTest, MatchesDirectDft) {
    const int n = GetParam();
    auto x = testSignal(n);
    auto expected = directDft(x);

    Fft fft(n);
    fft.forward(x);

    for (int k = 0; k < n; k++) {
        EXPECT_NEAR(x[k].real(), expected[k].real(), 1e-8) << "bin " << k;
        EXPECT_NEAR(x[k].imag(), expected[k].imag(), 1e-8) << "bin " << k;
    }
}

TEST_P(FftSizeTest, InverseRestoresInput) {
    const int n = GetParam();
    auto original = testSignal(n);
    auto x = original;

    Fft fft(n);
    fft.forward(x);
    fft.inverse(x);

    for (int i = 0; i < n; i++) {
        EXPECT_NEAR(x[i].real(), original[i].real(), 1e-9);
        EXPECT_NEAR(x[i].imag(), original[i].imag(), 1e-9);
    }
}

// Powers of two take the radix-2 path; the rest go through Bluestein.
INSTANTIATE_TEST_SUITE_P(Sizes, FftSizeTest,
                         ::testing::Values(1, 2, 8, 64, 3, 7, 12, 90, 340));

TEST(FftTest, PowerOfTwoDetection) {
    EXPECT_TRUE(Fft(1024).isPowerOfTwo());
    EXPECT_FALSE(Fft(1020).isPowerOfTwo());
    EXPECT_EQ(Fft::nextPowerOfTwo(1019), 1024);
    EXPECT_EQ(Fft::nextPowerOfTwo(1024), 1024);
}

TEST(FftTest, RejectsBadSizes) {
    EXPECT_THROW(Fft(0), std::invalid_argument);

    Fft fft(8);
    std::vector<Complex> wrong(7);
    EXPECT_THROW(fft.forward(wrong), std::invalid_argument);
}

TEST(FftTest, SineLandsInItsBin) {
    const int n = 96;
    std::vector<Complex> x(n);
    for (int i = 0; i < n; i++)
        x[i] = Complex(std::cos(2.0 * M_PI * 5 * i / n), 0.0);

    Fft(n).forward(x);
    EXPECT_NEAR(std::abs(x[5]), n / 2.0, 1e-8);
    EXPECT_NEAR(std::abs(x[n - 5]), n / 2.0, 1e-8);
    EXPECT_NEAR(std::abs(x[6]), 0.0, 1e-8);
}
