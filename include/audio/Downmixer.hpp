#pragma once
#include <cstddef>
#include <vector>

// Stereo → mono by averaging each interleaved (L, R) pair.
// An odd trailing sample has no partner and is passed through unchanged.
class Downmixer {
public:
    // Runs once per frame callback: writes into `out` (cleared first) and
    // reuses its capacity.
    static void toMonoInto(const float* interleaved, size_t count,
                           std::vector<float>& out);

    static std::vector<float> toMono(const std::vector<float>& interleaved);

    // Dispatch on channel count: 2 → average pairs, anything else → copy.
    static void mixInto(const float* samples, size_t count, int channels,
                        std::vector<float>& out);
};
