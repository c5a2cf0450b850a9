#include "audio/Downmixer.hpp"

void Downmixer::toMonoInto(const float* interleaved, size_t count,
                           std::vector<float>& out) {
    out.clear();
    if (!interleaved || count == 0) return;

    out.reserve(count / 2 + 1);
    size_t pairs = count / 2;
    for (size_t i = 0; i < pairs; i++)
        out.push_back((interleaved[2 * i] + interleaved[2 * i + 1]) / 2.0f);

    if (count % 2 != 0)
        out.push_back(interleaved[count - 1]);
}

std::vector<float> Downmixer::toMono(const std::vector<float>& interleaved) {
    std::vector<float> out;
    toMonoInto(interleaved.data(), interleaved.size(), out);
    return out;
}

void Downmixer::mixInto(const float* samples, size_t count, int channels,
                        std::vector<float>& out) {
    if (channels == 2) {
        toMonoInto(samples, count, out);
        return;
    }
    out.assign(samples, samples + count);
}
