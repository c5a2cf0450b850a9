#pragma once
#include <vector>
#include <cstddef>
#include <cstring>
#include <utility>

// Append-only mono sample buffer for one capture session.
// Pre-sized to targetRate × expectedSecs so the frame callback path does not
// reallocate in the common case; growth past that is allowed, never an error.
class SampleAccumulator {
public:
    static constexpr int defaultExpectedSecs = 30;

    // expectedSecs <= 0 means "unbounded / unknown" → defaultExpectedSecs.
    SampleAccumulator(int targetRateHz, int expectedSecs)
        : initialCapacity_(capacityFor(targetRateHz, expectedSecs)) {
        buf_.reserve(initialCapacity_);
    }

    static size_t capacityFor(int targetRateHz, int expectedSecs) {
        if (targetRateHz <= 0) return 0;
        int secs = expectedSecs > 0 ? expectedSecs : defaultExpectedSecs;
        return (size_t)targetRateHz * (size_t)secs;
    }

    void append(const float* data, size_t count) {
        if (!data || count == 0) return;
        size_t old = buf_.size();
        if (old + count > buf_.capacity())
            grows_++;
        buf_.resize(old + count);
        std::memcpy(&buf_[old], data, count * sizeof(float));
    }

    void append(const std::vector<float>& samples) {
        append(samples.data(), samples.size());
    }

    // Copy of everything accumulated so far; the buffer is left intact.
    std::vector<float> snapshot() const { return buf_; }

    // Hands the buffer over once the session is finished with it.
    std::vector<float> release() { return std::move(buf_); }

    size_t size() const { return buf_.size(); }
    bool   empty() const { return buf_.empty(); }
    size_t capacity() const { return buf_.capacity(); }
    size_t initialCapacity() const { return initialCapacity_; }

    // Appends that had to reallocate past the current capacity.
    int growCount() const { return grows_; }

private:
    std::vector<float> buf_;
    size_t initialCapacity_;
    int grows_ = 0;
};
