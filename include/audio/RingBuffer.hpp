#pragma once
#include <vector>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <type_traits>

// Lock-free single-producer single-consumer ring buffer.
// Producer: PortAudio callback thread (real-time safe: no allocs, no locks).
// Consumer: the capture run loop thread.
//
// T must be trivially copyable; PortAudioCapture instantiates it with
// uint8_t to carry raw frame bytes in whatever sample format was negotiated.
template <typename T>
class RingBuffer {
    static_assert(std::is_trivially_copyable<T>::value,
                  "RingBuffer element must be trivially copyable");

public:
    explicit RingBuffer(size_t capacity = 8192)
        : buf_(capacity), capacity_(capacity) {}

    // Producer: write elements. Returns how many fit; the rest are dropped.
    size_t write(const T* data, size_t count) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        size_t space = capacity_ - (wr - rd);
        size_t toWrite = std::min(count, space);
        if (toWrite == 0) return 0;

        size_t wrIdx = wr % capacity_;
        size_t firstChunk = std::min(toWrite, capacity_ - wrIdx);
        std::memcpy(&buf_[wrIdx], data, firstChunk * sizeof(T));

        if (toWrite > firstChunk) {
            std::memcpy(&buf_[0], data + firstChunk,
                        (toWrite - firstChunk) * sizeof(T));
        }

        writePos_.store(wr + toWrite, std::memory_order_release);
        return toWrite;
    }

    // Consumer: read up to count elements into out
    size_t read(T* out, size_t count) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);

        size_t toRead = std::min(count, wr - rd);
        if (toRead == 0) return 0;

        size_t rdIdx = rd % capacity_;
        size_t firstChunk = std::min(toRead, capacity_ - rdIdx);
        std::memcpy(out, &buf_[rdIdx], firstChunk * sizeof(T));

        if (toRead > firstChunk) {
            std::memcpy(out + firstChunk, &buf_[0],
                        (toRead - firstChunk) * sizeof(T));
        }

        readPos_.store(rd + toRead, std::memory_order_release);
        return toRead;
    }

    // Producer: write only as many whole records of `unit` elements as fit.
    // Returns elements written, always a multiple of unit.
    size_t writeWhole(const T* data, size_t count, size_t unit) {
        if (unit == 0) return 0;
        size_t fits = std::min(count, space());
        fits -= fits % unit;
        return fits > 0 ? write(data, fits) : 0;
    }

    // Consumer: read up to count elements, rounded down to whole records of
    // `unit` elements. A record is never split across two reads.
    size_t readWhole(T* out, size_t count, size_t unit) {
        if (unit == 0) return 0;
        size_t wanted = std::min(count, available());
        wanted -= wanted % unit;
        return wanted > 0 ? read(out, wanted) : 0;
    }

    size_t space() const {
        return capacity_ - (writePos_.load(std::memory_order_relaxed)
                            - readPos_.load(std::memory_order_acquire));
    }

    size_t available() const {
        return writePos_.load(std::memory_order_acquire)
             - readPos_.load(std::memory_order_relaxed);
    }

    size_t capacity() const { return capacity_; }

    // Only safe while neither side is active.
    void reset() {
        writePos_.store(0, std::memory_order_relaxed);
        readPos_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<T> buf_;
    size_t capacity_;
    std::atomic<size_t> writePos_{0};
    std::atomic<size_t> readPos_{0};
};
