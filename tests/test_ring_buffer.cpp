#include <gtest/gtest.h>
#include "audio/RingBuffer.hpp"
#include <cstdint>
#include <cstring>
#include <vector>

// PortAudioCapture moves raw interleaved frames through RingBuffer<uint8_t>.
// A stereo int16 frame is 4 bytes, a mono float32 frame is 4, stereo float32 8.

static std::vector<uint8_t> frameBytes(uint8_t tag, size_t frameSize) {
    std::vector<uint8_t> f(frameSize);
    for (size_t i = 0; i < frameSize; i++) f[i] = (uint8_t)(tag * 16 + i);
    return f;
}

static std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

TEST(RingBufferTest, RawBytesSurviveWrap) {
    RingBuffer<uint8_t> buf(10);

    std::vector<uint8_t> frames = {0x01, 0x80, 0xff, 0x7f, 0x00, 0x00, 0x34, 0x12};
    ASSERT_EQ(buf.write(frames.data(), 8), 8u);

    std::vector<uint8_t> out(8);
    ASSERT_EQ(buf.read(out.data(), 4), 4u);
    ASSERT_EQ(buf.write(frames.data(), 4), 4u);   // wraps
    EXPECT_EQ(buf.available(), 8u);

    ASSERT_EQ(buf.read(out.data(), 8), 8u);
    std::vector<uint8_t> expected = {0x00, 0x00, 0x34, 0x12, 0x01, 0x80, 0xff, 0x7f};
    EXPECT_EQ(out, expected);
}

TEST(RingBufferTest, WriteWholeStoresOnlyCompleteFrames) {
    // Room for two and a half stereo int16 frames
    RingBuffer<uint8_t> buf(10);
    auto block = concat({frameBytes(1, 4), frameBytes(2, 4), frameBytes(3, 4)});

    EXPECT_EQ(buf.writeWhole(block.data(), block.size(), 4), 8u);
    EXPECT_EQ(buf.available(), 8u);
    EXPECT_EQ(buf.space(), 2u);

    // Two free bytes cannot hold a frame
    EXPECT_EQ(buf.writeWhole(block.data(), 4, 4), 0u);
    EXPECT_EQ(buf.available(), 8u);
}

TEST(RingBufferTest, ReadWholeNeverSplitsAFrame) {
    RingBuffer<uint8_t> buf(16);
    auto block = concat({frameBytes(1, 4), frameBytes(2, 4)});
    ASSERT_EQ(buf.writeWhole(block.data(), block.size(), 4), 8u);

    std::vector<uint8_t> out(16);
    EXPECT_EQ(buf.readWhole(out.data(), 6, 4), 4u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 4), frameBytes(1, 4));
    EXPECT_EQ(buf.available(), 4u);

    EXPECT_EQ(buf.readWhole(out.data(), out.size(), 4), 4u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 4), frameBytes(2, 4));
}

TEST(RingBufferTest, ReadWholeLeavesTrailingPartialFrame) {
    RingBuffer<uint8_t> buf(16);
    auto f = frameBytes(1, 8);
    ASSERT_EQ(buf.write(f.data(), 3), 3u);

    std::vector<uint8_t> out(16);
    EXPECT_EQ(buf.readWhole(out.data(), out.size(), 4), 0u);
    EXPECT_EQ(buf.available(), 3u);

    ASSERT_EQ(buf.write(f.data() + 3, 1), 1u);
    EXPECT_EQ(buf.readWhole(out.data(), out.size(), 4), 4u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 4),
              std::vector<uint8_t>(f.begin(), f.begin() + 4));
}

TEST(RingBufferTest, StereoFloatFramesStayPairedAcrossWrap) {
    RingBuffer<uint8_t> buf(20);
    auto a = frameBytes(1, 8), b = frameBytes(2, 8), c = frameBytes(3, 8);

    auto ab = concat({a, b});
    ASSERT_EQ(buf.writeWhole(ab.data(), ab.size(), 8), 16u);

    std::vector<uint8_t> out(20);
    ASSERT_EQ(buf.readWhole(out.data(), 8, 8), 8u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 8), a);

    // Frame c starts at byte 16 and wraps after 4 bytes
    ASSERT_EQ(buf.writeWhole(c.data(), c.size(), 8), 8u);
    ASSERT_EQ(buf.readWhole(out.data(), out.size(), 8), 16u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 16), concat({b, c}));
}

TEST(RingBufferTest, OverflowDropsWholeFramesOnly) {
    // 14 bytes hold three 4-byte frames; the remaining two bytes stay unused
    RingBuffer<uint8_t> buf(14);
    auto block = concat({frameBytes(1, 4), frameBytes(2, 4), frameBytes(3, 4),
                         frameBytes(4, 4), frameBytes(5, 4)});

    size_t written = buf.writeWhole(block.data(), block.size(), 4);
    EXPECT_EQ(written, 12u);
    EXPECT_EQ(block.size() - written, 8u);

    std::vector<uint8_t> out(14);
    ASSERT_EQ(buf.readWhole(out.data(), out.size(), 4), 12u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 12),
              std::vector<uint8_t>(block.begin(), block.begin() + 12));

    // Second pass starts at byte 12 and wraps mid-frame
    ASSERT_EQ(buf.writeWhole(block.data(), block.size(), 4), 12u);
    ASSERT_EQ(buf.readWhole(out.data(), out.size(), 4), 12u);
    EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 12),
              std::vector<uint8_t>(block.begin(), block.begin() + 12));
}

TEST(RingBufferTest, ZeroFrameSizeMovesNothing) {
    RingBuffer<uint8_t> buf(8);
    uint8_t data[4] = {1, 2, 3, 4};
    EXPECT_EQ(buf.writeWhole(data, 4, 0), 0u);
    ASSERT_EQ(buf.write(data, 4), 4u);
    EXPECT_EQ(buf.readWhole(data, 4, 0), 0u);
    EXPECT_EQ(buf.available(), 4u);
}

TEST(RingBufferTest, ResetDiscardsPendingFrames) {
    RingBuffer<uint8_t> buf(16);
    auto f = frameBytes(1, 4);
    buf.writeWhole(f.data(), f.size(), 4);
    buf.reset();
    EXPECT_EQ(buf.available(), 0u);
    EXPECT_EQ(buf.space(), 16u);
}

TEST(RingBufferTest, MonoFloatBlocksAtUnalignedCapacity) {
    // 30 bytes is not a multiple of the frame size, so the wrap point drifts
    RingBuffer<uint8_t> buf(30);

    for (int cycle = 0; cycle < 50; cycle++) {
        float samples[3];
        for (int i = 0; i < 3; i++) samples[i] = (float)(cycle * 3 + i) * 0.01f;
        uint8_t bytes[sizeof(samples)];
        std::memcpy(bytes, samples, sizeof(samples));

        ASSERT_EQ(buf.writeWhole(bytes, sizeof(bytes), sizeof(float)), 12u);

        uint8_t out[32];
        ASSERT_EQ(buf.readWhole(out, sizeof(out), sizeof(float)), 12u);
        float decoded[3];
        std::memcpy(decoded, out, sizeof(decoded));
        for (int i = 0; i < 3; i++)
            EXPECT_FLOAT_EQ(decoded[i], samples[i]);
    }
}
