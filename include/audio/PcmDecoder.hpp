#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Decodes raw frame bytes delivered by the audio backend into normalized
// float samples.
//
//   length % 4 == 0 and 4-byte aligned  → little-endian float32, one-to-one
//   length % 2 == 0                     → little-endian int16, divided by 32767
//   otherwise                           → empty (callback data is dropped)
//
// Channel layout is untouched; interleaved input stays interleaved.
class PcmDecoder {
public:
    enum class Format {
        Float32,
        Int16,
        Undecodable
    };

    static constexpr float int16Scale = 32767.0f;

    // Which decoding decode() would pick for this buffer.
    static Format detect(const uint8_t* data, size_t byteCount);

    static std::vector<float> decode(const uint8_t* data, size_t byteCount);

    // Same as decode(), but reuses out's capacity (out is cleared first) so
    // the frame callback stops allocating once the scratch buffer is warm.
    static void decodeInto(const uint8_t* data, size_t byteCount,
                           std::vector<float>& out);

    // Decode with a format fixed at stream-open time. The byte count alone
    // is ambiguous for int16 streams: an even number of samples is also a
    // multiple of 4 bytes.
    static void decodeAs(Format format, const uint8_t* data, size_t byteCount,
                         std::vector<float>& out);

    static const char* formatName(Format format);
};
