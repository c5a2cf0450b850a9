#include "audio/PcmDecoder.hpp"
#include <cstring>

namespace {

bool hostIsLittleEndian() {
    const uint16_t probe = 1;
    uint8_t first;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

float readFloatLE(const uint8_t* p) {
    uint32_t bits = (uint32_t)p[0]
                  | ((uint32_t)p[1] << 8)
                  | ((uint32_t)p[2] << 16)
                  | ((uint32_t)p[3] << 24);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

int16_t readInt16LE(const uint8_t* p) {
    return (int16_t)((uint16_t)p[0] | ((uint16_t)p[1] << 8));
}

void decodeFloat32(const uint8_t* data, size_t byteCount, std::vector<float>& out) {
    size_t count = byteCount / 4;
    out.resize(count);
    if (hostIsLittleEndian()) {
        std::memcpy(out.data(), data, count * sizeof(float));
        return;
    }
    for (size_t i = 0; i < count; i++)
        out[i] = readFloatLE(data + i * 4);
}

void decodeInt16(const uint8_t* data, size_t byteCount, std::vector<float>& out) {
    size_t count = byteCount / 2;
    out.resize(count);
    for (size_t i = 0; i < count; i++)
        out[i] = readInt16LE(data + i * 2) / PcmDecoder::int16Scale;
}

}  // namespace

PcmDecoder::Format PcmDecoder::detect(const uint8_t* data, size_t byteCount) {
    if (!data || byteCount == 0)
        return Format::Undecodable;

    bool aligned = reinterpret_cast<uintptr_t>(data) % alignof(float) == 0;
    if (byteCount % 4 == 0 && aligned)
        return Format::Float32;
    if (byteCount % 2 == 0)
        return Format::Int16;
    return Format::Undecodable;
}

std::vector<float> PcmDecoder::decode(const uint8_t* data, size_t byteCount) {
    std::vector<float> out;
    decodeInto(data, byteCount, out);
    return out;
}

void PcmDecoder::decodeInto(const uint8_t* data, size_t byteCount,
                            std::vector<float>& out) {
    decodeAs(detect(data, byteCount), data, byteCount, out);
}

void PcmDecoder::decodeAs(Format format, const uint8_t* data, size_t byteCount,
                          std::vector<float>& out) {
    out.clear();
    if (!data) return;

    switch (format) {
        case Format::Float32:
            if (byteCount % 4 == 0)
                decodeFloat32(data, byteCount, out);
            break;
        case Format::Int16:
            if (byteCount % 2 == 0)
                decodeInt16(data, byteCount, out);
            break;
        case Format::Undecodable:
            break;
    }
}

const char* PcmDecoder::formatName(Format format) {
    switch (format) {
        case Format::Float32:     return "f32le";
        case Format::Int16:       return "s16le";
        case Format::Undecodable: return "undecodable";
    }
    return "unknown";
}
