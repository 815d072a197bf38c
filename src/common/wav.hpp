#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE helpers. encode() builds a 16-bit mono file in memory, decode()
// turns a PCM file into mono float samples for the engine.
namespace wav {

// Size of a canonical PCM header: RIFF + fmt (16 bytes) + data chunk header.
constexpr size_t kHeaderBytes = 44;

struct Format {
    uint16_t audio_format = 0; // 1 = PCM integer, 3 = IEEE float
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;
};

struct Pcm {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;     // as stored in the file
    std::vector<float> samples; // mono, [-1, 1]

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

// Walks the chunk list and locates "fmt " and "data".
std::expected<Format, std::string> parse_format(std::span<const uint8_t> bytes);

// Decodes 16-bit integer or 32-bit float PCM, averaging channels down to mono.
std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes);

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(kHeaderBytes + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + kHeaderBytes, samples.data(), data_size);
    }

    return out;
}

} // namespace wav
