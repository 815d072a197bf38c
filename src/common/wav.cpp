#include "wav.hpp"

#include <algorithm>
#include <format>
#include <string_view>

namespace wav {

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string_view tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

std::expected<Format, std::string> parse_format(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || tag(bytes.data()) != "RIFF" || tag(bytes.data() + 8) != "WAVE") {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Format fmt;
    bool have_fmt = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        auto id = tag(bytes.data() + pos);
        size_t size = read_u32(bytes.data() + pos + 4);
        size_t body = pos + 8;

        if (id == "fmt ") {
            if (size < 16 || body + 16 > bytes.size()) {
                return std::unexpected("truncated fmt chunk");
            }
            fmt.audio_format = read_u16(bytes.data() + body);
            fmt.channels = read_u16(bytes.data() + body + 2);
            fmt.sample_rate = read_u32(bytes.data() + body + 4);
            fmt.bits_per_sample = read_u16(bytes.data() + body + 14);
            // WAVE_FORMAT_EXTENSIBLE: the real format code leads the subformat GUID.
            if (fmt.audio_format == 0xFFFE && size >= 40 && body + 26 <= bytes.size()) {
                fmt.audio_format = read_u16(bytes.data() + body + 24);
            }
            have_fmt = true;
        } else if (id == "data") {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            fmt.data_offset = body;
            // Streaming writers leave the size at 0 or 0xFFFFFFFF; read to the end.
            size_t rest = bytes.size() - body;
            fmt.data_size = (size == 0 || size > rest) ? rest : size;
            return fmt;
        }

        // Chunks are padded to even sizes.
        pos = body + size + (size & 1);
    }

    return std::unexpected(have_fmt ? "missing data chunk" : "missing fmt chunk");
}

std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    auto fmt = parse_format(bytes);
    if (!fmt) return std::unexpected(fmt.error());

    if (fmt->channels == 0) return std::unexpected("invalid channel count 0");
    if (fmt->sample_rate == 0) return std::unexpected("invalid sample rate 0");

    bool is_int16 = fmt->audio_format == 1 && fmt->bits_per_sample == 16;
    bool is_float32 = fmt->audio_format == 3 && fmt->bits_per_sample == 32;
    if (!is_int16 && !is_float32) {
        return std::unexpected(std::format("unsupported WAV encoding (format {}, {} bits)",
                                           fmt->audio_format, fmt->bits_per_sample));
    }

    size_t bytes_per_sample = fmt->bits_per_sample / 8;
    size_t frame_bytes = bytes_per_sample * fmt->channels;
    size_t n_frames = fmt->data_size / frame_bytes;
    const uint8_t* data = bytes.data() + fmt->data_offset;

    Pcm pcm;
    pcm.sample_rate = fmt->sample_rate;
    pcm.channels = fmt->channels;
    pcm.samples.resize(n_frames);

    for (size_t i = 0; i < n_frames; ++i) {
        float acc = 0.0f;
        for (uint16_t c = 0; c < fmt->channels; ++c) {
            const uint8_t* p = data + i * frame_bytes + c * bytes_per_sample;
            if (is_int16) {
                int16_t s;
                std::memcpy(&s, p, 2);
                acc += static_cast<float>(s) / 32768.0f;
            } else {
                float s;
                std::memcpy(&s, p, 4);
                acc += s;
            }
        }
        pcm.samples[i] = acc / fmt->channels;
    }

    return pcm;
}

} // namespace wav
