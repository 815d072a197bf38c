#pragma once

#include "hallucination_filter.hpp"
#include "whisper/engine.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>

struct Transcription {
    std::string text;
    std::string language;
    std::optional<double> language_probability;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Bytes-in, transcript-out pipeline shared by the CLI and the server:
// size check, temp-file bridge to the engine, segment join, hallucination filter.
class Transcriber {
public:
    // filter may be null to return the engine's text as-is.
    Transcriber(SpeechEngine& engine, const HallucinationFilter* filter,
                std::string temp_dir = {});

    std::expected<Transcription, std::string> transcribe(std::span<const uint8_t> wav_bytes);

private:
    SpeechEngine& engine_;
    const HallucinationFilter* filter_;
    std::string temp_dir_;
};

// Concatenates segments without a separator and trims surrounding whitespace.
std::string join_segments(const std::vector<std::string>& segments);
