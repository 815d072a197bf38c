#include "transcriber.hpp"

#include "temp_file.hpp"
#include "wav.hpp"

#include <chrono>
#include <exception>
#include <print>

Transcriber::Transcriber(SpeechEngine& engine, const HallucinationFilter* filter,
                         std::string temp_dir)
    : engine_(engine), filter_(filter), temp_dir_(std::move(temp_dir)) {}

std::expected<Transcription, std::string>
Transcriber::transcribe(std::span<const uint8_t> wav_bytes) {
    if (wav_bytes.size() < wav::kHeaderBytes) {
        return std::unexpected("Invalid WAV data (too short)");
    }

    auto tmp = TempFile::create(temp_dir_, ".wav");
    if (!tmp) return std::unexpected(tmp.error());

    if (auto written = tmp->write_all(wav_bytes); !written) {
        return std::unexpected(written.error());
    }

    auto start = std::chrono::steady_clock::now();

    std::expected<EngineOutput, std::string> out;
    try {
        out = engine_.transcribe(tmp->path());
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }

    auto end = std::chrono::steady_clock::now();

    if (!out) return std::unexpected(out.error());

    std::string text = join_segments(out->segments);
    if (filter_) {
        auto hit = filter_->find_match(text);
        if (!hit.empty()) {
            std::println(stderr, "[kikitori] Dropping hallucinated transcript (matched \"{}\")", hit);
            text.clear();
        }
    }

    return Transcription{
        .text = std::move(text),
        .language = std::move(out->language),
        .language_probability = out->language_probability,
        .duration_s = out->duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}

std::string join_segments(const std::vector<std::string>& segments) {
    std::string text;
    for (auto& s : segments) text += s;

    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}
