#pragma once

#include "../config.hpp"
#include "../wav.hpp"
#include "device.hpp"
#include "engine.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <string>

struct whisper_context;

// Decoded audio plus the output fields known before inference runs.
struct PreparedInput {
    wav::Pcm pcm;
    EngineOutput out;
    bool detect_language = false;
};

// Everything transcribe() checks before touching the model: WAV decoding, the
// 16 kHz requirement, and the language. A forced language is reported with
// probability 1.0; "auto" (or empty) leaves both for detection.
std::expected<PreparedInput, std::string> prepare_input(std::span<const uint8_t> wav_bytes,
                                                        const std::string& language);

// whisper.cpp model loaded once and shared by every request. whisper_full is
// not reentrant on a context, so transcribe() calls are serialized.
class WhisperEngine : public SpeechEngine {
public:
    static std::expected<std::unique_ptr<WhisperEngine>, std::string>
        load(const Config::Model& model, const Config::Decode& decode,
             const DeviceSelection& device);

    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::expected<EngineOutput, std::string> transcribe(const std::string& wav_path) override;
    EngineInfo info() const override { return info_; }

private:
    WhisperEngine(whisper_context* ctx, Config::Model model, Config::Decode decode,
                  EngineInfo info);

    whisper_context* ctx_ = nullptr;
    Config::Model model_;
    Config::Decode decode_;
    EngineInfo info_;
    std::mutex mutex_;
};
