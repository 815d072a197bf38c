#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct EngineOutput {
    std::vector<std::string> segments; // in playback order
    std::string language;
    std::optional<double> language_probability;
    double duration_s = 0.0;
};

struct EngineInfo {
    std::string model;
    std::string device;
    std::string compute_type;
};

// Speech-to-text runtime. Implementations take a path to a WAV file.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<EngineOutput, std::string> transcribe(const std::string& wav_path) = 0;
    virtual EngineInfo info() const = 0;
};
