#pragma once

#include "../config.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>

struct DeviceSelection {
    std::string device;       // "cuda" or "cpu"
    std::string compute_type; // effective precision
    std::string accelerator;  // GPU description when device == "cuda"

    bool use_gpu() const { return device == "cuda"; }
};

struct ModelFile {
    std::string path;
    std::string compute_type; // precision of the file actually chosen
};

// Returns a description of the first GPU ggml can use, if any.
using AcceleratorProbe = std::function<std::optional<std::string>()>;

std::optional<std::string> probe_accelerator();

// "cuda" falls back to "cpu" when no GPU is present; cpu always runs int8.
DeviceSelection resolve_device(const std::string& requested_device,
                               const std::string& requested_compute,
                               const AcceleratorProbe& probe);

// Maps size + compute type to a ggml model file under models_dir, falling
// back to the unquantized file when the quantized one is not installed.
std::expected<ModelFile, std::string> resolve_model_file(const Config::Model& model,
                                                         const std::string& compute_type);

inline constexpr const char* kDefaultVadModel = "ggml-silero-v5.1.2.bin";

// Silero VAD weights: the configured path if set, else the file whisper.cpp's
// download script installs next to the models. nullopt when neither exists.
std::optional<std::string> resolve_vad_model(const Config::Model& model,
                                             const Config::Decode& decode);
