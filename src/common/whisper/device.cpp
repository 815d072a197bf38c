#include "device.hpp"

#include <filesystem>
#include <ggml-backend.h>
#include <print>

namespace fs = std::filesystem;

std::optional<std::string> probe_accelerator() {
    // Builds with dynamically loaded backends start with an empty registry.
    if (ggml_backend_reg_count() == 0) ggml_backend_load_all();

    size_t n = ggml_backend_dev_count();
    for (size_t i = 0; i < n; ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        if (ggml_backend_dev_type(dev) == GGML_BACKEND_DEVICE_TYPE_GPU) {
            const char* desc = ggml_backend_dev_description(dev);
            return std::string(desc ? desc : ggml_backend_dev_name(dev));
        }
    }
    return std::nullopt;
}

DeviceSelection resolve_device(const std::string& requested_device,
                               const std::string& requested_compute,
                               const AcceleratorProbe& probe) {
    DeviceSelection sel;
    sel.device = requested_device;

    if (requested_device == "cuda" || requested_device == "gpu") {
        auto gpu = probe ? probe() : std::nullopt;
        if (gpu) {
            std::println(stderr, "[kikitori] GPU available: {}", *gpu);
            sel.device = "cuda";
            sel.accelerator = *gpu;
        } else {
            std::println(stderr, "[kikitori] GPU not available, falling back to CPU");
            sel.device = "cpu";
        }
    }

    // float16 on CPU is slow; use the int8 weights there.
    sel.compute_type = sel.device == "cpu" ? "int8" : requested_compute;
    return sel;
}

std::expected<ModelFile, std::string> resolve_model_file(const Config::Model& model,
                                                         const std::string& compute_type) {
    if (!model.path.empty()) {
        if (!fs::exists(model.path)) {
            return std::unexpected("model file not found: " + model.path);
        }
        return ModelFile{.path = model.path, .compute_type = compute_type};
    }

    std::string suffix;
    if (compute_type == "int8" || compute_type == "int8_float16") {
        suffix = "-q8_0";
    } else if (compute_type != "float16" && compute_type != "float32") {
        return std::unexpected("unknown compute type: " + compute_type);
    }

    auto dir = fs::path(model.models_dir);
    auto preferred = dir / ("ggml-" + model.size + suffix + ".bin");
    if (fs::exists(preferred)) {
        return ModelFile{.path = preferred.string(), .compute_type = compute_type};
    }

    if (!suffix.empty()) {
        auto full = dir / ("ggml-" + model.size + ".bin");
        if (fs::exists(full)) {
            std::println(stderr, "[kikitori] {} not found, using {}",
                         preferred.filename().string(), full.filename().string());
            return ModelFile{.path = full.string(), .compute_type = "float16"};
        }
    }

    return std::unexpected("model file not found: " + preferred.string());
}

std::optional<std::string> resolve_vad_model(const Config::Model& model,
                                             const Config::Decode& decode) {
    if (!decode.vad_model_path.empty()) {
        if (fs::exists(decode.vad_model_path)) return decode.vad_model_path;
        std::println(stderr, "[kikitori] VAD model not found: {}", decode.vad_model_path);
    }

    auto bundled = fs::path(model.models_dir) / kDefaultVadModel;
    if (fs::exists(bundled)) return bundled.string();
    return std::nullopt;
}
