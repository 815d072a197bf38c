#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            read_field(m, "size", cfg.model.size);
            read_field(m, "device", cfg.model.device);
            read_field(m, "compute_type", cfg.model.compute_type);
            read_field(m, "models_dir", cfg.model.models_dir);
            read_field(m, "path", cfg.model.path);
            read_field(m, "threads", cfg.model.threads);
            read_field(m, "gpu_device", cfg.model.gpu_device);
        }

        if (j.contains("decode")) {
            auto& d = j["decode"];
            read_field(d, "language", cfg.decode.language);
            read_field(d, "beam_size", cfg.decode.beam_size);
            read_field(d, "best_of", cfg.decode.best_of);
            read_field(d, "vad_filter", cfg.decode.vad_filter);
            read_field(d, "vad_model_path", cfg.decode.vad_model_path);
            read_field(d, "vad_threshold", cfg.decode.vad_threshold);
            read_field(d, "min_silence_duration_ms", cfg.decode.min_silence_duration_ms);
            read_field(d, "speech_pad_ms", cfg.decode.speech_pad_ms);
            read_field(d, "initial_prompt", cfg.decode.initial_prompt);
            read_field(d, "no_speech_threshold", cfg.decode.no_speech_threshold);
            read_field(d, "condition_on_previous_text", cfg.decode.condition_on_previous_text);
        }

        if (j.contains("server")) {
            auto& s = j["server"];
            read_field(s, "host", cfg.server.host);
            read_field(s, "port", cfg.server.port);
            read_field(s, "max_body_bytes", cfg.server.max_body_bytes);
            read_field(s, "read_timeout_s", cfg.server.read_timeout_s);
            read_field(s, "temp_dir", cfg.server.temp_dir);
        }

        if (j.contains("hallucinations")) {
            cfg.hallucinations = j["hallucinations"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (auto v = env("WHISPER_MODEL")) model.size = v;
    if (auto v = env("WHISPER_DEVICE")) model.device = v;
    if (auto v = env("WHISPER_COMPUTE_TYPE")) model.compute_type = v;
    if (auto v = env("WHISPER_MODELS_DIR")) model.models_dir = v;
    if (auto v = env("WHISPER_MODEL_PATH")) model.path = v;
    if (auto v = env("WHISPER_VAD_MODEL")) decode.vad_model_path = v;

    if (auto v = env("WHISPER_PORT")) {
        std::string_view s(v);
        uint16_t p = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), p);
        if (ec == std::errc{} && ptr == s.data() + s.size() && p != 0) {
            server.port = p;
        } else {
            std::println(stderr, "config: ignoring invalid WHISPER_PORT={}", s);
        }
    }
}
