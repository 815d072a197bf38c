#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Model {
        std::string size = "small";           // tiny, base, small, medium, large-v2, large-v3
        std::string device = "cuda";          // "cuda" or "cpu"
        std::string compute_type = "float16"; // "float16", "int8_float16", "int8"
        std::string models_dir = "models";
        std::string path;                     // explicit model file, overrides size/models_dir
        int threads = 4;
        int gpu_device = 0;
    } model;

    struct Decode {
        std::string language = "ja"; // "auto" to detect
        int beam_size = 5;
        int best_of = 5;
        bool vad_filter = true;
        std::string vad_model_path;
        float vad_threshold = 0.5f;
        int min_silence_duration_ms = 1000;
        int speech_pad_ms = 400;
        std::string initial_prompt =
            "以下は、マイクからの入力音声に対する、ノイズを除去した日本語の文字起こしです。";
        float no_speech_threshold = 0.6f;
        bool condition_on_previous_text = false;
    } decode;

    struct Server {
        std::string host = "127.0.0.1";
        uint16_t port = 5001;
        size_t max_body_bytes = 64 * 1024 * 1024;
        int read_timeout_s = 30;
        std::string temp_dir; // empty = system temp directory
    } server;

    // Phrases whisper emits on silence. A transcript containing any of them is dropped.
    std::vector<std::string> hallucinations = {
        "ご視聴ありがとうございました",
        "チャンネル登録",
        "高評価",
        "Subtitles by",
        "Amara.org",
    };

    static Config load(const std::string& path);
    static Config load_default();

    // Overlay WHISPER_* environment variables.
    void apply_env();
};
