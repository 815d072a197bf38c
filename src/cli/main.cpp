#include "config.hpp"
#include "hallucination_filter.hpp"
#include "result_json.hpp"
#include "transcriber.hpp"
#include "wav.hpp"
#include "whisper/device.hpp"
#include "whisper/remote_engine.hpp"
#include "whisper/whisper_engine.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <iterator>
#include <memory>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] < audio.wav", prog);
    std::println(stderr, "Transcribes WAV data from stdin and prints one JSON line.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -s, --server URL    Send audio to a running kikitori-server instead of");
    std::println(stderr, "                      loading the model locally");
    std::println(stderr, "  --filter            Drop known hallucinated phrases");
    std::println(stderr, "  -v, --verbose       Log progress to stderr");
    std::println(stderr, "  -h, --help          Show this help");
}

static void emit(const nlohmann::json& j) {
    std::println("{}", dump_json(j));
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool filter_enabled = false;
    std::string config_path;
    std::string server_url;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--filter") {
            filter_enabled = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--server" || arg == "-s") && i + 1 < argc) {
            server_url = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown or incomplete option: {}", arg);
            usage(argv[0]);
            return 2;
        }
    }

    std::vector<uint8_t> wav_data((std::istreambuf_iterator<char>(std::cin)),
                                  std::istreambuf_iterator<char>());

    // Reject before paying for a model load.
    if (wav_data.size() < wav::kHeaderBytes) {
        emit(error_json("Invalid WAV data (too short)"));
        return 0;
    }

    if (auto fmt = wav::parse_format(wav_data); fmt && fmt->sample_rate != 16000) {
        std::println(stderr, "[kikitori] Warning: sample rate {} != 16000", fmt->sample_rate);
    }

    try {
        Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
        config.apply_env();

        std::unique_ptr<SpeechEngine> engine;
        if (!server_url.empty()) {
            if (verbose) std::println(stderr, "[kikitori] Using server {}", server_url);
            engine = std::make_unique<RemoteEngine>(server_url);
        } else {
            auto device = resolve_device(config.model.device, config.model.compute_type,
                                         probe_accelerator);
            auto loaded = WhisperEngine::load(config.model, config.decode, device);
            if (!loaded) {
                emit(error_json("failed to load model: " + loaded.error()));
                return 0;
            }
            engine = std::move(*loaded);
        }

        HallucinationFilter filter(config.hallucinations);
        Transcriber transcriber(*engine, filter_enabled ? &filter : nullptr,
                                config.server.temp_dir);

        auto result = transcriber.transcribe(wav_data);
        if (verbose && result) {
            std::println(stderr, "[kikitori] {:.1f}s audio transcribed in {:.2f}s",
                         result->duration_s, result->processing_s);
        }
        emit(result_to_json(result, false));
    } catch (const std::exception& e) {
        emit(error_json(e.what()));
    }

    return 0;
}
