#include "whisper_engine.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <vector>
#include <whisper.h>

namespace {

std::expected<std::vector<uint8_t>, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("could not open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad()) return std::unexpected("read error on " + path);
    return bytes;
}

bool is_auto_language(const std::string& lang) {
    return lang.empty() || lang == "auto";
}

} // namespace

std::expected<std::unique_ptr<WhisperEngine>, std::string>
WhisperEngine::load(const Config::Model& model, const Config::Decode& decode,
                    const DeviceSelection& device) {
    if (!is_auto_language(decode.language) && whisper_lang_id(decode.language.c_str()) < 0) {
        return std::unexpected("unknown language: " + decode.language);
    }

    auto file = resolve_model_file(model, device.compute_type);
    if (!file) return std::unexpected(file.error());

    std::println(stderr, "[kikitori] Loading model: {} ({})", model.size, file->path);
    std::println(stderr, "[kikitori] Device: {}, Compute type: {}", device.device,
                 file->compute_type);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = device.use_gpu();
    cparams.gpu_device = model.gpu_device;
    cparams.flash_attn = device.use_gpu();

    whisper_context* ctx = whisper_init_from_file_with_params(file->path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("failed to load model from " + file->path);
    }

    Config::Decode effective = decode;
    if (effective.vad_filter) {
        if (auto vad = resolve_vad_model(model, decode)) {
            std::println(stderr, "[kikitori] VAD model: {}", *vad);
            effective.vad_model_path = *vad;
        } else {
            std::println(stderr, "[kikitori] No VAD model found (expected {} in {}), running without VAD",
                         kDefaultVadModel, model.models_dir);
            effective.vad_filter = false;
        }
    }

    EngineInfo info{
        .model = model.path.empty() ? model.size : model.path,
        .device = device.device,
        .compute_type = file->compute_type,
    };

    std::println(stderr, "[kikitori] Model loaded successfully");
    return std::unique_ptr<WhisperEngine>(
        new WhisperEngine(ctx, model, std::move(effective), std::move(info)));
}

WhisperEngine::WhisperEngine(whisper_context* ctx, Config::Model model, Config::Decode decode,
                             EngineInfo info)
    : ctx_(ctx), model_(std::move(model)), decode_(std::move(decode)), info_(std::move(info)) {}

WhisperEngine::~WhisperEngine() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<PreparedInput, std::string> prepare_input(std::span<const uint8_t> wav_bytes,
                                                        const std::string& language) {
    auto pcm = wav::decode(wav_bytes);
    if (!pcm) return std::unexpected("failed to decode WAV: " + pcm.error());

    if (pcm->sample_rate != WHISPER_SAMPLE_RATE) {
        return std::unexpected(std::format("unsupported sample rate {} Hz, expected {} Hz",
                                           pcm->sample_rate, WHISPER_SAMPLE_RATE));
    }

    PreparedInput in;
    in.out.duration_s = pcm->duration_s();
    in.pcm = std::move(*pcm);
    if (is_auto_language(language)) {
        in.detect_language = true;
    } else {
        // Forced language: whisper does not score it, report full confidence.
        in.out.language = language;
        in.out.language_probability = 1.0;
    }
    return in;
}

std::expected<EngineOutput, std::string>
WhisperEngine::transcribe(const std::string& wav_path) {
    auto bytes = read_file(wav_path);
    if (!bytes) return std::unexpected(bytes.error());

    auto in = prepare_input(*bytes, decode_.language);
    if (!in) return std::unexpected(in.error());

    EngineOutput& out = in->out;
    const std::vector<float>& samples = in->pcm.samples;
    if (samples.empty()) {
        return std::move(out);
    }

    const int n_samples = static_cast<int>(samples.size());
    std::lock_guard lock(mutex_);

    if (in->detect_language) {
        if (whisper_pcm_to_mel(ctx_, samples.data(), n_samples, model_.threads) != 0) {
            return std::unexpected("failed to compute mel spectrogram");
        }
        std::vector<float> probs(whisper_lang_max_id() + 1, 0.0f);
        int lang_id = whisper_lang_auto_detect(ctx_, 0, model_.threads, probs.data());
        if (lang_id < 0) {
            return std::unexpected("language detection failed");
        }
        out.language = whisper_lang_str(lang_id);
        out.language_probability = probs[lang_id];
    }

    auto strategy = decode_.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY;
    whisper_full_params params = whisper_full_default_params(strategy);

    params.n_threads = model_.threads;
    params.language = out.language.c_str();
    params.translate = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.token_timestamps = false;

    params.no_context = !decode_.condition_on_previous_text;
    params.initial_prompt = decode_.initial_prompt.empty() ? nullptr : decode_.initial_prompt.c_str();
    params.no_speech_thold = decode_.no_speech_threshold;
    params.greedy.best_of = decode_.best_of;
    params.beam_search.beam_size = decode_.beam_size;

    if (decode_.vad_filter) {
        params.vad = true;
        params.vad_model_path = decode_.vad_model_path.c_str();
        params.vad_params = whisper_vad_default_params();
        params.vad_params.threshold = decode_.vad_threshold;
        params.vad_params.min_silence_duration_ms = decode_.min_silence_duration_ms;
        params.vad_params.speech_pad_ms = decode_.speech_pad_ms;
    }

    int rc = whisper_full(ctx_, params, samples.data(), n_samples);
    if (rc != 0) {
        return std::unexpected(std::format("whisper_full failed (code {})", rc));
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    out.segments.reserve(n_segments);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        out.segments.emplace_back(text ? text : "");
    }

    return std::move(out);
}
