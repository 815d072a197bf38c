#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "kikitori_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        std::ofstream(path) << content;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for the lifetime of the object.
struct ScopedEnv {
    std::string name;

    ScopedEnv(std::string n, const char* value) : name(std::move(n)) {
        ::setenv(name.c_str(), value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.model.size == "small");
        REQUIRE(cfg.model.device == "cuda");
        REQUIRE(cfg.model.compute_type == "float16");
        REQUIRE(cfg.decode.language == "ja");
        REQUIRE(cfg.decode.beam_size == 5);
        REQUIRE(cfg.decode.best_of == 5);
        REQUIRE(cfg.decode.vad_filter);
        REQUIRE(cfg.decode.min_silence_duration_ms == 1000);
        REQUIRE(cfg.decode.speech_pad_ms == 400);
        REQUIRE(cfg.decode.no_speech_threshold == 0.6f);
        REQUIRE_FALSE(cfg.decode.condition_on_previous_text);
        REQUIRE_FALSE(cfg.decode.initial_prompt.empty());
        REQUIRE(cfg.server.host == "127.0.0.1");
        REQUIRE(cfg.server.port == 5001);
        REQUIRE(cfg.hallucinations.size() == 5);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "model": {
                "size": "large-v3",
                "device": "cpu",
                "compute_type": "int8",
                "models_dir": "/opt/models",
                "threads": 8
            },
            "decode": {
                "language": "auto",
                "beam_size": 1,
                "vad_filter": false,
                "min_silence_duration_ms": 500,
                "initial_prompt": ""
            },
            "server": { "host": "0.0.0.0", "port": 9000, "temp_dir": "/var/tmp" },
            "hallucinations": ["thanks for watching"]
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.size == "large-v3");
        REQUIRE(cfg.model.device == "cpu");
        REQUIRE(cfg.model.compute_type == "int8");
        REQUIRE(cfg.model.models_dir == "/opt/models");
        REQUIRE(cfg.model.threads == 8);
        REQUIRE(cfg.decode.language == "auto");
        REQUIRE(cfg.decode.beam_size == 1);
        REQUIRE_FALSE(cfg.decode.vad_filter);
        REQUIRE(cfg.decode.min_silence_duration_ms == 500);
        REQUIRE(cfg.decode.initial_prompt.empty());
        REQUIRE(cfg.server.host == "0.0.0.0");
        REQUIRE(cfg.server.port == 9000);
        REQUIRE(cfg.server.temp_dir == "/var/tmp");
        REQUIRE(cfg.hallucinations == std::vector<std::string>{"thanks for watching"});
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "decode": { "language": "en" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.decode.language == "en");
        // Other fields retain defaults
        REQUIRE(cfg.decode.beam_size == 5);
        REQUIRE(cfg.model.size == "small");
        REQUIRE(cfg.server.port == 5001);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.model.size == "small");
        REQUIRE(cfg.server.port == 5001);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "model": { "size": "tiny" }, "server": { "port": "eighty" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.size == "small");
        REQUIRE(cfg.server.port == 5001);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/kikitori_test_nonexistent_config_file.json");
        REQUIRE(cfg.model.size == "small");
        REQUIRE(cfg.server.port == 5001);
    }
}

TEST_CASE("Config environment overrides", "[config]") {

    SECTION("WhisperVariables") {
        ScopedEnv model("WHISPER_MODEL", "medium");
        ScopedEnv device("WHISPER_DEVICE", "cpu");
        ScopedEnv compute("WHISPER_COMPUTE_TYPE", "int8");
        ScopedEnv port("WHISPER_PORT", "5050");
        ScopedEnv vad("WHISPER_VAD_MODEL", "/models/silero.bin");

        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.model.size == "medium");
        REQUIRE(cfg.model.device == "cpu");
        REQUIRE(cfg.model.compute_type == "int8");
        REQUIRE(cfg.server.port == 5050);
        REQUIRE(cfg.decode.vad_model_path == "/models/silero.bin");
    }

    SECTION("InvalidPortIgnored") {
        ScopedEnv port("WHISPER_PORT", "70000");
        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.server.port == 5001);
    }

    SECTION("EmptyValueIgnored") {
        ScopedEnv model("WHISPER_MODEL", "");
        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.model.size == "small");
    }
}
