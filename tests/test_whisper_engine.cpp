#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "whisper/whisper_engine.hpp"

#include <cstring>

TEST_CASE("prepare_input", "[engine]") {

    SECTION("ForcedLanguageHasFullConfidence") {
        auto in = prepare_input(wav::encode(std::vector<int16_t>(16000, 0), 16000), "ja");
        REQUIRE(in.has_value());
        REQUIRE_FALSE(in->detect_language);
        REQUIRE(in->out.language == "ja");
        REQUIRE(in->out.language_probability == 1.0);
        REQUIRE(in->out.duration_s == 1.0);
        REQUIRE(in->out.segments.empty());
        REQUIRE(in->pcm.samples.size() == 16000);
    }

    SECTION("AutoLeavesLanguageForDetection") {
        for (const char* lang : {"auto", ""}) {
            auto in = prepare_input(silent_wav(), lang);
            REQUIRE(in.has_value());
            REQUIRE(in->detect_language);
            REQUIRE(in->out.language.empty());
            REQUIRE_FALSE(in->out.language_probability.has_value());
        }
    }

    SECTION("HeaderOnlyWavStillReportsForcedLanguage") {
        auto in = prepare_input(wav::encode(std::vector<int16_t>{}, 16000), "ja");
        REQUIRE(in.has_value());
        REQUIRE(in->pcm.samples.empty());
        REQUIRE(in->out.duration_s == 0.0);
        REQUIRE(in->out.language == "ja");
        REQUIRE(in->out.language_probability == 1.0);
    }

    SECTION("Non16kRejected") {
        auto in = prepare_input(wav::encode(std::vector<int16_t>(441, 0), 44100), "ja");
        REQUIRE_FALSE(in.has_value());
        REQUIRE(in.error() == "unsupported sample rate 44100 Hz, expected 16000 Hz");
    }

    SECTION("GarbageIsDecodeError") {
        std::vector<uint8_t> junk(100, 'x');
        auto in = prepare_input(junk, "ja");
        REQUIRE_FALSE(in.has_value());
        REQUIRE(in.error() == "failed to decode WAV: not a RIFF/WAVE file");
    }
}
