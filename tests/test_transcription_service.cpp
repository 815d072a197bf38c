#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "hallucination_filter.hpp"
#include "test_support.hpp"
#include "transcriber.hpp"
#include "transcription_service.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

httplib::Response post(TranscriptionService& service, std::string body) {
    httplib::Request req;
    req.method = "POST";
    req.path = "/";
    req.body = std::move(body);
    httplib::Response res;
    service.handle_transcribe(req, res);
    return res;
}

std::string as_body(const std::vector<uint8_t>& bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

} // namespace

TEST_CASE("TranscriptionService handlers", "[service]") {
    TmpDir dir;
    FakeEngine engine;
    HallucinationFilter filter(Config{}.hallucinations);
    Transcriber transcriber(engine, &filter, dir.path.string());
    TranscriptionService service(transcriber, engine.info());

    SECTION("HealthReportsResolvedEngine") {
        httplib::Request req;
        httplib::Response res;
        service.handle_health(req, res);
        REQUIRE(res.status == 200);
        REQUIRE(res.get_header_value("Content-Type") == "application/json; charset=utf-8");
        auto j = json::parse(res.body);
        REQUIRE(j["status"] == "ok");
        REQUIRE(j["model"] == "small");
        REQUIRE(j["device"] == "cpu");
        REQUIRE(j["compute_type"] == "int8");
        REQUIRE(engine.calls == 0);
    }

    SECTION("Success") {
        engine.next = segments_output({"おはよう", "ございます"}, 1.25);
        auto res = post(service, as_body(silent_wav()));
        REQUIRE(res.status == 200);
        REQUIRE(res.get_header_value("Content-Type") == "application/json; charset=utf-8");
        auto j = json::parse(res.body);
        REQUIRE(j["success"] == true);
        REQUIRE(j["text"] == "おはようございます");
        REQUIRE(j["language"] == "ja");
        REQUIRE(j["language_probability"] == 1.0);
        REQUIRE(j["duration"] == 1.25);
        REQUIRE(engine.calls == 1);
    }

    SECTION("EmptyBody") {
        auto res = post(service, "");
        REQUIRE(res.status == 200);
        auto j = json::parse(res.body);
        REQUIRE(j["success"] == false);
        REQUIRE(j["error"] == "No audio data received");
        REQUIRE(engine.calls == 0);
    }

    SECTION("TooShortBody") {
        auto res = post(service, std::string(43, 'R'));
        REQUIRE(res.status == 200);
        auto j = json::parse(res.body);
        REQUIRE(j["success"] == false);
        REQUIRE(j["error"] == "Invalid WAV data (too short)");
        REQUIRE(engine.calls == 0);
    }

    SECTION("EngineFailureStill200") {
        engine.next = std::unexpected(std::string("failed to decode WAV: not a RIFF/WAVE file"));
        auto res = post(service, std::string(100, 'x'));
        REQUIRE(res.status == 200);
        auto j = json::parse(res.body);
        REQUIRE(j["success"] == false);
        REQUIRE(j["error"] == "failed to decode WAV: not a RIFF/WAVE file");
        REQUIRE_FALSE(j.contains("text"));
        REQUIRE(dir.file_count() == 0);
    }

    SECTION("EngineExceptionStill200") {
        engine.throw_on_call = true;
        auto res = post(service, as_body(silent_wav()));
        REQUIRE(res.status == 200);
        REQUIRE(json::parse(res.body)["error"] == "engine exploded");
    }

    SECTION("HallucinationFiltered") {
        engine.next = segments_output({"チャンネル登録よろしくお願いします"});
        auto j = json::parse(post(service, as_body(silent_wav())).body);
        REQUIRE(j["success"] == true);
        REQUIRE(j["text"] == "");
    }

    SECTION("JapaneseNotEscaped") {
        engine.next = segments_output({"日本語"});
        auto res = post(service, as_body(silent_wav()));
        REQUIRE(res.body.find("日本語") != std::string::npos);
        REQUIRE(res.body.find("\\u") == std::string::npos);
    }
}
