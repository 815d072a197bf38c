#include "transcription_service.hpp"

#include "result_json.hpp"

#include <cstdint>
#include <format>
#include <print>
#include <span>

TranscriptionService::TranscriptionService(Transcriber& transcriber, EngineInfo info, bool verbose)
    : transcriber_(transcriber), info_(std::move(info)), verbose_(verbose) {}

void TranscriptionService::handle_transcribe(const httplib::Request& req, httplib::Response& res) {
    res.status = 200;
    if (req.body.empty()) {
        res.set_content(dump_json(error_json("No audio data received")), kJsonContentType);
        return;
    }

    log(std::format("Transcribing {} bytes", req.body.size()));

    auto bytes = std::span(reinterpret_cast<const uint8_t*>(req.body.data()), req.body.size());
    auto result = transcriber_.transcribe(bytes);

    if (result) {
        log(std::format("Transcribed {:.1f}s audio in {:.2f}s: \"{}\"",
                        result->duration_s, result->processing_s, result->text));
    } else {
        std::println(stderr, "[kikitori-server] Transcription failed: {}", result.error());
    }

    // Errors travel in the JSON body; clients check "success", not the status code.
    res.set_content(dump_json(result_to_json(result, true)), kJsonContentType);
}

void TranscriptionService::handle_health(const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content(dump_json(health_json(info_)), kJsonContentType);
}

void TranscriptionService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[kikitori-server] {}", msg);
    }
}
