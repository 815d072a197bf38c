#pragma once

#include "transcriber.hpp"
#include "whisper/engine.hpp"

#include <httplib.h>
#include <string>

// Request handlers behind the HTTP routes.
//   POST <any path>  -> transcription result, always 200
//   GET  /health     -> model/device/compute type
// Routing and everything else (404, 413) is set up by HttpServer.
class TranscriptionService {
public:
    TranscriptionService(Transcriber& transcriber, EngineInfo info, bool verbose = false);

    void handle_transcribe(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

private:
    void log(const std::string& msg);

    Transcriber& transcriber_;
    EngineInfo info_;
    bool verbose_;
};

inline constexpr const char* kJsonContentType = "application/json; charset=utf-8";
