#pragma once

#include "transcription_service.hpp"

#include <cstddef>
#include <cstdint>
#include <httplib.h>
#include <string>

// httplib::Server wired to a TranscriptionService. bind() then run();
// stop() may be called from any thread and makes run() return.
class HttpServer {
public:
    HttpServer(TranscriptionService& service, size_t max_body_bytes, int read_timeout_s);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Port 0 binds an ephemeral port; port() reports the one chosen.
    bool bind(const std::string& host, uint16_t port);
    uint16_t port() const { return port_; }

    // Blocks serving requests until stop().
    bool run();
    void stop();
    void wait_until_ready() const { srv_.wait_until_ready(); }

private:
    void setup_routes_();

    TranscriptionService& service_;
    size_t max_body_bytes_;
    httplib::Server srv_;
    uint16_t port_ = 0;
};
