#pragma once

#include "engine.hpp"

#include <expected>
#include <string>

// Forwards WAV files to a running kikitori-server over HTTP.
class RemoteEngine : public SpeechEngine {
public:
    explicit RemoteEngine(std::string url, long timeout_s = 30);
    ~RemoteEngine() override;

    RemoteEngine(const RemoteEngine&) = delete;
    RemoteEngine& operator=(const RemoteEngine&) = delete;

    std::expected<EngineOutput, std::string> transcribe(const std::string& wav_path) override;

    // Last /health answer, or "remote" placeholders if the server was never reached.
    EngineInfo info() const override { return info_; }

    // GET <url>/health. Caches the reported model/device/compute type.
    std::expected<EngineInfo, std::string> health();

private:
    std::string url_;
    long timeout_s_;
    EngineInfo info_{.model = "remote", .device = "remote", .compute_type = "remote"};
};
