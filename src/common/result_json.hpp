#pragma once

#include "transcriber.hpp"
#include "whisper/engine.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Wire shape of a transcription result, shared by the CLI and the server:
// {"success": true, "text", "language", ["language_probability",] "duration"}
// or {"success": false, "error"}.
nlohmann::json result_to_json(const std::expected<Transcription, std::string>& result,
                              bool with_language_probability);

nlohmann::json error_json(const std::string& message);

nlohmann::json health_json(const EngineInfo& info);

// UTF-8 passes through unescaped; invalid sequences are replaced rather than thrown.
std::string dump_json(const nlohmann::json& j);
