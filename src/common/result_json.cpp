#include "result_json.hpp"

using json = nlohmann::json;

json result_to_json(const std::expected<Transcription, std::string>& result,
                    bool with_language_probability) {
    if (!result) return error_json(result.error());

    json j = {
        {"success", true},
        {"text", result->text},
        {"language", result->language},
    };
    if (with_language_probability) {
        j["language_probability"] = result->language_probability
            ? json(*result->language_probability)
            : json(nullptr);
    }
    j["duration"] = result->duration_s;
    return j;
}

json error_json(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

json health_json(const EngineInfo& info) {
    return {
        {"status", "ok"},
        {"model", info.model},
        {"device", info.device},
        {"compute_type", info.compute_type},
    };
}

std::string dump_json(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
