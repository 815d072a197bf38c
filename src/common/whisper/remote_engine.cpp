#include "remote_engine.hpp"

#include <cstdio>
#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

RemoteEngine::RemoteEngine(std::string url, long timeout_s)
    : url_(std::move(url)), timeout_s_(timeout_s) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RemoteEngine::~RemoteEngine() {
    curl_global_cleanup();
}

std::expected<EngineOutput, std::string>
RemoteEngine::transcribe(const std::string& wav_path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(wav_path, ec);
    if (ec) return std::unexpected("could not stat " + wav_path + ": " + ec.message());

    FILE* file = std::fopen(wav_path.c_str(), "rb");
    if (!file) return std::unexpected("could not open " + wav_path);

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(file);
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint = url_ + "/";
    std::string response_body;
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: audio/wav");

    // The default read callback fread()s from READDATA.
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_READDATA, file);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    std::fclose(file);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected("transcription timeout (" + std::to_string(timeout_s_) + "s)");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status != 200) {
        return std::unexpected("server error: HTTP " + std::to_string(status) + " - " +
                               response_body);
    }

    try {
        auto j = json::parse(response_body);

        if (!j.value("success", false)) {
            return std::unexpected(j.value("error", std::string("transcription failed")));
        }

        EngineOutput out;
        out.segments.push_back(j.value("text", std::string()));
        out.language = j.value("language", std::string());
        if (j.contains("language_probability") && j["language_probability"].is_number()) {
            out.language_probability = j["language_probability"].get<double>();
        }
        out.duration_s = j.value("duration", 0.0);
        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<EngineInfo, std::string> RemoteEngine::health() {
    CURL* curl = curl_easy_init();
    if (!curl) return std::unexpected("curl_easy_init failed");

    std::string endpoint = url_ + "/health";
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 2L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status != 200) {
        return std::unexpected("health check failed: HTTP " + std::to_string(status));
    }

    try {
        auto j = json::parse(response_body);
        if (j.value("status", "") != "ok") {
            return std::unexpected("server not ready: " + response_body);
        }
        info_ = EngineInfo{
            .model = j.value("model", ""),
            .device = j.value("device", ""),
            .compute_type = j.value("compute_type", ""),
        };
        return info_;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
