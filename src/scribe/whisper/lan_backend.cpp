#include "lan_backend.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

LanBackend::LanBackend(std::string url, std::string api_format, std::string language,
                       long timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), timeout_s_(timeout_s) {}

LanBackend::~LanBackend() {
    if (curl_initialized_) {
        curl_global_cleanup();
    }
}

std::expected<void, std::string> LanBackend::load() {
    if (curl_initialized_) return {};

    if (api_format_ != "whisper.cpp" && api_format_ != "openai") {
        return std::unexpected("unknown api_format: " + api_format_);
    }

    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        return std::unexpected(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
    curl_initialized_ = true;
    return {};
}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(const std::string& audio_path) {
    if (!curl_initialized_) {
        return std::unexpected("backend not loaded");
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    // Build URL and form based on API format
    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    CURLcode file_rc = curl_mime_filedata(part, audio_path.c_str());

    bool send_language = !language_.empty();
    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);

        // The OpenAI API detects the language when the field is omitted.
        send_language = send_language && language_ != "auto";
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    if (send_language) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language_.c_str(), CURL_ZERO_TERMINATED);
    }

    if (file_rc != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected(std::string("cannot attach audio file: ") + curl_easy_strerror(file_rc));
    }

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    auto result = parse_response(response_body);
    if (!result) {
        if (http_status >= 400) {
            return std::unexpected("HTTP " + std::to_string(http_status) + ": " + result.error());
        }
        return std::unexpected(result.error());
    }

    result->processing_s = processing_s;
    return result;
}

std::expected<TranscriptResult, std::string> LanBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("text") && j["text"].is_string()) {
            TranscriptResult tr;
            tr.text = j["text"].get<std::string>();
            // Only verbose_json responses carry the audio length.
            if (j.contains("duration") && j["duration"].is_number()) {
                tr.duration_s = j["duration"].get<double>();
            }
            return tr;
        }
        if (j.contains("error")) {
            auto& err = j["error"];
            // OpenAI nests the message in an object.
            if (err.is_object() && err.contains("message")) {
                return std::unexpected("server error: " + err["message"].get<std::string>());
            }
            if (err.is_string()) {
                return std::unexpected("server error: " + err.get<std::string>());
            }
            return std::unexpected("server error: " + err.dump());
        }
        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
