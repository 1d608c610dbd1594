#pragma once

#include "backend.hpp"

#include <string>

class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string language = "auto", long timeout_s = 600);
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    std::expected<void, std::string> load() override;
    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& audio_path) override;

    bool concurrent_safe() const override { return true; }
    std::string name() const override { return "lan"; }

    // Extracts the transcription text from a server response body.
    static std::expected<TranscriptResult, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
    long timeout_s_;
    bool curl_initialized_ = false;
};
