#pragma once

#include "backend.hpp"

#include <string>

struct whisper_context;

// Runs a ggml whisper model in-process through whisper.cpp.
class LocalBackend : public WhisperBackend {
public:
    LocalBackend(std::string model_path, std::string language = "auto",
                 int threads = 4, long timeout_s = 600);
    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    std::expected<void, std::string> load() override;
    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& audio_path) override;

    std::string name() const override { return "local"; }

private:
    std::string model_path_;
    std::string language_;
    int threads_;
    long timeout_s_;
    whisper_context* ctx_ = nullptr;
};
