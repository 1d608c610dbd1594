#pragma once

#include <expected>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// A speech-to-text model. load() is expensive and is called once before the
// first transcribe(); the returned text is passed through untouched.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;

    virtual std::expected<void, std::string> load() = 0;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const std::string& audio_path) = 0;

    // True if transcribe() may run on several threads at once.
    virtual bool concurrent_safe() const { return false; }
    virtual std::string name() const = 0;
};
