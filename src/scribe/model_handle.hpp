#pragma once

#include "whisper/backend.hpp"

#include <expected>
#include <memory>
#include <mutex>
#include <string>

// Owns a backend and loads it on first use. Shared across transcriptions in
// one process; only the transcribe call is serialized, and only for backends
// that are not safe to call concurrently.
class ModelHandle {
public:
    explicit ModelHandle(std::unique_ptr<WhisperBackend> backend);

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    // Loads the backend if that has not succeeded yet. A failed load is
    // attempted again by the next call.
    std::expected<void, std::string> ensure_loaded();

    std::expected<TranscriptResult, std::string> transcribe(const std::string& audio_path);

    bool loaded() const;
    std::string backend_name() const { return backend_->name(); }

private:
    std::unique_ptr<WhisperBackend> backend_;
    mutable std::mutex load_mutex_;
    std::mutex invoke_mutex_;
    bool loaded_ = false;
};
