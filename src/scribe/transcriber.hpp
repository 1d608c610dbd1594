#pragma once

#include "model_handle.hpp"

#include <expected>
#include <optional>
#include <string>

struct TranscriptionRequest {
    std::string audio_path;
    std::optional<std::string> output_path;
};

struct TranscriptionResult {
    std::string text;
    std::string output_path;
};

enum class TranscriptionErrorKind { AudioNotFound, ModelInvocationFailure, OutputWriteFailure };

struct TranscriptionError {
    TranscriptionErrorKind kind;
    std::string path;
    std::string cause;

    // "<stage>: <path>: <cause>"
    std::string message() const;
};

const char* to_string(TranscriptionErrorKind kind);

// AudioNotFound unless audio_path names a readable regular file.
std::expected<void, TranscriptionError> check_audio_file(const std::string& audio_path);

// Runs one transcription: checks the input, asks the model for text and
// writes it to the resolved output path.
class Transcriber {
public:
    explicit Transcriber(ModelHandle& model, bool verbose = false);

    std::expected<TranscriptionResult, TranscriptionError>
        process(const TranscriptionRequest& request);

private:
    void log(const std::string& msg);

    ModelHandle& model_;
    bool verbose_;
};

std::expected<TranscriptionResult, TranscriptionError>
process_audio_with_whisper(ModelHandle& model, const std::string& audio_file_path,
                           const std::optional<std::string>& output_file_path = std::nullopt,
                           bool verbose = false);
