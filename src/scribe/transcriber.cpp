#include "transcriber.hpp"

#include "output/file_output.hpp"
#include "path_resolver.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

const char* to_string(TranscriptionErrorKind kind) {
    switch (kind) {
        case TranscriptionErrorKind::AudioNotFound:
            return "audio not found";
        case TranscriptionErrorKind::ModelInvocationFailure:
            return "model invocation failed";
        case TranscriptionErrorKind::OutputWriteFailure:
            return "output write failed";
    }
    return "unknown error";
}

std::expected<void, TranscriptionError> check_audio_file(const std::string& audio_path) {
    auto not_found = [&audio_path](std::string cause) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::AudioNotFound, audio_path, std::move(cause)});
    };

    if (audio_path.empty()) return not_found("empty path");

    struct stat st{};
    if (::stat(audio_path.c_str(), &st) < 0) return not_found(std::strerror(errno));
    if (S_ISDIR(st.st_mode)) return not_found("is a directory");
    if (::access(audio_path.c_str(), R_OK) < 0) return not_found(std::strerror(errno));
    return {};
}

std::string TranscriptionError::message() const {
    return std::format("{}: {}: {}", to_string(kind), path, cause);
}

Transcriber::Transcriber(ModelHandle& model, bool verbose)
    : model_(model), verbose_(verbose) {}

std::expected<TranscriptionResult, TranscriptionError>
Transcriber::process(const TranscriptionRequest& request) {
    const auto& audio_path = request.audio_path;

    if (auto res = check_audio_file(audio_path); !res) {
        return std::unexpected(std::move(res.error()));
    }

    if (!model_.loaded()) {
        log("Loading " + model_.backend_name() + " model...");
    }
    if (auto res = model_.ensure_loaded(); !res) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::ModelInvocationFailure, audio_path,
            "model load failed: " + res.error()});
    }

    log("Processing audio file: " + audio_path);
    auto transcript = model_.transcribe(audio_path);
    if (!transcript) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::ModelInvocationFailure, audio_path, transcript.error()});
    }
    log(std::format("Transcription complete: {:.1f}s audio, {:.1f}s processing, {} chars",
                    transcript->duration_s, transcript->processing_s, transcript->text.size()));

    auto output_path = resolve_output_path(audio_path, request.output_path);

    FileOutput file(output_path);
    if (auto res = file.deliver(transcript->text); !res) {
        return std::unexpected(TranscriptionError{
            TranscriptionErrorKind::OutputWriteFailure, output_path, res.error()});
    }
    log("Transcription saved to " + output_path);

    return TranscriptionResult{
        .text = std::move(transcript->text),
        .output_path = std::move(output_path),
    };
}

void Transcriber::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[scribe] {}", msg);
    }
}

std::expected<TranscriptionResult, TranscriptionError>
process_audio_with_whisper(ModelHandle& model, const std::string& audio_file_path,
                           const std::optional<std::string>& output_file_path, bool verbose) {
    Transcriber transcriber(model, verbose);
    return transcriber.process({audio_file_path, output_file_path});
}
