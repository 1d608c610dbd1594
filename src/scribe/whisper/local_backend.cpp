#include "local_backend.hpp"
#include "../audio_loader.hpp"

#include <chrono>
#include <filesystem>
#include <whisper.h>

namespace {

constexpr uint32_t kWhisperSampleRate = WHISPER_SAMPLE_RATE;

struct Deadline {
    std::chrono::steady_clock::time_point at;
};

bool deadline_passed(void* user_data) {
    auto* d = static_cast<Deadline*>(user_data);
    return std::chrono::steady_clock::now() >= d->at;
}

} // namespace

LocalBackend::LocalBackend(std::string model_path, std::string language, int threads,
                           long timeout_s)
    : model_path_(std::move(model_path)), language_(std::move(language)),
      threads_(threads), timeout_s_(timeout_s) {}

LocalBackend::~LocalBackend() {
    if (ctx_) {
        whisper_free(ctx_);
    }
}

std::expected<void, std::string> LocalBackend::load() {
    if (ctx_) return {};

    if (!std::filesystem::exists(model_path_)) {
        return std::unexpected("model file not found: " + model_path_);
    }

    if (!language_.empty() && language_ != "auto" && whisper_lang_id(language_.c_str()) == -1) {
        return std::unexpected("unknown language: " + language_);
    }

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected("failed to initialize whisper context from " + model_path_);
    }
    return {};
}

std::expected<TranscriptResult, std::string>
LocalBackend::transcribe(const std::string& audio_path) {
    if (!ctx_) {
        return std::unexpected("model not loaded");
    }

    auto audio = audio::load_mono(audio_path, kWhisperSampleRate);
    if (!audio) {
        return std::unexpected(audio.error());
    }
    if (audio->samples.empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = audio->duration_s();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.n_threads = threads_;
    wparams.language = language_.empty() ? "auto" : language_.c_str();
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_special = false;
    wparams.print_timestamps = false;

    auto start = std::chrono::steady_clock::now();

    Deadline deadline{start + std::chrono::seconds(timeout_s_)};
    if (timeout_s_ > 0) {
        wparams.abort_callback = deadline_passed;
        wparams.abort_callback_user_data = &deadline;
    }

    int rc = whisper_full(ctx_, wparams, audio->samples.data(),
                          static_cast<int>(audio->samples.size()));

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (rc != 0) {
        if (timeout_s_ > 0 && end >= deadline.at) {
            return std::unexpected("transcription timed out after " +
                                   std::to_string(timeout_s_) + "s");
        }
        return std::unexpected("whisper_full failed with code " + std::to_string(rc));
    }

    std::string text;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; i++) {
        text += whisper_full_get_segment_text(ctx_, i);
    }

    return TranscriptResult{
        .text = std::move(text),
        .duration_s = duration_s,
        .processing_s = processing_s,
    };
}
