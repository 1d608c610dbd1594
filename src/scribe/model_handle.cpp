#include "model_handle.hpp"

ModelHandle::ModelHandle(std::unique_ptr<WhisperBackend> backend)
    : backend_(std::move(backend)) {}

std::expected<void, std::string> ModelHandle::ensure_loaded() {
    std::lock_guard lock(load_mutex_);
    if (loaded_) return {};

    auto res = backend_->load();
    if (!res) return res;

    loaded_ = true;
    return {};
}

std::expected<TranscriptResult, std::string>
ModelHandle::transcribe(const std::string& audio_path) {
    if (auto res = ensure_loaded(); !res) {
        return std::unexpected("model load failed: " + res.error());
    }

    if (backend_->concurrent_safe()) {
        return backend_->transcribe(audio_path);
    }

    std::lock_guard lock(invoke_mutex_);
    return backend_->transcribe(audio_path);
}

bool ModelHandle::loaded() const {
    std::lock_guard lock(load_mutex_);
    return loaded_;
}
