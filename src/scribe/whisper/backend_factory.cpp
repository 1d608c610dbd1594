#include "backend_factory.hpp"

#include "lan_backend.hpp"
#ifdef SCRIBE_HAVE_WHISPER_CPP
#include "local_backend.hpp"
#endif

std::expected<std::unique_ptr<WhisperBackend>, std::string> make_backend(const Config& config) {
    const auto& b = config.backend;

    if (b.type == "lan") {
        return std::make_unique<LanBackend>(b.url, b.api_format, b.language, b.timeout_s);
    }

    if (b.type == "local") {
#ifdef SCRIBE_HAVE_WHISPER_CPP
        return std::make_unique<LocalBackend>(config.model.path, b.language,
                                              config.model.threads, b.timeout_s);
#else
        return std::unexpected("scribe was built without whisper.cpp; use the lan backend");
#endif
    }

    return std::unexpected("unknown backend type: " + b.type);
}
