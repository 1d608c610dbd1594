#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "whisper/backend_factory.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "scribe_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(fd >= 0);
        REQUIRE(::write(fd, content.data(), content.size()) ==
                static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.backend.api_format == "whisper.cpp");
        REQUIRE(cfg.backend.language == "auto");
        REQUIRE(cfg.backend.timeout_s == 600);
        REQUIRE(cfg.model.threads == 4);
        REQUIRE(cfg.model.path.ends_with("ggml-base.bin"));
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "type": "lan",
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "language": "de",
                "timeout_s": 30
            },
            "model": { "path": "/models/ggml-small.bin", "threads": 8 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.backend.timeout_s == 30);
        REQUIRE(cfg.model.path == "/models/ggml-small.bin");
        REQUIRE(cfg.model.threads == 8);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.backend.timeout_s == 600);
        REQUIRE(cfg.model.threads == 4);
    }

    SECTION("ModelPathTildeExpanded") {
        TmpFile f(R"({ "model": { "path": "~/models/ggml-base.en.bin" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model.path.front() != '~');
        REQUIRE(cfg.model.path.ends_with("/models/ggml-base.en.bin"));
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.language == "auto");
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "backend": { "type": "lan", "timeout_s": "soon" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.timeout_s == 600);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/scribe_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.model.threads == 4);
    }
}

TEST_CASE("make_backend", "[config]") {

    SECTION("LanBackend") {
        Config cfg;
        cfg.backend.type = "lan";
        auto backend = make_backend(cfg);
        REQUIRE(backend.has_value());
        REQUIRE((*backend)->name() == "lan");
        REQUIRE((*backend)->concurrent_safe());
    }

    SECTION("UnknownType") {
        Config cfg;
        cfg.backend.type = "cloud";
        auto backend = make_backend(cfg);
        REQUIRE_FALSE(backend.has_value());
        REQUIRE(backend.error() == "unknown backend type: cloud");
    }
}
