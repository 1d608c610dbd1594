#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("timeout_s")) cfg.backend.timeout_s = b["timeout_s"].get<long>();
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("path")) {
                cfg.model.path = platform::expand_user(m["path"].get<std::string>());
            }
            if (m.contains("threads")) cfg.model.threads = m["threads"].get<int>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::string default_model_path() {
    auto dir = platform::data_dir();
    if (dir.empty()) return "ggml-base.bin";
    return dir + "/models/ggml-base.bin";
}
