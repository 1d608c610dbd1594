#pragma once

#include <string>

// <data_dir>/models/ggml-base.bin
std::string default_model_path();

struct Config {
    struct Backend {
        std::string type = "local";                 // "local" or "lan"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp";     // "whisper.cpp" or "openai"
        std::string language = "auto";
        long timeout_s = 600;
    } backend;

    struct Model {
        std::string path = default_model_path();
        int threads = 4;
    } model;

    static Config load(const std::string& path);
    static Config load_default();
};
