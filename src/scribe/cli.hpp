#pragma once

#include "config.hpp"
#include "whisper/backend.hpp"

#include <cstdio>
#include <expected>
#include <functional>
#include <memory>
#include <string>

using BackendFactory =
    std::function<std::expected<std::unique_ptr<WhisperBackend>, std::string>(const Config&)>;

// Exit codes of the scribe command.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Runs the command line: parses argv, loads config, transcribes one file.
// The output path (and text with -p) goes to out; diagnostics go to err.
int run_cli(int argc, char* argv[], std::FILE* out, std::FILE* err,
            const BackendFactory& factory);
int run_cli(int argc, char* argv[], std::FILE* out = stdout, std::FILE* err = stderr);
