#pragma once

#include "../config.hpp"
#include "backend.hpp"

#include <expected>
#include <memory>
#include <string>

std::expected<std::unique_ptr<WhisperBackend>, std::string> make_backend(const Config& config);
