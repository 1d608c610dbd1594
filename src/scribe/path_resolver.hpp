#pragma once

#include <optional>
#include <string>

// Returns output_path unchanged when given, otherwise the audio path with its
// final extension replaced by ".txt" (same directory).
std::string resolve_output_path(const std::string& audio_path,
                                const std::optional<std::string>& output_path = std::nullopt);
