#include "path_resolver.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::string resolve_output_path(const std::string& audio_path,
                                const std::optional<std::string>& output_path) {
    if (output_path) return *output_path;

    fs::path p(audio_path);
    return (p.parent_path() / p.stem()).string() + ".txt";
}
