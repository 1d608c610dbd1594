#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();

// Replaces a leading "~" or "~/" with the user's home directory.
std::string expand_user(const std::string& path);

} // namespace platform
