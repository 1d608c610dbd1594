#include "stdout_output.hpp"

#include <cerrno>
#include <cstring>

std::expected<void, std::string> StdoutOutput::deliver(const std::string& text) {
    if (std::fwrite(text.data(), 1, text.size(), stream_) != text.size() ||
        std::fputc('\n', stream_) == EOF || std::fflush(stream_) != 0) {
        return std::unexpected(std::string("stdout write failed: ") + std::strerror(errno));
    }
    return {};
}
