#pragma once

#include "output.hpp"

#include <string>

// Writes text to a file. Regular files are replaced atomically: the data goes
// to a temporary file in the same directory, which is renamed over the
// destination only once fully written, so a failure leaves the destination
// as it was. A symlinked destination is written through to its target;
// devices and pipes are opened and truncated in place.
class FileOutput : public OutputMethod {
public:
    explicit FileOutput(std::string path);

    std::expected<void, std::string> deliver(const std::string& text) override;

    const std::string& path() const { return path_; }

private:
    std::expected<void, std::string> write_atomic(const std::string& target,
                                                  const std::string& text);
    std::expected<void, std::string> write_in_place(const std::string& target,
                                                    const std::string& text);

    std::string path_;
};
