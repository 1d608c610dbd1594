#pragma once

#include "output.hpp"

#include <cstdio>

class StdoutOutput : public OutputMethod {
public:
    explicit StdoutOutput(std::FILE* stream = stdout) : stream_(stream) {}

    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    std::FILE* stream_;
};
