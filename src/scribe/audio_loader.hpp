#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace audio {

struct Pcm {
    std::vector<float> samples; // mono, [-1, 1]
    uint32_t sample_rate = 0;
    uint32_t source_sample_rate = 0;
    int source_channels = 0;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

// Reads any container libsndfile understands, mixes it down to mono and
// resamples it to target_rate.
std::expected<Pcm, std::string> load_mono(const std::string& path, uint32_t target_rate);

} // namespace audio
