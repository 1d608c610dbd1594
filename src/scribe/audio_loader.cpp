#include "audio_loader.hpp"

#include <cmath>
#include <memory>
#include <samplerate.h>
#include <sndfile.h>

namespace audio {

namespace {

struct SndFileCloser {
    void operator()(SNDFILE* f) const { sf_close(f); }
};

using SndFilePtr = std::unique_ptr<SNDFILE, SndFileCloser>;

} // namespace

std::expected<Pcm, std::string> load_mono(const std::string& path, uint32_t target_rate) {
    SF_INFO info{};
    SndFilePtr file(sf_open(path.c_str(), SFM_READ, &info));
    if (!file) {
        return std::unexpected("cannot decode " + path + ": " + sf_strerror(nullptr));
    }
    if (info.channels < 1 || info.samplerate < 1) {
        return std::unexpected("invalid stream parameters in " + path);
    }

    std::vector<float> interleaved(static_cast<size_t>(info.frames) * info.channels);
    sf_count_t frames = sf_readf_float(file.get(), interleaved.data(), info.frames);
    if (frames < 0) {
        return std::unexpected(std::string("read error: ") + sf_strerror(file.get()));
    }

    std::vector<float> mono(static_cast<size_t>(frames));
    for (sf_count_t i = 0; i < frames; i++) {
        float sum = 0.0f;
        for (int c = 0; c < info.channels; c++) {
            sum += interleaved[static_cast<size_t>(i) * info.channels + c];
        }
        mono[static_cast<size_t>(i)] = sum / info.channels;
    }

    Pcm out;
    out.source_sample_rate = static_cast<uint32_t>(info.samplerate);
    out.source_channels = info.channels;
    out.sample_rate = target_rate;

    if (out.source_sample_rate == target_rate || mono.empty()) {
        out.samples = std::move(mono);
        return out;
    }

    double ratio = static_cast<double>(target_rate) / info.samplerate;
    out.samples.resize(static_cast<size_t>(std::ceil(mono.size() * ratio)) + 1);

    SRC_DATA src{};
    src.data_in = mono.data();
    src.input_frames = static_cast<long>(mono.size());
    src.data_out = out.samples.data();
    src.output_frames = static_cast<long>(out.samples.size());
    src.src_ratio = ratio;

    if (int err = src_simple(&src, SRC_SINC_MEDIUM_QUALITY, 1); err != 0) {
        return std::unexpected(std::string("resample failed: ") + src_strerror(err));
    }
    out.samples.resize(static_cast<size_t>(src.output_frames_gen));
    return out;
}

} // namespace audio
