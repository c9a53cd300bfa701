#include "audio/pcm_decoder.hpp"

#include "process.hpp"
#include "text_util.hpp"

#include <cstring>
#include <format>

namespace pcm {

std::expected<std::vector<float>, std::string> decode_file(const std::string& ffmpeg_bin,
                                                           const std::string& audio_path) {
    // f32le bytes land directly in the sample buffer; a sample may straddle
    // two reads, so the buffer is sized by bytes and trimmed at the end.
    std::vector<float> samples;
    size_t bytes = 0;
    auto append = [&](const char* data, size_t size) {
        samples.resize((bytes + size + sizeof(float) - 1) / sizeof(float));
        std::memcpy(reinterpret_cast<char*>(samples.data()) + bytes, data, size);
        bytes += size;
    };

    auto result = process::run({
        ffmpeg_bin, "-nostdin", "-hide_banner", "-v", "error",
        "-i", audio_path,
        "-vn", "-f", "f32le", "-acodec", "pcm_f32le",
        "-ac", "1", "-ar", std::to_string(kSampleRate),
        "-",
    }, append);
    if (!result) {
        return std::unexpected("cannot run ffmpeg: " + result.error());
    }
    if (result->exit_code != 0) {
        auto err = text::trim(result->err);
        return std::unexpected(std::format("failed to decode audio (ffmpeg exit {}){}{}",
                                           result->exit_code, err.empty() ? "" : ": ", err));
    }

    samples.resize(bytes / sizeof(float));
    if (samples.empty()) {
        return std::unexpected("audio contains no samples");
    }
    return samples;
}

} // namespace pcm
