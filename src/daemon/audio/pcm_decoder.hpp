#pragma once

#include <expected>
#include <string>
#include <vector>

namespace pcm {

constexpr int kSampleRate = 16000;

// Decodes any container/codec ffmpeg understands into 16 kHz mono float
// samples in [-1, 1].
std::expected<std::vector<float>, std::string> decode_file(const std::string& ffmpeg_bin,
                                                           const std::string& audio_path);

} // namespace pcm
