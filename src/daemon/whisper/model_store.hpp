#pragma once

#include "model/speech_model.hpp"

#include <expected>
#include <string>

// Maps a model request onto a ggml model file, fetching named models into
// the cache directory on first use.
namespace model_store {

inline constexpr const char* kDefaultBaseUrl =
    "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";

inline constexpr const char* kVadModelFile = "ggml-silero-v5.1.2.bin";

// ggml-<name>-q8_0.bin, ggml-<name>.bin or ggml-<name>-f32.bin
std::string ggml_file_name(const std::string& name, ComputeType type);

std::expected<std::string, std::string> resolve(const LoadRequest& request,
                                                const std::string& base_url = kDefaultBaseUrl);

// Configured VAD model, or the conventional file in the cache directory.
// Empty when neither exists.
std::string find_vad_model(const std::string& configured, const std::string& cache_dir);

} // namespace model_store
