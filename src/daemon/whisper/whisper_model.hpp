#pragma once

#include "model/speech_model.hpp"

#include <string>

// Loads ggml Whisper models through whisper.cpp. Audio is decoded with
// ffmpeg; each decode() call runs on its own whisper_state so one context
// can serve concurrent requests.
class WhisperModelLoader : public ModelLoader {
public:
    explicit WhisperModelLoader(std::string ffmpeg_bin = "ffmpeg");

    std::expected<std::shared_ptr<SpeechModel>, std::string>
        load(const LoadRequest& request) override;

private:
    std::string ffmpeg_bin_;
};
