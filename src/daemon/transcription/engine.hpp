#pragma once

#include "error.hpp"
#include "transcription/types.hpp"

#include <optional>
#include <string>

class ModelManager;

class TranscriptionEngine {
public:
    explicit TranscriptionEngine(ModelManager& models);

    // Runs the model over a local audio file and fully materializes its
    // segments. An empty language means auto-detect.
    Result<TranscriptionResult> transcribe(const std::string& audio_path,
                                           const std::optional<std::string>& language = std::nullopt);

    static TranscriptionOptions make_options(const std::optional<std::string>& language);

private:
    ModelManager& models_;
};
