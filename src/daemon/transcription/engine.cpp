#include "transcription/engine.hpp"

#include "log.hpp"
#include "model/model_manager.hpp"
#include "text_util.hpp"

TranscriptionEngine::TranscriptionEngine(ModelManager& models)
    : models_(models) {}

TranscriptionOptions TranscriptionEngine::make_options(const std::optional<std::string>& language) {
    TranscriptionOptions opts;
    opts.beam_size = 5;
    opts.vad_enabled = true;
    opts.min_silence_ms = 500;
    // "auto" means detect, same as omitting the language.
    if (language && !language->empty() && text::to_lower(*language) != "auto") {
        opts.language = *language;
    }
    return opts;
}

Result<TranscriptionResult> TranscriptionEngine::transcribe(const std::string& audio_path,
                                                            const std::optional<std::string>& language) {
    auto model = models_.get_model();
    if (!model) return std::unexpected(model.error());

    auto opts = make_options(language);
    logging::info("Transcribing {} (language: {})", audio_path,
                  opts.language ? *opts.language : "auto-detect");

    auto stream = (*model)->decode(audio_path, opts);
    if (!stream) {
        return make_error(ErrorKind::Transcription, stream.error());
    }

    TranscriptionResult result;
    std::string joined;
    while (auto raw = (*stream)->next()) {
        auto text = text::trim(raw->text);
        joined += text;
        result.segments.push_back(Segment{
            .id = raw->id,
            .start = raw->start,
            .end = raw->end,
            .text = std::move(text),
        });
    }

    const auto& info = (*stream)->info();
    result.full_text = text::trim(joined);
    result.detected_language = info.language;
    result.duration_seconds = info.duration;

    logging::info("Transcription done, language: {}, segments: {}",
                  result.detected_language, result.segments.size());
    return result;
}
