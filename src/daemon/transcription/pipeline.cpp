#include "transcription/pipeline.hpp"

#include "audio/duration_probe.hpp"
#include "audio/source_resolver.hpp"
#include "log.hpp"
#include "storage/history_db.hpp"
#include "transcription/engine.hpp"

#include <chrono>
#include <exception>

using Clock = std::chrono::steady_clock;

namespace {

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace

TranscriptionPipeline::TranscriptionPipeline(AudioSourceResolver& resolver, DurationProbe& probe,
                                             TranscriptionEngine& engine, HistoryDb* history)
    : resolver_(resolver), probe_(probe), engine_(engine), history_(history) {}

Result<DetailResponse> TranscriptionPipeline::transcribe_upload(
    std::string_view bytes, const std::string& filename,
    const std::optional<std::string>& language, const std::string& request_id) {
    Source source{.kind = "upload", .name = filename, .request_id = request_id};

    auto audio = resolver_.from_upload(bytes, filename, request_id);
    if (!audio) {
        if (audio.error().is_client_error()) {
            logging::info("[{}] rejected upload '{}': {}", request_id, filename, audio.error().message);
            return std::unexpected(audio.error());
        }
        logging::error("[{}] {}", request_id, audio.error().message);
        auto resp = response::failure(audio.error());
        record(source, resp, 0.0);
        return resp;
    }

    logging::info("[{}] received '{}' ({} bytes)", request_id, filename, bytes.size());
    return execute(*audio, language, source);
}

DetailResponse TranscriptionPipeline::transcribe_url(const std::string& url,
                                                     const std::optional<std::string>& language,
                                                     const std::string& request_id) {
    Source source{.kind = "url", .name = url, .request_id = request_id};
    auto start = Clock::now();

    auto audio = resolver_.from_url(url, request_id);
    if (!audio) {
        logging::error("[{}] {}", request_id, audio.error().message);
        auto resp = response::failure(audio.error());
        record(source, resp, seconds_since(start));
        return resp;
    }

    return execute(*audio, language, source);
}

DetailResponse TranscriptionPipeline::execute(const TempAudioFile& audio,
                                              const std::optional<std::string>& language,
                                              const Source& source) {
    const auto& id = source.request_id;

    double duration = probe_.probe_duration(audio.path());
    if (duration > 0.0) logging::info("[{}] Audio duration: {:.2f}s", id, duration);

    auto start = Clock::now();
    Result<TranscriptionResult> result;
    try {
        result = engine_.transcribe(audio.path(), language);
    } catch (const std::exception& e) {
        result = make_error(ErrorKind::Transcription, e.what());
    }
    double elapsed = seconds_since(start);

    if (!result) {
        logging::error("[{}] transcription failed ({}): {}", id, to_string(result.error().kind),
                       result.error().message);
        auto resp = response::failure(result.error());
        record(source, resp, elapsed);
        return resp;
    }

    logging::info("[{}] Transcription completed in {:.2f}s, language: {}, text length: {}",
                  id, elapsed, result->detected_language, result->full_text.size());
    if (duration > 0.0) logging::info("[{}] RTF: {:.3f}", id, elapsed / duration);

    auto resp = response::success(*result, duration);
    record(source, resp, elapsed);
    return resp;
}

void TranscriptionPipeline::record(const Source& source, const DetailResponse& resp,
                                   double processing_time) {
    if (!history_) return;

    HistoryEntry e;
    e.request_id = source.request_id;
    e.source = source.kind;
    e.source_name = source.name;
    e.success = resp.success;
    e.text = resp.text;
    e.language = resp.language.value_or("");
    e.audio_duration = resp.duration.value_or(0.0);
    e.processing_time = processing_time;
    e.error = resp.error.value_or("");

    if (!history_->insert(e)) logging::warn("[{}] failed to record history entry", source.request_id);
}
