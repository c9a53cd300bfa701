#include "transcription/response.hpp"

FlatResponse DetailResponse::flat() const {
    return FlatResponse{
        .success = success,
        .text = text,
        .language = language,
        .duration = duration,
        .error = error,
    };
}

namespace response {

DetailResponse success(const TranscriptionResult& result, double probed_duration) {
    DetailResponse r;
    r.success = true;
    r.text = result.full_text;
    if (!result.detected_language.empty()) r.language = result.detected_language;
    if (probed_duration > 0.0) {
        r.duration = probed_duration;
    } else if (result.duration_seconds > 0.0) {
        r.duration = result.duration_seconds;
    }
    r.segments = result.segments;
    return r;
}

DetailResponse failure(const Error& error) {
    DetailResponse r;
    r.success = false;
    r.error = error.message;
    return r;
}

} // namespace response

namespace {

template <typename T>
nlohmann::json nullable(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json& j, const Segment& s) {
    j = {
        {"id", s.id},
        {"start", s.start},
        {"end", s.end},
        {"text", s.text},
    };
}

void to_json(nlohmann::json& j, const FlatResponse& r) {
    j = {
        {"success", r.success},
        {"text", r.text},
        {"language", nullable(r.language)},
        {"duration", nullable(r.duration)},
        {"error", nullable(r.error)},
    };
}

void to_json(nlohmann::json& j, const DetailResponse& r) {
    j = {
        {"success", r.success},
        {"text", r.text},
        {"language", nullable(r.language)},
        {"duration", nullable(r.duration)},
        {"segments", r.segments},
        {"error", nullable(r.error)},
    };
}
