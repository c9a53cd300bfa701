#pragma once

#include "audio/temp_audio_file.hpp"
#include "error.hpp"
#include "transcription/response.hpp"

#include <optional>
#include <string>
#include <string_view>

class AudioSourceResolver;
class DurationProbe;
class TranscriptionEngine;
class HistoryDb;

// resolve -> probe -> transcribe -> shape, with the request's temp file
// held for the whole sequence.
class TranscriptionPipeline {
public:
    TranscriptionPipeline(AudioSourceResolver& resolver, DurationProbe& probe,
                          TranscriptionEngine& engine, HistoryDb* history = nullptr);

    // Only request-shape violations come back as an error; every other
    // outcome is a shaped response.
    Result<DetailResponse> transcribe_upload(std::string_view bytes, const std::string& filename,
                                             const std::optional<std::string>& language,
                                             const std::string& request_id);

    DetailResponse transcribe_url(const std::string& url,
                                  const std::optional<std::string>& language,
                                  const std::string& request_id);

private:
    struct Source {
        std::string kind; // "upload" or "url"
        std::string name;
        std::string request_id;
    };

    DetailResponse execute(const TempAudioFile& audio, const std::optional<std::string>& language,
                           const Source& source);
    void record(const Source& source, const DetailResponse& resp, double processing_time);

    AudioSourceResolver& resolver_;
    DurationProbe& probe_;
    TranscriptionEngine& engine_;
    HistoryDb* history_;
};
