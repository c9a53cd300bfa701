#pragma once

#include <optional>
#include <string>
#include <vector>

struct TranscriptionOptions {
    int beam_size = 5;
    bool vad_enabled = true;
    int min_silence_ms = 500;
    std::optional<std::string> language; // unset: auto-detect
};

struct Segment {
    int id = 0;
    double start = 0.0; // seconds
    double end = 0.0;
    std::string text;   // trimmed
};

struct TranscriptionResult {
    std::string full_text;
    std::string detected_language;
    double duration_seconds = 0.0;
    std::vector<Segment> segments;
};
