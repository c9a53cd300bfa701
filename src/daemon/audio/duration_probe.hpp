#pragma once

#include <string>

// Best-effort audio duration via ffprobe. Any failure yields 0.0.
class DurationProbe {
public:
    explicit DurationProbe(std::string ffprobe_bin = "ffprobe");

    double probe_duration(const std::string& audio_path) const;

private:
    std::string ffprobe_bin_;
};
