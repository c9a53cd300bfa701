#include "audio/duration_probe.hpp"

#include "log.hpp"
#include "process.hpp"
#include "text_util.hpp"

#include <charconv>
#include <cmath>

DurationProbe::DurationProbe(std::string ffprobe_bin)
    : ffprobe_bin_(std::move(ffprobe_bin)) {}

double DurationProbe::probe_duration(const std::string& audio_path) const {
    auto result = process::run({
        ffprobe_bin_, "-v", "error",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        audio_path,
    });
    if (!result) {
        logging::warn("cannot probe duration of {}: {}", audio_path, result.error());
        return 0.0;
    }

    auto out = text::trim(result->out);
    double seconds = 0.0;
    auto [ptr, ec] = std::from_chars(out.data(), out.data() + out.size(), seconds);
    if (out.empty() || ec != std::errc{} || ptr != out.data() + out.size() ||
        !std::isfinite(seconds) || seconds < 0.0) {
        logging::warn("cannot probe duration of {}: ffprobe exited {} with output '{}'",
                      audio_path, result->exit_code, out);
        return 0.0;
    }

    return seconds;
}
