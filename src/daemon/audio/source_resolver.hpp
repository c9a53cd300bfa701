#pragma once

#include "audio/temp_audio_file.hpp"
#include "config.hpp"
#include "error.hpp"

#include <string>
#include <string_view>

// Turns uploaded bytes or a remote URL into a request-owned local file.
class AudioSourceResolver {
public:
    explicit AudioSourceResolver(const Config& config);

    bool is_allowed(const std::string& filename) const;

    Result<TempAudioFile> from_upload(std::string_view bytes, const std::string& filename,
                                      const std::string& request_id) const;

    Result<TempAudioFile> from_url(const std::string& url, const std::string& request_id) const;

    // Extension of the last path segment of url, or "mp3" when there is no
    // usable one. Query strings and fragments are ignored.
    static std::string extension_from_url(const std::string& url);

private:
    std::string temp_path(std::string_view prefix, const std::string& request_id,
                          const std::string& ext) const;

    const Config& config_;
};
