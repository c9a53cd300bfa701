#pragma once

#include <string>

// A request-owned audio file on disk. The file is removed when the handle is
// destroyed, whichever way the request ends.
class TempAudioFile {
public:
    TempAudioFile() = default;
    explicit TempAudioFile(std::string path);
    ~TempAudioFile();

    TempAudioFile(const TempAudioFile&) = delete;
    TempAudioFile& operator=(const TempAudioFile&) = delete;
    TempAudioFile(TempAudioFile&& other) noexcept;
    TempAudioFile& operator=(TempAudioFile&& other) noexcept;

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

private:
    void remove();

    std::string path_;
};
