#include "audio/temp_audio_file.hpp"

#include "log.hpp"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

TempAudioFile::TempAudioFile(std::string path)
    : path_(std::move(path)) {}

TempAudioFile::~TempAudioFile() {
    remove();
}

TempAudioFile::TempAudioFile(TempAudioFile&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

TempAudioFile& TempAudioFile::operator=(TempAudioFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void TempAudioFile::remove() {
    if (path_.empty()) return;

    std::error_code ec;
    if (fs::remove(path_, ec)) {
        logging::info("Removed temp file {}", path_);
    } else if (ec) {
        logging::warn("could not remove temp file {}: {}", path_, ec.message());
    }
    path_.clear();
}
