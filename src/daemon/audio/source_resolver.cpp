#include "audio/source_resolver.hpp"

#include "log.hpp"
#include "net/http_fetch.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultUrlExtension = "mp3";
constexpr size_t kMaxExtensionLength = 8;

double to_mb(uint64_t bytes) {
    return static_cast<double>(bytes) / 1024.0 / 1024.0;
}

} // namespace

AudioSourceResolver::AudioSourceResolver(const Config& config)
    : config_(config) {}

bool AudioSourceResolver::is_allowed(const std::string& filename) const {
    return config_.is_allowed_file(filename);
}

Result<TempAudioFile> AudioSourceResolver::from_upload(std::string_view bytes,
                                                       const std::string& filename,
                                                       const std::string& request_id) const {
    if (filename.empty()) {
        return make_error(ErrorKind::BadRequest, "no filename provided");
    }
    if (!is_allowed(filename)) {
        return make_error(ErrorKind::BadRequest,
                          "unsupported file format. Allowed formats: " +
                              config_.allowed_extensions_list());
    }

    uint64_t max = config_.files.max_file_size;
    if (bytes.size() > max) {
        logging::warn("upload {} too large: {:.2f}MB (max {}MB)", filename,
                      to_mb(bytes.size()), max / 1024 / 1024);
        return make_error(ErrorKind::PayloadTooLarge,
                          std::format("file too large. Maximum allowed size is {}MB",
                                      max / 1024 / 1024));
    }

    TempAudioFile file(temp_path("upload", request_id, text::extension_of(filename)));

    std::ofstream out(file.path(), std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return make_error(ErrorKind::Internal, "cannot create temp file " + file.path());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return make_error(ErrorKind::Internal, "failed to write temp file " + file.path());
    }

    logging::info("Saved upload {} ({:.2f}MB) to {}", filename, to_mb(bytes.size()), file.path());
    return file;
}

Result<TempAudioFile> AudioSourceResolver::from_url(const std::string& url,
                                                    const std::string& request_id) const {
    logging::info("Downloading audio from {}", url);

    auto lower = text::to_lower(url);
    if (!lower.starts_with("http://") && !lower.starts_with("https://")) {
        return make_error(ErrorKind::Download, "unsupported URL scheme (http and https only): " + url);
    }

    TempAudioFile file(temp_path("download", request_id, extension_from_url(url)));

    net::FetchOptions opts;
    opts.timeout_s = config_.files.download_timeout_s;
    opts.max_bytes = config_.files.max_file_size;

    auto fetched = net::fetch_to_file(url, file.path(), opts);
    if (!fetched) {
        return make_error(ErrorKind::Download, fetched.error());
    }

    logging::info("Download complete, {} bytes", fetched->bytes);
    return file;
}

std::string AudioSourceResolver::extension_from_url(const std::string& url) {
    std::string_view rest(url);

    auto cut = rest.find_first_of("?#");
    if (cut != std::string_view::npos) rest = rest.substr(0, cut);

    auto scheme = rest.find("://");
    if (scheme != std::string_view::npos) {
        rest = rest.substr(scheme + 3);
        auto slash = rest.find('/');
        if (slash == std::string_view::npos) return kDefaultUrlExtension;
        rest = rest.substr(slash);
    }

    auto last_slash = rest.rfind('/');
    auto segment = last_slash == std::string_view::npos ? rest : rest.substr(last_slash + 1);

    auto dot = segment.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == segment.size()) return kDefaultUrlExtension;

    auto ext = segment.substr(dot + 1);
    bool plain = ext.size() <= kMaxExtensionLength &&
                 std::ranges::all_of(ext, [](unsigned char c) { return std::isalnum(c) != 0; });
    if (!plain) return kDefaultUrlExtension;

    return text::to_lower(std::string(ext));
}

std::string AudioSourceResolver::temp_path(std::string_view prefix, const std::string& request_id,
                                           const std::string& ext) const {
    auto name = std::format("{}_{}.{}", prefix, request_id, ext);
    return (fs::path(config_.files.temp_dir) / name).string();
}
