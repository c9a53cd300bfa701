#include "net/http_fetch.hpp"

#include <curl/curl.h>
#include <format>
#include <fstream>

namespace net {

namespace {

struct Sink {
    std::ofstream out;
    uint64_t written = 0;
    uint64_t limit = 0;
    bool over_limit = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<Sink*>(userdata);
    size_t n = size * nmemb;
    if (sink->limit > 0 && sink->written + n > sink->limit) {
        sink->over_limit = true;
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->out.write(ptr, static_cast<std::streamsize>(n));
    if (!sink->out) return 0;
    sink->written += n;
    return n;
}

} // namespace

std::expected<FetchStats, std::string> fetch_to_file(const std::string& url,
                                                     const std::string& dest_path,
                                                     const FetchOptions& opts) {
    Sink sink;
    sink.limit = opts.max_bytes;
    sink.out.open(dest_path, std::ios::binary | std::ios::trunc);
    if (!sink.out.is_open()) {
        return std::unexpected("cannot open " + dest_path + " for writing");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_s);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (opts.max_bytes > 0) {
        curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE,
                         static_cast<curl_off_t>(opts.max_bytes));
    }

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    sink.out.close();

    if (sink.over_limit || res == CURLE_FILESIZE_EXCEEDED) {
        return std::unexpected(std::format("response body exceeds the {} byte limit", opts.max_bytes));
    }
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return std::unexpected("download failed: " + detail);
    }
    if (status < 200 || status >= 300) {
        return std::unexpected(std::format("HTTP {} fetching {}", status, url));
    }

    return FetchStats{.status = status, .bytes = sink.written};
}

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

} // namespace net
