#include "api_client.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <format>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Owns the handle and any attached request state until the transfer ends.
struct Request {
    CURL* curl = curl_easy_init();
    curl_mime* mime = nullptr;
    curl_slist* headers = nullptr;

    ~Request() {
        if (mime) curl_mime_free(mime);
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
};

std::expected<ApiResponse, std::string> perform(Request& req, const std::string& url,
                                                long timeout_s) {
    std::string response_body;

    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    ApiResponse out;
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &out.status);

    try {
        out.body = json::parse(response_body);
    } catch (const json::exception& e) {
        return std::unexpected(std::format("HTTP {}: unparsable response: {}", out.status, e.what()));
    }
    return out;
}

} // namespace

ApiClient::ApiClient(std::string base_url, long timeout_s)
    : base_url_(std::move(base_url)), timeout_s_(timeout_s) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::expected<ApiResponse, std::string>
ApiClient::transcribe_file(const std::string& path, const std::optional<std::string>& language,
                           bool detailed) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected("no such file: " + path);
    }

    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");

    req.mime = curl_mime_init(req.curl);
    curl_mimepart* part = curl_mime_addpart(req.mime);
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, path.c_str()) != CURLE_OK) {
        return std::unexpected("cannot read " + path);
    }

    if (language && !language->empty()) {
        part = curl_mime_addpart(req.mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language->c_str(), CURL_ZERO_TERMINATED);
    }

    curl_easy_setopt(req.curl, CURLOPT_MIMEPOST, req.mime);
    return perform(req, base_url_ + (detailed ? "/transcribe/detail" : "/transcribe"), timeout_s_);
}

std::expected<ApiResponse, std::string>
ApiClient::transcribe_url(const std::string& url, const std::optional<std::string>& language) {
    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");

    json body = {{"url", url}};
    if (language && !language->empty()) body["language"] = *language;
    std::string payload = body.dump();

    req.headers = curl_slist_append(req.headers, "Content-Type: application/json");
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(req.curl, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    return perform(req, base_url_ + "/transcribe/url", timeout_s_);
}

std::expected<ApiResponse, std::string> ApiClient::status() {
    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");
    return perform(req, base_url_ + "/", timeout_s_);
}

std::expected<ApiResponse, std::string> ApiClient::history(int limit) {
    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");
    return perform(req, std::format("{}/history?limit={}", base_url_, limit), timeout_s_);
}
