#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ApiResponse {
    long status = 0;
    nlohmann::json body;
};

// Blocking client for the scribed HTTP API. Transport failures and
// unparsable bodies are errors; HTTP error statuses are returned as-is.
class ApiClient {
public:
    explicit ApiClient(std::string base_url, long timeout_s = 600);

    std::expected<ApiResponse, std::string> transcribe_file(const std::string& path,
                                                           const std::optional<std::string>& language,
                                                           bool detailed);
    std::expected<ApiResponse, std::string> transcribe_url(const std::string& url,
                                                          const std::optional<std::string>& language);
    std::expected<ApiResponse, std::string> status();
    std::expected<ApiResponse, std::string> history(int limit);

private:
    std::string base_url_;
    long timeout_s_;
};
