#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace net {

struct FetchOptions {
    long timeout_s = 60;         // whole transfer; 0 = no limit
    long connect_timeout_s = 15;
    uint64_t max_bytes = 0;      // 0 = unlimited
};

struct FetchStats {
    long status = 0;
    uint64_t bytes = 0;
};

// GET url (http/https only, redirects followed) and stream the body into
// dest_path. Any non-2xx final status is an error whose message contains
// the status code.
std::expected<FetchStats, std::string> fetch_to_file(const std::string& url,
                                                     const std::string& dest_path,
                                                     const FetchOptions& opts = {});

// curl_global_init/cleanup for the lifetime of main().
struct CurlGlobal {
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace net
