#include "api_client.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--server URL] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe FILE [--language L] [--detail]  Transcribe a local audio file");
    std::println(stderr, "  url URL [--language L]                     Transcribe audio from a URL");
    std::println(stderr, "  status                                     Show server status");
    std::println(stderr, "  history [--limit N]                        Show recent requests");
}

static std::string text_or_null(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "-";
    if (j[key].is_string()) return j[key].get<std::string>();
    return j[key].dump();
}

// Prints a transcription payload. Returns the process exit code.
static int print_transcription(const ApiResponse& resp, bool detailed) {
    const auto& body = resp.body;
    if (resp.status != 200) {
        std::println(stderr, "Error (HTTP {}): {}", resp.status, body.value("detail", body.dump()));
        return 1;
    }
    if (!body.value("success", false)) {
        std::println(stderr, "Error: {}", text_or_null(body, "error"));
        return 1;
    }

    if (detailed && body.contains("segments")) {
        for (auto& seg : body["segments"]) {
            std::println("[{:7.2f} -> {:7.2f}] {}", seg.value("start", 0.0), seg.value("end", 0.0),
                         seg.value("text", ""));
        }
        std::println("Language: {}, duration: {}", text_or_null(body, "language"),
                     text_or_null(body, "duration"));
    } else {
        std::println("{}", body.value("text", ""));
    }
    return 0;
}

int main(int argc, char* argv[]) {
    const char* env_url = std::getenv("SCRIBED_URL");
    std::string server = env_url && *env_url ? env_url : "http://localhost:8000";
    std::string command;
    std::string target;
    std::optional<std::string> language;
    bool detailed = false;
    int limit = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--server" && i + 1 < argc) {
            server = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--detail") {
            detailed = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (target.empty()) {
            target = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }
    if ((command == "transcribe" || command == "url") && target.empty()) {
        std::println(stderr, "{}: missing argument", command);
        usage(argv[0]);
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    ApiClient client(server);
    int rc = 0;

    if (command == "transcribe") {
        auto resp = client.transcribe_file(target, language, detailed);
        if (!resp) {
            std::println(stderr, "Error: {}", resp.error());
            rc = 1;
        } else {
            rc = print_transcription(*resp, detailed);
        }
    } else if (command == "url") {
        auto resp = client.transcribe_url(target, language);
        if (!resp) {
            std::println(stderr, "Error: {}", resp.error());
            rc = 1;
        } else {
            rc = print_transcription(*resp, false);
        }
    } else if (command == "status") {
        auto resp = client.status();
        if (!resp) {
            std::println(stderr, "Failed to reach scribed at {}: {}", server, resp.error());
            rc = 1;
        } else {
            auto& b = resp->body;
            std::println("Status: {}", b.value("status", "unknown"));
            std::println("Model: {} ({})", b.value("model", ""), b.value("device", ""));
            std::println("Model loaded: {}", b.value("model_loaded", false) ? "yes" : "no");
        }
    } else if (command == "history") {
        auto resp = client.history(limit);
        if (!resp) {
            std::println(stderr, "Error: {}", resp.error());
            rc = 1;
        } else if (resp->status != 200) {
            std::println(stderr, "Error: {}", resp->body.value("detail", resp->body.dump()));
            rc = 1;
        } else {
            for (auto& entry : resp->body["entries"]) {
                std::println("[{}] {} {}", entry.value("timestamp", ""), entry.value("source", ""),
                             text_or_null(entry, "source_name"));
                if (entry.value("success", false)) {
                    std::println("  {}", entry.value("text", ""));
                } else {
                    std::println("  Error: {}", text_or_null(entry, "error"));
                }
            }
        }
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
