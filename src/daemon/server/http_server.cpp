#include "server/http_server.hpp"

#include "log.hpp"
#include "model/model_manager.hpp"
#include "request_id.hpp"
#include "storage/history_db.hpp"
#include "transcription/pipeline.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <format>
#include <optional>

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

constexpr const char* kRequestIdHeader = "X-Request-ID";
constexpr int kDefaultHistoryLimit = 10;
constexpr int kMaxHistoryLimit = 100;

// Multipart framing overhead allowed on top of the file size limit, so the
// limit itself is enforced with a proper error body.
constexpr size_t kMultipartSlack = 1024 * 1024;

// Each request is served start to finish on one worker thread.
thread_local Clock::time_point t_request_start;

std::optional<std::string> form_language(const httplib::Request& req) {
    if (!req.has_file("language")) return std::nullopt;
    auto lang = req.get_file_value("language").content;
    if (lang.empty()) return std::nullopt;
    return lang;
}

} // namespace

HttpServer::HttpServer(const Config& config, ModelManager& models,
                       TranscriptionPipeline& pipeline, HistoryDb* history)
    : config_(config), models_(models), pipeline_(pipeline), history_(history) {
    server_.new_task_queue = [n = config_.server.workers] {
        return new httplib::ThreadPool(static_cast<size_t>(std::max(1, n)));
    };

    server_.set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                 {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                 {"Access-Control-Allow-Headers", "content-type, authorization"}});

    server_.set_read_timeout(config_.server.read_timeout_s, 0);
    server_.set_write_timeout(config_.server.write_timeout_s, 0);
    server_.set_payload_max_length(config_.files.max_file_size + kMultipartSlack);

    server_.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        t_request_start = Clock::now();
        auto id = request_id::generate();
        res.set_header(kRequestIdHeader, id);
        logging::info("[{}] --> {} {}", id, req.method, req.path);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.set_post_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        double elapsed = std::chrono::duration<double>(Clock::now() - t_request_start).count();
        res.set_header("X-Process-Time", std::format("{:.4f}", elapsed));
        logging::info("[{}] <-- {} {} {} ({:.3f}s)", request_id_of(res), req.method, req.path,
                      res.status, elapsed);
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // Non-standard exception type; reported with the generic message.
        }
        logging::error("[{}] unhandled exception on {} {}: {}", request_id_of(res), req.method,
                       req.path, what);
        send_detail(res, 500, std::format("internal server error: {}", what));
    });

    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        if (res.status == 404) send_detail(res, 404, std::format("not found: {}", req.path));
        else if (res.status == 413) send_detail(res, 413, "request body too large");
    });

    register_routes();
}

void HttpServer::register_routes() {
    server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    server_.Post("/transcribe", [this](const httplib::Request& req, httplib::Response& res) {
        handle_upload(req, res, false);
    });
    server_.Post("/transcribe/detail", [this](const httplib::Request& req, httplib::Response& res) {
        handle_upload(req, res, true);
    });
    server_.Post("/transcribe/url", [this](const httplib::Request& req, httplib::Response& res) {
        handle_url(req, res);
    });
    server_.Get("/history", [this](const httplib::Request& req, httplib::Response& res) {
        handle_history(req, res);
    });

    // CORS pre-flight
    server_.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });
}

int HttpServer::bind(const std::string& host, int port) {
    if (port == 0) return server_.bind_to_any_port(host);
    if (!server_.bind_to_port(host, port)) return -1;
    return port;
}

bool HttpServer::listen() {
    return server_.listen_after_bind();
}

void HttpServer::stop() {
    server_.stop();
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto& cfg = models_.config();
    std::string model = cfg.local_model_path.empty() ? cfg.model_name_or_path
                                                     : cfg.local_model_path;
    send_json(res, {
        {"status", "ok"},
        {"message", "scribed is running"},
        {"model", model},
        {"device", std::string(to_string(cfg.device))},
        {"model_loaded", models_.is_loaded()},
    });
}

void HttpServer::handle_upload(const httplib::Request& req, httplib::Response& res, bool detailed) {
    if (!req.has_file("file")) {
        send_detail(res, 400, "no file provided");
        return;
    }

    const auto& file = req.get_file_value("file");
    auto result = pipeline_.transcribe_upload(file.content, file.filename, form_language(req),
                                              request_id_of(res));
    if (!result) {
        send_detail(res, result.error().http_status(), result.error().message);
        return;
    }

    if (detailed) send_json(res, *result);
    else send_json(res, result->flat());
}

void HttpServer::handle_url(const httplib::Request& req, httplib::Response& res) {
    std::string url;
    std::optional<std::string> language;
    try {
        auto body = json::parse(req.body);
        if (!body.is_object() || !body.contains("url") || !body["url"].is_string()) {
            send_detail(res, 400, "field 'url' is required");
            return;
        }
        url = body["url"].get<std::string>();
        if (body.contains("language") && body["language"].is_string()) {
            auto lang = body["language"].get<std::string>();
            if (!lang.empty()) language = lang;
        }
    } catch (const json::exception& e) {
        send_detail(res, 400, std::format("invalid JSON body: {}", e.what()));
        return;
    }

    if (url.empty()) {
        send_detail(res, 400, "field 'url' is required");
        return;
    }

    auto resp = pipeline_.transcribe_url(url, language, request_id_of(res));
    send_json(res, resp.flat());
}

void HttpServer::handle_history(const httplib::Request& req, httplib::Response& res) {
    if (!history_) {
        send_detail(res, 404, "history disabled");
        return;
    }

    int limit = kDefaultHistoryLimit;
    if (req.has_param("limit")) {
        auto s = req.get_param_value("limit");
        int parsed = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
        if (ec != std::errc{} || ptr != s.data() + s.size() || parsed < 1) {
            send_detail(res, 400, "limit must be a positive integer");
            return;
        }
        limit = std::min(parsed, kMaxHistoryLimit);
    }

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : history_->recent(limit)) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"request_id", e.request_id},
            {"source", e.source},
            {"source_name", e.source_name},
            {"success", e.success},
            {"text", e.text},
            {"language", e.language.empty() ? json(nullptr) : json(e.language)},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"error", e.error.empty() ? json(nullptr) : json(e.error)},
        });
    }
    send_json(res, resp);
}

void HttpServer::send_json(httplib::Response& res, const json& body, int status) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void HttpServer::send_detail(httplib::Response& res, int status, const std::string& detail) {
    send_json(res, {{"detail", detail}}, status);
}

std::string HttpServer::request_id_of(const httplib::Response& res) {
    return res.get_header_value(kRequestIdHeader);
}
