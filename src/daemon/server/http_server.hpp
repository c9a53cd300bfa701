#pragma once

#include "config.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

class ModelManager;
class TranscriptionPipeline;
class HistoryDb;

class HttpServer {
public:
    // history may be null when the history store is disabled.
    HttpServer(const Config& config, ModelManager& models, TranscriptionPipeline& pipeline,
               HistoryDb* history);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Returns the bound port (port 0 binds any free port), or -1 on failure.
    int bind(const std::string& host, int port);

    // Blocks until stop() is called.
    bool listen();
    void stop();

    bool is_running() const { return server_.is_running(); }
    void wait_until_ready() const { server_.wait_until_ready(); }

private:
    void register_routes();

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_upload(const httplib::Request& req, httplib::Response& res, bool detailed);
    void handle_url(const httplib::Request& req, httplib::Response& res);
    void handle_history(const httplib::Request& req, httplib::Response& res);

    static void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200);
    static void send_detail(httplib::Response& res, int status, const std::string& detail);
    static std::string request_id_of(const httplib::Response& res);

    const Config& config_;
    ModelManager& models_;
    TranscriptionPipeline& pipeline_;
    HistoryDb* history_;
    httplib::Server server_;
};
