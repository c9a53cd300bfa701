#include "audio/duration_probe.hpp"
#include "audio/source_resolver.hpp"
#include "config.hpp"
#include "log.hpp"
#include "model/model_config.hpp"
#include "model/model_manager.hpp"
#include "net/http_fetch.hpp"
#include "platform/platform_paths.hpp"
#include "server/http_server.hpp"
#include "storage/history_db.hpp"
#include "transcription/engine.hpp"
#include "transcription/pipeline.hpp"
#include "whisper/whisper_model.hpp"

#include <filesystem>
#include <memory>
#include <print>
#include <signal.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static bool ensure_dir(const std::string& path, const char* what) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        logging::error("cannot create {} directory {}: {}", what, path, ec.message());
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool preload = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--preload") {
            preload = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: scribed [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("      --preload       Load the model before accepting requests");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    logging::set_verbose(verbose);

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_env();

    auto model_config = ModelConfig::from(config.model);
    if (!model_config) {
        logging::error("{}", model_config.error());
        return 1;
    }

    if (!ensure_dir(config.files.temp_dir, "temp")) return 1;
    if (!ensure_dir(config.model.cache_dir, "model cache")) return 1;

    // Block termination signals before any worker thread starts so they
    // are only delivered to the waiter below.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    net::CurlGlobal curl;

    ModelManager models(*model_config, std::make_unique<WhisperModelLoader>(config.tools.ffmpeg));
    TranscriptionEngine engine(models);
    AudioSourceResolver resolver(config);
    DurationProbe probe(config.tools.ffprobe);

    std::unique_ptr<HistoryDb> history;
    if (config.history.enabled) {
        std::string db_path = config.history.path;
        if (db_path.empty()) {
            auto data = platform::data_dir();
            if (!data.empty()) db_path = data + "/history.db";
        }
        if (db_path.empty()) {
            logging::warn("no data directory (HOME unset), history disabled");
        } else {
            history = std::make_unique<HistoryDb>();
            if (!history->open(db_path)) {
                logging::warn("history DB failed to open, history disabled");
                history.reset();
            }
        }
    }

    TranscriptionPipeline pipeline(resolver, probe, engine, history.get());

    logging::info("Model: {}, device: {}, compute type: {}, threads: {}",
                  model_config->local_model_path.empty() ? model_config->model_name_or_path
                                                         : model_config->local_model_path,
                  to_string(model_config->device), to_string(model_config->compute_type),
                  model_config->thread_count);

    if (preload) {
        auto model = models.get_model();
        if (!model) {
            logging::error("{}", model.error().message);
            return 1;
        }
    }

    HttpServer server(config, models, pipeline, history.get());
    int port = server.bind(config.server.host, config.server.port);
    if (port < 0) {
        logging::error("could not bind to {}:{}", config.server.host, config.server.port);
        return 1;
    }

    std::jthread signal_waiter([&server, mask] {
        int sig = 0;
        sigwait(&mask, &sig);
        logging::info("Received signal {}, shutting down", sig);
        server.stop();
    });

    std::println(stderr, "[scribed] listening on http://{}:{}", config.server.host, port);

    bool ok = server.listen();

    // Wake the waiter if listen() returned without a signal; a pending
    // signal is harmless since every thread blocks it.
    kill(getpid(), SIGTERM);
    return ok ? 0 : 1;
}
