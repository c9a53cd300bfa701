#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Model {
        std::string name = "small";       // named model, or a path to a model file
        std::string local_path;           // takes precedence over name when set
        std::string device = "cpu";       // "cpu", "gpu" ("cuda" accepted)
        std::string compute_type = "int8"; // "int8", "float16", "float32"
        int threads = 4;
        std::string cache_dir = "./models";
        std::string vad_model;            // Silero VAD ggml model; defaults into cache_dir
    } model;

    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 8000;
        int workers = 8;
        int read_timeout_s = 300;
        int write_timeout_s = 300;
    } server;

    struct Files {
        std::string temp_dir = "./temp";
        uint64_t max_file_size = 100ull * 1024 * 1024;
        int download_timeout_s = 60;
        std::vector<std::string> allowed_extensions = {
            "mp3", "wav", "m4a", "flac", "ogg", "wma", "aac", "opus", "webm", "mp4"};
    } files;

    struct Tools {
        std::string ffprobe = "ffprobe";
        std::string ffmpeg = "ffmpeg";
    } tools;

    struct History {
        bool enabled = true;
        std::string path; // empty: <data dir>/history.db
    } history;

    bool is_allowed_file(const std::string& filename) const;
    std::string allowed_extensions_list() const;

    // Environment variables override whatever the config file set.
    void apply_env();

    static Config load(const std::string& path);
    static Config load_default();
};
