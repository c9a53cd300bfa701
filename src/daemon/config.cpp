#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void env_number(const char* name, T& target) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    std::string_view sv(v);
    T parsed{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        std::println(stderr, "config: ignoring {}={} (not a number)", name, v);
        return;
    }
    target = parsed;
}

void env_string(const char* name, std::string& target) {
    const char* v = std::getenv(name);
    if (v && *v) target = v;
}

} // namespace

bool Config::is_allowed_file(const std::string& filename) const {
    auto ext = text::extension_of(filename);
    if (ext.empty()) return false;
    return std::ranges::find(files.allowed_extensions, ext) != files.allowed_extensions.end();
}

std::string Config::allowed_extensions_list() const {
    std::string out;
    for (const auto& ext : files.allowed_extensions) {
        if (!out.empty()) out += ", ";
        out += ext;
    }
    return out;
}

void Config::apply_env() {
    env_string("WHISPER_MODEL", model.name);
    env_string("WHISPER_DEVICE", model.device);
    env_string("WHISPER_COMPUTE_TYPE", model.compute_type);
    env_number("WHISPER_CPU_THREADS", model.threads);
    env_string("WHISPER_MODEL_DIR", model.cache_dir);
    env_string("WHISPER_LOCAL_MODEL_PATH", model.local_path);
    env_string("WHISPER_VAD_MODEL", model.vad_model);
    env_string("API_HOST", server.host);
    env_number("API_PORT", server.port);
    env_string("TEMP_DIR", files.temp_dir);
    env_number("MAX_FILE_SIZE", files.max_file_size);
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("local_path")) cfg.model.local_path = m["local_path"].get<std::string>();
            if (m.contains("device")) cfg.model.device = m["device"].get<std::string>();
            if (m.contains("compute_type")) cfg.model.compute_type = m["compute_type"].get<std::string>();
            if (m.contains("threads")) cfg.model.threads = m["threads"].get<int>();
            if (m.contains("cache_dir")) cfg.model.cache_dir = m["cache_dir"].get<std::string>();
            if (m.contains("vad_model")) cfg.model.vad_model = m["vad_model"].get<std::string>();
        }

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host")) cfg.server.host = s["host"].get<std::string>();
            if (s.contains("port")) cfg.server.port = s["port"].get<uint16_t>();
            if (s.contains("workers")) cfg.server.workers = s["workers"].get<int>();
            if (s.contains("read_timeout")) cfg.server.read_timeout_s = s["read_timeout"].get<int>();
            if (s.contains("write_timeout")) cfg.server.write_timeout_s = s["write_timeout"].get<int>();
        }

        if (j.contains("files")) {
            auto& fl = j["files"];
            if (fl.contains("temp_dir")) cfg.files.temp_dir = fl["temp_dir"].get<std::string>();
            if (fl.contains("max_file_size")) cfg.files.max_file_size = fl["max_file_size"].get<uint64_t>();
            if (fl.contains("download_timeout")) cfg.files.download_timeout_s = fl["download_timeout"].get<int>();
            if (fl.contains("allowed_extensions")) {
                cfg.files.allowed_extensions.clear();
                for (auto& e : fl["allowed_extensions"]) {
                    cfg.files.allowed_extensions.push_back(text::to_lower(e.get<std::string>()));
                }
            }
        }

        if (j.contains("tools")) {
            auto& t = j["tools"];
            if (t.contains("ffprobe")) cfg.tools.ffprobe = t["ffprobe"].get<std::string>();
            if (t.contains("ffmpeg")) cfg.tools.ffmpeg = t["ffmpeg"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
