#pragma once

#include "model/speech_model.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace test {

// RAII scratch directory under the system temp dir.
struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("scribed_test_" + tag + "_" + std::to_string(getpid()) + "_" +
                std::to_string(counter++));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }

    size_t entry_count() const {
        size_t n = 0;
        for ([[maybe_unused]] auto& e : std::filesystem::directory_iterator(path)) ++n;
        return n;
    }
};

// Sets (or with nullopt, unsets) an environment variable for the scope,
// restoring the old value.
struct EnvVar {
    std::string name;
    std::optional<std::string> old;

    EnvVar(std::string n, const std::optional<std::string>& value) : name(std::move(n)) {
        if (const char* v = std::getenv(name.c_str())) old = v;
        if (value) setenv(name.c_str(), value->c_str(), 1);
        else unsetenv(name.c_str());
    }

    ~EnvVar() {
        if (old) setenv(name.c_str(), old->c_str(), 1);
        else unsetenv(name.c_str());
    }
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Writes an executable shell script standing in for ffprobe/ffmpeg.
inline std::string write_script(const TmpDir& dir, const std::string& name,
                                const std::string& body) {
    auto path = dir.file(name);
    write_file(path, "#!/bin/sh\n" + body + "\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);
    return path;
}

class FakeSegmentStream : public SegmentStream {
public:
    FakeSegmentStream(std::vector<RawSegment> segments, DecodeInfo info)
        : segments_(std::move(segments)), info_(std::move(info)) {}

    std::optional<RawSegment> next() override {
        if (pos_ >= segments_.size()) return std::nullopt;
        return segments_[pos_++];
    }

    const DecodeInfo& info() const override { return info_; }

private:
    std::vector<RawSegment> segments_;
    DecodeInfo info_;
    size_t pos_ = 0;
};

// Scripted model: returns the configured segments, fails with decode_error,
// throws decode_exception, or throws an int when decode_throws_int is set.
class FakeSpeechModel : public SpeechModel {
public:
    std::vector<RawSegment> segments;
    DecodeInfo info;
    std::string decode_error;
    std::string decode_exception;
    bool decode_throws_int = false;

    std::atomic<int> decode_calls{0};
    std::mutex mutex;
    std::string last_path;
    TranscriptionOptions last_options;
    bool last_path_existed = false;

    std::expected<std::unique_ptr<SegmentStream>, std::string>
    decode(const std::string& audio_path, const TranscriptionOptions& options) override {
        ++decode_calls;
        {
            std::lock_guard<std::mutex> lock(mutex);
            last_path = audio_path;
            last_options = options;
            last_path_existed = std::filesystem::exists(audio_path);
        }
        if (!decode_exception.empty()) throw std::runtime_error(decode_exception);
        if (decode_throws_int) throw 42;
        if (!decode_error.empty()) return std::unexpected(decode_error);
        return std::make_unique<FakeSegmentStream>(segments, info);
    }
};

// Loader double. fail_compute_types lists compute types whose load throws;
// fail_all makes every attempt return an error.
class FakeLoader : public ModelLoader {
public:
    explicit FakeLoader(std::shared_ptr<SpeechModel> model = std::make_shared<FakeSpeechModel>())
        : model_(std::move(model)) {}

    std::atomic<int> load_count{0};
    std::vector<ComputeType> fail_compute_types;
    bool fail_all = false;
    std::chrono::milliseconds delay{0};

    std::mutex mutex;
    std::vector<LoadRequest> requests;

    std::expected<std::shared_ptr<SpeechModel>, std::string>
    load(const LoadRequest& request) override {
        ++load_count;
        {
            std::lock_guard<std::mutex> lock(mutex);
            requests.push_back(request);
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        if (fail_all) return std::unexpected("no backend available");
        for (auto t : fail_compute_types) {
            if (t == request.compute_type) {
                throw std::runtime_error("unsupported compute type");
            }
        }
        return model_;
    }

private:
    std::shared_ptr<SpeechModel> model_;
};

// Serves canned routes on 127.0.0.1 from a background thread.
class LocalHttpServer {
public:
    httplib::Server server;
    int port = -1;

    LocalHttpServer() = default;
    ~LocalHttpServer() { stop(); }

    void start() {
        port = server.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    void stop() {
        if (thread_.joinable()) {
            server.stop();
            thread_.join();
        }
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

private:
    std::thread thread_;
};

} // namespace test
