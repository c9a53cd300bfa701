#include "whisper/model_store.hpp"

#include "log.hpp"
#include "net/http_fetch.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace model_store {

// Only quantized and f16 weights are published; float32 runs the f16 file.
std::string ggml_file_name(const std::string& name, ComputeType type) {
    if (type == ComputeType::Int8) return std::format("ggml-{}-q8_0.bin", name);
    return std::format("ggml-{}.bin", name);
}

std::expected<std::string, std::string> resolve(const LoadRequest& request,
                                                const std::string& base_url) {
    std::error_code ec;

    if (request.is_local_path) {
        if (!fs::is_regular_file(request.model, ec)) {
            return std::unexpected("local model not found: " + request.model);
        }
        return request.model;
    }

    if (request.model.empty()) {
        return std::unexpected("no model configured");
    }

    // A name that already points at a file is taken as-is.
    if (fs::is_regular_file(request.model, ec)) {
        return request.model;
    }

    auto file_name = ggml_file_name(request.model, request.compute_type);
    auto root = request.download_root.empty() ? fs::path(".") : fs::path(request.download_root);
    auto target = root / file_name;
    if (fs::is_regular_file(target, ec)) {
        return target.string();
    }

    fs::create_directories(root, ec);
    if (ec) {
        return std::unexpected("cannot create model directory " + root.string() + ": " + ec.message());
    }

    auto url = base_url + "/" + file_name;
    auto partial = target;
    partial += ".part";

    logging::info("Downloading model {} to {}", url, target.string());

    net::FetchOptions opts;
    opts.timeout_s = 0;
    opts.connect_timeout_s = 30;

    auto fetched = net::fetch_to_file(url, partial.string(), opts);
    if (!fetched) {
        fs::remove(partial, ec);
        return std::unexpected("model download failed: " + fetched.error());
    }

    fs::rename(partial, target, ec);
    if (ec) {
        fs::remove(partial, ec);
        return std::unexpected("cannot move downloaded model into place: " + target.string());
    }

    logging::info("Model downloaded ({} bytes)", fetched->bytes);
    return target.string();
}

std::string find_vad_model(const std::string& configured, const std::string& cache_dir) {
    std::error_code ec;
    if (!configured.empty()) {
        return fs::is_regular_file(configured, ec) ? configured : std::string{};
    }
    if (cache_dir.empty()) return {};
    auto candidate = fs::path(cache_dir) / kVadModelFile;
    return fs::is_regular_file(candidate, ec) ? candidate.string() : std::string{};
}

} // namespace model_store
