#include "model/model_manager.hpp"

#include "log.hpp"

#include <exception>

ModelManager::ModelManager(ModelConfig config, std::unique_ptr<ModelLoader> loader)
    : config_(std::move(config)), loader_(std::move(loader)) {}

Result<std::shared_ptr<SpeechModel>> ModelManager::get_model() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (model_) return model_;
    if (load_error_) return std::unexpected(*load_error_);

    bool local = !config_.local_model_path.empty();
    logging::info("Loading model {} (device: {}, compute type: {}, threads: {})",
                  local ? config_.local_model_path : config_.model_name_or_path,
                  to_string(config_.device), to_string(config_.compute_type),
                  config_.thread_count);

    auto compute_type = config_.compute_type;
    if (config_.device == Device::Cpu && compute_type == ComputeType::Float16) {
        logging::warn("float16 is not supported on cpu, using int8");
        compute_type = ComputeType::Int8;
    }

    auto first = attempt(make_request(compute_type));
    if (first) {
        model_ = std::move(*first);
        active_compute_ = compute_type;
        logging::info("Model loaded (compute type: {})", to_string(compute_type));
        return model_;
    }

    logging::warn("model load with {} failed: {}", to_string(compute_type), first.error());
    logging::info("Retrying model load with float32");

    auto second = attempt(make_request(ComputeType::Float32));
    if (second) {
        model_ = std::move(*second);
        active_compute_ = ComputeType::Float32;
        logging::info("Model loaded (compute type: float32)");
        return model_;
    }

    load_error_ = Error{
        ErrorKind::ModelLoad,
        "model load failed: " + first.error() + "; float32 fallback failed: " + second.error(),
    };
    logging::error("{}", load_error_->message);
    return std::unexpected(*load_error_);
}

bool ModelManager::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr;
}

std::optional<ComputeType> ModelManager::active_compute_type() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_compute_;
}

LoadRequest ModelManager::make_request(ComputeType compute_type) const {
    bool local = !config_.local_model_path.empty();
    return LoadRequest{
        .model = local ? config_.local_model_path : config_.model_name_or_path,
        .is_local_path = local,
        .device = config_.device,
        .compute_type = compute_type,
        .thread_count = config_.thread_count,
        .download_root = local ? std::string{} : config_.model_cache_dir,
        .vad_model_path = config_.vad_model_path,
    };
}

std::expected<std::shared_ptr<SpeechModel>, std::string>
ModelManager::attempt(const LoadRequest& request) {
    try {
        auto result = loader_->load(request);
        if (result && !*result) {
            return std::unexpected("loader returned no model");
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}
