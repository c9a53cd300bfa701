#pragma once

#include "error.hpp"
#include "model/model_config.hpp"
#include "model/speech_model.hpp"

#include <memory>
#include <mutex>
#include <optional>

// Owns the process-wide speech model. The first get_model() loads it (with a
// float32 retry on failure); later calls return the same handle. A load that
// fails twice is remembered and reported to every later caller.
class ModelManager {
public:
    ModelManager(ModelConfig config, std::unique_ptr<ModelLoader> loader);

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    Result<std::shared_ptr<SpeechModel>> get_model();

    bool is_loaded() const;
    const ModelConfig& config() const { return config_; }

    // Compute type actually in use once loaded (after downgrade/fallback).
    std::optional<ComputeType> active_compute_type() const;

private:
    LoadRequest make_request(ComputeType compute_type) const;
    std::expected<std::shared_ptr<SpeechModel>, std::string> attempt(const LoadRequest& request);

    ModelConfig config_;
    std::unique_ptr<ModelLoader> loader_;

    mutable std::mutex mutex_;
    std::shared_ptr<SpeechModel> model_;
    std::optional<ComputeType> active_compute_;
    std::optional<Error> load_error_;
};
