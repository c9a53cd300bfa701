#pragma once

#include "config.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

enum class Device { Cpu, Gpu };

enum class ComputeType { Int8, Float16, Float32 };

std::string_view to_string(Device device);
std::string_view to_string(ComputeType type);

// "cuda" is accepted as an alias of "gpu".
std::optional<Device> parse_device(std::string_view s);
std::optional<ComputeType> parse_compute_type(std::string_view s);

struct ModelConfig {
    std::string model_name_or_path;
    std::string local_model_path; // overrides model_name_or_path when set
    Device device = Device::Cpu;
    ComputeType compute_type = ComputeType::Int8;
    int thread_count = 4;
    std::string model_cache_dir;
    std::string vad_model_path;

    static std::expected<ModelConfig, std::string> from(const Config::Model& m);
};
