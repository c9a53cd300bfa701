#include "model/model_config.hpp"

#include "text_util.hpp"

std::string_view to_string(Device device) {
    switch (device) {
        case Device::Cpu: return "cpu";
        case Device::Gpu: return "gpu";
    }
    return "cpu";
}

std::string_view to_string(ComputeType type) {
    switch (type) {
        case ComputeType::Int8: return "int8";
        case ComputeType::Float16: return "float16";
        case ComputeType::Float32: return "float32";
    }
    return "float32";
}

std::optional<Device> parse_device(std::string_view s) {
    auto v = text::to_lower(std::string(s));
    if (v == "cpu") return Device::Cpu;
    if (v == "gpu" || v == "cuda") return Device::Gpu;
    return std::nullopt;
}

std::optional<ComputeType> parse_compute_type(std::string_view s) {
    auto v = text::to_lower(std::string(s));
    if (v == "int8") return ComputeType::Int8;
    if (v == "float16") return ComputeType::Float16;
    if (v == "float32") return ComputeType::Float32;
    return std::nullopt;
}

std::expected<ModelConfig, std::string> ModelConfig::from(const Config::Model& m) {
    auto device = parse_device(m.device);
    if (!device) {
        return std::unexpected("unknown device '" + m.device + "' (expected cpu or gpu)");
    }
    auto compute = parse_compute_type(m.compute_type);
    if (!compute) {
        return std::unexpected("unknown compute type '" + m.compute_type +
                               "' (expected int8, float16 or float32)");
    }
    if (m.threads <= 0) {
        return std::unexpected("thread count must be positive");
    }

    return ModelConfig{
        .model_name_or_path = m.name,
        .local_model_path = m.local_path,
        .device = *device,
        .compute_type = *compute,
        .thread_count = m.threads,
        .model_cache_dir = m.cache_dir,
        .vad_model_path = m.vad_model,
    };
}
