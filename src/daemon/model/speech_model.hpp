#pragma once

#include "model/model_config.hpp"
#include "transcription/types.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>

// A segment as emitted by the inference engine, text untouched.
struct RawSegment {
    int id = 0;
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

// Side-channel information reported alongside the segments.
struct DecodeInfo {
    std::string language;
    double duration = 0.0;
};

// Lazy, single-pass sequence of recognized segments.
class SegmentStream {
public:
    virtual ~SegmentStream() = default;
    virtual std::optional<RawSegment> next() = 0;
    virtual const DecodeInfo& info() const = 0;
};

// A loaded speech-to-text model. decode() may be called concurrently.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;
    virtual std::expected<std::unique_ptr<SegmentStream>, std::string>
        decode(const std::string& audio_path, const TranscriptionOptions& options) = 0;
};

struct LoadRequest {
    std::string model;         // local path or model name
    bool is_local_path = false;
    Device device = Device::Cpu;
    ComputeType compute_type = ComputeType::Int8;
    int thread_count = 4;
    std::string download_root; // empty for local paths
    std::string vad_model_path;
};

class ModelLoader {
public:
    virtual ~ModelLoader() = default;
    virtual std::expected<std::shared_ptr<SpeechModel>, std::string>
        load(const LoadRequest& request) = 0;
};
