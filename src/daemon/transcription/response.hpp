#pragma once

#include "error.hpp"
#include "transcription/types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct FlatResponse {
    bool success = false;
    std::string text;
    std::optional<std::string> language;
    std::optional<double> duration;
    std::optional<std::string> error;
};

struct DetailResponse {
    bool success = false;
    std::string text;
    std::optional<std::string> language;
    std::optional<double> duration;
    std::vector<Segment> segments;
    std::optional<std::string> error;

    FlatResponse flat() const;
};

namespace response {

// probed_duration wins when positive, then the engine's own duration;
// otherwise the duration is reported as null.
DetailResponse success(const TranscriptionResult& result, double probed_duration);

// Business failure payload: success=false, empty text, the error message.
DetailResponse failure(const Error& error);

} // namespace response

void to_json(nlohmann::json& j, const Segment& s);
void to_json(nlohmann::json& j, const FlatResponse& r);
void to_json(nlohmann::json& j, const DetailResponse& r);
