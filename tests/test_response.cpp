#include <catch2/catch_test_macros.hpp>

#include "transcription/response.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

TranscriptionResult sample_result() {
    TranscriptionResult r;
    r.full_text = "你好世界";
    r.detected_language = "zh";
    r.duration_seconds = 2.5;
    r.segments = {{0, 0.0, 1.2, "你好"}, {1, 1.2, 2.5, "世界"}};
    return r;
}

} // namespace

TEST_CASE("Response shaping", "[response]") {

    SECTION("FlatSuccess") {
        auto resp = response::success(sample_result(), 2.5);
        json j = resp.flat();
        REQUIRE(j == json::parse(R"({
            "success": true, "text": "你好世界", "language": "zh",
            "duration": 2.5, "error": null
        })"));
    }

    SECTION("DetailedCarriesSegments") {
        json j = response::success(sample_result(), 2.5);
        REQUIRE(j["segments"].size() == 2);
        REQUIRE(j["segments"][0] == json::parse(R"({"id": 0, "start": 0.0, "end": 1.2, "text": "你好"})"));
        REQUIRE(j["segments"][1]["text"] == "世界");
        REQUIRE(j["error"].is_null());
    }

    SECTION("ProbedDurationPreferred") {
        auto resp = response::success(sample_result(), 3.75);
        REQUIRE(resp.duration == 3.75);
    }

    SECTION("EngineDurationWhenProbeFailed") {
        auto resp = response::success(sample_result(), 0.0);
        REQUIRE(resp.duration == 2.5);
    }

    SECTION("NullDurationWhenUnknown") {
        auto result = sample_result();
        result.duration_seconds = 0.0;
        json j = response::success(result, 0.0).flat();
        REQUIRE(j["duration"].is_null());
    }

    SECTION("FailurePayload") {
        auto resp = response::failure(Error{ErrorKind::Download, "HTTP 404 fetching http://x/a.mp3"});
        json flat = resp.flat();
        REQUIRE(flat["success"] == false);
        REQUIRE(flat["text"] == "");
        REQUIRE(flat["language"].is_null());
        REQUIRE(flat["duration"].is_null());
        REQUIRE(flat["error"] == "HTTP 404 fetching http://x/a.mp3");
        REQUIRE_FALSE(flat.contains("segments"));

        json detailed = resp;
        REQUIRE(detailed["segments"].is_array());
        REQUIRE(detailed["segments"].empty());
    }
}
