#include <catch2/catch_test_macros.hpp>

#include "audio/pcm_decoder.hpp"
#include "test_support.hpp"

TEST_CASE("PCM decoding", "[pcm]") {
    test::TmpDir dir("pcm");
    auto audio = dir.file("a.mp3");
    test::write_file(audio, "data");

    SECTION("ReadsFloatSamplesFromStdout") {
        // Two little-endian float32 samples: 0.0 and 1.0
        auto bin = test::write_script(dir, "ffmpeg",
                                      "printf '\\000\\000\\000\\000\\000\\000\\200\\077'");
        auto samples = pcm::decode_file(bin, audio);
        REQUIRE(samples.has_value());
        REQUIRE(samples->size() == 2);
        REQUIRE((*samples)[0] == 0.0f);
        REQUIRE((*samples)[1] == 1.0f);
    }

    SECTION("SampleSplitAcrossWrites") {
        // 1.0f arrives in two writes; the trailing odd byte is dropped.
        auto bin = test::write_script(dir, "ffmpeg",
                                      "printf '\\000\\000'; sleep 0.1; printf '\\200\\077\\000'");
        auto samples = pcm::decode_file(bin, audio);
        REQUIRE(samples.has_value());
        REQUIRE(samples->size() == 1);
        REQUIRE((*samples)[0] == 1.0f);
    }

    SECTION("NonZeroExitIsError") {
        auto bin = test::write_script(dir, "ffmpeg", "echo 'Invalid data found' >&2; exit 1");
        auto samples = pcm::decode_file(bin, audio);
        REQUIRE_FALSE(samples.has_value());
        REQUIRE(samples.error().find("Invalid data found") != std::string::npos);
    }

    SECTION("EmptyOutputIsError") {
        auto bin = test::write_script(dir, "ffmpeg", "exit 0");
        REQUIRE_FALSE(pcm::decode_file(bin, audio).has_value());
    }

    SECTION("MissingBinaryIsError") {
        REQUIRE_FALSE(pcm::decode_file(dir.file("no-such-ffmpeg"), audio).has_value());
    }
}
