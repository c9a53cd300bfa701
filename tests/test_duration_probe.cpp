#include <catch2/catch_test_macros.hpp>

#include "audio/duration_probe.hpp"
#include "test_support.hpp"

TEST_CASE("DurationProbe", "[probe]") {
    test::TmpDir dir("probe");
    auto audio = dir.file("a.wav");
    test::write_file(audio, "data");

    SECTION("ParsesSeconds") {
        auto bin = test::write_script(dir, "ffprobe", "echo 2.5");
        DurationProbe probe(bin);
        REQUIRE(probe.probe_duration(audio) == 2.5);
    }

    SECTION("PassesPathAsLastArgument") {
        // Prints 1 when the last argument is the audio path
        auto bin = test::write_script(dir, "ffprobe",
                                      "for a; do last=$a; done; [ \"$last\" = \"" + audio +
                                          "\" ] && echo 1 || echo 0");
        DurationProbe probe(bin);
        REQUIRE(probe.probe_duration(audio) == 1.0);
    }

    SECTION("NonNumericOutputIsZero") {
        auto bin = test::write_script(dir, "ffprobe", "echo N/A");
        DurationProbe probe(bin);
        REQUIRE(probe.probe_duration(audio) == 0.0);
    }

    SECTION("FailingProbeIsZero") {
        auto bin = test::write_script(dir, "ffprobe", "echo 'Invalid data' >&2; exit 1");
        DurationProbe probe(bin);
        REQUIRE(probe.probe_duration(audio) == 0.0);
    }

    SECTION("MissingBinaryIsZero") {
        DurationProbe probe(dir.file("no-such-ffprobe"));
        REQUIRE(probe.probe_duration(audio) == 0.0);
    }
}
