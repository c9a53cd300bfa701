#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "whisper/model_store.hpp"

#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("Model store file naming", "[model_store]") {
    REQUIRE(model_store::ggml_file_name("small", ComputeType::Int8) == "ggml-small-q8_0.bin");
    REQUIRE(model_store::ggml_file_name("small", ComputeType::Float16) == "ggml-small.bin");
    REQUIRE(model_store::ggml_file_name("large-v3", ComputeType::Float32) == "ggml-large-v3.bin");
    REQUIRE(model_store::ggml_file_name("large-v3", ComputeType::Float16) ==
            model_store::ggml_file_name("large-v3", ComputeType::Float32));
}

TEST_CASE("Model store resolve", "[model_store]") {
    test::TmpDir dir("models");

    test::LocalHttpServer repo;
    repo.server.Get("/ggml-tiny-q8_0.bin", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("ggml-weights", "application/octet-stream");
    });
    repo.server.Get("/ggml-tiny.bin", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("f16-weights", "application/octet-stream");
    });
    repo.start();
    auto base_url = repo.url("");

    LoadRequest req{
        .model = "tiny",
        .is_local_path = false,
        .device = Device::Cpu,
        .compute_type = ComputeType::Int8,
        .thread_count = 1,
        .download_root = dir.path.string(),
        .vad_model_path = "",
    };

    SECTION("LocalPathUsedAsIs") {
        auto local = dir.file("custom.bin");
        test::write_file(local, "x");
        req.model = local;
        req.is_local_path = true;
        req.download_root.clear();

        auto path = model_store::resolve(req, base_url);
        REQUIRE(path.has_value());
        REQUIRE(*path == local);
    }

    SECTION("MissingLocalPathIsError") {
        req.model = dir.file("missing.bin");
        req.is_local_path = true;
        REQUIRE_FALSE(model_store::resolve(req, base_url).has_value());
    }

    SECTION("NameThatIsAFileUsedAsIs") {
        auto file = dir.file("ggml-mine.bin");
        test::write_file(file, "x");
        req.model = file;
        auto path = model_store::resolve(req, base_url);
        REQUIRE(path.has_value());
        REQUIRE(*path == file);
    }

    SECTION("CachedFileNotDownloadedAgain") {
        auto cached = dir.file("ggml-tiny-q8_0.bin");
        test::write_file(cached, "cached");
        repo.stop();

        auto path = model_store::resolve(req, base_url);
        REQUIRE(path.has_value());
        REQUIRE(*path == cached);
    }

    SECTION("DownloadsIntoCache") {
        auto path = model_store::resolve(req, base_url);
        REQUIRE(path.has_value());
        REQUIRE(fs::path(*path) == dir.path / "ggml-tiny-q8_0.bin");
        REQUIRE(fs::file_size(*path) == std::string("ggml-weights").size());
        REQUIRE_FALSE(fs::exists(*path + ".part"));
    }

    SECTION("Float32FallbackFetchesPublishedWeights") {
        req.compute_type = ComputeType::Float32;
        auto path = model_store::resolve(req, base_url);
        REQUIRE(path.has_value());
        REQUIRE(fs::path(*path) == dir.path / "ggml-tiny.bin");
    }

    SECTION("FailedDownloadLeavesNoPartialFile") {
        req.model = "base";
        auto path = model_store::resolve(req, base_url);
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().find("404") != std::string::npos);
        REQUIRE(dir.entry_count() == 0);
    }
}

TEST_CASE("VAD model lookup", "[model_store]") {
    test::TmpDir dir("vad");

    SECTION("NothingAvailable") {
        REQUIRE(model_store::find_vad_model("", dir.path.string()).empty());
    }

    SECTION("ConventionalFileInCache") {
        auto file = dir.file(model_store::kVadModelFile);
        test::write_file(file, "x");
        REQUIRE(model_store::find_vad_model("", dir.path.string()) == file);
    }

    SECTION("ConfiguredPath") {
        auto file = dir.file("silero.bin");
        test::write_file(file, "x");
        REQUIRE(model_store::find_vad_model(file, "") == file);
        REQUIRE(model_store::find_vad_model(dir.file("missing.bin"), dir.path.string()).empty());
    }
}
