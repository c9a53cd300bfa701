#include <catch2/catch_test_macros.hpp>

#include "model/model_manager.hpp"
#include "test_support.hpp"

#include <memory>
#include <thread>
#include <vector>

namespace {

ModelConfig make_config(Device device = Device::Cpu, ComputeType type = ComputeType::Int8) {
    return ModelConfig{
        .model_name_or_path = "small",
        .local_model_path = "",
        .device = device,
        .compute_type = type,
        .thread_count = 4,
        .model_cache_dir = "/tmp/scribed-models",
        .vad_model_path = "",
    };
}

} // namespace

TEST_CASE("ModelManager", "[model]") {

    SECTION("LoadsLazilyAndOnce") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        ModelManager mgr(make_config(), std::move(loader));

        REQUIRE_FALSE(mgr.is_loaded());
        REQUIRE(fake->load_count == 0);

        auto first = mgr.get_model();
        auto second = mgr.get_model();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->get() == second->get());
        REQUIRE(fake->load_count == 1);
        REQUIRE(mgr.is_loaded());
        REQUIRE(mgr.active_compute_type() == ComputeType::Int8);
    }

    SECTION("PassesConfiguration") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        ModelManager mgr(make_config(Device::Gpu, ComputeType::Float16), std::move(loader));

        REQUIRE(mgr.get_model().has_value());
        REQUIRE(fake->requests.size() == 1);
        const auto& req = fake->requests[0];
        REQUIRE(req.model == "small");
        REQUIRE_FALSE(req.is_local_path);
        REQUIRE(req.device == Device::Gpu);
        REQUIRE(req.compute_type == ComputeType::Float16);
        REQUIRE(req.thread_count == 4);
        REQUIRE(req.download_root == "/tmp/scribed-models");
    }

    SECTION("CpuFloat16DowngradedToInt8") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        ModelManager mgr(make_config(Device::Cpu, ComputeType::Float16), std::move(loader));

        REQUIRE(mgr.get_model().has_value());
        REQUIRE(fake->requests.size() == 1);
        REQUIRE(fake->requests[0].compute_type == ComputeType::Int8);
        REQUIRE(mgr.active_compute_type() == ComputeType::Int8);
    }

    SECTION("LocalPathTakesPrecedence") {
        auto cfg = make_config();
        cfg.local_model_path = "/opt/models/ggml-small.bin";
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        ModelManager mgr(cfg, std::move(loader));

        REQUIRE(mgr.get_model().has_value());
        REQUIRE(fake->requests[0].model == "/opt/models/ggml-small.bin");
        REQUIRE(fake->requests[0].is_local_path);
        REQUIRE(fake->requests[0].download_root.empty());
    }

    SECTION("FallsBackToFloat32") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        fake->fail_compute_types = {ComputeType::Int8};
        ModelManager mgr(make_config(), std::move(loader));

        auto model = mgr.get_model();
        REQUIRE(model.has_value());
        REQUIRE(fake->load_count == 2);
        REQUIRE(fake->requests[1].compute_type == ComputeType::Float32);
        REQUIRE(fake->requests[1].model == fake->requests[0].model);
        REQUIRE(fake->requests[1].thread_count == fake->requests[0].thread_count);
        REQUIRE(mgr.active_compute_type() == ComputeType::Float32);

        // Cached after the fallback as well
        REQUIRE(mgr.get_model().has_value());
        REQUIRE(fake->load_count == 2);
    }

    SECTION("BothAttemptsFail") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        fake->fail_compute_types = {ComputeType::Int8, ComputeType::Float32};
        ModelManager mgr(make_config(), std::move(loader));

        auto model = mgr.get_model();
        REQUIRE_FALSE(model.has_value());
        REQUIRE(model.error().kind == ErrorKind::ModelLoad);
        REQUIRE(model.error().message.find("unsupported compute type") != std::string::npos);
        REQUIRE(fake->load_count == 2);
        REQUIRE_FALSE(mgr.is_loaded());

        // The failure is final until restart: no third attempt
        auto again = mgr.get_model();
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().kind == ErrorKind::ModelLoad);
        REQUIRE(fake->load_count == 2);
    }

    SECTION("ErrorReturnCountsAsFailure") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        fake->fail_all = true;
        ModelManager mgr(make_config(), std::move(loader));

        auto model = mgr.get_model();
        REQUIRE_FALSE(model.has_value());
        REQUIRE(model.error().message.find("no backend available") != std::string::npos);
        REQUIRE(fake->load_count == 2);
    }

    SECTION("ConcurrentFirstUseLoadsOnce") {
        auto loader = std::make_unique<test::FakeLoader>();
        auto* fake = loader.get();
        fake->delay = std::chrono::milliseconds(50);
        ModelManager mgr(make_config(), std::move(loader));

        constexpr int kThreads = 8;
        std::vector<SpeechModel*> seen(kThreads, nullptr);
        {
            std::vector<std::jthread> threads;
            for (int i = 0; i < kThreads; ++i) {
                threads.emplace_back([&mgr, &seen, i] {
                    auto m = mgr.get_model();
                    if (m) seen[i] = m->get();
                });
            }
        }

        REQUIRE(fake->load_count == 1);
        for (auto* p : seen) {
            REQUIRE(p != nullptr);
            REQUIRE(p == seen[0]);
        }
    }
}
