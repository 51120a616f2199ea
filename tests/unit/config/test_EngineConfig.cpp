#include <paneltree/config/EngineConfig.hpp>

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace PT;

TEST_SUITE("config.engine") {
    TEST_CASE("phase names round trip") {
        for (auto const phase : ParallelPhases::kAll) {
            auto parsed = phaseFromString(phaseToString(phase));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == phase);
        }
        CHECK_FALSE(phaseFromString("layout").has_value());
    }

    TEST_CASE("defaults apply to an empty object") {
        auto config = load_engine_config("{}");
        REQUIRE(config.has_value());
        CHECK(config->parallel == ParallelPhases::all());
        CHECK(config->worker_threads == 0);
        CHECK(config->min_parallel_len == 2);
    }

    TEST_CASE("parallel accepts object, array and boolean forms") {
        SUBCASE("object disables listed phases") {
            auto config = load_engine_config(R"({"parallel": {"render": false, "update": false}, "worker_threads": 3})");
            REQUIRE(config.has_value());
            CHECK_FALSE(config->parallel.contains(Phase::Render));
            CHECK_FALSE(config->parallel.contains(Phase::Update));
            CHECK(config->parallel.contains(Phase::Init));
            CHECK(config->worker_threads == 3);
        }
        SUBCASE("array enables only listed phases") {
            auto config = load_engine_config(R"({"parallel": ["init", "render_update"]})");
            REQUIRE(config.has_value());
            CHECK(config->parallel == ParallelPhases::none().with(Phase::Init).with(Phase::RenderUpdate));
        }
        SUBCASE("boolean toggles everything") {
            auto config = load_engine_config(R"({"parallel": false})");
            REQUIRE(config.has_value());
            CHECK(config->parallel.is_empty());
        }
    }

    TEST_CASE("invalid documents are reported") {
        auto broken = load_engine_config("{not json");
        REQUIRE_FALSE(broken.has_value());
        CHECK(broken.error().code == Error::Code::MalformedInput);

        auto unknown = load_engine_config(R"({"parallel": ["init", "layout"]})");
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::MalformedInput);

        auto wrongType = load_engine_config(R"({"worker_threads": "four"})");
        REQUIRE_FALSE(wrongType.has_value());
        CHECK(wrongType.error().code == Error::Code::InvalidType);

        auto zeroLen = load_engine_config(R"({"min_parallel_len": 0})");
        REQUIRE_FALSE(zeroLen.has_value());
        CHECK(zeroLen.error().code == Error::Code::OutOfRange);
    }

    TEST_CASE("file loading") {
        auto missing = load_engine_config_file("/nonexistent/paneltree/config.json");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::IoFailure);

        auto path = std::filesystem::temp_directory_path() / "paneltree_engine_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"parallel": ["event"], "min_parallel_len": 8})";
        }
        auto config = load_engine_config_file(path);
        std::filesystem::remove(path);
        REQUIRE(config.has_value());
        CHECK(config->parallel == ParallelPhases::none().with(Phase::Event));
        CHECK(config->min_parallel_len == 8);
    }

    TEST_CASE("environment override") {
        EngineConfig config;
        ::setenv("PANELTREE_PARALLEL", "0", 1);
        apply_environment(config);
        CHECK(config.parallel.is_empty());

        ::setenv("PANELTREE_PARALLEL", "1", 1);
        apply_environment(config);
        CHECK(config.parallel == ParallelPhases::all());
        ::unsetenv("PANELTREE_PARALLEL");
    }

    TEST_CASE("serialized config loads back") {
        EngineConfig config;
        config.parallel         = ParallelPhases::none().with(Phase::Info);
        config.worker_threads   = 2;
        config.min_parallel_len = 5;

        auto json = nlohmann::json::parse(engine_config_to_json(config));
        CHECK(json["parallel"]["info"] == true);
        CHECK(json["parallel"]["render"] == false);

        auto loaded = load_engine_config(engine_config_to_json(config));
        REQUIRE(loaded.has_value());
        CHECK(loaded->parallel == config.parallel);
        CHECK(loaded->worker_threads == 2);
        CHECK(loaded->min_parallel_len == 5);
    }
}
