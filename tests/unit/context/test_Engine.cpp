#include "PanelTreeTestHelper.hpp"

#include <doctest/doctest.h>

using namespace PT;
using namespace PT::Test;

TEST_SUITE("context.engine") {
    TEST_CASE("root context follows the loaded config") {
        auto config = load_engine_config(R"({"parallel": ["init", "render"], "worker_threads": 3, "min_parallel_len": 5})");
        REQUIRE(config.has_value());

        Engine engine(*config);
        REQUIRE(engine.pool() != nullptr);
        CHECK(engine.pool()->size() == 3);
        REQUIRE(engine.scheduler() != nullptr);

        auto ctx = engine.root_context();
        CHECK(ctx.pool() == engine.pool());
        CHECK(ctx.updates() == engine.scheduler().get());
        CHECK(ctx.min_parallel_len() == 5);
        CHECK(ctx.parallel(Phase::Init, 5));
        CHECK_FALSE(ctx.parallel(Phase::Init, 4));
        CHECK_FALSE(ctx.parallel(Phase::Update, 5));
    }

    TEST_CASE("no parallel phase means no pool") {
        EngineConfig config;
        config.parallel = ParallelPhases::none();

        Engine engine(config);
        CHECK(engine.pool() == nullptr);
        CHECK_FALSE(engine.root_context().parallel(Phase::Init));
    }

    TEST_CASE("zero worker threads sizes the pool to the machine") {
        EngineConfig config;
        config.worker_threads = 0;

        Engine engine(config);
        REQUIRE(engine.pool() != nullptr);
        CHECK(engine.pool()->size() >= 1);
    }

    TEST_CASE("tree passes run on the engine pool") {
        EngineConfig config;
        config.worker_threads   = 2;
        config.min_parallel_len = 2;

        Engine engine(config);
        auto   host = WidgetId::next();
        auto   ctx  = engine.root_context().with_widget(host);
        auto   list = vector_of({1, 2, 3, 4, 5, 6, 7, 8});

        list->init_all(ctx);
        list->for_each([](std::size_t, Node& n) { CHECK(as_recording(n).inits == 1); });

        NullObserver observer;
        list->update_all(ctx, WidgetUpdates::everything(), observer);
        list->for_each([](std::size_t, Node& n) { CHECK(as_recording(n).updates == 1); });
    }
}
