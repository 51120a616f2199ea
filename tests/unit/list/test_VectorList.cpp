#include "PanelTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace PT;
using namespace PT::Test;

TEST_SUITE("list.vector") {
    TEST_CASE("len matches every visit and drain") {
        auto list = vector_of({4, 5, 6});
        CHECK(list->len() == 3);
        CHECK_FALSE(list->is_empty());
        CHECK(keys_of(*list) == std::vector<int>{4, 5, 6});

        std::size_t visited = 0;
        list->for_each([&](std::size_t i, Node&) { CHECK(i == visited++); });
        CHECK(visited == list->len());

        std::vector<NodePtr> out;
        list->drain_into(out);
        CHECK(out.size() == 3);
        CHECK(list->is_empty());
        CHECK(as_recording(*out[0]).key == 4);
    }

    TEST_CASE("with_node out of range throws") {
        auto list = vector_of({1});
        int  seen = 0;
        list->with_node(0, [&](Node& n) { seen = as_recording(n).key; });
        CHECK(seen == 1);
        CHECK_THROWS_AS(list->with_node(1, [](Node&) {}), std::out_of_range);
        CHECK_THROWS_AS(list->remove(3), std::out_of_range);
    }

    TEST_CASE("try_for_each stops at the first false") {
        auto list  = vector_of({1, 2, 3, 4});
        int  calls = 0;
        auto done  = list->try_for_each([&](std::size_t i, Node&) {
            ++calls;
            return i < 1;
        });
        CHECK_FALSE(done);
        CHECK(calls == 2);
        CHECK(list->try_for_each([](std::size_t, Node&) { return true; }));
    }

    TEST_CASE("structural helpers") {
        auto list = vector_of({1, 2, 3});
        list->insert(1, node(9));
        list->insert(100, node(8));
        CHECK(keys_of(*list) == std::vector<int>{1, 9, 2, 3, 8});
        list->move_node(0, 3);
        CHECK(keys_of(*list) == std::vector<int>{9, 2, 3, 1, 8});
        auto removed = list->remove(1);
        CHECK(as_recording(*removed).key == 2);
        list->clear();
        CHECK(list->is_empty());

        auto made = make_vector_list(node(1), std::make_unique<PlainNode>());
        CHECK(keys_of(*made) == std::vector<int>{1, -1});
    }

    TEST_CASE("fold_reduce keeps index order") {
        TestEnv env(4);
        auto    list = std::make_unique<VectorList>();
        for (int i = 0; i < 40; ++i) {
            list->push(node(i));
        }
        auto const joined = list->fold_reduce<std::string>(
            env.ctx,
            [] { return std::string{}; },
            [](std::string acc, std::size_t, Node& n) { return acc + std::to_string(as_recording(n).key) + ","; },
            [](std::string left, std::string right) { return left + right; });

        std::string expected;
        for (int i = 0; i < 40; ++i) {
            expected += std::to_string(i) + ",";
        }
        CHECK(joined == expected);
    }

    TEST_CASE("par_each visits every index once") {
        TestEnv env(4);
        auto    list = std::make_unique<VectorList>();
        for (int i = 0; i < 100; ++i) {
            list->push(node(i));
        }
        std::vector<std::atomic<int>> hits(100);
        std::atomic<int>              mismatched{0};
        list->par_each(env.ctx, [&](std::size_t i, Node& n) {
            if (static_cast<std::size_t>(as_recording(n).key) != i)
                ++mismatched;
            ++hits[i];
        });
        CHECK(mismatched == 0);
        for (auto& hit : hits) {
            CHECK(hit == 1);
        }
    }

    TEST_CASE("node exceptions propagate out of parallel passes") {
        TestEnv env(2);
        auto    list = vector_of({1, 2, 3, 4});
        CHECK_THROWS_AS(list->par_each(env.ctx,
                                       [](std::size_t i, Node&) {
                                           if (i == 2)
                                               throw std::runtime_error("node failure");
                                       }),
                        std::runtime_error);
    }

    TEST_CASE("tree passes reach every child") {
        TestEnv env(2);
        auto    list = vector_of({1, 2, 3});
        list->init_all(env.ctx);
        list->event_all(env.ctx, EventUpdate{"click", std::nullopt});
        NullObserver observer;
        list->update_all(env.ctx, WidgetUpdates::everything(), observer);

        InfoBuilder info;
        list->info_all(env.ctx, info);
        CHECK(info.widget_ids() == ids_of(*list));
        CHECK(info.children_of(env.host) == ids_of(*list));

        FrameBuilder frame;
        list->render_all(env.ctx, frame);
        CHECK(frame.widgets() == ids_of(*list));

        FrameUpdate update;
        list->render_update_all(env.ctx, update);
        CHECK(update.widgets() == ids_of(*list));

        list->deinit_all(env.ctx);
        list->for_each([](std::size_t, Node& n) {
            auto& rec = as_recording(n);
            CHECK(rec.inits == 1);
            CHECK(rec.events == 1);
            CHECK(rec.updates == 1);
            CHECK(rec.infos == 1);
            CHECK(rec.renders == 1);
            CHECK(rec.render_updates == 1);
            CHECK(rec.deinits == 1);
        });
    }
}
