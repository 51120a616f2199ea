#include "PanelTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <stdexcept>

using namespace PT;
using namespace PT::Test;

TEST_SUITE("list.sorting") {
    TEST_CASE("stable sort keeps equal keys in inner order") {
        auto        inner = vector_of({3, 1, 1, 2});
        auto const  ids   = ids_of(*inner);
        SortingList list(std::move(inner), by_key());

        CHECK(list.sort_map() == std::vector<std::size_t>{1, 2, 3, 0});
        CHECK(keys_of(list) == std::vector<int>{1, 1, 2, 3});

        // The two key-1 items keep their relative order.
        auto const sortedIds = ids_of(list);
        CHECK(sortedIds[0] == ids[1]);
        CHECK(sortedIds[1] == ids[2]);
        CHECK(list.is_sort_fresh());
    }

    TEST_CASE("drain yields the sorted order") {
        SortingList list(vector_of({5, 3, 9, 1, 3, 7}), by_key());
        auto const  visited = ids_of(list);

        std::vector<NodePtr> out;
        out.push_back(node(-5));
        list.drain_into(out);
        REQUIRE(out.size() == 7);

        std::vector<WidgetId> drained;
        for (std::size_t i = 1; i < out.size(); ++i) {
            drained.push_back(out[i]->as_widget()->id());
        }
        CHECK(drained == visited);
        CHECK(list.len() == 0);
    }

    TEST_CASE("positional access follows the sorted order") {
        SortingList list(vector_of({2, 0, 1}), by_key());
        int         reached = -1;
        list.with_node(0, [&](Node& n) { reached = as_recording(n).key; });
        CHECK(reached == 0);
        CHECK_THROWS_AS(list.with_node(3, [](Node&) {}), std::out_of_range);

        TestEnv          env(2);
        std::vector<int> order;
        list.par_each(env.ctx, [&](std::size_t, Node& n) { order.push_back(as_recording(n).key); });
        CHECK(order == std::vector<int>{0, 1, 2});

        FrameBuilder frame;
        list.render_all(env.ctx, frame);
        CHECK(frame.widgets() == ids_of(list));
    }

    TEST_CASE("descendants can request a resort") {
        TestEnv     env;
        auto        inner = vector_of({1, 2, 3});
        auto*       raw   = inner.get();
        SortingList list(std::move(inner), by_key());
        list.init_all(env.ctx);
        CHECK(keys_of(list) == std::vector<int>{1, 2, 3});
        CHECK(list.is_sort_fresh());

        auto& first            = as_recording(*raw->nodes()[0]);
        first.key              = 10;
        first.resort_on_update = true;

        ChangedObserver observer;
        list.update_all(env.ctx, WidgetUpdates::everything(), observer);
        CHECK(observer.changed());
        CHECK_FALSE(list.is_sort_fresh());
        CHECK(keys_of(list) == std::vector<int>{2, 3, 10});
    }

    TEST_CASE("update re-sorts keys changed without a resort request") {
        TestEnv     env;
        auto        inner = vector_of({1, 2, 3});
        auto*       raw   = inner.get();
        SortingList list(std::move(inner), by_key());
        list.init_all(env.ctx);
        CHECK(list.sort_map() == std::vector<std::size_t>{0, 1, 2});

        as_recording(*raw->nodes()[0]).key = 10;

        RecordingObserver observer;
        list.update_all(env.ctx, WidgetUpdates::everything(), observer);
        CHECK(observer.events.empty());
        CHECK_FALSE(list.is_sort_fresh());
        CHECK(keys_of(list) == std::vector<int>{2, 3, 10});
        CHECK(list.is_sort_fresh());
    }

    TEST_CASE("empty list has a fresh map") {
        SortingList list(std::make_unique<VectorList>(), by_key());
        CHECK(list.is_sort_fresh());
        CHECK(list.sort_map().empty());
        CHECK(list.is_sort_fresh());

        TestEnv env;
        list.init_all(env.ctx);
        CHECK(list.is_sort_fresh());
    }

    TEST_CASE("structural change in the inner list resets the observer") {
        TestEnv     env;
        auto        editable = std::make_unique<EditableList>();
        auto        handle   = editable->reference();
        handle.push(node(1));
        SortingList list(std::move(editable), by_key());
        list.init_all(env.ctx);

        handle.push(node(0));
        RecordingObserver observer;
        list.update_all(env.ctx, WidgetUpdates{}, observer);
        CHECK(observer.events == std::vector<std::string>{"reset"});
        CHECK(keys_of(list) == std::vector<int>{0, 1});
    }

    TEST_CASE("sorting_by replaces the comparator of an existing sorting list") {
        auto list = sorting_by(vector_of({1, 3, 2}), by_key());
        CHECK(keys_of(*list) == std::vector<int>{1, 2, 3});
        auto* raw = list.get();

        list = sorting_by(std::move(list), [](Node& a, Node& b) {
            return as_recording(b).key <=> as_recording(a).key;
        });
        CHECK(list.get() == raw);
        CHECK(keys_of(*list) == std::vector<int>{3, 2, 1});
    }

    TEST_CASE("comparator failure leaves the map stale") {
        bool        fail = true;
        SortingList list(vector_of({2, 1}), [&](Node& a, Node& b) -> std::weak_ordering {
            if (fail)
                throw std::runtime_error("compare");
            return as_recording(a).key <=> as_recording(b).key;
        });
        CHECK_THROWS_AS(list.sort_map(), std::runtime_error);
        CHECK_FALSE(list.is_sort_fresh());
        fail = false;
        CHECK(keys_of(list) == std::vector<int>{1, 2});
        CHECK_THROWS_AS(SortingList(vector_of({1}), nullptr), std::invalid_argument);
    }
}
