#include "PanelTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

using namespace PT;
using namespace PT::Test;

TEST_SUITE("inspect.list") {
    TEST_CASE("snapshot describes every composite") {
        TestEnv     env;
        auto        sorted = std::make_unique<SortingList>(vector_of({2, 1}), by_key());
        auto        inner  = chain(vector_of({0}), std::move(sorted));
        auto        key    = StateId::next();
        PanelList<> panel(std::move(inner));
        panel.track_info_range(key);
        panel.init_all(env.ctx);

        auto snapshot = inspect_list(panel);
        CHECK(snapshot["kind"] == "panel");
        CHECK(snapshot["len"] == 3);
        CHECK(snapshot["naturally_sorted"] == true);
        CHECK(snapshot["z_order"] == nlohmann::json::array({0, 1, 2}));
        CHECK(snapshot["info_id"] == key.value);

        auto const& chainEntry = snapshot["sublists"][0];
        CHECK(chainEntry["kind"] == "chain");
        REQUIRE(chainEntry["sublists"].size() == 2);
        CHECK(chainEntry["sublists"][0]["kind"] == "vector");
        CHECK(chainEntry["sublists"][0]["widgets"].size() == 1);

        auto const& sortEntry = chainEntry["sublists"][1];
        CHECK(sortEntry["kind"] == "sorting");
        CHECK(sortEntry["sort_map"] == nlohmann::json::array({1, 0}));
        CHECK(sortEntry["sort_fresh"] == false);
    }

    TEST_CASE("depth limit truncates nested lists") {
        auto           list = chain(vector_of({1}), vector_of({2}));
        InspectOptions options;
        options.max_depth   = 0;
        options.include_ids = false;
        auto snapshot       = inspect_list(*list, options);
        CHECK(snapshot["truncated"] == true);
        CHECK_FALSE(snapshot.contains("sublists"));

        SortingList empty(std::make_unique<VectorList>(), by_key());
        CHECK(inspect_list(empty)["sort_fresh"] == true);

        EditableList editable;
        auto         dumped = nlohmann::json::parse(inspect_list_dump(editable));
        CHECK(dumped["kind"] == "editable");
        CHECK(dumped["sublists"][0]["kind"] == "vector");
    }
}
