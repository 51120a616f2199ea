#include <paneltree/info/InfoBuilder.hpp>

#include <doctest/doctest.h>

using namespace PT;

TEST_SUITE("info.builder") {
    TEST_CASE("widgets keep insertion order and parents") {
        InfoBuilder info;
        auto parent = WidgetId::next();
        auto a      = WidgetId::next();
        auto b      = WidgetId::next();
        info.push_widget(parent, std::nullopt);
        info.push_widget(a, parent);
        info.push_widget(b, parent);

        CHECK(info.widget_ids() == std::vector<WidgetId>{parent, a, b});
        CHECK(info.children_of(parent) == std::vector<WidgetId>{a, b});
        CHECK(info.children_of(a).empty());
    }

    TEST_CASE("panel metadata is keyed by owner and state id") {
        InfoBuilder info;
        auto owner = WidgetId::next();
        auto key   = StateId::next();
        auto first = WidgetId::next();
        auto last  = WidgetId::next();

        CHECK_FALSE(info.panel_range(owner, key).has_value());
        info.set_panel_range(owner, key, PanelListRange{std::make_pair(first, last), 2});

        auto range = info.panel_range(owner, key);
        REQUIRE(range.has_value());
        REQUIRE(range->range.has_value());
        CHECK(range->range->first == first);
        CHECK(range->range->second == last);
        CHECK(range->version == 2);
        CHECK_FALSE(info.panel_range(std::nullopt, key).has_value());
        CHECK_FALSE(info.panel_range(owner, StateId::next()).has_value());
    }

    TEST_CASE("fold appends widgets and merges metadata") {
        InfoBuilder info;
        auto a = WidgetId::next();
        auto b = WidgetId::next();
        info.push_widget(a, std::nullopt);

        auto split = info.parallel_split();
        CHECK(split.widgets().empty());
        split.push_widget(b, std::nullopt);
        auto key = StateId::next();
        split.set_panel_range(a, key, PanelListRange{std::nullopt, 1});
        info.parallel_fold(std::move(split));

        CHECK(info.widget_ids() == std::vector<WidgetId>{a, b});
        auto range = info.panel_range(a, key);
        REQUIRE(range.has_value());
        CHECK_FALSE(range->range.has_value());
        CHECK(range->version == 1);
    }
}
