#include <paneltree/core/Ids.hpp>
#include <paneltree/core/ZIndex.hpp>

#include <doctest/doctest.h>

using namespace PT;

TEST_SUITE("core.zindex") {
    TEST_CASE("ZIndex saturates at back and front") {
        CHECK(ZIndex::front() + 5 == ZIndex::front());
        CHECK(ZIndex::back() - 5 == ZIndex::back());
        CHECK((ZIndex::defaultIndex() + 1).value == ZIndex::kDefault + 1);
        CHECK(ZIndex::back() < ZIndex::defaultIndex());
        CHECK(ZIndex::defaultIndex() < ZIndex::front());
        CHECK(ZIndex{} == ZIndex::defaultIndex());
    }

    TEST_CASE("ZIndex debug labels are relative to the nearest constant") {
        CHECK(ZIndex::defaultIndex().to_string() == "DEFAULT");
        CHECK(ZIndex::back().to_string() == "BACK");
        CHECK(ZIndex::front().to_string() == "FRONT");
        CHECK((ZIndex::defaultIndex() + 1).to_string() == "DEFAULT+1");
        CHECK((ZIndex::defaultIndex() - 2).to_string() == "DEFAULT-2");
        CHECK((ZIndex::back() + 3).to_string() == "BACK+3");
        CHECK((ZIndex::front() - 4).to_string() == "FRONT-4");
    }
}

TEST_SUITE("core.ids") {
    TEST_CASE("Generated ids are unique and never zero") {
        auto a = WidgetId::next();
        auto b = WidgetId::next();
        CHECK(a.value != 0);
        CHECK(a != b);
        CHECK(a.to_string() == "wgt#" + std::to_string(a.value));

        auto s1 = StateId::next();
        auto s2 = StateId::next();
        CHECK(s1 != s2);
    }
}
