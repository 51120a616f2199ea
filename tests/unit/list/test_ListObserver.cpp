#include "PanelTreeTestHelper.hpp"

#include <doctest/doctest.h>

using namespace PT;
using namespace PT::Test;

TEST_SUITE("list.observer") {
    TEST_CASE("reset-only observers") {
        NullObserver    null;
        ChangedObserver changed;
        CHECK(null.is_reset_only());
        CHECK(changed.is_reset_only());
        CHECK_FALSE(changed.changed());
        changed.moved(0, 1);
        CHECK(changed.changed());
    }

    TEST_CASE("offset observer shifts every index") {
        RecordingObserver inner;
        OffsetObserver    shifted{inner, 3};
        CHECK_FALSE(shifted.is_reset_only());
        shifted.inserted(0);
        shifted.removed(1);
        shifted.moved(2, 0);
        shifted.reset();
        CHECK(inner.events == std::vector<std::string>{"inserted(3)", "removed(4)", "moved(5,3)", "reset"});

        NullObserver   null;
        OffsetObserver overNull{null, 1};
        CHECK(overNull.is_reset_only());
    }

    TEST_CASE("fan out reaches both observers") {
        RecordingObserver first;
        ChangedObserver   second;
        FanOutObserver    both{first, second};
        CHECK_FALSE(both.is_reset_only());
        both.inserted(2);
        CHECK(first.events == std::vector<std::string>{"inserted(2)"});
        CHECK(second.changed());

        NullObserver   a;
        NullObserver   b;
        FanOutObserver resetOnly{a, b};
        CHECK(resetOnly.is_reset_only());
    }
}
