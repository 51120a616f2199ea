#include <paneltree/core/Ids.hpp>

#include <atomic>

namespace PT {

namespace {
std::atomic<std::uint64_t> nextWidgetId{1};
std::atomic<std::uint64_t> nextStateId{1};
} // namespace

auto WidgetId::next() -> WidgetId {
    return WidgetId{nextWidgetId.fetch_add(1, std::memory_order_relaxed)};
}

auto StateId::next() -> StateId {
    return StateId{nextStateId.fetch_add(1, std::memory_order_relaxed)};
}

} // namespace PT
