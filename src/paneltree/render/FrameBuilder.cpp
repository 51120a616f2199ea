#include <paneltree/render/FrameBuilder.hpp>

#include <algorithm>
#include <atomic>
#include <iterator>

namespace PT {

namespace {
std::atomic<std::uint64_t> nextFrameValueKey{1};
} // namespace

auto FrameValueKey::next() -> FrameValueKey {
    return FrameValueKey{nextFrameValueKey.fetch_add(1, std::memory_order_relaxed)};
}

auto displayItemKindToString(DisplayItemKind kind) -> std::string_view {
    switch (kind) {
    case DisplayItemKind::PushReferenceFrame:
        return "push_reference_frame";
    case DisplayItemKind::PopReferenceFrame:
        return "pop_reference_frame";
    case DisplayItemKind::PushChild:
        return "push_child";
    case DisplayItemKind::PopChild:
        return "pop_child";
    case DisplayItemKind::Widget:
        return "widget";
    }
    return "unknown";
}

auto FrameBuilder::push_widget(WidgetId id) -> void {
    items_.push_back(DisplayItem{.kind = DisplayItemKind::Widget, .widget = id});
}

auto FrameBuilder::parallel_split() const -> FrameBuilder {
    return FrameBuilder{};
}

auto FrameBuilder::parallel_fold(FrameBuilder&& split) -> void {
    if (items_.empty()) {
        items_ = std::move(split.items_);
        return;
    }
    items_.reserve(items_.size() + split.items_.size());
    std::move(split.items_.begin(), split.items_.end(), std::back_inserter(items_));
    split.items_.clear();
}

auto FrameBuilder::widgets() const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    for (auto const& item : items_) {
        if (item.kind == DisplayItemKind::Widget && item.widget)
            out.push_back(*item.widget);
    }
    return out;
}

auto FrameBuilder::count(DisplayItemKind kind) const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(items_.begin(), items_.end(), [kind](DisplayItem const& item) { return item.kind == kind; }));
}

} // namespace PT
