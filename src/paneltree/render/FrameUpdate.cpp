#include <paneltree/render/FrameUpdate.hpp>

#include <iterator>

namespace PT {

auto FrameUpdate::update_widget(WidgetId id) -> void {
    items_.push_back(FrameUpdateItem{.kind = FrameUpdateItem::Kind::Widget, .widget = id});
}

auto FrameUpdate::parallel_split() const -> FrameUpdate {
    return FrameUpdate{};
}

auto FrameUpdate::parallel_fold(FrameUpdate&& split) -> void {
    if (items_.empty()) {
        items_ = std::move(split.items_);
        return;
    }
    items_.reserve(items_.size() + split.items_.size());
    std::move(split.items_.begin(), split.items_.end(), std::back_inserter(items_));
    split.items_.clear();
}

auto FrameUpdate::transforms() const -> std::vector<FrameValueUpdate> {
    std::vector<FrameValueUpdate> out;
    for (auto const& item : items_) {
        if (item.kind == FrameUpdateItem::Kind::Transform && item.transform)
            out.push_back(*item.transform);
    }
    return out;
}

auto FrameUpdate::widgets() const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    for (auto const& item : items_) {
        if (item.kind == FrameUpdateItem::Kind::Widget && item.widget)
            out.push_back(*item.widget);
    }
    return out;
}

} // namespace PT
