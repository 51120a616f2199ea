#include <paneltree/info/InfoBuilder.hpp>

#include <iterator>

namespace PT {

namespace {
// Widget ids start at one, zero keys metadata written outside any widget.
auto ownerKey(std::optional<WidgetId> owner) -> std::uint64_t {
    return owner ? owner->value : 0;
}
} // namespace

auto InfoBuilder::push_widget(WidgetId id, std::optional<WidgetId> parent) -> void {
    widgets_.push_back(WidgetInfo{id, parent});
}

auto InfoBuilder::set_panel_range(std::optional<WidgetId> owner, StateId key, PanelListRange range) -> void {
    meta_[ownerKey(owner)][key.value] = std::move(range);
}

auto InfoBuilder::panel_range(std::optional<WidgetId> owner, StateId key) const -> std::optional<PanelListRange> {
    auto const ownerIt = meta_.find(ownerKey(owner));
    if (ownerIt == meta_.end())
        return std::nullopt;
    auto const it = ownerIt->second.find(key.value);
    if (it == ownerIt->second.end())
        return std::nullopt;
    return it->second;
}

auto InfoBuilder::parallel_split() const -> InfoBuilder {
    return InfoBuilder{};
}

auto InfoBuilder::parallel_fold(InfoBuilder&& split) -> void {
    if (widgets_.empty()) {
        widgets_ = std::move(split.widgets_);
    } else {
        widgets_.reserve(widgets_.size() + split.widgets_.size());
        std::move(split.widgets_.begin(), split.widgets_.end(), std::back_inserter(widgets_));
    }
    split.widgets_.clear();

    for (auto& [owner, entries] : split.meta_) {
        auto& target = meta_[owner];
        for (auto& [key, range] : entries) {
            target[key] = std::move(range);
        }
    }
    split.meta_.clear();
}

auto InfoBuilder::widget_ids() const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    out.reserve(widgets_.size());
    for (auto const& info : widgets_) {
        out.push_back(info.id);
    }
    return out;
}

auto InfoBuilder::children_of(WidgetId parent) const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    for (auto const& info : widgets_) {
        if (info.parent == parent)
            out.push_back(info.id);
    }
    return out;
}

} // namespace PT
