#include <paneltree/list/PanelList.hpp>
#include <paneltree/node/WidgetNode.hpp>

#include "log/TaggedLogger.hpp"

#include <limits>
#include <string>

namespace PT {

namespace detail {

PanelSlotGuard::PanelSlotGuard(std::atomic<bool>& busy, std::string_view operation)
    : busy_(busy) {
    if (busy_.exchange(true, std::memory_order_acquire))
        throw std::logic_error("PanelList::" + std::string(operation) + " called visitor twice on same index");
}

auto throw_panel_index(std::size_t index, std::size_t len) -> void {
    throw std::out_of_range("PanelList index " + std::to_string(index) + " out of range for length "
                            + std::to_string(len));
}

} // namespace detail

namespace {
auto zIndexOf(Node& node) -> ZIndex {
    if (auto* widget = node.as_widget())
        return widget->z_index();
    return ZIndex::defaultIndex();
}
} // namespace

PanelListBase::PanelListBase(NodeListPtr inner, FrameValueKey key, std::optional<StateId> infoId, bool naturallySorted)
    : inner_(std::move(inner)), offset_key_(key), info_id_(infoId), naturally_sorted_(naturallySorted) {
    if (!inner_)
        throw std::invalid_argument("PanelList requires an inner list");
}

auto PanelListBase::z_sort() -> void {
    auto const count = inner_->len();
    if (count > std::numeric_limits<std::uint32_t>::max())
        throw std::length_error("PanelList z-order supports at most 2^32-1 items");

    std::vector<std::uint64_t> packed;
    packed.reserve(count);
    auto prev    = ZIndex::back();
    bool needMap = false;
    inner_->for_each([&](std::size_t i, Node& node) {
        auto const z = zIndexOf(node);
        packed.push_back((static_cast<std::uint64_t>(z.value) << 32) | static_cast<std::uint64_t>(i));
        needMap |= z < prev;
        prev = z;
    });

    ++z_sort_count_;
    naturally_sorted_ = !needMap;
    if (needMap) {
        std::sort(packed.begin(), packed.end());
        for (auto& entry : packed) {
            entry &= std::numeric_limits<std::uint32_t>::max();
        }
        z_map_ = std::move(packed);
    } else {
        z_map_.clear();
    }
    pt_log("PanelList::z_sort len=" + std::to_string(count) + " natural=" + std::to_string(naturally_sorted_),
           "PanelList");
}

auto PanelListBase::ensure_z_map() -> bool {
    if (naturally_sorted_)
        return false;
    if (z_map_.size() != inner_->len())
        this->z_sort();
    return !naturally_sorted_;
}

auto PanelListBase::z_map(std::size_t index) -> std::size_t {
    auto const count = inner_->len();
    if (index >= count)
        detail::throw_panel_index(index, count);
    if (!this->ensure_z_map())
        return index;
    return static_cast<std::size_t>(z_map_[index]);
}

auto PanelListBase::z_order() -> std::vector<std::size_t> {
    std::vector<std::size_t> order;
    auto const               count = inner_->len();
    order.reserve(count);
    if (!this->ensure_z_map()) {
        for (std::size_t i = 0; i < count; ++i) {
            order.push_back(i);
        }
        return order;
    }
    for (auto const packed : z_map_) {
        order.push_back(static_cast<std::size_t>(packed));
    }
    return order;
}

auto PanelListBase::init_inner(NodeContext const& ctx) -> void {
    z_map_.clear();
    ZIndexScope scope{ctx.widget_id()};
    inner_->init_all(ctx.with_z_index_scope(scope));
    naturally_sorted_ = !scope.resort.load(std::memory_order_relaxed);
}

auto PanelListBase::update_inner(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> bool {
    ZIndexScope scope{ctx.widget_id()};
    inner_->update_all(ctx.with_z_index_scope(scope), updates, observer);
    return scope.resort.load(std::memory_order_relaxed);
}

auto PanelListBase::after_update(NodeContext const& ctx, bool resort, bool structureChanged) -> void {
    if (resort || structureChanged) {
        z_map_.clear();
        naturally_sorted_ = false;
        ctx.request_render();
    }
    if (structureChanged && info_id_) {
        if (!pump_update_) {
            info_version_ = static_cast<std::uint8_t>(info_version_ + 1);
            pump_update_  = true;
        }
        ctx.request_info();
    }
}

auto PanelListBase::info_all(NodeContext const& ctx, InfoBuilder& info) -> void {
    auto const count = inner_->len();
    if (count == 0)
        return;

    inner_->info_all(ctx, info);
    if (!info_id_)
        return;

    std::optional<WidgetId> first;
    std::optional<WidgetId> last;
    inner_->with_node(0, [&](Node& node) {
        if (auto* widget = node.as_widget())
            first = widget->id();
    });
    inner_->with_node(count - 1, [&](Node& node) {
        if (auto* widget = node.as_widget())
            last = widget->id();
    });

    PanelListRange range;
    if (first && last)
        range.range = std::make_pair(*first, *last);
    range.version = info_version_;
    info.set_panel_range(ctx.widget_id(), *info_id_, range);

    if (std::exchange(pump_update_, false)) {
        inner_->for_each([&](std::size_t, Node& node) {
            if (auto* widget = node.as_widget())
                ctx.with_widget(widget->id()).request_update();
        });
    }
}

} // namespace PT
