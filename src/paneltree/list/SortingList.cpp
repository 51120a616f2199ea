#include <paneltree/list/SortingList.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace PT {

SortingList::SortingList(NodeListPtr inner, SortFn sort)
    : inner_(std::move(inner)), sort_(std::move(sort)) {
    if (!inner_)
        throw std::invalid_argument("SortingList requires an inner list");
    if (!sort_)
        throw std::invalid_argument("SortingList requires a comparator");
}

auto SortingList::set_sort(SortFn sort) -> void {
    if (!sort)
        throw std::invalid_argument("SortingList requires a comparator");
    sort_ = std::move(sort);
    this->invalidate_sort();
}

auto SortingList::update_map() -> void {
    auto const count = inner_->len();
    if (count == 0) {
        map_.clear();
        return;
    }
    if (map_.size() == count)
        return;

    map_.resize(count);
    std::iota(map_.begin(), map_.end(), std::size_t{0});
    try {
        std::stable_sort(map_.begin(), map_.end(), [this](std::size_t a, std::size_t b) {
            bool less = false;
            inner_->with_node(a, [&](Node& left) {
                inner_->with_node(b, [&](Node& right) { less = std::is_lt(sort_(left, right)); });
            });
            return less;
        });
    } catch (...) {
        // A half sorted map has the right length and would be taken as fresh.
        map_.clear();
        throw;
    }
}

auto SortingList::sort_map() -> std::vector<std::size_t> const& {
    this->update_map();
    return map_;
}

template <typename Fn>
auto SortingList::with_scope(NodeContext const& ctx, Fn&& fn) -> bool {
    SortingScope scope;
    fn(ctx.with_sorting_scope(scope));
    auto const resort = scope.resort.load(std::memory_order_relaxed);
    if (resort)
        this->invalidate_sort();
    return resort;
}

auto SortingList::with_node(std::size_t index, NodeFn const& fn) -> void {
    this->update_map();
    if (index >= map_.size())
        throw std::out_of_range("SortingList::with_node index " + std::to_string(index) + " out of range for length "
                                + std::to_string(map_.size()));
    inner_->with_node(map_[index], fn);
}

auto SortingList::for_each(Visitor const& fn) -> void {
    this->update_map();
    for (std::size_t k = 0; k < map_.size(); ++k) {
        inner_->with_node(map_[k], [&](Node& node) { fn(k, node); });
    }
}

auto SortingList::drain_into(std::vector<NodePtr>& out) -> void {
    this->update_map();
    auto map = std::exchange(map_, {});

    auto const base = out.size();
    inner_->drain_into(out);
    if (out.size() - base != map.size())
        throw std::logic_error("SortingList::drain_into inner list drained " + std::to_string(out.size() - base)
                               + " nodes for a map of " + std::to_string(map.size()));

    // out[base + k] = drained[map[k]], following each cycle once; map[j] = j marks visited slots.
    for (std::size_t i = 0; i < map.size(); ++i) {
        if (map[i] == i)
            continue;
        auto        held = std::move(out[base + i]);
        std::size_t j    = i;
        while (true) {
            auto const src = map[j];
            map[j]         = j;
            if (src == i) {
                out[base + j] = std::move(held);
                break;
            }
            out[base + j] = std::move(out[base + src]);
            j             = src;
        }
    }
}

auto SortingList::init_all(NodeContext const& ctx) -> void {
    this->with_scope(ctx, [&](NodeContext const& inner) { inner_->init_all(inner); });
    this->invalidate_sort();
}

auto SortingList::deinit_all(NodeContext const& ctx) -> void {
    this->with_scope(ctx, [&](NodeContext const& inner) { inner_->deinit_all(inner); });
    this->invalidate_sort();
}

auto SortingList::info_all(NodeContext const& ctx, InfoBuilder& info) -> void {
    this->with_scope(ctx, [&](NodeContext const& inner) { inner_->info_all(inner, info); });
}

auto SortingList::event_all(NodeContext const& ctx, EventUpdate const& update) -> void {
    this->with_scope(ctx, [&](NodeContext const& inner) { inner_->event_all(inner, update); });
}

auto SortingList::update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void {
    ChangedObserver changed;
    auto const      resort
        = this->with_scope(ctx, [&](NodeContext const& inner) { inner_->update_all(inner, updates, changed); });
    // Sort keys may have changed without a resort request.
    this->invalidate_sort();
    if (changed.changed() || resort)
        observer.reset();
}

auto SortingList::render_all(NodeContext const& ctx, FrameBuilder& frame) -> void {
    this->update_map();
    this->with_scope(ctx, [&](NodeContext const& inner) {
        for (std::size_t k = 0; k < map_.size(); ++k) {
            inner_->with_node(map_[k], [&](Node& node) { node.render(inner, frame); });
        }
    });
}

auto SortingList::render_update_all(NodeContext const& ctx, FrameUpdate& update) -> void {
    this->with_scope(ctx, [&](NodeContext const& inner) { inner_->render_update_all(inner, update); });
}

auto SortingList::render_list(NodeContext const&, FrameBuilder& frame, RenderFn const& fn) -> void {
    this->for_each([&](std::size_t k, Node& node) { fn(k, node, frame); });
}

auto SortingList::render_update_list(NodeContext const&, FrameUpdate& update, RenderUpdateFn const& fn) -> void {
    this->for_each([&](std::size_t k, Node& node) { fn(k, node, update); });
}

auto sorting_by(NodeListPtr list, SortingList::SortFn sort) -> NodeListPtr {
    if (auto* sorting = dynamic_cast<SortingList*>(list.get())) {
        sorting->set_sort(std::move(sort));
        return list;
    }
    return std::make_unique<SortingList>(std::move(list), std::move(sort));
}

} // namespace PT
