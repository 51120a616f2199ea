#pragma once

#include <paneltree/list/NodeList.hpp>

#include <compare>
#include <functional>
#include <vector>

namespace PT {

/**
 * Sorted view over an inner list.
 *
 * The inner list keeps its order; a map from sorted position to inner index is rebuilt
 * lazily with a stable sort whenever its length differs from the inner length, and
 * invalidation clears it. Positional access (`with_node`, `for_each`, `try_for_each`,
 * `par_each`, `fold_reduce`, `render_list`, `render_update_list`) and `drain_into`
 * follow the sorted order; `par_each` and `fold_reduce` run sequentially to keep it.
 * `info_all`, `event_all` and `render_update_all` delegate unsorted.
 *
 * Every context-taking pass installs a SortingScope so descendants can request a
 * resort with `ctx.invalidate_parent_sort()`.
 */
class SortingList final : public NodeList {
public:
    using SortFn = std::function<std::weak_ordering(Node&, Node&)>;

    SortingList(NodeListPtr inner, SortFn sort);

    [[nodiscard]] auto inner() -> NodeList& {
        return *inner_;
    }

    // Replaces the comparator and invalidates the map.
    auto set_sort(SortFn sort) -> void;

    auto invalidate_sort() -> void {
        map_.clear();
    }

    // Sorted position to inner index; rebuilt on demand.
    [[nodiscard]] auto sort_map() -> std::vector<std::size_t> const&;

    [[nodiscard]] auto is_sort_fresh() const -> bool {
        return map_.size() == inner_->len();
    }

    [[nodiscard]] auto len() const -> std::size_t override {
        return inner_->len();
    }

    auto with_node(std::size_t index, NodeFn const& fn) -> void override;
    auto for_each(Visitor const& fn) -> void override;
    auto drain_into(std::vector<NodePtr>& out) -> void override;

    auto init_all(NodeContext const& ctx) -> void override;
    auto deinit_all(NodeContext const& ctx) -> void override;
    auto info_all(NodeContext const& ctx, InfoBuilder& info) -> void override;
    auto event_all(NodeContext const& ctx, EventUpdate const& update) -> void override;
    auto update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void override;
    auto render_all(NodeContext const& ctx, FrameBuilder& frame) -> void override;
    auto render_update_all(NodeContext const& ctx, FrameUpdate& update) -> void override;
    auto render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void override;
    auto render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void override;

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "sorting";
    }

    auto for_each_sublist(SublistFn const& fn) -> void override {
        fn(*inner_);
    }

private:
    auto update_map() -> void;

    // Runs `fn(inner_ctx)` under a fresh SortingScope and invalidates the map when a resort was requested.
    template <typename Fn>
    auto with_scope(NodeContext const& ctx, Fn&& fn) -> bool;

    NodeListPtr              inner_;
    SortFn                   sort_;
    std::vector<std::size_t> map_{};
};

// Wraps `list` in a SortingList, or replaces the comparator when it already is one.
[[nodiscard]] auto sorting_by(NodeListPtr list, SortingList::SortFn sort) -> NodeListPtr;

} // namespace PT
