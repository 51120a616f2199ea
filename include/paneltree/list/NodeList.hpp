#pragma once

#include <paneltree/context/NodeContext.hpp>
#include <paneltree/list/ListObserver.hpp>
#include <paneltree/node/Node.hpp>
#include <paneltree/update/Updates.hpp>

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace PT {

class InfoBuilder;
class FrameBuilder;
class FrameUpdate;

/**
 * NodeList: uniform, index-addressed contract over a sequence of child nodes.
 *
 * Contract
 * --------
 * - Indices are 0-based and dense; `with_node(i)` with `i >= len()` throws std::out_of_range.
 * - Sequential visits (`for_each`, `try_for_each`, default tree operations) run in index order.
 * - `par_each` and `fold_reduce` may call the visitor concurrently on disjoint indices.
 *   `fold_reduce` may call `identity` more than once and combines chunk results with
 *   `reduce` in index order, so `reduce` must be associative.
 * - `update_all` is the only operation that may change the structure of the list; it
 *   reports every change to the observer with indices relative to the state before
 *   that change.
 * - Exceptions thrown by nodes propagate out of every operation, including parallel ones.
 */
class NodeList {
public:
    using NodeFn         = std::function<void(Node&)>;
    using Visitor        = std::function<void(std::size_t, Node&)>;
    using TryVisitor     = std::function<bool(std::size_t, Node&)>;
    using AnyIdentity    = std::function<std::any()>;
    using AnyFold        = std::function<std::any(std::any, std::size_t, Node&)>;
    using AnyReduce      = std::function<std::any(std::any, std::any)>;
    using RenderFn       = std::function<void(std::size_t, Node&, FrameBuilder&)>;
    using RenderUpdateFn = std::function<void(std::size_t, Node&, FrameUpdate&)>;
    using SublistFn      = std::function<void(NodeList&)>;

    NodeList()          = default;
    virtual ~NodeList() = default;

    NodeList(NodeList const&)                    = delete;
    auto operator=(NodeList const&) -> NodeList& = delete;

    [[nodiscard]] virtual auto len() const -> std::size_t = 0;

    [[nodiscard]] auto is_empty() const -> bool {
        return this->len() == 0;
    }

    virtual auto with_node(std::size_t index, NodeFn const& fn) -> void = 0;
    virtual auto for_each(Visitor const& fn) -> void                    = 0;

    // Stops at the first visitor returning false; returns true when every item was visited.
    virtual auto try_for_each(TryVisitor const& fn) -> bool;

    virtual auto par_each(NodeContext const& ctx, Visitor const& fn) -> void;

    virtual auto fold_reduce_any(NodeContext const& ctx,
                                 AnyIdentity const& identity,
                                 AnyFold const& fold,
                                 AnyReduce const& reduce) -> std::any;

    template <typename T, typename Identity, typename Fold, typename Reduce>
    auto fold_reduce(NodeContext const& ctx, Identity const& identity, Fold const& fold, Reduce const& reduce) -> T;

    // Moves every node into `out` in iteration order, leaving the list empty.
    virtual auto drain_into(std::vector<NodePtr>& out) -> void = 0;

    virtual auto init_all(NodeContext const& ctx) -> void;
    virtual auto deinit_all(NodeContext const& ctx) -> void;
    virtual auto info_all(NodeContext const& ctx, InfoBuilder& info) -> void;
    virtual auto event_all(NodeContext const& ctx, EventUpdate const& update) -> void;
    virtual auto update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void;
    virtual auto render_all(NodeContext const& ctx, FrameBuilder& frame) -> void;
    virtual auto render_update_all(NodeContext const& ctx, FrameUpdate& update) -> void;

    // Per-item render with the list's own ordering and parallelism; `fn` may run concurrently.
    virtual auto render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void;
    virtual auto render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void;

    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;

    // Direct sub-lists of a composite, in order.
    virtual auto for_each_sublist(SublistFn const&) -> void {}

protected:
    // Chunk size for splitting `len` items over the context pool.
    [[nodiscard]] static auto split_grain(NodeContext const& ctx, std::size_t len) -> std::size_t;
};

using NodeListPtr = std::unique_ptr<NodeList>;

template <typename T, typename Identity, typename Fold, typename Reduce>
auto NodeList::fold_reduce(NodeContext const& ctx, Identity const& identity, Fold const& fold, Reduce const& reduce)
    -> T {
    std::any result = this->fold_reduce_any(
        ctx,
        [&identity]() -> std::any { return std::any{T(identity())}; },
        [&fold](std::any acc, std::size_t index, Node& node) -> std::any {
            return std::any{T(fold(std::any_cast<T>(std::move(acc)), index, node))};
        },
        [&reduce](std::any left, std::any right) -> std::any {
            return std::any{T(reduce(std::any_cast<T>(std::move(left)), std::any_cast<T>(std::move(right))))};
        });
    return std::any_cast<T>(std::move(result));
}

} // namespace PT
