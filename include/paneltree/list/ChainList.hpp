#pragma once

#include <paneltree/list/NodeList.hpp>

namespace PT {

/**
 * Two lists end to end.
 *
 * Index `i < first.len()` routes to the first list, any other index to the second at
 * `i - first.len()`. Structural updates run the first list before the second so the
 * offset reported for the second list accounts for edits the first one just applied.
 */
class ChainList final : public NodeList {
public:
    ChainList(NodeListPtr first, NodeListPtr second);

    [[nodiscard]] auto first() -> NodeList& {
        return *first_;
    }
    [[nodiscard]] auto second() -> NodeList& {
        return *second_;
    }

    [[nodiscard]] auto len() const -> std::size_t override {
        return first_->len() + second_->len();
    }

    auto with_node(std::size_t index, NodeFn const& fn) -> void override;
    auto for_each(Visitor const& fn) -> void override;
    auto try_for_each(TryVisitor const& fn) -> bool override;
    auto par_each(NodeContext const& ctx, Visitor const& fn) -> void override;
    auto fold_reduce_any(NodeContext const& ctx, AnyIdentity const& identity, AnyFold const& fold, AnyReduce const& reduce)
        -> std::any override;
    auto drain_into(std::vector<NodePtr>& out) -> void override;

    auto init_all(NodeContext const& ctx) -> void override;
    auto deinit_all(NodeContext const& ctx) -> void override;
    auto info_all(NodeContext const& ctx, InfoBuilder& info) -> void override;
    auto event_all(NodeContext const& ctx, EventUpdate const& update) -> void override;
    auto update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void override;
    auto render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void override;
    auto render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void override;

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "chain";
    }

    auto for_each_sublist(SublistFn const& fn) -> void override;

private:
    NodeListPtr first_;
    NodeListPtr second_;
};

/**
 * Concatenates two lists.
 *
 * A null operand yields the other one. When `first` is already a MultiList the second
 * list is appended to it (its sub-lists when it is a MultiList too) instead of nesting.
 */
[[nodiscard]] auto chain(NodeListPtr first, NodeListPtr second) -> NodeListPtr;

} // namespace PT
