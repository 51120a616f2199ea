#pragma once

#include <paneltree/list/NodeList.hpp>

#include <utility>
#include <vector>

namespace PT {

/**
 * Any number of lists end to end.
 *
 * Routing scans the sub-list lengths, so it is linear in the number of sub-lists and
 * independent of the number of items. Non-reducing passes fan out over every
 * sub-list, sink-writing passes split the sub-list range in halves.
 */
class MultiList final : public NodeList {
public:
    MultiList() = default;
    explicit MultiList(std::vector<NodeListPtr> lists);

    auto push(NodeListPtr list) -> void;

    [[nodiscard]] auto lists() -> std::vector<NodeListPtr>& {
        return lists_;
    }

    // Moves the sub-lists out, leaving this list empty.
    [[nodiscard]] auto take_lists() -> std::vector<NodeListPtr> {
        return std::exchange(lists_, {});
    }

    [[nodiscard]] auto len() const -> std::size_t override;

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
        return "multi";
    }

    auto for_each_sublist(SublistFn const& fn) -> void override;

private:
    // Start index of every sub-list followed by the total length.
    [[nodiscard]] auto offsets() const -> std::vector<std::size_t>;

    // Calls `fn(list, sink)` for lists in [begin, end), forking halves onto split sinks.
    template <typename Sink, typename Fn>
    auto split_sinks(NodeContext const& ctx, std::size_t begin, std::size_t end, Sink& sink, Fn const& fn) -> void;

    std::vector<NodeListPtr> lists_{};
};

} // namespace PT
