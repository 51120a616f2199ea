#pragma once

#include <paneltree/list/NodeList.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace PT {

// Dense owning list; every other list bottoms out here.
class VectorList final : public NodeList {
public:
    VectorList() = default;
    explicit VectorList(std::vector<NodePtr> nodes)
        : nodes_(std::move(nodes)) {}

    [[nodiscard]] static auto with_capacity(std::size_t capacity) -> std::unique_ptr<VectorList>;

    auto push(NodePtr node) -> void;

    // Indices past the end append.
    auto insert(std::size_t index, NodePtr node) -> void;

    // Throws std::out_of_range when `index >= len()`.
    auto remove(std::size_t index) -> NodePtr;

    auto move_node(std::size_t from, std::size_t to) -> void;

    auto clear() -> void {
        nodes_.clear();
    }

    auto reserve(std::size_t capacity) -> void {
        nodes_.reserve(capacity);
    }

    [[nodiscard]] auto nodes() -> std::vector<NodePtr>& {
        return nodes_;
    }

    [[nodiscard]] auto len() const -> std::size_t override {
        return nodes_.size();
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
        return "vector";
    }

private:
    std::vector<NodePtr> nodes_{};
};

template <typename... Nodes>
[[nodiscard]] auto make_vector_list(std::unique_ptr<Nodes>... nodes) -> std::unique_ptr<VectorList> {
    std::vector<NodePtr> items;
    items.reserve(sizeof...(Nodes));
    (items.push_back(std::move(nodes)), ...);
    return std::make_unique<VectorList>(std::move(items));
}

} // namespace PT
