#pragma once

#include <paneltree/core/Ids.hpp>
#include <paneltree/list/VectorList.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace PT {

class UpdateScheduler;

namespace detail {

// Requests queued by EditableListRef handles, drained by the owning list on update.
struct EditState {
    using RetainFn = std::function<bool(Node&)>;
    using MoveToFn = std::function<std::size_t(std::size_t, std::size_t)>;

    explicit EditState(bool isAlive)
        : alive(isAlive) {}

    std::mutex                                       mutex;
    std::optional<WidgetId>                          target{};
    std::weak_ptr<UpdateScheduler>                   scheduler{};
    std::vector<std::pair<std::size_t, NodePtr>>     insert{};
    std::vector<NodePtr>                             push{};
    std::vector<RetainFn>                            retain{};
    std::vector<std::pair<std::size_t, std::size_t>> move_index{};
    std::vector<std::pair<WidgetId, MoveToFn>>       move_id{};
    bool                                             clear = false;
    bool                                             alive = false;

    [[nodiscard]] auto has_requests() const -> bool {
        return clear || !insert.empty() || !push.empty() || !retain.empty() || !move_index.empty()
               || !move_id.empty();
    }
};

} // namespace detail

/**
 * Cloneable handle that queues edits for an EditableList from any thread.
 *
 * Requests are applied during the list's next `update_all`. Once the list is destroyed
 * the handle is dead and every request is dropped.
 */
class EditableListRef {
public:
    using RetainFn = detail::EditState::RetainFn;
    using MoveToFn = detail::EditState::MoveToFn;

    // A handle that is never alive.
    [[nodiscard]] static auto dummy() -> EditableListRef;

    [[nodiscard]] auto alive() const -> bool;

    // Indices past the end append when applied.
    auto insert(std::size_t index, NodePtr node) const -> void;
    auto push(NodePtr node) const -> void;
    auto remove(WidgetId id) const -> void;
    auto retain(RetainFn predicate) const -> void;
    auto move_index(std::size_t removeIndex, std::size_t insertIndex) const -> void;
    // `to(current_index, len)` resolves the destination at apply time.
    auto move_id(WidgetId id, MoveToFn to) const -> void;
    auto clear() const -> void;

    [[nodiscard]] auto operator==(EditableListRef const& other) const -> bool {
        return state_ == other.state_;
    }

private:
    friend class EditableList;

    explicit EditableListRef(std::shared_ptr<detail::EditState> state)
        : state_(std::move(state)) {}

    // Locks, drops the request when dead, queues it and wakes the target.
    template <typename Fn>
    auto request(Fn&& fn) const -> void;

    std::shared_ptr<detail::EditState> state_;
};

/**
 * Vector list that can be edited through EditableListRef handles.
 *
 * Requests apply in the order retain, insert, push, move_index, move_id, each step
 * reported to the observer with indices from just before it. A pending clear dominates:
 * every current node is deinited and dropped, queued retains are discarded, the observer
 * gets a single reset and the remaining requests apply to the empty list.
 */
class EditableList final : public NodeList {
public:
    EditableList();
    explicit EditableList(std::vector<NodePtr> nodes);
    ~EditableList() override;

    EditableList(EditableList const&)                    = delete;
    auto operator=(EditableList const&) -> EditableList& = delete;

    [[nodiscard]] auto reference() const -> EditableListRef {
        return EditableListRef{state_};
    }

    [[nodiscard]] auto vec() -> VectorList& {
        return vec_;
    }

    [[nodiscard]] auto len() const -> std::size_t override {
        return vec_.len();
    }

    auto with_node(std::size_t index, NodeFn const& fn) -> void override {
        vec_.with_node(index, fn);
    }
    auto for_each(Visitor const& fn) -> void override {
        vec_.for_each(fn);
    }
    auto try_for_each(TryVisitor const& fn) -> bool override {
        return vec_.try_for_each(fn);
    }
    auto par_each(NodeContext const& ctx, Visitor const& fn) -> void override {
        vec_.par_each(ctx, fn);
    }
    auto fold_reduce_any(NodeContext const& ctx, AnyIdentity const& identity, AnyFold const& fold, AnyReduce const& reduce)
        -> std::any override {
        return vec_.fold_reduce_any(ctx, identity, fold, reduce);
    }
    auto drain_into(std::vector<NodePtr>& out) -> void override {
        vec_.drain_into(out);
    }

    auto init_all(NodeContext const& ctx) -> void override;
    auto deinit_all(NodeContext const& ctx) -> void override;
    auto info_all(NodeContext const& ctx, InfoBuilder& info) -> void override {
        vec_.info_all(ctx, info);
    }
    auto event_all(NodeContext const& ctx, EventUpdate const& update) -> void override {
        vec_.event_all(ctx, update);
    }
    auto update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void override;
    auto render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void override {
        vec_.render_list(ctx, frame, fn);
    }
    auto render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void override {
        vec_.render_update_list(ctx, update, fn);
    }

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "editable";
    }

    auto for_each_sublist(SublistFn const& fn) -> void override {
        fn(vec_);
    }

private:
    auto fulfill_requests(NodeContext const& ctx, ListObserver& observer) -> void;

    VectorList                         vec_;
    std::shared_ptr<detail::EditState> state_;
};

} // namespace PT
