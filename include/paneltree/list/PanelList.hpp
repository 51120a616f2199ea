#pragma once

#include <paneltree/core/Ids.hpp>
#include <paneltree/core/ZIndex.hpp>
#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/list/NodeList.hpp>
#include <paneltree/list/PanelListData.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>
#include <paneltree/render/FrameValue.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace PT {

namespace detail {
// Exclusive claim on a panel data slot for a visitor that may run in parallel.
// Claiming a slot that is already held, from any thread, throws std::logic_error.
class PanelSlotGuard {
public:
    PanelSlotGuard(std::atomic<bool>& busy, std::string_view operation);
    ~PanelSlotGuard() {
        busy_.store(false, std::memory_order_release);
    }

    PanelSlotGuard(PanelSlotGuard const&)                    = delete;
    auto operator=(PanelSlotGuard const&) -> PanelSlotGuard& = delete;

private:
    std::atomic<bool>& busy_;
};

[[noreturn]] auto throw_panel_index(std::size_t index, std::size_t len) -> void;
} // namespace detail

/**
 * Non-template part of PanelList: z-order, info range tracking and delegation to the
 * inner list.
 *
 * Z-order packs `(z << 32) | index` per item. A scan that finds the keys already
 * non-decreasing leaves the map empty and marks the list naturally sorted; otherwise
 * the packed keys are sorted numerically (equal z keeps index order) and masked down
 * to indices. The map is rebuilt only when its length no longer matches the list or
 * after it was invalidated.
 */
class PanelListBase : public NodeList {
public:
    [[nodiscard]] auto inner() -> NodeList& {
        return *inner_;
    }

    [[nodiscard]] auto offset_key() const -> FrameValueKey {
        return offset_key_;
    }

    [[nodiscard]] auto info_id() const -> std::optional<StateId> {
        return info_id_;
    }

    // Position of `index` in render order.
    [[nodiscard]] auto z_map(std::size_t index) -> std::size_t;

    // Every index in render order.
    [[nodiscard]] auto z_order() -> std::vector<std::size_t>;

    [[nodiscard]] auto is_naturally_sorted() const -> bool {
        return naturally_sorted_;
    }

    // Number of z-map rebuilds so far.
    [[nodiscard]] auto z_sort_count() const -> std::size_t {
        return z_sort_count_;
    }

    [[nodiscard]] auto len() const -> std::size_t override {
        return inner_->len();
    }

    auto with_node(std::size_t index, NodeFn const& fn) -> void override {
        inner_->with_node(index, fn);
    }
    auto for_each(Visitor const& fn) -> void override {
        inner_->for_each(fn);
    }
    auto try_for_each(TryVisitor const& fn) -> bool override {
        return inner_->try_for_each(fn);
    }
    auto par_each(NodeContext const& ctx, Visitor const& fn) -> void override {
        inner_->par_each(ctx, fn);
    }
    auto fold_reduce_any(NodeContext const& ctx, AnyIdentity const& identity, AnyFold const& fold, AnyReduce const& reduce)
        -> std::any override {
        return inner_->fold_reduce_any(ctx, identity, fold, reduce);
    }

    auto deinit_all(NodeContext const& ctx) -> void override {
        inner_->deinit_all(ctx);
    }
    auto info_all(NodeContext const& ctx, InfoBuilder& info) -> void override;
    auto event_all(NodeContext const& ctx, EventUpdate const& update) -> void override {
        inner_->event_all(ctx, update);
    }

    [[nodiscard]] auto kind() const -> std::string_view override {
        return "panel";
    }

    auto for_each_sublist(SublistFn const& fn) -> void override {
        fn(*inner_);
    }

protected:
    PanelListBase(NodeListPtr inner, FrameValueKey key, std::optional<StateId> infoId, bool naturallySorted);

    auto z_sort() -> void;

    // Makes sure the z-map is fresh; returns false when the list renders in natural order.
    auto ensure_z_map() -> bool;

    // Runs init on the inner list under a z-index scope bound to the panel widget.
    auto init_inner(NodeContext const& ctx) -> void;

    // Runs update on the inner list under a z-index scope; returns whether a child changed its z-index.
    auto update_inner(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> bool;

    // Z-map invalidation, render and info requests after an update.
    auto after_update(NodeContext const& ctx, bool resort, bool structureChanged) -> void;

    NodeListPtr                inner_;
    FrameValueKey              offset_key_;
    std::optional<StateId>     info_id_;
    std::uint8_t               info_version_ = 0;
    bool                       pump_update_  = true;
    std::vector<std::uint64_t> z_map_{};
    bool                       naturally_sorted_ = true;
    std::size_t                z_sort_count_     = 0;
};

/**
 * Panel children plus one data slot per item.
 *
 * Slots carry the layout output the default render uses (child offset and reference
 * frame flag). Each slot has its own busy flag so parallel visitors can hand out disjoint
 * mutable access; locking a slot that is already held throws std::logic_error, which
 * only happens when a visitor is called twice for the same index.
 *
 * `commit_data()` must run at the end of every layout pass; its result tells the panel
 * whether a full render or a render update is needed.
 */
template <PanelListData D = DefaultPanelListData>
class PanelList final : public PanelListBase {
public:
    using DataFn     = std::function<void(Node&, D&)>;
    using DataVisit  = std::function<void(std::size_t, Node&, D&)>;
    using RenderItem = std::function<void(std::size_t, Node&, D&, FrameBuilder&)>;
    using UpdateItem = std::function<void(std::size_t, Node&, D&, FrameUpdate&)>;

    struct Parts {
        NodeListPtr            list;
        std::vector<D>         data;
        FrameValueKey          offset_key;
        std::optional<StateId> info_id;
    };

    explicit PanelList(NodeListPtr list)
        : PanelListBase(std::move(list), FrameValueKey::next(), std::nullopt, true) {
        this->sync_slots();
    }

    // Length mismatch between `list` and `data` throws std::invalid_argument.
    [[nodiscard]] static auto from_parts(NodeListPtr list,
                                         std::vector<D> data,
                                         FrameValueKey offsetKey,
                                         std::optional<StateId> infoId) -> std::unique_ptr<PanelList> {
        if (!list || list->len() != data.size())
            throw std::invalid_argument("PanelList::from_parts list and data length mismatch");
        return std::unique_ptr<PanelList>(new PanelList(std::move(list), std::move(data), offsetKey, infoId));
    }

    [[nodiscard]] auto into_parts() && -> Parts {
        std::vector<D> data;
        data.reserve(slots_.size());
        for (auto& slot : slots_) {
            data.push_back(std::move(slot->data));
        }
        slots_.clear();
        return Parts{std::move(inner_), std::move(data), offset_key_, info_id_};
    }

    // Publishes the first and last child widget in the info tree of the panel under `id`.
    auto track_info_range(StateId id) -> PanelList& {
        info_id_      = id;
        info_version_ = 0;
        pump_update_  = true;
        return *this;
    }

    [[nodiscard]] auto data(std::size_t index) -> D& {
        return this->slot_at(index).data;
    }

    auto with_node_data(std::size_t index, DataFn const& fn) -> void {
        auto& slot = this->slot_at(index);
        inner_->with_node(index, [&](Node& node) { fn(node, slot.data); });
    }

    auto for_each_data(DataVisit const& fn) -> void {
        inner_->for_each([&](std::size_t i, Node& node) { fn(i, node, this->slot_at(i).data); });
    }

    auto par_each_data(NodeContext const& ctx, DataVisit const& fn) -> void {
        inner_->par_each(ctx, [&](std::size_t i, Node& node) {
            auto& slot = this->slot_at(i);
            detail::PanelSlotGuard guard(slot.busy, "par_each_data");
            fn(i, node, slot.data);
        });
    }

    template <typename T, typename Identity, typename Fold, typename Reduce>
    auto fold_reduce_data(NodeContext const& ctx, Identity const& identity, Fold const& fold, Reduce const& reduce) -> T {
        return inner_->fold_reduce<T>(
            ctx,
            identity,
            [&](T acc, std::size_t i, Node& node) {
                auto& slot = this->slot_at(i);
                detail::PanelSlotGuard guard(slot.busy, "fold_reduce_data");
                return T(fold(std::move(acc), i, node, slot.data));
            },
            reduce);
    }

    auto commit_data() -> PanelListDataChanges {
        PanelListDataChanges changes;
        for (auto& slot : slots_) {
            changes |= slot->data.commit();
        }
        return changes;
    }

    auto for_each_z_sorted(DataVisit const& fn) -> void {
        if (!this->ensure_z_map()) {
            this->for_each_data(fn);
            return;
        }
        for (auto const packed : z_map_) {
            auto const index = static_cast<std::size_t>(packed);
            auto&      slot  = this->slot_at(index);
            inner_->with_node(index, [&](Node& node) { fn(index, node, slot.data); });
        }
    }

    // Renders every item inside its offset scope, in z-order when the panel has custom z-indices.
    auto render_items(NodeContext const& ctx, FrameBuilder& frame, RenderItem const& fn) -> void {
        auto const key = offset_key_;
        if (naturally_sorted_) {
            inner_->render_list(ctx, frame, [&](std::size_t i, Node& child, FrameBuilder& f) {
                auto& slot = this->slot_at(i);
                detail::PanelSlotGuard guard(slot.busy, "render_items");
                render_item(key, i, child, slot.data, f, fn);
            });
            return;
        }
        this->for_each_z_sorted([&](std::size_t i, Node& child, D& data) { render_item(key, i, child, data, frame, fn); });
    }

    // Updates the bound transform or child offset of every item.
    auto render_update_items(NodeContext const& ctx, FrameUpdate& update, UpdateItem const& fn) -> void {
        auto const key = offset_key_;
        inner_->render_update_list(ctx, update, [&](std::size_t i, Node& child, FrameUpdate& u) {
            auto& slot = this->slot_at(i);
            detail::PanelSlotGuard guard(slot.busy, "render_update_items");
            auto const offset = slot.data.child_offset();
            if (slot.data.define_reference_frame()) {
                u.with_transform(key.update_child(static_cast<std::uint32_t>(i), PxTransform::translate(offset), false),
                                 [&](FrameUpdate& inner) { fn(i, child, slot.data, inner); });
            } else {
                u.with_child(offset, [&](FrameUpdate& inner) { fn(i, child, slot.data, inner); });
            }
        });
    }

    auto drain_into(std::vector<NodePtr>& out) -> void override {
        inner_->drain_into(out);
        slots_.clear();
        z_map_.clear();
    }

    auto init_all(NodeContext const& ctx) -> void override {
        this->init_inner(ctx);
        this->sync_slots();
    }

    auto update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void override {
        SlotObserver adapter{slots_, observer};
        auto const   resort = this->update_inner(ctx, updates, adapter);
        this->sync_slots();
        this->after_update(ctx, resort, adapter.changed);
    }

    auto render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void override {
        this->render_items(ctx, frame, [&](std::size_t i, Node& node, D&, FrameBuilder& f) { fn(i, node, f); });
    }

    auto render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void override {
        this->render_update_items(ctx, update, [&](std::size_t i, Node& node, D&, FrameUpdate& u) { fn(i, node, u); });
    }

private:
    struct Slot {
        std::atomic<bool> busy{false};
        D                 data{};
    };

    using Slots = std::vector<std::unique_ptr<Slot>>;

    // Keeps one slot per item in step with the inner list before forwarding each change.
    class SlotObserver final : public ListObserver {
    public:
        SlotObserver(Slots& slots, ListObserver& inner)
            : slots_(slots), inner_(inner) {}

        auto inserted(std::size_t index) -> void override {
            changed = true;
            slots_.insert(slots_.begin() + static_cast<std::ptrdiff_t>(std::min(index, slots_.size())),
                          std::make_unique<Slot>());
            inner_.inserted(index);
        }

        auto removed(std::size_t index) -> void override {
            changed = true;
            if (index < slots_.size())
                slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(index));
            inner_.removed(index);
        }

        auto moved(std::size_t from, std::size_t to) -> void override {
            changed = true;
            if (from < slots_.size()) {
                auto slot = std::move(slots_[from]);
                slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(from));
                slots_.insert(slots_.begin() + static_cast<std::ptrdiff_t>(std::min(to, slots_.size())),
                              std::move(slot));
            }
            inner_.moved(from, to);
        }

        auto reset() -> void override {
            changed = true;
            slots_.clear();
            inner_.reset();
        }

        [[nodiscard]] auto is_reset_only() const -> bool override {
            return false;
        }

        bool changed = false;

    private:
        Slots&        slots_;
        ListObserver& inner_;
    };

    PanelList(NodeListPtr list, std::vector<D> data, FrameValueKey offsetKey, std::optional<StateId> infoId)
        : PanelListBase(std::move(list), offsetKey, infoId, false) {
        slots_.reserve(data.size());
        for (auto& item : data) {
            auto slot  = std::make_unique<Slot>();
            slot->data = std::move(item);
            slots_.push_back(std::move(slot));
        }
    }

    auto sync_slots() -> void {
        auto const count = inner_->len();
        if (slots_.size() > count) {
            slots_.resize(count);
            return;
        }
        while (slots_.size() < count) {
            slots_.push_back(std::make_unique<Slot>());
        }
    }

    auto slot_at(std::size_t index) -> Slot& {
        if (index >= slots_.size())
            detail::throw_panel_index(index, slots_.size());
        return *slots_[index];
    }

    static auto render_item(FrameValueKey key,
                            std::size_t index,
                            Node& child,
                            D& data,
                            FrameBuilder& frame,
                            RenderItem const& fn) -> void {
        auto const offset = data.child_offset();
        auto const item   = static_cast<std::uint32_t>(index);
        if (data.define_reference_frame()) {
            frame.push_reference_frame(key.spatial_id(item),
                                       key.bind_child(item, PxTransform::translate(offset), false),
                                       [&](FrameBuilder& inner) { fn(index, child, data, inner); });
        } else {
            frame.push_child(offset, [&](FrameBuilder& inner) { fn(index, child, data, inner); });
        }
    }

    Slots slots_{};
};

} // namespace PT
