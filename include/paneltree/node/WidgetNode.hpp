#pragma once

#include <paneltree/core/Ids.hpp>
#include <paneltree/core/ZIndex.hpp>
#include <paneltree/node/Node.hpp>

#include <atomic>

namespace PT {

/**
 * Node with identity.
 *
 * The public lifecycle methods enter the widget context (`ctx.with_widget(id())`)
 * and forward to the protected `on_*` hooks. By default a widget registers itself
 * in the info tree and in the display list, and only runs `on_update` when the
 * update set contains it.
 */
class WidgetNode : public Node {
public:
    explicit WidgetNode(WidgetId id = WidgetId::next());

    [[nodiscard]] auto id() const -> WidgetId {
        return id_;
    }

    [[nodiscard]] auto is_inited() const -> bool {
        return inited_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto z_index() const -> ZIndex {
        return z_index_;
    }

    // Valid only while the widget is a direct child of a z-sorting panel list, during init or update.
    // Flags the panel for resort on success.
    auto set_z_index(NodeContext const& ctx, ZIndex index) -> bool;

    auto init(NodeContext const& ctx) -> void final;
    auto deinit(NodeContext const& ctx) -> void final;
    auto info(NodeContext const& ctx, InfoBuilder& info) -> void final;
    auto event(NodeContext const& ctx, EventUpdate const& update) -> void final;
    auto update(NodeContext const& ctx, WidgetUpdates const& updates) -> void final;
    auto render(NodeContext const& ctx, FrameBuilder& frame) -> void final;
    auto render_update(NodeContext const& ctx, FrameUpdate& update) -> void final;

    auto as_widget() -> WidgetNode* final {
        return this;
    }

protected:
    // `ctx` is already the widget context: `ctx.widget_id() == id()`.
    virtual auto on_init(NodeContext const&) -> void {}
    virtual auto on_deinit(NodeContext const&) -> void {}
    virtual auto on_info(NodeContext const&, InfoBuilder&) -> void {}
    virtual auto on_event(NodeContext const&, EventUpdate const&) -> void {}
    virtual auto on_update(NodeContext const&, WidgetUpdates const&) -> void {}
    virtual auto on_render(NodeContext const&, FrameBuilder&) -> void {}
    virtual auto on_render_update(NodeContext const&, FrameUpdate&) -> void {}

private:
    WidgetId          id_;
    ZIndex            z_index_{};
    std::atomic<bool> inited_{false};
};

} // namespace PT
