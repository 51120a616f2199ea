#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/node/WidgetNode.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>

namespace PT {

WidgetNode::WidgetNode(WidgetId id)
    : id_(id) {}

auto WidgetNode::set_z_index(NodeContext const& ctx, ZIndex index) -> bool {
    auto* scope = ctx.z_index_scope();
    if (scope == nullptr || !scope->panel_id || ctx.parent_id() != scope->panel_id || ctx.widget_id() != id_)
        return false;
    z_index_ = index;
    scope->resort.store(true, std::memory_order_relaxed);
    return true;
}

auto WidgetNode::init(NodeContext const& ctx) -> void {
    auto const inner = ctx.with_widget(id_);
    this->on_init(inner);
    inited_.store(true, std::memory_order_release);
}

auto WidgetNode::deinit(NodeContext const& ctx) -> void {
    auto const inner = ctx.with_widget(id_);
    this->on_deinit(inner);
    inited_.store(false, std::memory_order_release);
}

auto WidgetNode::info(NodeContext const& ctx, InfoBuilder& info) -> void {
    auto const inner = ctx.with_widget(id_);
    info.push_widget(id_, inner.parent_id());
    this->on_info(inner, info);
}

auto WidgetNode::event(NodeContext const& ctx, EventUpdate const& update) -> void {
    this->on_event(ctx.with_widget(id_), update);
}

auto WidgetNode::update(NodeContext const& ctx, WidgetUpdates const& updates) -> void {
    if (!updates.contains(id_))
        return;
    this->on_update(ctx.with_widget(id_), updates);
}

auto WidgetNode::render(NodeContext const& ctx, FrameBuilder& frame) -> void {
    auto const inner = ctx.with_widget(id_);
    frame.push_widget(id_);
    this->on_render(inner, frame);
}

auto WidgetNode::render_update(NodeContext const& ctx, FrameUpdate& update) -> void {
    auto const inner = ctx.with_widget(id_);
    update.update_widget(id_);
    this->on_render_update(inner, update);
}

} // namespace PT
