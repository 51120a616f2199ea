#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/list/NodeList.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>
#include <paneltree/task/WorkerPool.hpp>

#include <algorithm>

namespace PT {

auto NodeList::try_for_each(TryVisitor const& fn) -> bool {
    auto const count = this->len();
    for (std::size_t i = 0; i < count; ++i) {
        bool keepGoing = true;
        this->with_node(i, [&](Node& node) { keepGoing = fn(i, node); });
        if (!keepGoing)
            return false;
    }
    return true;
}

auto NodeList::par_each(NodeContext const&, Visitor const& fn) -> void {
    this->for_each(fn);
}

auto NodeList::fold_reduce_any(NodeContext const&, AnyIdentity const& identity, AnyFold const& fold, AnyReduce const&)
    -> std::any {
    std::any acc = identity();
    this->for_each([&](std::size_t i, Node& node) { acc = fold(std::move(acc), i, node); });
    return acc;
}

auto NodeList::init_all(NodeContext const& ctx) -> void {
    this->for_each([&](std::size_t, Node& node) { node.init(ctx); });
}

auto NodeList::deinit_all(NodeContext const& ctx) -> void {
    this->for_each([&](std::size_t, Node& node) { node.deinit(ctx); });
}

auto NodeList::info_all(NodeContext const& ctx, InfoBuilder& info) -> void {
    this->for_each([&](std::size_t, Node& node) { node.info(ctx, info); });
}

auto NodeList::event_all(NodeContext const& ctx, EventUpdate const& update) -> void {
    this->for_each([&](std::size_t, Node& node) { node.event(ctx, update); });
}

auto NodeList::update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver&) -> void {
    this->for_each([&](std::size_t, Node& node) { node.update(ctx, updates); });
}

auto NodeList::render_all(NodeContext const& ctx, FrameBuilder& frame) -> void {
    this->render_list(ctx, frame, [&ctx](std::size_t, Node& node, FrameBuilder& f) { node.render(ctx, f); });
}

auto NodeList::render_update_all(NodeContext const& ctx, FrameUpdate& update) -> void {
    this->render_update_list(ctx, update, [&ctx](std::size_t, Node& node, FrameUpdate& u) { node.render_update(ctx, u); });
}

auto NodeList::render_list(NodeContext const&, FrameBuilder& frame, RenderFn const& fn) -> void {
    this->for_each([&](std::size_t i, Node& node) { fn(i, node, frame); });
}

auto NodeList::render_update_list(NodeContext const&, FrameUpdate& update, RenderUpdateFn const& fn) -> void {
    this->for_each([&](std::size_t i, Node& node) { fn(i, node, update); });
}

auto NodeList::split_grain(NodeContext const& ctx, std::size_t len) -> std::size_t {
    auto const workers = ctx.pool() != nullptr ? ctx.pool()->size() : 0;
    if (workers == 0)
        return std::max<std::size_t>(len, 1);
    return std::max<std::size_t>(1, len / (workers * 4));
}

} // namespace PT
