#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/list/VectorList.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>
#include <paneltree/task/WorkerPool.hpp>

#include <iterator>
#include <stdexcept>
#include <string>

namespace PT {

auto VectorList::with_capacity(std::size_t capacity) -> std::unique_ptr<VectorList> {
    auto list = std::make_unique<VectorList>();
    list->reserve(capacity);
    return list;
}

auto VectorList::push(NodePtr node) -> void {
    nodes_.push_back(std::move(node));
}

auto VectorList::insert(std::size_t index, NodePtr node) -> void {
    if (index >= nodes_.size()) {
        nodes_.push_back(std::move(node));
        return;
    }
    nodes_.insert(nodes_.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
}

auto VectorList::remove(std::size_t index) -> NodePtr {
    if (index >= nodes_.size())
        throw std::out_of_range("VectorList::remove index " + std::to_string(index) + " out of range for length "
                                + std::to_string(nodes_.size()));
    auto node = std::move(nodes_[index]);
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(index));
    return node;
}

auto VectorList::move_node(std::size_t from, std::size_t to) -> void {
    auto node = this->remove(from);
    this->insert(to, std::move(node));
}

auto VectorList::with_node(std::size_t index, NodeFn const& fn) -> void {
    if (index >= nodes_.size())
        throw std::out_of_range("VectorList::with_node index " + std::to_string(index) + " out of range for length "
                                + std::to_string(nodes_.size()));
    fn(*nodes_[index]);
}

auto VectorList::for_each(Visitor const& fn) -> void {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        fn(i, *nodes_[i]);
    }
}

auto VectorList::try_for_each(TryVisitor const& fn) -> bool {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (!fn(i, *nodes_[i]))
            return false;
    }
    return true;
}

auto VectorList::par_each(NodeContext const& ctx, Visitor const& fn) -> void {
    if (!ctx.can_fork(nodes_.size())) {
        this->for_each(fn);
        return;
    }
    ctx.pool()->for_range(
        0, nodes_.size(), [&](std::size_t i) { fn(i, *nodes_[i]); }, split_grain(ctx, nodes_.size()));
}

auto VectorList::fold_reduce_any(NodeContext const& ctx,
                                 AnyIdentity const& identity,
                                 AnyFold const& fold,
                                 AnyReduce const& reduce) -> std::any {
    if (!ctx.can_fork(nodes_.size()))
        return NodeList::fold_reduce_any(ctx, identity, fold, reduce);
    return ctx.pool()->fold_range<std::any>(
        0,
        nodes_.size(),
        identity,
        [&](std::any acc, std::size_t i) { return fold(std::move(acc), i, *nodes_[i]); },
        reduce,
        split_grain(ctx, nodes_.size()));
}

auto VectorList::drain_into(std::vector<NodePtr>& out) -> void {
    out.reserve(out.size() + nodes_.size());
    std::move(nodes_.begin(), nodes_.end(), std::back_inserter(out));
    nodes_.clear();
}

auto VectorList::init_all(NodeContext const& ctx) -> void {
    if (ctx.parallel(Phase::Init, nodes_.size()))
        this->par_each(ctx, [&](std::size_t, Node& node) { node.init(ctx); });
    else
        NodeList::init_all(ctx);
}

auto VectorList::deinit_all(NodeContext const& ctx) -> void {
    if (ctx.parallel(Phase::Deinit, nodes_.size()))
        this->par_each(ctx, [&](std::size_t, Node& node) { node.deinit(ctx); });
    else
        NodeList::deinit_all(ctx);
}

auto VectorList::info_all(NodeContext const& ctx, InfoBuilder& info) -> void {
    if (!ctx.parallel(Phase::Info, nodes_.size())) {
        NodeList::info_all(ctx, info);
        return;
    }
    auto folded = this->fold_reduce<InfoBuilder>(
        ctx,
        [&info] { return info.parallel_split(); },
        [&ctx](InfoBuilder acc, std::size_t, Node& node) {
            node.info(ctx, acc);
            return acc;
        },
        [](InfoBuilder left, InfoBuilder right) {
            left.parallel_fold(std::move(right));
            return left;
        });
    info.parallel_fold(std::move(folded));
}

auto VectorList::event_all(NodeContext const& ctx, EventUpdate const& update) -> void {
    if (ctx.parallel(Phase::Event, nodes_.size()))
        this->par_each(ctx, [&](std::size_t, Node& node) { node.event(ctx, update); });
    else
        NodeList::event_all(ctx, update);
}

auto VectorList::update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void {
    if (ctx.parallel(Phase::Update, nodes_.size()))
        this->par_each(ctx, [&](std::size_t, Node& node) { node.update(ctx, updates); });
    else
        NodeList::update_all(ctx, updates, observer);
}

auto VectorList::render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void {
    if (!ctx.parallel(Phase::Render, nodes_.size())) {
        NodeList::render_list(ctx, frame, fn);
        return;
    }
    auto folded = this->fold_reduce<FrameBuilder>(
        ctx,
        [&frame] { return frame.parallel_split(); },
        [&fn](FrameBuilder acc, std::size_t i, Node& node) {
            fn(i, node, acc);
            return acc;
        },
        [](FrameBuilder left, FrameBuilder right) {
            left.parallel_fold(std::move(right));
            return left;
        });
    frame.parallel_fold(std::move(folded));
}

auto VectorList::render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void {
    if (!ctx.parallel(Phase::RenderUpdate, nodes_.size())) {
        NodeList::render_update_list(ctx, update, fn);
        return;
    }
    auto folded = this->fold_reduce<FrameUpdate>(
        ctx,
        [&update] { return update.parallel_split(); },
        [&fn](FrameUpdate acc, std::size_t i, Node& node) {
            fn(i, node, acc);
            return acc;
        },
        [](FrameUpdate left, FrameUpdate right) {
            left.parallel_fold(std::move(right));
            return left;
        });
    update.parallel_fold(std::move(folded));
}

} // namespace PT
