#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/list/ChainList.hpp>
#include <paneltree/list/MultiList.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>
#include <paneltree/task/WorkerPool.hpp>

#include <stdexcept>
#include <string>

namespace PT {

ChainList::ChainList(NodeListPtr first, NodeListPtr second)
    : first_(std::move(first)), second_(std::move(second)) {
    if (!first_ || !second_)
        throw std::invalid_argument("ChainList requires two lists");
}

auto ChainList::with_node(std::size_t index, NodeFn const& fn) -> void {
    auto const firstLen = first_->len();
    if (index < firstLen) {
        first_->with_node(index, fn);
        return;
    }
    auto const local = index - firstLen;
    if (local >= second_->len())
        throw std::out_of_range("ChainList::with_node index " + std::to_string(index) + " out of range for length "
                                + std::to_string(this->len()));
    second_->with_node(local, fn);
}

auto ChainList::for_each(Visitor const& fn) -> void {
    first_->for_each(fn);
    auto const offset = first_->len();
    second_->for_each([&](std::size_t i, Node& node) { fn(offset + i, node); });
}

auto ChainList::try_for_each(TryVisitor const& fn) -> bool {
    if (!first_->try_for_each(fn))
        return false;
    auto const offset = first_->len();
    return second_->try_for_each([&](std::size_t i, Node& node) { return fn(offset + i, node); });
}

auto ChainList::par_each(NodeContext const& ctx, Visitor const& fn) -> void {
    auto const offset = first_->len();
    Visitor    shifted = [&](std::size_t i, Node& node) { fn(offset + i, node); };
    if (!ctx.can_fork(this->len())) {
        first_->par_each(ctx, fn);
        second_->par_each(ctx, shifted);
        return;
    }
    ctx.pool()->join([&] { first_->par_each(ctx, fn); }, [&] { second_->par_each(ctx, shifted); });
}

auto ChainList::fold_reduce_any(NodeContext const& ctx,
                                AnyIdentity const& identity,
                                AnyFold const& fold,
                                AnyReduce const& reduce) -> std::any {
    auto const offset  = first_->len();
    AnyFold    shifted = [&](std::any acc, std::size_t i, Node& node) { return fold(std::move(acc), offset + i, node); };
    if (!ctx.can_fork(this->len())) {
        auto left  = first_->fold_reduce_any(ctx, identity, fold, reduce);
        auto right = second_->fold_reduce_any(ctx, identity, shifted, reduce);
        return reduce(std::move(left), std::move(right));
    }
    std::any left;
    std::any right;
    ctx.pool()->join([&] { left = first_->fold_reduce_any(ctx, identity, fold, reduce); },
                     [&] { right = second_->fold_reduce_any(ctx, identity, shifted, reduce); });
    return reduce(std::move(left), std::move(right));
}

auto ChainList::drain_into(std::vector<NodePtr>& out) -> void {
    first_->drain_into(out);
    second_->drain_into(out);
}

auto ChainList::init_all(NodeContext const& ctx) -> void {
    if (ctx.parallel(Phase::Init)) {
        ctx.pool()->join([&] { first_->init_all(ctx); }, [&] { second_->init_all(ctx); });
    } else {
        first_->init_all(ctx);
        second_->init_all(ctx);
    }
}

auto ChainList::deinit_all(NodeContext const& ctx) -> void {
    if (ctx.parallel(Phase::Deinit)) {
        ctx.pool()->join([&] { first_->deinit_all(ctx); }, [&] { second_->deinit_all(ctx); });
    } else {
        first_->deinit_all(ctx);
        second_->deinit_all(ctx);
    }
}

auto ChainList::info_all(NodeContext const& ctx, InfoBuilder& info) -> void {
    if (!ctx.parallel(Phase::Info)) {
        first_->info_all(ctx, info);
        second_->info_all(ctx, info);
        return;
    }
    auto split = info.parallel_split();
    ctx.pool()->join([&] { first_->info_all(ctx, info); }, [&] { second_->info_all(ctx, split); });
    info.parallel_fold(std::move(split));
}

auto ChainList::event_all(NodeContext const& ctx, EventUpdate const& update) -> void {
    if (ctx.parallel(Phase::Event)) {
        ctx.pool()->join([&] { first_->event_all(ctx, update); }, [&] { second_->event_all(ctx, update); });
    } else {
        first_->event_all(ctx, update);
        second_->event_all(ctx, update);
    }
}

auto ChainList::update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void {
    if (observer.is_reset_only() && ctx.parallel(Phase::Update)) {
        ChangedObserver firstChanged;
        ChangedObserver secondChanged;
        ctx.pool()->join([&] { first_->update_all(ctx, updates, firstChanged); },
                         [&] { second_->update_all(ctx, updates, secondChanged); });
        if (firstChanged.changed() || secondChanged.changed())
            observer.reset();
        return;
    }

    first_->update_all(ctx, updates, observer);
    OffsetObserver shifted{observer, first_->len()};
    second_->update_all(ctx, updates, shifted);
}

auto ChainList::render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void {
    auto const offset  = first_->len();
    RenderFn   shifted = [&](std::size_t i, Node& node, FrameBuilder& f) { fn(offset + i, node, f); };
    if (!ctx.parallel(Phase::Render)) {
        first_->render_list(ctx, frame, fn);
        second_->render_list(ctx, frame, shifted);
        return;
    }
    auto split = frame.parallel_split();
    ctx.pool()->join([&] { first_->render_list(ctx, frame, fn); }, [&] { second_->render_list(ctx, split, shifted); });
    frame.parallel_fold(std::move(split));
}

auto ChainList::render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void {
    auto const     offset  = first_->len();
    RenderUpdateFn shifted = [&](std::size_t i, Node& node, FrameUpdate& u) { fn(offset + i, node, u); };
    if (!ctx.parallel(Phase::RenderUpdate)) {
        first_->render_update_list(ctx, update, fn);
        second_->render_update_list(ctx, update, shifted);
        return;
    }
    auto split = update.parallel_split();
    ctx.pool()->join([&] { first_->render_update_list(ctx, update, fn); },
                     [&] { second_->render_update_list(ctx, split, shifted); });
    update.parallel_fold(std::move(split));
}

auto ChainList::for_each_sublist(SublistFn const& fn) -> void {
    fn(*first_);
    fn(*second_);
}

auto chain(NodeListPtr first, NodeListPtr second) -> NodeListPtr {
    if (!first)
        return second;
    if (!second)
        return first;

    if (auto* multi = dynamic_cast<MultiList*>(first.get())) {
        if (auto* other = dynamic_cast<MultiList*>(second.get())) {
            for (auto& list : other->take_lists()) {
                multi->push(std::move(list));
            }
        } else {
            multi->push(std::move(second));
        }
        return first;
    }
    return std::make_unique<ChainList>(std::move(first), std::move(second));
}

} // namespace PT
