#include <paneltree/info/InfoBuilder.hpp>
#include <paneltree/list/MultiList.hpp>
#include <paneltree/render/FrameBuilder.hpp>
#include <paneltree/render/FrameUpdate.hpp>
#include <paneltree/task/WorkerPool.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace PT {

MultiList::MultiList(std::vector<NodeListPtr> lists)
    : lists_(std::move(lists)) {
    if (std::any_of(lists_.begin(), lists_.end(), [](NodeListPtr const& list) { return !list; }))
        throw std::invalid_argument("MultiList cannot hold a null list");
}

auto MultiList::push(NodeListPtr list) -> void {
    if (!list)
        throw std::invalid_argument("MultiList cannot hold a null list");
    lists_.push_back(std::move(list));
}

auto MultiList::len() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& list : lists_) {
        total += list->len();
    }
    return total;
}

auto MultiList::offsets() const -> std::vector<std::size_t> {
    std::vector<std::size_t> out;
    out.reserve(lists_.size() + 1);
    std::size_t offset = 0;
    for (auto const& list : lists_) {
        out.push_back(offset);
        offset += list->len();
    }
    out.push_back(offset);
    return out;
}

auto MultiList::with_node(std::size_t index, NodeFn const& fn) -> void {
    auto local = index;
    for (auto& list : lists_) {
        auto const listLen = list->len();
        if (local < listLen) {
            list->with_node(local, fn);
            return;
        }
        local -= listLen;
    }
    throw std::out_of_range("MultiList::with_node index " + std::to_string(index) + " out of range for length "
                            + std::to_string(this->len()));
}

auto MultiList::for_each(Visitor const& fn) -> void {
    std::size_t offset = 0;
    for (auto& list : lists_) {
        list->for_each([&](std::size_t i, Node& node) { fn(offset + i, node); });
        offset += list->len();
    }
}

auto MultiList::try_for_each(TryVisitor const& fn) -> bool {
    std::size_t offset = 0;
    for (auto& list : lists_) {
        if (!list->try_for_each([&](std::size_t i, Node& node) { return fn(offset + i, node); }))
            return false;
        offset += list->len();
    }
    return true;
}

auto MultiList::par_each(NodeContext const& ctx, Visitor const& fn) -> void {
    auto const starts = this->offsets();
    if (!ctx.can_fork(starts.back()) || lists_.size() < 2) {
        for (std::size_t l = 0; l < lists_.size(); ++l) {
            lists_[l]->par_each(ctx, [&, offset = starts[l]](std::size_t i, Node& node) { fn(offset + i, node); });
        }
        return;
    }
    ctx.pool()->for_range(0, lists_.size(), [&](std::size_t l) {
        lists_[l]->par_each(ctx, [&, offset = starts[l]](std::size_t i, Node& node) { fn(offset + i, node); });
    });
}

auto MultiList::fold_reduce_any(NodeContext const& ctx,
                                AnyIdentity const& identity,
                                AnyFold const& fold,
                                AnyReduce const& reduce) -> std::any {
    auto const starts    = this->offsets();
    auto       foldList  = [&](std::any acc, std::size_t l) -> std::any {
        auto const offset = starts[l];
        auto       part   = lists_[l]->fold_reduce_any(
            ctx,
            identity,
            [&](std::any inner, std::size_t i, Node& node) { return fold(std::move(inner), offset + i, node); },
            reduce);
        return reduce(std::move(acc), std::move(part));
    };
    if (!ctx.can_fork(starts.back())) {
        std::any acc = identity();
        for (std::size_t l = 0; l < lists_.size(); ++l) {
            acc = foldList(std::move(acc), l);
        }
        return acc;
    }
    return ctx.pool()->fold_range<std::any>(0, lists_.size(), identity, foldList, reduce);
}

auto MultiList::drain_into(std::vector<NodePtr>& out) -> void {
    for (auto& list : lists_) {
        list->drain_into(out);
    }
}

auto MultiList::init_all(NodeContext const& ctx) -> void {
    if (ctx.parallel(Phase::Init) && lists_.size() > 1) {
        ctx.pool()->for_range(0, lists_.size(), [&](std::size_t l) { lists_[l]->init_all(ctx); });
        return;
    }
    for (auto& list : lists_) {
        list->init_all(ctx);
    }
}

auto MultiList::deinit_all(NodeContext const& ctx) -> void {
    if (ctx.parallel(Phase::Deinit) && lists_.size() > 1) {
        ctx.pool()->for_range(0, lists_.size(), [&](std::size_t l) { lists_[l]->deinit_all(ctx); });
        return;
    }
    for (auto& list : lists_) {
        list->deinit_all(ctx);
    }
}

auto MultiList::event_all(NodeContext const& ctx, EventUpdate const& update) -> void {
    if (ctx.parallel(Phase::Event) && lists_.size() > 1) {
        ctx.pool()->for_range(0, lists_.size(), [&](std::size_t l) { lists_[l]->event_all(ctx, update); });
        return;
    }
    for (auto& list : lists_) {
        list->event_all(ctx, update);
    }
}

template <typename Sink, typename Fn>
auto MultiList::split_sinks(NodeContext const& ctx, std::size_t begin, std::size_t end, Sink& sink, Fn const& fn)
    -> void {
    if (end - begin == 1) {
        fn(begin, sink);
        return;
    }
    auto const mid   = begin + (end - begin) / 2;
    auto       split = sink.parallel_split();
    ctx.pool()->join([&] { this->split_sinks(ctx, begin, mid, sink, fn); },
                     [&] { this->split_sinks(ctx, mid, end, split, fn); });
    sink.parallel_fold(std::move(split));
}

auto MultiList::info_all(NodeContext const& ctx, InfoBuilder& info) -> void {
    if (ctx.parallel(Phase::Info) && lists_.size() > 1) {
        this->split_sinks(ctx, 0, lists_.size(), info, [&](std::size_t l, InfoBuilder& sink) {
            lists_[l]->info_all(ctx, sink);
        });
        return;
    }
    for (auto& list : lists_) {
        list->info_all(ctx, info);
    }
}

auto MultiList::update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void {
    if (observer.is_reset_only() && ctx.parallel(Phase::Update) && lists_.size() > 1) {
        std::vector<ChangedObserver> changed(lists_.size());
        ctx.pool()->for_range(0, lists_.size(), [&](std::size_t l) { lists_[l]->update_all(ctx, updates, changed[l]); });
        for (std::size_t l = 0; l < lists_.size(); ++l) {
            if (changed[l].changed()) {
                observer.reset();
                break;
            }
        }
        return;
    }

    std::size_t offset = 0;
    for (auto& list : lists_) {
        OffsetObserver shifted{observer, offset};
        list->update_all(ctx, updates, shifted);
        offset += list->len();
    }
}

auto MultiList::render_list(NodeContext const& ctx, FrameBuilder& frame, RenderFn const& fn) -> void {
    auto const starts = this->offsets();
    auto       renderOne = [&](std::size_t l, FrameBuilder& sink) {
        auto const offset = starts[l];
        lists_[l]->render_list(
            ctx, sink, [&](std::size_t i, Node& node, FrameBuilder& f) { fn(offset + i, node, f); });
    };
    if (ctx.parallel(Phase::Render) && lists_.size() > 1) {
        this->split_sinks(ctx, 0, lists_.size(), frame, renderOne);
        return;
    }
    for (std::size_t l = 0; l < lists_.size(); ++l) {
        renderOne(l, frame);
    }
}

auto MultiList::render_update_list(NodeContext const& ctx, FrameUpdate& update, RenderUpdateFn const& fn) -> void {
    auto const starts = this->offsets();
    auto       updateOne = [&](std::size_t l, FrameUpdate& sink) {
        auto const offset = starts[l];
        lists_[l]->render_update_list(
            ctx, sink, [&](std::size_t i, Node& node, FrameUpdate& u) { fn(offset + i, node, u); });
    };
    if (ctx.parallel(Phase::RenderUpdate) && lists_.size() > 1) {
        this->split_sinks(ctx, 0, lists_.size(), update, updateOne);
        return;
    }
    for (std::size_t l = 0; l < lists_.size(); ++l) {
        updateOne(l, update);
    }
}

auto MultiList::for_each_sublist(SublistFn const& fn) -> void {
    for (auto& list : lists_) {
        fn(*list);
    }
}

} // namespace PT
