#include <paneltree/context/NodeContext.hpp>
#include <paneltree/context/UpdateScheduler.hpp>
#include <paneltree/task/WorkerPool.hpp>

namespace PT {

NodeContext::NodeContext(WorkerPool* pool, ParallelPhases phases, UpdateScheduler* updates, std::size_t minParallelLen)
    : pool_(pool), phases_(phases), updates_(updates), min_parallel_len_(minParallelLen == 0 ? 1 : minParallelLen) {}

auto NodeContext::parallel(Phase phase) const -> bool {
    return phases_.contains(phase) && pool_ != nullptr && pool_->size() > 0;
}

auto NodeContext::can_fork(std::size_t len) const -> bool {
    return len >= min_parallel_len_ && pool_ != nullptr && pool_->size() > 0;
}

auto NodeContext::with_widget(WidgetId id) const -> NodeContext {
    NodeContext inner = *this;
    inner.parent_     = widget_;
    inner.widget_     = id;
    return inner;
}

auto NodeContext::with_phases(ParallelPhases phases) const -> NodeContext {
    NodeContext inner = *this;
    inner.phases_     = phases;
    return inner;
}

auto NodeContext::with_sorting_scope(SortingScope& scope) const -> NodeContext {
    NodeContext inner = *this;
    inner.sorting_    = &scope;
    return inner;
}

auto NodeContext::with_z_index_scope(ZIndexScope& scope) const -> NodeContext {
    NodeContext inner = *this;
    inner.z_index_    = &scope;
    return inner;
}

auto NodeContext::invalidate_parent_sort() const -> void {
    if (sorting_ != nullptr) {
        sorting_->resort.store(true, std::memory_order_relaxed);
    }
}

auto NodeContext::request_update() const -> void {
    if (updates_ != nullptr) {
        updates_->update(widget_);
    }
}

auto NodeContext::request_info() const -> void {
    if (updates_ != nullptr && widget_) {
        updates_->update_info(*widget_);
    }
}

auto NodeContext::request_render() const -> void {
    if (updates_ != nullptr && widget_) {
        updates_->render(*widget_);
    }
}

auto NodeContext::request_render_update() const -> void {
    if (updates_ != nullptr && widget_) {
        updates_->render_update(*widget_);
    }
}

} // namespace PT
