#pragma once

#include <paneltree/config/ParallelPhases.hpp>
#include <paneltree/core/Ids.hpp>

#include <atomic>
#include <cstddef>
#include <optional>

namespace PT {

class WorkerPool;
class UpdateScheduler;

// Installed by a sorting list around its inner list calls; any descendant may flag a resort.
struct SortingScope {
    std::atomic<bool> resort{false};
};

// Installed by a panel list around its inner list calls; direct child widgets register z-index changes.
struct ZIndexScope {
    explicit ZIndexScope(std::optional<WidgetId> panel)
        : panel_id(panel) {}

    std::optional<WidgetId> panel_id;
    std::atomic<bool>       resort{false};
};

/**
 * Immutable context threaded through every list and node operation.
 *
 * Scoped values (current widget, sorting scope, z-index scope) are installed by
 * deriving a modified copy with the `with_*` methods. The outer value is never
 * changed, so leaving a scope is simply returning to the caller's context.
 */
class NodeContext {
public:
    NodeContext() = default;
    NodeContext(WorkerPool* pool, ParallelPhases phases, UpdateScheduler* updates, std::size_t minParallelLen = 2);

    [[nodiscard]] auto pool() const -> WorkerPool* {
        return pool_;
    }

    [[nodiscard]] auto phases() const -> ParallelPhases {
        return phases_;
    }

    // True when `phase` is enabled and a pool with live workers is attached.
    [[nodiscard]] auto parallel(Phase phase) const -> bool;

    // True when `len` items are worth splitting for `phase`.
    [[nodiscard]] auto parallel(Phase phase, std::size_t len) const -> bool {
        return len >= min_parallel_len_ && parallel(phase);
    }

    // True when a pool with live workers is attached, regardless of phase.
    [[nodiscard]] auto can_fork(std::size_t len) const -> bool;

    [[nodiscard]] auto min_parallel_len() const -> std::size_t {
        return min_parallel_len_;
    }

    [[nodiscard]] auto updates() const -> UpdateScheduler* {
        return updates_;
    }

    [[nodiscard]] auto widget_id() const -> std::optional<WidgetId> {
        return widget_;
    }

    [[nodiscard]] auto parent_id() const -> std::optional<WidgetId> {
        return parent_;
    }

    [[nodiscard]] auto with_widget(WidgetId id) const -> NodeContext;
    [[nodiscard]] auto with_phases(ParallelPhases phases) const -> NodeContext;
    [[nodiscard]] auto with_sorting_scope(SortingScope& scope) const -> NodeContext;
    [[nodiscard]] auto with_z_index_scope(ZIndexScope& scope) const -> NodeContext;

    [[nodiscard]] auto is_inside_sorting_list() const -> bool {
        return sorting_ != nullptr;
    }

    // Asks the nearest enclosing sorting list to re-sort after the current call.
    auto invalidate_parent_sort() const -> void;

    [[nodiscard]] auto z_index_scope() const -> ZIndexScope* {
        return z_index_;
    }

    // Requests addressed to the current widget; dropped when there is no scheduler or widget.
    auto request_update() const -> void;
    auto request_info() const -> void;
    auto request_render() const -> void;
    auto request_render_update() const -> void;

private:
    WorkerPool*             pool_             = nullptr;
    ParallelPhases          phases_           = ParallelPhases::none();
    UpdateScheduler*        updates_          = nullptr;
    std::size_t             min_parallel_len_ = 2;
    std::optional<WidgetId> widget_{};
    std::optional<WidgetId> parent_{};
    SortingScope*           sorting_ = nullptr;
    ZIndexScope*            z_index_ = nullptr;
};

} // namespace PT
