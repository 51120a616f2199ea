#pragma once

#include <paneltree/core/Ids.hpp>
#include <paneltree/update/Updates.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace PT {

// Requests accumulated since the last drain.
struct UpdateRequests {
    phmap::flat_hash_set<std::uint64_t> update{};
    phmap::flat_hash_set<std::uint64_t> info{};
    phmap::flat_hash_set<std::uint64_t> render{};
    phmap::flat_hash_set<std::uint64_t> render_update{};
    std::size_t                         ambient_updates = 0;

    [[nodiscard]] auto empty() const -> bool {
        return update.empty() && info.empty() && render.empty() && render_update.empty() && ambient_updates == 0;
    }

    [[nodiscard]] auto wants_update(WidgetId id) const -> bool {
        return update.contains(id.value);
    }
    [[nodiscard]] auto wants_info(WidgetId id) const -> bool {
        return info.contains(id.value);
    }
    [[nodiscard]] auto wants_render(WidgetId id) const -> bool {
        return render.contains(id.value);
    }
    [[nodiscard]] auto wants_render_update(WidgetId id) const -> bool {
        return render_update.contains(id.value);
    }

    // Update set for the next `update_all` pass.
    [[nodiscard]] auto to_widget_updates() const -> WidgetUpdates;
};

/**
 * Collects "wake this widget" requests from tree passes and from any thread holding
 * an editable list handle.
 *
 * Thread-safety: every method locks; `take_requests` swaps the pending set with an
 * empty one so callers never observe a partially drained state.
 */
class UpdateScheduler : public std::enable_shared_from_this<UpdateScheduler> {
public:
    UpdateScheduler() = default;

    UpdateScheduler(UpdateScheduler const&)                    = delete;
    auto operator=(UpdateScheduler const&) -> UpdateScheduler& = delete;

    // nullopt wakes whichever widget is ambient for the next pass.
    auto update(std::optional<WidgetId> target) -> void;
    auto update_info(WidgetId target) -> void;
    auto render(WidgetId target) -> void;
    auto render_update(WidgetId target) -> void;

    [[nodiscard]] auto take_requests() -> UpdateRequests;
    [[nodiscard]] auto has_pending() const -> bool;

private:
    mutable std::mutex mutex_;
    UpdateRequests     pending_{};
};

} // namespace PT
