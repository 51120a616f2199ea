#include <paneltree/context/UpdateScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace PT {

auto UpdateRequests::to_widget_updates() const -> WidgetUpdates {
    if (ambient_updates > 0) {
        return WidgetUpdates::everything();
    }
    WidgetUpdates updates;
    for (auto const id : update) {
        updates.insert(WidgetId{id});
    }
    return updates;
}

auto UpdateScheduler::update(std::optional<WidgetId> target) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (target) {
        pending_.update.insert(target->value);
    } else {
        ++pending_.ambient_updates;
    }
}

auto UpdateScheduler::update_info(WidgetId target) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.info.insert(target.value);
}

auto UpdateScheduler::render(WidgetId target) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.render.insert(target.value);
}

auto UpdateScheduler::render_update(WidgetId target) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.render_update.insert(target.value);
}

auto UpdateScheduler::take_requests() -> UpdateRequests {
    std::lock_guard<std::mutex> lock(mutex_);
    UpdateRequests              taken = std::exchange(pending_, UpdateRequests{});
    pt_log("UpdateScheduler::take_requests update=" + std::to_string(taken.update.size())
               + " info=" + std::to_string(taken.info.size()) + " render=" + std::to_string(taken.render.size()),
           "Updates");
    return taken;
}

auto UpdateScheduler::has_pending() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_.empty();
}

} // namespace PT
