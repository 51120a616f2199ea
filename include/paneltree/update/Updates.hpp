#pragma once

#include <paneltree/core/Ids.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <optional>
#include <string>

namespace PT {

// Event payload delivered through `event_all`.
struct EventUpdate {
    std::string             name;
    std::optional<WidgetId> target;

    [[nodiscard]] auto targets(WidgetId id) const -> bool {
        return !target || *target == id;
    }
};

// Set of widgets that requested an update in the current pass.
class WidgetUpdates {
public:
    WidgetUpdates() = default;

    [[nodiscard]] static auto everything() -> WidgetUpdates {
        WidgetUpdates updates;
        updates.all_ = true;
        return updates;
    }

    auto insert(WidgetId id) -> void {
        ids_.insert(id.value);
    }

    [[nodiscard]] auto contains(WidgetId id) const -> bool {
        return all_ || ids_.contains(id.value);
    }

    [[nodiscard]] auto is_all() const -> bool {
        return all_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return ids_.size();
    }

private:
    phmap::flat_hash_set<std::uint64_t> ids_{};
    bool                                all_ = false;
};

} // namespace PT
