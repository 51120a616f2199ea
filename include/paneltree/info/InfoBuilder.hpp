#pragma once

#include <paneltree/core/Ids.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace PT {

struct WidgetInfo {
    WidgetId                id;
    std::optional<WidgetId> parent;
};

// First and last child widget of a panel list, written into the info tree of the panel widget.
struct PanelListRange {
    std::optional<std::pair<WidgetId, WidgetId>> range{};
    std::uint8_t                                 version = 0;
};

/**
 * Recording info-tree builder.
 *
 * Widget entries keep insertion order; panel metadata is keyed by the owning widget
 * and a StateId. A split builder starts empty and folding it back appends its
 * entries and merges its metadata.
 */
class InfoBuilder {
public:
    InfoBuilder() = default;

    auto push_widget(WidgetId id, std::optional<WidgetId> parent) -> void;

    auto set_panel_range(std::optional<WidgetId> owner, StateId key, PanelListRange range) -> void;

    [[nodiscard]] auto panel_range(std::optional<WidgetId> owner, StateId key) const -> std::optional<PanelListRange>;

    [[nodiscard]] auto parallel_split() const -> InfoBuilder;
    auto               parallel_fold(InfoBuilder&& split) -> void;

    [[nodiscard]] auto widgets() const -> std::vector<WidgetInfo> const& {
        return widgets_;
    }

    [[nodiscard]] auto widget_ids() const -> std::vector<WidgetId>;

    // Widgets whose parent is `parent`, in insertion order.
    [[nodiscard]] auto children_of(WidgetId parent) const -> std::vector<WidgetId>;

private:
    using PanelMeta = phmap::flat_hash_map<std::uint64_t, PanelListRange>;

    std::vector<WidgetInfo>                         widgets_{};
    phmap::flat_hash_map<std::uint64_t, PanelMeta> meta_{};
};

} // namespace PT
