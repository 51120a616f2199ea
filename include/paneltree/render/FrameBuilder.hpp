#pragma once

#include <paneltree/core/Ids.hpp>
#include <paneltree/layout/Units.hpp>
#include <paneltree/render/FrameValue.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace PT {

enum class DisplayItemKind : std::uint8_t {
    PushReferenceFrame,
    PopReferenceFrame,
    PushChild,
    PopChild,
    Widget,
};

[[nodiscard]] auto displayItemKindToString(DisplayItemKind kind) -> std::string_view;

struct DisplayItem {
    DisplayItemKind               kind = DisplayItemKind::Widget;
    std::optional<WidgetId>       widget{};
    std::optional<SpatialFrameId> frame{};
    std::optional<FrameValueId>   binding{};
    PxTransform                   transform{};
    PxVector                      offset{};
};

/**
 * Recording display-list builder.
 *
 * Items are appended in paint order. A builder can be split into an empty sibling
 * for a parallel branch; folding the sibling back appends its items after the ones
 * already recorded, so a fold in branch order reproduces the sequential display list.
 */
class FrameBuilder {
public:
    FrameBuilder() = default;

    template <typename Fn>
    auto push_reference_frame(SpatialFrameId id, FrameValue<PxTransform> const& transform, Fn&& fn) -> void {
        items_.push_back(DisplayItem{.kind      = DisplayItemKind::PushReferenceFrame,
                                     .frame     = id,
                                     .binding   = transform.id,
                                     .transform = transform.value});
        fn(*this);
        items_.push_back(DisplayItem{.kind = DisplayItemKind::PopReferenceFrame, .frame = id});
    }

    template <typename Fn>
    auto push_child(PxVector offset, Fn&& fn) -> void {
        items_.push_back(DisplayItem{.kind = DisplayItemKind::PushChild, .offset = offset});
        fn(*this);
        items_.push_back(DisplayItem{.kind = DisplayItemKind::PopChild});
    }

    auto push_widget(WidgetId id) -> void;

    [[nodiscard]] auto parallel_split() const -> FrameBuilder;
    auto               parallel_fold(FrameBuilder&& split) -> void;

    [[nodiscard]] auto items() const -> std::vector<DisplayItem> const& {
        return items_;
    }

    // Widgets in paint order.
    [[nodiscard]] auto widgets() const -> std::vector<WidgetId>;

    [[nodiscard]] auto count(DisplayItemKind kind) const -> std::size_t;

private:
    std::vector<DisplayItem> items_{};
};

} // namespace PT
