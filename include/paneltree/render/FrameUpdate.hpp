#pragma once

#include <paneltree/core/Ids.hpp>
#include <paneltree/layout/Units.hpp>
#include <paneltree/render/FrameValue.hpp>

#include <optional>
#include <vector>

namespace PT {

struct FrameUpdateItem {
    enum class Kind : std::uint8_t { Transform, ChildOffset, Widget };

    Kind                            kind = Kind::Widget;
    std::optional<FrameValueUpdate> transform{};
    PxVector                        offset{};
    std::optional<WidgetId>         widget{};
};

/**
 * Recording render-update builder.
 *
 * Records bound transform updates, child offsets in effect for nested updates, and
 * the widgets visited. Split and fold follow the same ordering rules as FrameBuilder.
 */
class FrameUpdate {
public:
    FrameUpdate() = default;

    template <typename Fn>
    auto with_transform(FrameValueUpdate const& update, Fn&& fn) -> void {
        items_.push_back(FrameUpdateItem{.kind = FrameUpdateItem::Kind::Transform, .transform = update});
        fn(*this);
    }

    template <typename Fn>
    auto with_child(PxVector offset, Fn&& fn) -> void {
        items_.push_back(FrameUpdateItem{.kind = FrameUpdateItem::Kind::ChildOffset, .offset = offset});
        fn(*this);
    }

    auto update_widget(WidgetId id) -> void;

    [[nodiscard]] auto parallel_split() const -> FrameUpdate;
    auto               parallel_fold(FrameUpdate&& split) -> void;

    [[nodiscard]] auto items() const -> std::vector<FrameUpdateItem> const& {
        return items_;
    }

    [[nodiscard]] auto transforms() const -> std::vector<FrameValueUpdate>;
    [[nodiscard]] auto widgets() const -> std::vector<WidgetId>;

private:
    std::vector<FrameUpdateItem> items_{};
};

} // namespace PT
