#pragma once

#include <paneltree/context/NodeContext.hpp>
#include <paneltree/layout/Units.hpp>

#include <concepts>
#include <cstdint>

namespace PT {

// Fields of panel item data that changed since the last commit.
class PanelListDataChanges {
public:
    static constexpr std::uint8_t kChildOffset          = 0b01;
    static constexpr std::uint8_t kDefineReferenceFrame = 0b10;

    constexpr PanelListDataChanges() = default;
    constexpr explicit PanelListDataChanges(std::uint8_t bits)
        : bits_(bits & (kChildOffset | kDefineReferenceFrame)) {}

    [[nodiscard]] static constexpr auto empty() -> PanelListDataChanges {
        return PanelListDataChanges{};
    }
    [[nodiscard]] static constexpr auto child_offset() -> PanelListDataChanges {
        return PanelListDataChanges{kChildOffset};
    }
    [[nodiscard]] static constexpr auto define_reference_frame() -> PanelListDataChanges {
        return PanelListDataChanges{kDefineReferenceFrame};
    }

    [[nodiscard]] constexpr auto contains(PanelListDataChanges other) const -> bool {
        return (bits_ & other.bits_) == other.bits_;
    }

    [[nodiscard]] constexpr auto is_empty() const -> bool {
        return bits_ == 0;
    }

    [[nodiscard]] constexpr auto bits() const -> std::uint8_t {
        return bits_;
    }

    constexpr auto operator|(PanelListDataChanges other) const -> PanelListDataChanges {
        return PanelListDataChanges{static_cast<std::uint8_t>(bits_ | other.bits_)};
    }

    constexpr auto operator|=(PanelListDataChanges other) -> PanelListDataChanges& {
        bits_ = static_cast<std::uint8_t>(bits_ | other.bits_);
        return *this;
    }

    constexpr auto operator==(PanelListDataChanges const&) const -> bool = default;

    // Full render when a reference frame flag changed, render update when only offsets moved.
    auto request_render(NodeContext const& ctx) const -> void {
        if (this->contains(define_reference_frame()))
            ctx.request_render();
        else if (this->contains(child_offset()))
            ctx.request_render_update();
    }

private:
    std::uint8_t bits_ = 0;
};

template <typename D>
concept PanelListData = std::default_initializable<D> && requires(D& data, D const& view) {
    { view.child_offset() } -> std::convertible_to<PxVector>;
    { view.define_reference_frame() } -> std::convertible_to<bool>;
    { data.commit() } -> std::same_as<PanelListDataChanges>;
};

// Offset and reference-frame flag used by the default panel render, plus the values of the last commit.
struct DefaultPanelListData {
    PxVector offset{};
    bool     reference_frame = false;

    [[nodiscard]] auto child_offset() const -> PxVector {
        return offset;
    }

    [[nodiscard]] auto define_reference_frame() const -> bool {
        return reference_frame;
    }

    auto commit() -> PanelListDataChanges {
        PanelListDataChanges changes;
        if (reference_frame != prev_reference_frame)
            changes |= PanelListDataChanges::define_reference_frame();
        if (offset != prev_offset)
            changes |= PanelListDataChanges::child_offset();
        prev_reference_frame = reference_frame;
        prev_offset          = offset;
        return changes;
    }

private:
    PxVector prev_offset{};
    bool     prev_reference_frame = false;
};

static_assert(PanelListData<DefaultPanelListData>);

} // namespace PT
