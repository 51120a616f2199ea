#pragma once

#include <paneltree/layout/Units.hpp>

#include <compare>
#include <cstdint>

namespace PT {

// Binding slot for a value that render updates may change without rebuilding the frame.
struct FrameValueId {
    std::uint64_t key   = 0;
    std::uint32_t index = 0;

    auto operator<=>(FrameValueId const&) const = default;
};

// Identity of a reference frame pushed into a display list.
struct SpatialFrameId {
    std::uint64_t key   = 0;
    std::uint32_t index = 0;

    auto operator<=>(SpatialFrameId const&) const = default;
};

template <typename T>
struct FrameValue {
    FrameValueId id{};
    T            value{};
    bool         animating = false;
};

struct FrameValueUpdate {
    FrameValueId id{};
    PxTransform  value{};
    bool         animating = false;
};

/**
 * Process-unique key for a family of bound frame values.
 *
 * One key plus an item index addresses every per-item binding of a list, so a render
 * update can replace the value of item `i` without knowing anything else about it.
 */
class FrameValueKey {
public:
    [[nodiscard]] static auto next() -> FrameValueKey;

    [[nodiscard]] auto value() const -> std::uint64_t {
        return key_;
    }

    [[nodiscard]] auto spatial_id(std::uint32_t index) const -> SpatialFrameId {
        return SpatialFrameId{key_, index};
    }

    [[nodiscard]] auto bind_child(std::uint32_t index, PxTransform value, bool animating) const
        -> FrameValue<PxTransform> {
        return FrameValue<PxTransform>{FrameValueId{key_, index}, value, animating};
    }

    [[nodiscard]] auto update_child(std::uint32_t index, PxTransform value, bool animating) const -> FrameValueUpdate {
        return FrameValueUpdate{FrameValueId{key_, index}, value, animating};
    }

    auto operator==(FrameValueKey const&) const -> bool = default;

private:
    explicit FrameValueKey(std::uint64_t key)
        : key_(key) {}

    std::uint64_t key_;
};

} // namespace PT
