#pragma once

#include <cstdint>

namespace PT {

struct PxVector {
    std::int32_t x = 0;
    std::int32_t y = 0;

    [[nodiscard]] static constexpr auto zero() -> PxVector {
        return PxVector{};
    }

    constexpr auto operator+(PxVector const& other) const -> PxVector {
        return PxVector{x + other.x, y + other.y};
    }

    constexpr auto operator-(PxVector const& other) const -> PxVector {
        return PxVector{x - other.x, y - other.y};
    }

    constexpr auto operator+=(PxVector const& other) -> PxVector& {
        x += other.x;
        y += other.y;
        return *this;
    }

    auto operator==(PxVector const&) const -> bool = default;
};

// Translation-only transform; panels only ever offset their children.
struct PxTransform {
    PxVector translation{};

    [[nodiscard]] static constexpr auto identity() -> PxTransform {
        return PxTransform{};
    }

    [[nodiscard]] static constexpr auto translate(PxVector offset) -> PxTransform {
        return PxTransform{offset};
    }

    [[nodiscard]] constexpr auto then(PxTransform const& other) const -> PxTransform {
        return PxTransform{translation + other.translation};
    }

    auto operator==(PxTransform const&) const -> bool = default;
};

} // namespace PT
