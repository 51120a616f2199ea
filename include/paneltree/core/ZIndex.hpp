#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string>

namespace PT {

/**
 * Position of a widget inside a panel render pass.
 *
 * Widgets with equal z-index render in logical order. Arithmetic saturates at
 * BACK and FRONT.
 */
struct ZIndex {
    std::uint32_t value = std::numeric_limits<std::uint32_t>::max() / 2;

    static constexpr std::uint32_t kBack    = 0;
    static constexpr std::uint32_t kDefault = std::numeric_limits<std::uint32_t>::max() / 2;
    static constexpr std::uint32_t kFront   = std::numeric_limits<std::uint32_t>::max();

    [[nodiscard]] static constexpr auto back() -> ZIndex {
        return ZIndex{kBack};
    }
    [[nodiscard]] static constexpr auto defaultIndex() -> ZIndex {
        return ZIndex{kDefault};
    }
    [[nodiscard]] static constexpr auto front() -> ZIndex {
        return ZIndex{kFront};
    }

    [[nodiscard]] constexpr auto saturating_add(std::uint32_t other) const -> ZIndex {
        return ZIndex{other > kFront - value ? kFront : value + other};
    }

    [[nodiscard]] constexpr auto saturating_sub(std::uint32_t other) const -> ZIndex {
        return ZIndex{other > value ? kBack : value - other};
    }

    constexpr auto operator+(std::uint32_t other) const -> ZIndex {
        return saturating_add(other);
    }

    constexpr auto operator-(std::uint32_t other) const -> ZIndex {
        return saturating_sub(other);
    }

    auto operator<=>(ZIndex const&) const = default;

    // Debug label relative to the nearest named constant, e.g. "DEFAULT+1".
    [[nodiscard]] auto to_string() const -> std::string {
        if (value == kDefault)
            return "DEFAULT";
        if (value == kBack)
            return "BACK";
        if (value == kFront)
            return "FRONT";
        if (value > kDefault) {
            if (value > kFront - 10000)
                return "FRONT-" + std::to_string(kFront - value);
            return "DEFAULT+" + std::to_string(value - kDefault);
        }
        if (value < kBack + 10000)
            return "BACK+" + std::to_string(value - kBack);
        return "DEFAULT-" + std::to_string(kDefault - value);
    }
};

} // namespace PT
