#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace PT {

// Identity of a widget node. Zero is never handed out by `WidgetId::next()`.
struct WidgetId {
    std::uint64_t value = 0;

    [[nodiscard]] static auto next() -> WidgetId;

    [[nodiscard]] auto to_string() const -> std::string {
        return "wgt#" + std::to_string(value);
    }

    auto operator<=>(WidgetId const&) const = default;
};

// Key of a metadata entry written into the info tree by a panel.
struct StateId {
    std::uint64_t value = 0;

    [[nodiscard]] static auto next() -> StateId;

    auto operator<=>(StateId const&) const = default;
};

} // namespace PT

template <>
struct std::hash<PT::WidgetId> {
    auto operator()(PT::WidgetId const& id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template <>
struct std::hash<PT::StateId> {
    auto operator()(PT::StateId const& id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
