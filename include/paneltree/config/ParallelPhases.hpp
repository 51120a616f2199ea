#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace PT {

// Tree pass that a composite list may fan out over worker threads.
enum class Phase : std::uint8_t {
    Init         = 1u << 0,
    Deinit       = 1u << 1,
    Info         = 1u << 2,
    Event        = 1u << 3,
    Update       = 1u << 4,
    Render       = 1u << 5,
    RenderUpdate = 1u << 6,
};

[[nodiscard]] constexpr auto phaseToString(Phase phase) -> std::string_view {
    switch (phase) {
    case Phase::Init:
        return "init";
    case Phase::Deinit:
        return "deinit";
    case Phase::Info:
        return "info";
    case Phase::Event:
        return "event";
    case Phase::Update:
        return "update";
    case Phase::Render:
        return "render";
    case Phase::RenderUpdate:
        return "render_update";
    }
    return "unknown";
}

[[nodiscard]] auto phaseFromString(std::string_view name) -> std::optional<Phase>;

class ParallelPhases {
public:
    constexpr ParallelPhases() = default;

    [[nodiscard]] static constexpr auto none() -> ParallelPhases {
        return ParallelPhases{};
    }

    [[nodiscard]] static constexpr auto all() -> ParallelPhases {
        return ParallelPhases{kAllBits};
    }

    [[nodiscard]] constexpr auto contains(Phase phase) const -> bool {
        return (bits_ & static_cast<std::uint8_t>(phase)) != 0;
    }

    constexpr auto set(Phase phase, bool enabled = true) -> ParallelPhases& {
        if (enabled)
            bits_ |= static_cast<std::uint8_t>(phase);
        else
            bits_ &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(phase));
        return *this;
    }

    [[nodiscard]] constexpr auto with(Phase phase) const -> ParallelPhases {
        auto copy = *this;
        copy.set(phase);
        return copy;
    }

    [[nodiscard]] constexpr auto is_empty() const -> bool {
        return bits_ == 0;
    }

    [[nodiscard]] constexpr auto bits() const -> std::uint8_t {
        return bits_;
    }

    constexpr auto operator==(ParallelPhases const&) const -> bool = default;

    static constexpr Phase kAll[] = {Phase::Init,   Phase::Deinit, Phase::Info,        Phase::Event,
                                     Phase::Update, Phase::Render, Phase::RenderUpdate};

private:
    static constexpr std::uint8_t kAllBits = 0x7F;

    constexpr explicit ParallelPhases(std::uint8_t bits)
        : bits_(bits) {}

    std::uint8_t bits_ = 0;
};

} // namespace PT
