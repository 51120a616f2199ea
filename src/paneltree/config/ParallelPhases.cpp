#include <paneltree/config/ParallelPhases.hpp>

namespace PT {

auto phaseFromString(std::string_view name) -> std::optional<Phase> {
    for (auto const phase : ParallelPhases::kAll) {
        if (phaseToString(phase) == name)
            return phase;
    }
    return std::nullopt;
}

} // namespace PT
