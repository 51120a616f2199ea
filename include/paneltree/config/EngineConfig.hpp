#pragma once

#include <paneltree/config/ParallelPhases.hpp>
#include <paneltree/core/Error.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace PT {

/**
 * Engine-wide settings read once at startup.
 *
 * JSON form:
 *   {
 *     "parallel": {"init": true, "update": false, ...} | ["init", "render"] | true,
 *     "worker_threads": 4,
 *     "min_parallel_len": 2
 *   }
 *
 * Missing keys keep their defaults. `worker_threads == 0` means one worker per
 * hardware thread.
 */
struct EngineConfig {
    ParallelPhases parallel         = ParallelPhases::all();
    std::size_t    worker_threads   = 0;
    std::size_t    min_parallel_len = 2;
};

[[nodiscard]] auto load_engine_config(std::string_view json) -> Expected<EngineConfig>;
[[nodiscard]] auto load_engine_config_file(std::filesystem::path const& path) -> Expected<EngineConfig>;

// PANELTREE_PARALLEL=0 disables every phase, any other value enables all of them.
auto apply_environment(EngineConfig& config) -> void;

[[nodiscard]] auto engine_config_to_json(EngineConfig const& config) -> std::string;

} // namespace PT
