#include <paneltree/config/EngineConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace PT {

namespace {

auto makeError(Error::Code code, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{code, std::move(message)});
}

auto parseParallel(nlohmann::json const& node) -> Expected<ParallelPhases> {
    if (node.is_boolean())
        return node.get<bool>() ? ParallelPhases::all() : ParallelPhases::none();

    ParallelPhases phases = ParallelPhases::none();
    if (node.is_array()) {
        for (auto const& entry : node) {
            if (!entry.is_string())
                return makeError(Error::Code::InvalidType, "parallel phase list entries must be strings");
            auto const name  = entry.get<std::string>();
            auto const phase = phaseFromString(name);
            if (!phase)
                return makeError(Error::Code::MalformedInput, "unknown parallel phase '" + name + "'");
            phases.set(*phase);
        }
        return phases;
    }

    if (node.is_object()) {
        // Phases left out of the object keep the default of enabled.
        phases = ParallelPhases::all();
        for (auto const& [name, value] : node.items()) {
            auto const phase = phaseFromString(name);
            if (!phase)
                return makeError(Error::Code::MalformedInput, "unknown parallel phase '" + name + "'");
            if (!value.is_boolean())
                return makeError(Error::Code::InvalidType, "parallel phase '" + name + "' must be a boolean");
            phases.set(*phase, value.get<bool>());
        }
        return phases;
    }

    return makeError(Error::Code::InvalidType, "'parallel' must be a boolean, an array or an object");
}

auto parseCount(nlohmann::json const& doc, char const* key, std::size_t& out) -> Expected<void> {
    auto it = doc.find(key);
    if (it == doc.end())
        return {};
    if (!it->is_number_unsigned())
        return makeError(Error::Code::InvalidType, std::string("'") + key + "' must be a non-negative integer");
    out = it->get<std::size_t>();
    return {};
}

} // namespace

auto load_engine_config(std::string_view json) -> Expected<EngineConfig> {
    auto doc = nlohmann::json::parse(json, nullptr, false);
    if (doc.is_discarded())
        return makeError(Error::Code::MalformedInput, "invalid engine config JSON");
    if (!doc.is_object())
        return makeError(Error::Code::InvalidType, "engine config must be a JSON object");

    EngineConfig config;
    if (auto it = doc.find("parallel"); it != doc.end()) {
        auto phases = parseParallel(*it);
        if (!phases)
            return std::unexpected(phases.error());
        config.parallel = *phases;
    }
    if (auto result = parseCount(doc, "worker_threads", config.worker_threads); !result)
        return std::unexpected(result.error());
    if (auto result = parseCount(doc, "min_parallel_len", config.min_parallel_len); !result)
        return std::unexpected(result.error());
    if (config.min_parallel_len == 0)
        return makeError(Error::Code::OutOfRange, "'min_parallel_len' must be at least 1");

    pt_log("EngineConfig loaded parallel=" + std::to_string(config.parallel.bits())
               + " workers=" + std::to_string(config.worker_threads),
           "Config");
    return config;
}

auto load_engine_config_file(std::filesystem::path const& path) -> Expected<EngineConfig> {
    std::ifstream stream(path);
    if (!stream)
        return makeError(Error::Code::IoFailure, "failed to open engine config '" + path.string() + "'");
    std::string buffer((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad())
        return makeError(Error::Code::IoFailure, "failed to read engine config '" + path.string() + "'");
    return load_engine_config(buffer);
}

auto apply_environment(EngineConfig& config) -> void {
    auto const* value = std::getenv("PANELTREE_PARALLEL");
    if (value == nullptr)
        return;
    config.parallel = std::string_view{value} == "0" ? ParallelPhases::none() : ParallelPhases::all();
    pt_log(std::string("PANELTREE_PARALLEL=") + value, "Config");
}

auto engine_config_to_json(EngineConfig const& config) -> std::string {
    nlohmann::json parallel = nlohmann::json::object();
    for (auto const phase : ParallelPhases::kAll) {
        parallel[std::string(phaseToString(phase))] = config.parallel.contains(phase);
    }
    nlohmann::json doc{
        {"parallel", std::move(parallel)},
        {"worker_threads", config.worker_threads},
        {"min_parallel_len", config.min_parallel_len},
    };
    return doc.dump();
}

} // namespace PT
