#include <paneltree/context/Engine.hpp>
#include <paneltree/context/UpdateScheduler.hpp>
#include <paneltree/task/WorkerPool.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <thread>

namespace PT {

namespace {
auto workerCount(EngineConfig const& config) -> std::size_t {
    if (config.worker_threads != 0)
        return config.worker_threads;
    auto const hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : hardware;
}
} // namespace

Engine::Engine(EngineConfig config)
    : config_(config),
      pool_(config.parallel.is_empty() ? nullptr : std::make_unique<WorkerPool>(workerCount(config))),
      scheduler_(std::make_shared<UpdateScheduler>()),
      root_(pool_.get(), config.parallel, scheduler_.get(), config.min_parallel_len) {
    pt_log("Engine workers=" + std::to_string(pool_ ? pool_->size() : 0)
                   + " min_parallel_len=" + std::to_string(root_.min_parallel_len()),
           "Config");
}

Engine::~Engine() = default;

} // namespace PT
