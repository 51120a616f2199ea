#pragma once

#include <paneltree/config/EngineConfig.hpp>
#include <paneltree/context/NodeContext.hpp>

#include <memory>

namespace PT {

class UpdateScheduler;
class WorkerPool;

/**
 * Runtime built from an EngineConfig: the worker pool, the update scheduler and the
 * root context every tree pass starts from.
 *
 * No pool is created when the config enables no parallel phase. `worker_threads == 0`
 * sizes the pool to the hardware concurrency.
 */
class Engine {
public:
    explicit Engine(EngineConfig config);
    ~Engine();

    Engine(Engine const&)                    = delete;
    auto operator=(Engine const&) -> Engine& = delete;

    [[nodiscard]] auto config() const -> EngineConfig const& {
        return config_;
    }

    [[nodiscard]] auto pool() const -> WorkerPool* {
        return pool_.get();
    }

    [[nodiscard]] auto scheduler() const -> std::shared_ptr<UpdateScheduler> const& {
        return scheduler_;
    }

    [[nodiscard]] auto root_context() const -> NodeContext {
        return root_;
    }

private:
    EngineConfig                     config_;
    std::unique_ptr<WorkerPool>      pool_;
    std::shared_ptr<UpdateScheduler> scheduler_;
    NodeContext                      root_;
};

} // namespace PT
