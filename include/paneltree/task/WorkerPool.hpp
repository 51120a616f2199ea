#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace PT {

/**
 * WorkerPool: fork-join scheduler shared by every composite list.
 *
 * Contract
 * --------
 * - join(a, b) runs `a` on the calling thread and offers `b` to the workers. When `a`
 *   returns the caller claims `b` if no worker started it yet, otherwise it blocks until
 *   the worker finishes. A thread only ever blocks on a job that is already running, so
 *   nested joins issued from inside worker jobs cannot deadlock.
 * - An exception thrown by either side is rethrown from join() after both sides have
 *   finished; the exception of `a` wins when both throw.
 * - After shutdown(), or for a pool without workers, join() runs both sides inline.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~WorkerPool();

    static WorkerPool& Instance();

    WorkerPool(WorkerPool const&)                    = delete;
    auto operator=(WorkerPool const&) -> WorkerPool& = delete;

    auto join(Job const& a, Job const& b) -> void;

    // Calls fn(i) for every i in [begin, end), splitting the range in halves down to `grain`.
    auto for_range(std::size_t begin, std::size_t end, std::function<void(std::size_t)> const& fn, std::size_t grain = 1)
        -> void;

    // Splits [begin, end) in halves down to `grain`, folds each chunk sequentially starting from
    // identity() and combines neighbouring chunks with reduce(left, right), preserving order.
    template <typename T, typename Identity, typename Fold, typename Reduce>
    auto fold_range(std::size_t begin,
                    std::size_t end,
                    Identity const& identity,
                    Fold const& fold,
                    Reduce const& reduce,
                    std::size_t grain = 1) -> T;

    auto shutdown() -> void;
    auto size() const -> std::size_t;

    // Number of joins whose second half was executed by a worker thread.
    [[nodiscard]] auto stolen_count() const -> std::size_t {
        return stolen.load(std::memory_order_relaxed);
    }

private:
    struct ForkedJob;

    auto workerFunction() -> void;
    auto enqueue(std::shared_ptr<ForkedJob> const& job) -> bool;
    static auto runJob(ForkedJob& job) -> void;

    std::vector<std::jthread>              workers;
    std::queue<std::shared_ptr<ForkedJob>> jobs;
    std::mutex                             mutex;
    std::condition_variable                jobCV;
    std::atomic<bool>                      shuttingDown{false};
    std::atomic<std::size_t>               activeWorkers{0};
    std::atomic<std::size_t>               stolen{0};
};

template <typename T, typename Identity, typename Fold, typename Reduce>
auto WorkerPool::fold_range(std::size_t begin,
                            std::size_t end,
                            Identity const& identity,
                            Fold const& fold,
                            Reduce const& reduce,
                            std::size_t grain) -> T {
    if (grain == 0)
        grain = 1;
    if (end <= begin)
        return identity();
    if (end - begin <= grain || this->size() == 0) {
        T acc = identity();
        for (std::size_t i = begin; i < end; ++i) {
            acc = fold(std::move(acc), i);
        }
        return acc;
    }

    auto const       mid = begin + (end - begin) / 2;
    std::optional<T> left;
    std::optional<T> right;
    this->join([&] { left.emplace(this->fold_range<T>(begin, mid, identity, fold, reduce, grain)); },
               [&] { right.emplace(this->fold_range<T>(mid, end, identity, fold, reduce, grain)); });
    return reduce(std::move(*left), std::move(*right));
}

} // namespace PT
