#include <paneltree/task/WorkerPool.hpp>

#include "log/TaggedLogger.hpp"
#include "task/JobState.hpp"

#include <exception>
#include <string>
#include <system_error>

namespace PT {

struct WorkerPool::ForkedJob {
    explicit ForkedJob(Job const* body)
        : fn(body) {}

    Job const*              fn;
    JobState                state;
    std::exception_ptr      error;
    std::mutex              doneMutex;
    std::condition_variable doneCV;
    bool                    done = false;
};

WorkerPool& WorkerPool::Instance() {
    // Leak-on-exit singleton to avoid destructor-order races with static panels
    static WorkerPool* instance = []() -> WorkerPool* {
        return new WorkerPool();
    }();
    return *instance;
}

WorkerPool::WorkerPool(std::size_t threadCount) {
    pt_log("WorkerPool::WorkerPool constructing", "WorkerPool");
    if (threadCount == 0)
        threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&WorkerPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const&) {
            pt_log("WorkerPool::WorkerPool failed to spawn worker", "WorkerPool", "ERROR");
            break;
        }
    }
    pt_log("WorkerPool::WorkerPool constructed with workers=" + std::to_string(activeWorkers.load()), "WorkerPool");
}

WorkerPool::~WorkerPool() {
    pt_log("WorkerPool::~WorkerPool", "WorkerPool");
    shutdown();
}

auto WorkerPool::enqueue(std::shared_ptr<ForkedJob> const& job) -> bool {
    std::lock_guard<std::mutex> lock(mutex);
    if (shuttingDown || workers.empty()) {
        return false;
    }
    jobs.push(job);
    jobCV.notify_one();
    return true;
}

auto WorkerPool::runJob(ForkedJob& job) -> void {
    job.state.transitionToRunning();
    try {
        (*job.fn)();
        job.state.markCompleted();
    } catch (...) {
        // Stored and rethrown by the joining thread.
        job.error = std::current_exception();
        job.state.markFailed();
    }
    {
        std::lock_guard<std::mutex> lock(job.doneMutex);
        job.done = true;
    }
    job.doneCV.notify_all();
}

auto WorkerPool::join(Job const& a, Job const& b) -> void {
    auto job = std::make_shared<ForkedJob>(&b);
    if (!this->enqueue(job)) {
        a();
        b();
        return;
    }

    std::exception_ptr firstError;
    try {
        a();
    } catch (...) {
        firstError = std::current_exception();
    }

    if (job->state.tryStart()) {
        // No worker picked it up, run it here; the queued entry is skipped later.
        runJob(*job);
    } else {
        std::unique_lock<std::mutex> lock(job->doneMutex);
        job->doneCV.wait(lock, [&job] { return job->done; });
        stolen.fetch_add(1, std::memory_order_relaxed);
    }

    if (firstError)
        std::rethrow_exception(firstError);
    if (job->error)
        std::rethrow_exception(job->error);
}

auto WorkerPool::for_range(std::size_t begin,
                           std::size_t end,
                           std::function<void(std::size_t)> const& fn,
                           std::size_t grain) -> void {
    if (grain == 0)
        grain = 1;
    if (end <= begin)
        return;
    if (end - begin <= grain || this->size() == 0) {
        for (std::size_t i = begin; i < end; ++i) {
            fn(i);
        }
        return;
    }
    auto const mid = begin + (end - begin) / 2;
    this->join([&] { this->for_range(begin, mid, fn, grain); }, [&] { this->for_range(mid, end, fn, grain); });
}

auto WorkerPool::shutdown() -> void {
    pt_log("WorkerPool::shutdown begin", "WorkerPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            pt_log("WorkerPool::shutdown already in progress", "WorkerPool");
            return;
        }
        this->shuttingDown = true;
        this->jobCV.notify_all();
    }

    for (auto& th : this->workers) {
        if (th.joinable()) {
            th.join();
        }
    }
    activeWorkers = 0;

    std::lock_guard<std::mutex> lock(this->mutex);
    this->workers.clear();
    // Anything left was claimed by its joining thread or will be, nothing to run here.
    while (!this->jobs.empty()) {
        this->jobs.pop();
    }
    pt_log("WorkerPool::shutdown ends", "WorkerPool");
}

auto WorkerPool::size() const -> std::size_t {
    return this->activeWorkers.load(std::memory_order_acquire);
}

auto WorkerPool::workerFunction() -> void {
    pt_log("WorkerPool::workerFunction start", "WorkerPool");
    while (true) {
        std::shared_ptr<ForkedJob> job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });

            if (this->shuttingDown && this->jobs.empty()) {
                break;
            }
            job = std::move(jobs.front());
            jobs.pop();
        }

        if (job->state.tryStart()) {
            runJob(*job);
        }
    }
    pt_log("WorkerPool::workerFunction exit", "WorkerPool");
}

} // namespace PT
