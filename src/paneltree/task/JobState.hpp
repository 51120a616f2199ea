#pragma once
#include <atomic>
#include <string_view>

namespace PT {

// Lifecycle of a forked job
enum class JobStatus {
    NotStarted, // Queued, nobody claimed it yet
    Starting,   // Claimed by a worker or by the joining thread
    Running,    // Job body is executing
    Completed,  // Job body returned
    Failed      // Job body threw, the exception is stored with the job
};

// Thread-safe wrapper for job state transitions
struct JobState {
    JobState() = default;

    JobState(const JobState&)            = delete;
    JobState& operator=(const JobState&) = delete;

    bool tryStart();            // NotStarted -> Starting. Exactly one caller wins the claim
    bool transitionToRunning(); // Starting -> Running
    bool markCompleted();       // Running -> Completed
    bool markFailed();          // Anything but Completed -> Failed
    bool isTerminal() const;    // Completed or Failed
    bool hasStarted() const;    // Any state except NotStarted
    bool isCompleted() const;
    bool isFailed() const;
    bool isRunning() const;

    JobStatus get() const;

    std::string_view toString() const;

private:
    std::atomic<JobStatus> state{JobStatus::NotStarted};
};

} // namespace PT
