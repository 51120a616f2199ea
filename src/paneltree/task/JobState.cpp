#include "JobState.hpp"

namespace PT {

namespace {
constexpr std::string_view jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::NotStarted:
            return "NotStarted";
        case JobStatus::Starting:
            return "Starting";
        case JobStatus::Running:
            return "Running";
        case JobStatus::Completed:
            return "Completed";
        case JobStatus::Failed:
            return "Failed";
        default:
            return "Unknown";
    }
}
} // namespace

bool JobState::tryStart() {
    JobStatus expected = JobStatus::NotStarted;
    return state.compare_exchange_strong(expected, JobStatus::Starting, std::memory_order_acq_rel);
}

bool JobState::transitionToRunning() {
    JobStatus expected = JobStatus::Starting;
    return state.compare_exchange_strong(expected, JobStatus::Running, std::memory_order_acq_rel);
}

bool JobState::markCompleted() {
    JobStatus expected = JobStatus::Running;
    return state.compare_exchange_strong(expected, JobStatus::Completed, std::memory_order_acq_rel);
}

bool JobState::markFailed() {
    JobStatus current = state.load(std::memory_order_acquire);
    while (current != JobStatus::Completed) {
        if (state.compare_exchange_weak(current, JobStatus::Failed, std::memory_order_acq_rel)) {
            return true;
        }
    }
    return false;
}

JobStatus JobState::get() const {
    return state.load(std::memory_order_acquire);
}

bool JobState::isTerminal() const {
    JobStatus current = get();
    return current == JobStatus::Completed || current == JobStatus::Failed;
}

bool JobState::hasStarted() const {
    return get() != JobStatus::NotStarted;
}

bool JobState::isCompleted() const {
    return get() == JobStatus::Completed;
}

bool JobState::isFailed() const {
    return get() == JobStatus::Failed;
}

bool JobState::isRunning() const {
    return get() == JobStatus::Running;
}

std::string_view JobState::toString() const {
    return jobStatusToString(get());
}

} // namespace PT
