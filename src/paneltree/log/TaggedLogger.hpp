#ifdef PT_LOG_DEBUG
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <source_location>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace PT {

/**
 * Asynchronous tagged logger.
 *
 * Callers queue a message and return; one writer thread formats it as
 * `[tag][tag] [thread] [dir/file:line] message` on stderr. Messages tagged with one of
 * the chatty tags ("WorkerPool", "Inspect") are dropped. Disabled until
 * setLoggingEnabled(true).
 */
class TaggedLogger {
public:
    TaggedLogger();
    ~TaggedLogger() = default;

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(std::string message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(std::string name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    static std::mutex coutMutex;

private:
    struct Entry {
        std::vector<std::string> tags;
        std::string              message;
        std::string              thread;
        std::source_location     location;
    };

    auto push(Entry entry) -> void;
    auto currentThreadName() -> std::string;
    auto writerLoop(std::stop_token stop) -> void;
    static auto write(Entry const& entry) -> void;

    std::atomic<bool>           enabled{false};
    std::mutex                  queueMutex;
    std::condition_variable_any queueCV;
    std::deque<Entry>           queue;

    std::mutex                                       namesMutex;
    std::unordered_map<std::thread::id, std::string> names;
    int                                              nextThread = 0;

    // Declared last so it stops and drains before the queue goes away.
    std::jthread writer;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(std::string message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled.load(std::memory_order_relaxed))
        return;
    this->push(Entry{.tags     = {std::string(std::forward<Tags>(tags))...},
                     .message  = std::move(message),
                     .thread   = this->currentThreadName(),
                     .location = location});
}

#define pt_log(message, ...) ::PT::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace PT

#else
#define pt_log(message, ...) ((void)0)
#endif // PT_LOG_DEBUG
