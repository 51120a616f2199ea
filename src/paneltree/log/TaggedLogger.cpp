#ifdef PT_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>
#include <string_view>

namespace PT {

namespace {
constexpr std::array<std::string_view, 2> kSkipTags{"WorkerPool", "Inspect"};

auto shortPath(const char* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}
} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : writer([this](std::stop_token stop) { this->writerLoop(stop); }) {}

auto TaggedLogger::setThreadName(std::string name) -> void {
    std::lock_guard<std::mutex> lock(namesMutex);
    names[std::this_thread::get_id()] = std::move(name);
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    enabled.store(on, std::memory_order_relaxed);
}

auto TaggedLogger::currentThreadName() -> std::string {
    std::lock_guard<std::mutex> lock(namesMutex);
    auto [it, inserted] = names.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(nextThread++);
    return it->second;
}

auto TaggedLogger::push(Entry entry) -> void {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        queue.push_back(std::move(entry));
    }
    queueCV.notify_one();
}

auto TaggedLogger::writerLoop(std::stop_token stop) -> void {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (true) {
        queueCV.wait(lock, stop, [this] { return !queue.empty(); });
        while (!queue.empty()) {
            auto entry = std::move(queue.front());
            queue.pop_front();
            lock.unlock();
            write(entry);
            lock.lock();
        }
        if (stop.stop_requested())
            return;
    }
}

auto TaggedLogger::write(Entry const& entry) -> void {
    auto const skipped = std::ranges::any_of(entry.tags, [](std::string const& tag) {
        return std::ranges::find(kSkipTags, tag) != kSkipTags.end();
    });
    if (skipped)
        return;

    std::string line;
    for (auto const& tag : entry.tags) {
        line += '[' + tag + ']';
    }
    line += " [" + entry.thread + "] [" + shortPath(entry.location.file_name()) + ':'
            + std::to_string(entry.location.line()) + "] " + entry.message + '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace PT
#endif // PT_LOG_DEBUG
