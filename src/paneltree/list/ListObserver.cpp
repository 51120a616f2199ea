#include <paneltree/list/ListObserver.hpp>

namespace PT {

auto OffsetObserver::inserted(std::size_t index) -> void {
    inner_.inserted(index + offset_);
}

auto OffsetObserver::removed(std::size_t index) -> void {
    inner_.removed(index + offset_);
}

auto OffsetObserver::moved(std::size_t from, std::size_t to) -> void {
    inner_.moved(from + offset_, to + offset_);
}

auto OffsetObserver::reset() -> void {
    inner_.reset();
}

auto FanOutObserver::inserted(std::size_t index) -> void {
    first_.inserted(index);
    second_.inserted(index);
}

auto FanOutObserver::removed(std::size_t index) -> void {
    first_.removed(index);
    second_.removed(index);
}

auto FanOutObserver::moved(std::size_t from, std::size_t to) -> void {
    first_.moved(from, to);
    second_.moved(from, to);
}

auto FanOutObserver::reset() -> void {
    first_.reset();
    second_.reset();
}

} // namespace PT
