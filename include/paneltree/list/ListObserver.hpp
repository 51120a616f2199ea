#pragma once

#include <cstddef>

namespace PT {

/**
 * Receives structural changes applied by a list during `update_all`.
 *
 * Indices are relative to the list state just before the change being reported.
 * An observer that only needs to know that something changed reports
 * `is_reset_only() == true`, which lets composite lists update their parts in
 * parallel and report a single `reset()`.
 */
class ListObserver {
public:
    virtual ~ListObserver() = default;

    virtual auto inserted(std::size_t index) -> void           = 0;
    virtual auto removed(std::size_t index) -> void            = 0;
    virtual auto moved(std::size_t from, std::size_t to) -> void = 0;
    virtual auto reset() -> void                               = 0;

    [[nodiscard]] virtual auto is_reset_only() const -> bool = 0;
};

// Ignores every notification.
class NullObserver final : public ListObserver {
public:
    auto inserted(std::size_t) -> void override {}
    auto removed(std::size_t) -> void override {}
    auto moved(std::size_t, std::size_t) -> void override {}
    auto reset() -> void override {}

    [[nodiscard]] auto is_reset_only() const -> bool override {
        return true;
    }
};

// Records whether any notification happened.
class ChangedObserver final : public ListObserver {
public:
    auto inserted(std::size_t) -> void override {
        changed_ = true;
    }
    auto removed(std::size_t) -> void override {
        changed_ = true;
    }
    auto moved(std::size_t, std::size_t) -> void override {
        changed_ = true;
    }
    auto reset() -> void override {
        changed_ = true;
    }

    [[nodiscard]] auto is_reset_only() const -> bool override {
        return true;
    }

    [[nodiscard]] auto changed() const -> bool {
        return changed_;
    }

private:
    bool changed_ = false;
};

// Forwards to `inner` with `offset` added to every index.
class OffsetObserver final : public ListObserver {
public:
    OffsetObserver(ListObserver& inner, std::size_t offset)
        : inner_(inner), offset_(offset) {}

    auto inserted(std::size_t index) -> void override;
    auto removed(std::size_t index) -> void override;
    auto moved(std::size_t from, std::size_t to) -> void override;
    auto reset() -> void override;

    [[nodiscard]] auto is_reset_only() const -> bool override {
        return inner_.is_reset_only();
    }

private:
    ListObserver& inner_;
    std::size_t   offset_;
};

// Forwards to both observers; reset-only only when both are.
class FanOutObserver final : public ListObserver {
public:
    FanOutObserver(ListObserver& first, ListObserver& second)
        : first_(first), second_(second) {}

    auto inserted(std::size_t index) -> void override;
    auto removed(std::size_t index) -> void override;
    auto moved(std::size_t from, std::size_t to) -> void override;
    auto reset() -> void override;

    [[nodiscard]] auto is_reset_only() const -> bool override {
        return first_.is_reset_only() && second_.is_reset_only();
    }

private:
    ListObserver& first_;
    ListObserver& second_;
};

} // namespace PT
