#pragma once

#include <paneltree/PanelTree.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PT::Test {

// Widget that counts every lifecycle call and can poke its context on init or update.
class RecordingNode : public WidgetNode {
public:
    explicit RecordingNode(int key = 0)
        : key(key) {}

    int key;

    std::atomic<int> inits{0};
    std::atomic<int> deinits{0};
    std::atomic<int> infos{0};
    std::atomic<int> events{0};
    std::atomic<int> updates{0};
    std::atomic<int> renders{0};
    std::atomic<int> render_updates{0};

    std::optional<ZIndex> z_on_init{};
    std::optional<ZIndex> z_on_update{};
    bool                  resort_on_update = false;
    std::optional<bool>   last_z_result{};

protected:
    auto on_init(NodeContext const& ctx) -> void override {
        ++inits;
        if (z_on_init)
            last_z_result = this->set_z_index(ctx, *z_on_init);
    }
    auto on_deinit(NodeContext const&) -> void override {
        ++deinits;
    }
    auto on_info(NodeContext const&, InfoBuilder&) -> void override {
        ++infos;
    }
    auto on_event(NodeContext const&, EventUpdate const&) -> void override {
        ++events;
    }
    auto on_update(NodeContext const& ctx, WidgetUpdates const&) -> void override {
        ++updates;
        if (z_on_update)
            last_z_result = this->set_z_index(ctx, *std::exchange(z_on_update, std::nullopt));
        if (resort_on_update) {
            resort_on_update = false;
            ctx.invalidate_parent_sort();
        }
    }
    auto on_render(NodeContext const&, FrameBuilder&) -> void override {
        ++renders;
    }
    auto on_render_update(NodeContext const&, FrameUpdate&) -> void override {
        ++render_updates;
    }
};

// Node without identity.
class PlainNode : public Node {
public:
    auto init(NodeContext const&) -> void override {
        ++inits;
    }
    auto deinit(NodeContext const&) -> void override {
        ++deinits;
    }
    auto info(NodeContext const&, InfoBuilder&) -> void override {}
    auto event(NodeContext const&, EventUpdate const&) -> void override {}
    auto update(NodeContext const&, WidgetUpdates const&) -> void override {}
    auto render(NodeContext const&, FrameBuilder&) -> void override {}
    auto render_update(NodeContext const&, FrameUpdate&) -> void override {}

    std::atomic<int> inits{0};
    std::atomic<int> deinits{0};
};

// Observer that wants fine-grained notifications and keeps them as strings.
class RecordingObserver final : public ListObserver {
public:
    auto inserted(std::size_t index) -> void override {
        events.push_back("inserted(" + std::to_string(index) + ")");
    }
    auto removed(std::size_t index) -> void override {
        events.push_back("removed(" + std::to_string(index) + ")");
    }
    auto moved(std::size_t from, std::size_t to) -> void override {
        events.push_back("moved(" + std::to_string(from) + "," + std::to_string(to) + ")");
    }
    auto reset() -> void override {
        events.push_back("reset");
    }
    [[nodiscard]] auto is_reset_only() const -> bool override {
        return false;
    }

    std::vector<std::string> events;
};

// Scheduler, optional worker pool and a root context bound to a host widget.
struct TestEnv {
    explicit TestEnv(std::size_t workers = 0, ParallelPhases phases = ParallelPhases::all())
        : scheduler(std::make_shared<UpdateScheduler>()),
          pool(workers > 0 ? std::make_unique<WorkerPool>(workers) : nullptr),
          root(pool.get(), phases, scheduler.get()),
          ctx(root.with_widget(host)) {}

    WidgetId                         host = WidgetId::next();
    std::shared_ptr<UpdateScheduler> scheduler;
    std::unique_ptr<WorkerPool>      pool;
    NodeContext                      root;
    NodeContext                      ctx;
};

inline auto node(int key) -> std::unique_ptr<RecordingNode> {
    return std::make_unique<RecordingNode>(key);
}

inline auto vector_of(std::initializer_list<int> keys) -> std::unique_ptr<VectorList> {
    auto list = std::make_unique<VectorList>();
    for (auto key : keys) {
        list->push(node(key));
    }
    return list;
}

inline auto as_recording(Node& n) -> RecordingNode& {
    return dynamic_cast<RecordingNode&>(n);
}

// Keys in iteration order; non-recording nodes show up as -1.
inline auto keys_of(NodeList& list) -> std::vector<int> {
    std::vector<int> keys;
    list.for_each([&](std::size_t, Node& n) {
        auto* rec = dynamic_cast<RecordingNode*>(&n);
        keys.push_back(rec != nullptr ? rec->key : -1);
    });
    return keys;
}

inline auto ids_of(NodeList& list) -> std::vector<WidgetId> {
    std::vector<WidgetId> ids;
    list.for_each([&](std::size_t, Node& n) {
        if (auto* widget = n.as_widget())
            ids.push_back(widget->id());
    });
    return ids;
}

inline auto by_key() -> SortingList::SortFn {
    return [](Node& a, Node& b) { return as_recording(a).key <=> as_recording(b).key; };
}

} // namespace PT::Test
