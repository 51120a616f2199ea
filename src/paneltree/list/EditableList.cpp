#include <paneltree/context/UpdateScheduler.hpp>
#include <paneltree/list/EditableList.hpp>
#include <paneltree/list/ListObserver.hpp>
#include <paneltree/node/WidgetNode.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace PT {

namespace {

// Requests moved out of the shared state so nodes can be inited without holding its lock.
struct PendingEdits {
    std::vector<std::pair<std::size_t, NodePtr>>                 insert;
    std::vector<NodePtr>                                         push;
    std::vector<detail::EditState::RetainFn>                     retain;
    std::vector<std::pair<std::size_t, std::size_t>>             move_index;
    std::vector<std::pair<WidgetId, detail::EditState::MoveToFn>> move_id;
    bool                                                         clear = false;
};

auto takeEdits(detail::EditState& state) -> std::optional<PendingEdits> {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.has_requests())
        return std::nullopt;
    PendingEdits edits;
    edits.insert     = std::exchange(state.insert, {});
    edits.push       = std::exchange(state.push, {});
    edits.retain     = std::exchange(state.retain, {});
    edits.move_index = std::exchange(state.move_index, {});
    edits.move_id    = std::exchange(state.move_id, {});
    edits.clear      = std::exchange(state.clear, false);
    return edits;
}

auto positionOf(VectorList& vec, WidgetId id) -> std::optional<std::size_t> {
    auto& nodes = vec.nodes();
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (auto* widget = nodes[i]->as_widget(); widget != nullptr && widget->id() == id)
            return i;
    }
    return std::nullopt;
}

auto requireNode(NodePtr const& node, std::string_view operation) -> void {
    if (!node)
        throw std::invalid_argument("EditableListRef::" + std::string(operation) + " requires a node");
}

} // namespace

template <typename Fn>
auto EditableListRef::request(Fn&& fn) const -> void {
    std::optional<WidgetId>          target;
    std::shared_ptr<UpdateScheduler> scheduler;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->alive)
            return;
        fn(*state_);
        target    = state_->target;
        scheduler = state_->scheduler.lock();
    }
    // Without a known scheduler the request waits for the next update pass.
    if (scheduler)
        scheduler->update(target);
}

auto EditableListRef::dummy() -> EditableListRef {
    return EditableListRef{std::make_shared<detail::EditState>(false)};
}

auto EditableListRef::alive() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->alive;
}

auto EditableListRef::insert(std::size_t index, NodePtr node) const -> void {
    requireNode(node, "insert");
    this->request([&](detail::EditState& state) { state.insert.emplace_back(index, std::move(node)); });
}

auto EditableListRef::push(NodePtr node) const -> void {
    requireNode(node, "push");
    this->request([&](detail::EditState& state) { state.push.push_back(std::move(node)); });
}

auto EditableListRef::remove(WidgetId id) const -> void {
    this->retain([id](Node& node) {
        auto* widget = node.as_widget();
        return widget == nullptr || widget->id() != id;
    });
}

auto EditableListRef::retain(RetainFn predicate) const -> void {
    if (!predicate)
        throw std::invalid_argument("EditableListRef::retain requires a predicate");
    this->request([&](detail::EditState& state) { state.retain.push_back(std::move(predicate)); });
}

auto EditableListRef::move_index(std::size_t removeIndex, std::size_t insertIndex) const -> void {
    if (removeIndex == insertIndex)
        return;
    this->request([&](detail::EditState& state) { state.move_index.emplace_back(removeIndex, insertIndex); });
}

auto EditableListRef::move_id(WidgetId id, MoveToFn to) const -> void {
    if (!to)
        throw std::invalid_argument("EditableListRef::move_id requires a destination function");
    this->request([&](detail::EditState& state) { state.move_id.emplace_back(id, std::move(to)); });
}

auto EditableListRef::clear() const -> void {
    this->request([](detail::EditState& state) { state.clear = true; });
}

EditableList::EditableList()
    : state_(std::make_shared<detail::EditState>(true)) {}

EditableList::EditableList(std::vector<NodePtr> nodes)
    : vec_(std::move(nodes)), state_(std::make_shared<detail::EditState>(true)) {}

EditableList::~EditableList() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->alive = false;
}

auto EditableList::init_all(NodeContext const& ctx) -> void {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->target = ctx.widget_id();
        if (auto* scheduler = ctx.updates(); scheduler != nullptr)
            state_->scheduler = scheduler->weak_from_this();
        else
            state_->scheduler.reset();
    }
    vec_.init_all(ctx);
}

auto EditableList::deinit_all(NodeContext const& ctx) -> void {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->target.reset();
    }
    vec_.deinit_all(ctx);
}

auto EditableList::update_all(NodeContext const& ctx, WidgetUpdates const& updates, ListObserver& observer) -> void {
    vec_.update_all(ctx, updates, observer);
    this->fulfill_requests(ctx, observer);
}

auto EditableList::fulfill_requests(NodeContext const& ctx, ListObserver& observer) -> void {
    auto edits = takeEdits(*state_);
    if (!edits)
        return;

    auto& nodes = vec_.nodes();

    // After a clear the observer only sees one reset, so the remaining steps report to nobody.
    NullObserver silent;
    auto&        report = edits->clear ? static_cast<ListObserver&>(silent) : observer;
    bool         changed = false;

    if (edits->clear) {
        pt_log("EditableList clear len=" + std::to_string(nodes.size()), "EditableList");
        for (auto& node : nodes) {
            node->deinit(ctx);
        }
        vec_.clear();
        observer.reset();
        changed = true;
    } else {
        for (auto& predicate : edits->retain) {
            // Every predicate call happens before the first removal, so a throwing
            // predicate leaves the list untouched.
            std::vector<bool> keep;
            keep.reserve(nodes.size());
            for (auto const& node : nodes) {
                keep.push_back(predicate(*node));
            }

            std::size_t at = 0;
            for (auto const kept : keep) {
                if (kept) {
                    ++at;
                    continue;
                }
                nodes[at]->deinit(ctx);
                vec_.remove(at);
                report.removed(at);
                changed = true;
            }
        }
    }

    for (auto& [index, node] : edits->insert) {
        node->init(ctx);
        auto const at = std::min(index, nodes.size());
        vec_.insert(at, std::move(node));
        report.inserted(at);
        changed = true;
    }

    for (auto& node : edits->push) {
        node->init(ctx);
        report.inserted(nodes.size());
        vec_.push(std::move(node));
        changed = true;
    }

    for (auto const& [from, to] : edits->move_index) {
        if (from >= nodes.size())
            continue;
        vec_.move_node(from, to);
        report.moved(from, std::min(to, nodes.size() - 1));
        changed = true;
    }

    for (auto const& [id, to] : edits->move_id) {
        auto const from = positionOf(vec_, id);
        if (!from)
            continue;
        auto const dest = to(*from, nodes.size());
        if (dest == *from)
            continue;
        vec_.move_node(*from, dest);
        report.moved(*from, std::min(dest, nodes.size() - 1));
        changed = true;
    }

    if (changed) {
        pt_log("EditableList applied edits len=" + std::to_string(nodes.size()), "EditableList");
        ctx.request_info();
    }
}

} // namespace PT
