#pragma once

#include <paneltree/context/NodeContext.hpp>
#include <paneltree/update/Updates.hpp>

#include <memory>

namespace PT {

class InfoBuilder;
class FrameBuilder;
class FrameUpdate;
class WidgetNode;

/**
 * A child element driven by its owning list.
 *
 * Every lifecycle call receives the context of the caller (the parent widget);
 * widgets derive their own context before running their hooks. Nodes are owned by
 * exactly one list slot at a time and move on insert and remove.
 */
class Node {
public:
    Node()          = default;
    virtual ~Node() = default;

    Node(Node const&)                    = delete;
    auto operator=(Node const&) -> Node& = delete;

    virtual auto init(NodeContext const& ctx) -> void                                = 0;
    virtual auto deinit(NodeContext const& ctx) -> void                              = 0;
    virtual auto info(NodeContext const& ctx, InfoBuilder& info) -> void             = 0;
    virtual auto event(NodeContext const& ctx, EventUpdate const& update) -> void    = 0;
    virtual auto update(NodeContext const& ctx, WidgetUpdates const& updates) -> void = 0;
    virtual auto render(NodeContext const& ctx, FrameBuilder& frame) -> void         = 0;
    virtual auto render_update(NodeContext const& ctx, FrameUpdate& update) -> void  = 0;

    // Widget view of this node, nullptr for plain nodes.
    virtual auto as_widget() -> WidgetNode* {
        return nullptr;
    }
};

using NodePtr = std::unique_ptr<Node>;

} // namespace PT
