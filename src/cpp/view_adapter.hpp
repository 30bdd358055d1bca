#pragma once

#include "node_tree.hpp"
#include "transform_projector.hpp"
#include "visual_state.hpp"

// Rendering side of the menu. The engine pushes state through this
// interface and never touches the renderer otherwise.
class ViewAdapter {
public:
    virtual ~ViewAdapter() = default;

    // A new tree was built; create one visual element per node
    virtual void build_nodes(const NodeTree& tree) = 0;

    // Called for every node on each redraw
    virtual void update_node(NodeId id, const NodeVisual& visual, const Transform& transform) = 0;

    // All nodes of one redraw have been updated
    virtual void frame_finished() {}

    // The node became the active one
    virtual void node_selected(NodeId id) {}

    // The menu was hidden; drop all visual elements
    virtual void teardown() = 0;
};
