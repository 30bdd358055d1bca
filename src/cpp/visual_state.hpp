#pragma once

#include <string>
#include <vector>
#include "node_tree.hpp"

// Role of a node relative to the current selection chain
enum class NodeState {
    PARENT,      // On the chain, but not its last element
    ACTIVE,      // Last element of the chain
    CHILD,       // Direct child of the active node
    GRANDCHILD,  // Child of a child, or an unselected child of a parent
    HIDDEN       // Not part of the visible rings
};

struct NodeVisual {
    NodeState state = NodeState::HIDDEN;
    bool hovered = false;
    bool dragged = false;

    bool is_visible() const { return state != NodeState::HIDDEN; }
};

// Derives the state of every node from the selection chain. Hover and drag
// flags are left cleared.
std::vector<NodeVisual> classify_nodes(const NodeTree& tree, const std::vector<NodeId>& chain);

// CSS-like class name of a state, e.g. "grandchild"
const char* to_string(NodeState state);
