#include "visual_state.hpp"

std::vector<NodeVisual> classify_nodes(const NodeTree& tree, const std::vector<NodeId>& chain) {
    std::vector<NodeVisual> visuals(tree.size());

    // Walk the chain from the root; a chain node overwrites the GRANDCHILD
    // state its parent gave it on the previous iteration
    for (std::size_t i = 0; i < chain.size(); ++i) {
        const MenuNode& node = tree.node(chain[i]);

        if (i == chain.size() - 1) {
            visuals[chain[i]].state = NodeState::ACTIVE;

            for (NodeId child : node.children) {
                visuals[child].state = NodeState::CHILD;

                for (NodeId grandchild : tree.node(child).children) {
                    visuals[grandchild].state = NodeState::GRANDCHILD;
                }
            }
        } else {
            visuals[chain[i]].state = NodeState::PARENT;

            for (NodeId child : node.children) {
                visuals[child].state = NodeState::GRANDCHILD;
            }
        }
    }

    return visuals;
}

const char* to_string(NodeState state) {
    switch (state) {
        case NodeState::PARENT:     return "parent";
        case NodeState::ACTIVE:     return "active";
        case NodeState::CHILD:      return "child";
        case NodeState::GRANDCHILD: return "grandchild";
        case NodeState::HIDDEN:     return "hidden";
    }
    return "hidden";
}
