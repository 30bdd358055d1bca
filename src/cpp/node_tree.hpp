#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "engine_config.hpp"
#include "geometry.hpp"
#include "menu_item.hpp"

using NodeId = std::size_t;

// One entry of the node arena. Structure is fixed once the tree is built;
// only position changes afterwards.
struct MenuNode {
    std::string name;
    std::string icon;
    std::string description;
    std::string command;

    std::optional<NodeId> parent;
    std::vector<NodeId> children;
    int depth = 0;

    // Direction from the parent's center, degrees, 0 = up. Unset for the root.
    std::optional<double> angle;

    // Hit-test wedge as seen from the parent
    double start_angle = 0.0;
    double end_angle = 0.0;

    // Absolute for the root, relative to the parent otherwise
    Vec2 position;

    bool is_leaf() const { return children.empty(); }
    Wedge wedge() const { return {start_angle, end_angle}; }
};

// Arena of menu nodes addressed by stable index. The root is always node 0.
class NodeTree {
public:
    static constexpr NodeId ROOT = 0;

    NodeTree() = default;

    // Builds the arena from an item description, resolving `menu:` references
    // against the library, and assigns angles to every node.
    // Throws ConfigurationError on reference cycles, unknown menu names, or
    // when the depth or node limits in config are exceeded.
    static NodeTree build(const MenuItem& root_item,
                          const MenuLibrary& library,
                          const EngineConfig& config);

    // Computes angle and wedge bounds for the children of id, recursively
    void assign_angles(NodeId id);

    bool empty() const { return nodes_.empty(); }
    std::size_t size() const { return nodes_.size(); }

    const MenuNode& node(NodeId id) const { return nodes_.at(id); }
    MenuNode& node(NodeId id) { return nodes_.at(id); }

    const MenuNode& root() const { return nodes_.at(ROOT); }
    MenuNode& root() { return nodes_.at(ROOT); }

    std::optional<NodeId> parent_of(NodeId id) const { return nodes_.at(id).parent; }

private:
    std::vector<MenuNode> nodes_;

    NodeId add_node(const MenuItem& item, std::optional<NodeId> parent, int depth);

    void add_children(NodeId parent_id,
                      const MenuItem& item,
                      const MenuLibrary& library,
                      const EngineConfig& config,
                      std::vector<std::string>& menu_path);
};
