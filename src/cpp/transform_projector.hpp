#pragma once

#include <optional>
#include <vector>
#include "engine_config.hpp"
#include "geometry.hpp"
#include "node_tree.hpp"
#include "visual_state.hpp"

// Per-node transform for the renderer. The translation is relative to the
// parent node's anchor (absolute for the root); scale only affects the
// node's own visuals, not its descendants.
struct Transform {
    double translate_x = 0.0;
    double translate_y = 0.0;
    double scale = 1.0;

    Vec2 translation() const { return {translate_x, translate_y}; }
};

// Engine state the projection depends on
struct ProjectionInput {
    double mouse_angle = 0.0;
    double mouse_distance = 0.0;
    Vec2 relative_mouse;
    std::optional<NodeId> hovered;
    std::optional<NodeId> dragged;
    bool drag_confirmed = false;   // Press moved further than the drag threshold
};

// Scale boost of a child ring item, largest for the item the cursor points at
double child_scale(double node_angle, double mouse_angle, bool hovered);

// Computes the transform of every node. Hidden nodes keep the identity.
std::vector<Transform> project_transforms(const NodeTree& tree,
                                          const std::vector<NodeVisual>& visuals,
                                          const ProjectionInput& input,
                                          const EngineConfig& config);

// Screen position of every visible node, summing translations from the root.
// Hidden nodes report the position of their nearest visible ancestor.
std::vector<Vec2> absolute_positions(const NodeTree& tree,
                                     const std::vector<Transform>& transforms);
