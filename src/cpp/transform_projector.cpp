#include "transform_projector.hpp"
#include <cmath>

static constexpr double PROXIMITY_SCALE = 0.15;
static constexpr double PROXIMITY_FALLOFF = 4.0;
static constexpr double HOVER_SCALE_BONUS = 0.05;

static void project_node(const NodeTree& tree,
                  const std::vector<NodeVisual>& visuals,
                  const ProjectionInput& input,
                  const EngineConfig& config,
                  NodeId id,
                  std::vector<Transform>& out) {
    const MenuNode& node = tree.node(id);
    Transform& transform = out[id];

    switch (visuals[id].state) {
        case NodeState::GRANDCHILD: {
            Vec2 dir = geometry::get_direction(node.angle.value_or(0.0) - 90.0,
                                               config.grandchild_distance);
            transform.translate_x = dir.x;
            transform.translate_y = dir.y;
            // Grandchildren are leaves of the visible rings
            return;
        }

        case NodeState::CHILD: {
            double angle = node.angle.value_or(0.0);

            if (input.mouse_distance > config.center_radius) {
                transform.scale = child_scale(angle, input.mouse_angle, input.hovered == id);
            }

            if (input.dragged == id && input.drag_confirmed) {
                transform.translate_x = input.relative_mouse.x;
                transform.translate_y = input.relative_mouse.y;
                transform.scale = 1.0;
            } else {
                Vec2 dir = geometry::get_direction(angle - 90.0, config.child_distance);
                transform.translate_x = dir.x;
                transform.translate_y = dir.y;
            }
            break;
        }

        case NodeState::ACTIVE:
        case NodeState::PARENT:
            transform.translate_x = node.position.x;
            transform.translate_y = node.position.y;
            break;

        case NodeState::HIDDEN:
            return;
    }

    for (NodeId child : node.children) {
        project_node(tree, visuals, input, config, child, out);
    }
}

double child_scale(double node_angle, double mouse_angle, bool hovered) {
    double diff = geometry::angle_difference(node_angle, mouse_angle);
    double scale = 1.0 + PROXIMITY_SCALE * std::pow(1.0 - diff / 180.0, PROXIMITY_FALLOFF);

    if (hovered) {
        scale += HOVER_SCALE_BONUS;
    }

    return scale;
}

std::vector<Transform> project_transforms(const NodeTree& tree,
                                          const std::vector<NodeVisual>& visuals,
                                          const ProjectionInput& input,
                                          const EngineConfig& config) {
    std::vector<Transform> transforms(tree.size());

    if (!tree.empty()) {
        project_node(tree, visuals, input, config, NodeTree::ROOT, transforms);
    }

    return transforms;
}

std::vector<Vec2> absolute_positions(const NodeTree& tree,
                                     const std::vector<Transform>& transforms) {
    std::vector<Vec2> positions(tree.size());

    // Parents are always stored before their children
    for (NodeId id = 0; id < tree.size(); ++id) {
        Vec2 base;
        if (auto parent = tree.parent_of(id)) {
            base = positions[*parent];
        }
        positions[id] = base + transforms[id].translation();
    }

    return positions;
}
