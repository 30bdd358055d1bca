#pragma once

#include <optional>
#include <vector>
#include "engine_config.hpp"
#include "geometry.hpp"
#include "menu_item.hpp"
#include "node_tree.hpp"
#include "transform_projector.hpp"
#include "view_adapter.hpp"
#include "visual_state.hpp"

// Pointer state relative to the active node
struct MouseState {
    Vec2 absolute;
    Vec2 relative;
    double distance = 0.0;
    double angle = 0.0;   // Degrees, 0 = up
};

// Resolves the node under the pointer: a child of the active node, or its
// parent when the pointer is in the center dead zone or the parent wedge.
// Returns nothing when the root is active and no child matches.
std::optional<NodeId> compute_hovered_node(double mouse_distance,
                                           double mouse_angle,
                                           const NodeTree& tree,
                                           const std::vector<NodeId>& selection_chain,
                                           double center_radius);

// Selection state machine of a radial menu. Owns the node tree while the
// menu is shown and drives the view through the injected adapter.
class PieMenuEngine {
public:
    PieMenuEngine(ViewAdapter& view, const EngineConfig& config);

    PieMenuEngine(const PieMenuEngine&) = delete;
    PieMenuEngine& operator=(const PieMenuEngine&) = delete;

    // Builds the tree for root_item and shows it centered at anchor.
    // Throws ConfigurationError if the description is malformed; the engine
    // state is left untouched in that case.
    void show(const MenuItem& root_item, const Vec2& anchor, const MenuLibrary& library = {});
    void hide();
    bool is_shown() const { return !selection_chain_.empty(); }

    // Pointer input from the view
    void on_pointer_move(double x, double y);
    void on_pointer_down(double x, double y);
    void on_pointer_up();

    // Makes id the active node, moving the menu so id ends up under the pointer
    void select_node(NodeId id);
    void hover_node(std::optional<NodeId> id);
    void drag_node(std::optional<NodeId> id);

    // Recomputes hover/drag state and pushes transforms to the view
    void redraw();

    const EngineConfig& config() const { return config_; }
    const NodeTree& tree() const { return tree_; }
    const std::vector<NodeId>& selection_chain() const { return selection_chain_; }
    NodeId active_node() const { return selection_chain_.back(); }
    std::optional<NodeId> hovered_node() const { return hovered_node_; }
    std::optional<NodeId> dragged_node() const { return dragged_node_; }
    const std::optional<Vec2>& press_origin() const { return press_origin_; }
    const MouseState& mouse() const { return mouse_; }
    const std::vector<NodeVisual>& visuals() const { return visuals_; }
    const std::vector<Transform>& transforms() const { return transforms_; }

    // Screen position of the active node
    Vec2 active_anchor() const;

    // True while a press has moved further than the drag threshold
    bool drag_confirmed() const;

private:
    ViewAdapter& view_;
    EngineConfig config_;

    NodeTree tree_;
    std::vector<NodeId> selection_chain_;
    std::optional<NodeId> hovered_node_;
    std::optional<NodeId> dragged_node_;

    std::optional<Vec2> press_origin_;
    MouseState mouse_;

    std::vector<NodeVisual> visuals_;
    std::vector<Transform> transforms_;

    void update_mouse(double x, double y);
    void emit_frame();
};
