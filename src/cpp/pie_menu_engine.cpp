#include "pie_menu_engine.hpp"
#include "debug.hpp"

std::optional<NodeId> compute_hovered_node(double mouse_distance,
                                           double mouse_angle,
                                           const NodeTree& tree,
                                           const std::vector<NodeId>& selection_chain,
                                           double center_radius) {
    if (selection_chain.empty()) {
        return std::nullopt;
    }

    std::optional<NodeId> parent;
    if (selection_chain.size() > 1) {
        parent = selection_chain[selection_chain.size() - 2];
    }

    // The center of the menu always leads back to the parent
    if (mouse_distance < center_radius) {
        return parent;
    }

    for (NodeId child : tree.node(selection_chain.back()).children) {
        if (geometry::wedge_contains(tree.node(child).wedge(), mouse_angle)) {
            return child;
        }
    }

    // Not in any child wedge, so the pointer is in the gap towards the parent
    return parent;
}

PieMenuEngine::PieMenuEngine(ViewAdapter& view, const EngineConfig& config)
    : view_(view)
    , config_(config)
{
}

void PieMenuEngine::show(const MenuItem& root_item, const Vec2& anchor, const MenuLibrary& library) {
    // Build first so a malformed description leaves the current menu intact
    NodeTree tree = NodeTree::build(root_item, library, config_);

    hide();

    tree_ = std::move(tree);
    mouse_ = MouseState();
    mouse_.absolute = anchor;
    visuals_ = classify_nodes(tree_, selection_chain_);

    DEBUG_LOGLN << "Showing menu at " << anchor.x << ", " << anchor.y;

    view_.build_nodes(tree_);

    select_node(NodeTree::ROOT);
    redraw();
}

void PieMenuEngine::hide() {
    if (!is_shown()) {
        return;
    }

    DEBUG_LOGLN << "Hiding menu";

    view_.teardown();

    tree_ = NodeTree();
    selection_chain_.clear();
    hovered_node_.reset();
    dragged_node_.reset();
    press_origin_.reset();
    mouse_ = MouseState();
    visuals_.clear();
    transforms_.clear();
}

void PieMenuEngine::on_pointer_move(double x, double y) {
    if (!is_shown()) {
        return;
    }

    update_mouse(x, y);
    redraw();
}

void PieMenuEngine::on_pointer_down(double x, double y) {
    if (!is_shown()) {
        return;
    }

    update_mouse(x, y);
    press_origin_ = Vec2(x, y);

    if (hovered_node_) {
        drag_node(hovered_node_);
    }

    redraw();
}

void PieMenuEngine::on_pointer_up() {
    if (!is_shown()) {
        return;
    }

    press_origin_.reset();

    if (dragged_node_) {
        NodeId target = *dragged_node_;
        select_node(target);
        drag_node(std::nullopt);
    }

    // Selecting a leaf may have hidden the menu from the view's callback
    if (is_shown()) {
        redraw();
    }
}

void PieMenuEngine::select_node(NodeId id) {
    if (!selection_chain_.empty() && selection_chain_.back() == id) {
        return;
    }

    const bool selected_parent = selection_chain_.size() > 1 &&
                                 selection_chain_[selection_chain_.size() - 2] == id;

    // Move the root so that the newly active node lands under the pointer
    MenuNode& root = tree_.root();
    if (id == NodeTree::ROOT) {
        root.position = mouse_.absolute;
    } else if (selected_parent) {
        const MenuNode& active = tree_.node(selection_chain_.back());
        root.position += mouse_.relative + active.position;
    } else {
        MenuNode& node = tree_.node(id);
        node.position = geometry::get_direction(node.angle.value_or(0.0) - 90.0, mouse_.distance);
        root.position += mouse_.relative - node.position;
    }

    if (selected_parent) {
        selection_chain_.pop_back();
    } else {
        selection_chain_.push_back(id);
    }

    mouse_.relative = Vec2();
    mouse_.distance = 0.0;

    visuals_ = classify_nodes(tree_, selection_chain_);
    if (hovered_node_) {
        visuals_[*hovered_node_].hovered = true;
    }
    if (dragged_node_) {
        visuals_[*dragged_node_].dragged = true;
    }

    DEBUG_LOGLN << "Selected '" << tree_.node(id).name << "' (depth "
                << selection_chain_.size() - 1 << ")";

    view_.node_selected(id);
}

void PieMenuEngine::hover_node(std::optional<NodeId> id) {
    if (hovered_node_ == id) {
        return;
    }

    if (hovered_node_) {
        visuals_[*hovered_node_].hovered = false;
        hovered_node_.reset();
    }

    if (id) {
        hovered_node_ = id;
        visuals_[*id].hovered = true;
    }
}

void PieMenuEngine::drag_node(std::optional<NodeId> id) {
    if (dragged_node_ == id) {
        return;
    }

    if (dragged_node_) {
        visuals_[*dragged_node_].dragged = false;
        dragged_node_.reset();
    }

    if (id) {
        dragged_node_ = id;
        visuals_[*id].dragged = true;
        DEBUG_LOGLN << "Dragging '" << tree_.node(*id).name << "'";
    }
}

void PieMenuEngine::redraw() {
    if (!is_shown()) {
        return;
    }

    hover_node(compute_hovered_node(mouse_.distance, mouse_.angle, tree_,
                                    selection_chain_, config_.center_radius));

    // An active drag follows the hover target
    if (dragged_node_ && dragged_node_ != hovered_node_) {
        drag_node(hovered_node_);
    }

    // Dragging back into the center aborts the gesture
    if (dragged_node_ && mouse_.distance < config_.center_radius) {
        DEBUG_LOGLN << "Drag cancelled in center";
        drag_node(std::nullopt);
    }

    if (press_origin_ && !dragged_node_ &&
        mouse_.distance > config_.center_radius && hovered_node_) {
        drag_node(hovered_node_);
    }

    emit_frame();
}

Vec2 PieMenuEngine::active_anchor() const {
    if (!is_shown()) {
        return Vec2();
    }

    Vec2 anchor = tree_.root().position;
    for (std::size_t i = 1; i < selection_chain_.size(); ++i) {
        anchor += tree_.node(selection_chain_[i]).position;
    }
    return anchor;
}

bool PieMenuEngine::drag_confirmed() const {
    return press_origin_.has_value() && dragged_node_.has_value() &&
           geometry::get_distance(mouse_.absolute, *press_origin_) > config_.drag_threshold;
}

void PieMenuEngine::update_mouse(double x, double y) {
    mouse_.absolute = Vec2(x, y);
    mouse_.relative = mouse_.absolute - active_anchor();
    mouse_.distance = geometry::get_length(mouse_.relative);
    mouse_.angle = geometry::get_angle(mouse_.relative);
}

void PieMenuEngine::emit_frame() {
    ProjectionInput input;
    input.mouse_angle = mouse_.angle;
    input.mouse_distance = mouse_.distance;
    input.relative_mouse = mouse_.relative;
    input.hovered = hovered_node_;
    input.dragged = dragged_node_;
    input.drag_confirmed = drag_confirmed();

    transforms_ = project_transforms(tree_, visuals_, input, config_);

    for (NodeId id = 0; id < tree_.size(); ++id) {
        view_.update_node(id, visuals_[id], transforms_[id]);
    }

    view_.frame_finished();
}
