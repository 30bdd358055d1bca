#include <gtest/gtest.h>
#include "recording_view.hpp"
#include "transform_projector.hpp"

class TransformProjectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree = NodeTree::build(make_menu({8, 5}), {}, config);
        tree.root().position = Vec2(500, 500);
        visuals = classify_nodes(tree, {NodeTree::ROOT});
    }

    NodeId root_child(size_t index) const {
        return tree.root().children.at(index);
    }

    EngineConfig config;
    NodeTree tree;
    std::vector<NodeVisual> visuals;
};

TEST_F(TransformProjectorTest, ChildScaleFalloff) {
    EXPECT_NEAR(child_scale(90, 90, false), 1.15, 1e-12);
    EXPECT_NEAR(child_scale(90, 90, true), 1.2, 1e-12);
    EXPECT_DOUBLE_EQ(child_scale(0, 180, false), 1.0);
    // Proximity is measured across the seam
    EXPECT_DOUBLE_EQ(child_scale(350, 10, false), child_scale(0, 20, false));
}

TEST_F(TransformProjectorTest, RootUsesAbsolutePosition) {
    auto transforms = project_transforms(tree, visuals, ProjectionInput(), config);

    EXPECT_DOUBLE_EQ(transforms[NodeTree::ROOT].translate_x, 500.0);
    EXPECT_DOUBLE_EQ(transforms[NodeTree::ROOT].translate_y, 500.0);
    EXPECT_DOUBLE_EQ(transforms[NodeTree::ROOT].scale, 1.0);
}

TEST_F(TransformProjectorTest, ChildrenSitOnCircle) {
    auto transforms = project_transforms(tree, visuals, ProjectionInput(), config);

    // Child 0 points up, child 2 points right
    EXPECT_NEAR(transforms[root_child(0)].translate_x, 0.0, 1e-9);
    EXPECT_NEAR(transforms[root_child(0)].translate_y, -100.0, 1e-9);
    EXPECT_NEAR(transforms[root_child(2)].translate_x, 100.0, 1e-9);
    EXPECT_NEAR(transforms[root_child(2)].translate_y, 0.0, 1e-9);

    // Mouse inside the center: no scaling
    for (NodeId id : tree.root().children) {
        EXPECT_DOUBLE_EQ(transforms[id].scale, 1.0);
    }
}

TEST_F(TransformProjectorTest, GrandchildrenUseSmallRadius) {
    auto transforms = project_transforms(tree, visuals, ProjectionInput(), config);

    for (NodeId id : tree.node(root_child(3)).children) {
        const MenuNode& node = tree.node(id);
        Vec2 expected = geometry::get_direction(*node.angle - 90.0, config.grandchild_distance);
        EXPECT_NEAR(transforms[id].translate_x, expected.x, 1e-9);
        EXPECT_NEAR(transforms[id].translate_y, expected.y, 1e-9);
        EXPECT_DOUBLE_EQ(transforms[id].scale, 1.0);
    }
}

TEST_F(TransformProjectorTest, ClosestChildIsLargest) {
    ProjectionInput input;
    input.mouse_distance = 120;
    input.mouse_angle = 95;
    input.hovered = root_child(2);

    auto transforms = project_transforms(tree, visuals, input, config);

    NodeId closest = root_child(2);
    for (NodeId id : tree.root().children) {
        if (id != closest) {
            EXPECT_GT(transforms[closest].scale, transforms[id].scale);
        }
    }
    EXPECT_DOUBLE_EQ(transforms[closest].scale, child_scale(90, 95, true));
}

TEST_F(TransformProjectorTest, ConfirmedDragFollowsPointer) {
    ProjectionInput input;
    input.mouse_distance = 130;
    input.mouse_angle = 90;
    input.relative_mouse = Vec2(130, 5);
    input.dragged = root_child(2);

    auto unconfirmed = project_transforms(tree, visuals, input, config);
    EXPECT_NEAR(unconfirmed[root_child(2)].translate_x, 100.0, 1e-9);

    input.drag_confirmed = true;
    auto confirmed = project_transforms(tree, visuals, input, config);
    EXPECT_DOUBLE_EQ(confirmed[root_child(2)].translate_x, 130.0);
    EXPECT_DOUBLE_EQ(confirmed[root_child(2)].translate_y, 5.0);
    EXPECT_DOUBLE_EQ(confirmed[root_child(2)].scale, 1.0);
}

TEST_F(TransformProjectorTest, AbsolutePositionsSumTranslations) {
    auto transforms = project_transforms(tree, visuals, ProjectionInput(), config);
    auto positions = absolute_positions(tree, transforms);

    EXPECT_DOUBLE_EQ(positions[NodeTree::ROOT].x, 500.0);
    EXPECT_NEAR(positions[root_child(2)].x, 600.0, 1e-9);
    EXPECT_NEAR(positions[root_child(2)].y, 500.0, 1e-9);

    NodeId grandchild = tree.node(root_child(2)).children[0];
    EXPECT_NEAR(positions[grandchild].x, 600.0 + transforms[grandchild].translate_x, 1e-9);
    EXPECT_NEAR(positions[grandchild].y, 500.0 + transforms[grandchild].translate_y, 1e-9);
}

TEST_F(TransformProjectorTest, DrilledNodesUseStoredPosition) {
    NodeId active = root_child(2);
    tree.node(active).position = Vec2(120, 0);
    visuals = classify_nodes(tree, {NodeTree::ROOT, active});

    auto transforms = project_transforms(tree, visuals, ProjectionInput(), config);
    auto positions = absolute_positions(tree, transforms);

    EXPECT_DOUBLE_EQ(positions[active].x, 620.0);
    EXPECT_DOUBLE_EQ(positions[active].y, 500.0);

    // Siblings of the active node shrink to grandchild dots around the root
    NodeId sibling = root_child(0);
    EXPECT_NEAR(transforms[sibling].translate_y, -config.grandchild_distance, 1e-9);
}
