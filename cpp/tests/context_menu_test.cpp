#include "tests/controller_test_common.h"

using namespace editor_test;

namespace {
class ContextMenuTest : public InteractionControllerTest {
protected:
    void SetUp() override {
        InteractionControllerTest::SetUp();
        load({makeCollider("box", square(0, 0, 40)), makeCollider("tri", triangle(100, 100, 40))});
    }

    ContextAction resolveAt(float wx, float wy) const {
        const Point2 s = toScreen(wx, wy);
        return controller.resolveContextMenu(s.x, s.y);
    }
};
} // namespace

TEST_F(ContextMenuTest, VertexResolvesToDeletePoint) {
    const ContextAction action = resolveAt(1, 1);
    EXPECT_EQ(action.kind, ContextActionKind::DeletePoint);
    EXPECT_EQ(action.colliderId, "box");
    EXPECT_EQ(action.pointIndex, 0u);

    EXPECT_EQ(controller.applyContextAction(action), EditorError::Ok);
    EXPECT_EQ(collider("box")->points.size(), 3u);
    EXPECT_EQ(commitCount, 1);
}

TEST_F(ContextMenuTest, DeletePointOnTriangleIsRefused) {
    const ContextAction action = resolveAt(100, 100);
    ASSERT_EQ(action.kind, ContextActionKind::DeletePoint);
    EXPECT_EQ(action.colliderId, "tri");

    EXPECT_EQ(controller.applyContextAction(action), EditorError::MinimumPointCount);
    EXPECT_EQ(collider("tri")->points.size(), 3u);
    EXPECT_FALSE(controller.canUndo());
}

TEST_F(ContextMenuTest, EdgeResolvesToInsertPoint) {
    const ContextAction action = resolveAt(20, 1);
    EXPECT_EQ(action.kind, ContextActionKind::InsertPoint);
    EXPECT_EQ(action.colliderId, "box");
    EXPECT_EQ(action.edgeIndex, 0u);
    EXPECT_FLOAT_EQ(action.position.x, 20.0f);
    EXPECT_FLOAT_EQ(action.position.y, 0.0f);

    EXPECT_EQ(controller.applyContextAction(action), EditorError::Ok);
    const auto& pts = collider("box")->points;
    ASSERT_EQ(pts.size(), 5u);
    EXPECT_EQ(pts[1], (Point2{20, 0}));
    EXPECT_EQ(controller.selectedColliderId(), "box");
    EXPECT_EQ(*controller.selectedPointIndex(), 1u);
}

TEST_F(ContextMenuTest, BodyResolvesToDeleteCollider) {
    controller.selectCollider("box");
    const ContextAction action = resolveAt(20, 20);
    EXPECT_EQ(action.kind, ContextActionKind::DeleteCollider);
    EXPECT_EQ(action.colliderId, "box");

    EXPECT_EQ(controller.applyContextAction(action), EditorError::Ok);
    EXPECT_EQ(collider("box"), nullptr);
    EXPECT_TRUE(controller.selectedColliderId().empty());

    controller.undo();
    EXPECT_NE(collider("box"), nullptr);
}

TEST_F(ContextMenuTest, EmptySpaceResolvesToCreateCollider) {
    const ContextAction action = resolveAt(300, 10);
    EXPECT_EQ(action.kind, ContextActionKind::CreateCollider);
    EXPECT_TRUE(action.colliderId.empty());

    EXPECT_EQ(controller.applyContextAction(action), EditorError::Ok);
    EXPECT_EQ(controller.mode(), InteractionMode::Drawing);
    EXPECT_FALSE(controller.canUndo());
}

TEST_F(ContextMenuTest, VertexBeatsBodyOfOverlappingCollider) {
    load({makeCollider("big", square(-50, -50, 200)), makeCollider("small", square(0, 0, 40))});
    const ContextAction action = resolveAt(40, 40);
    EXPECT_EQ(action.kind, ContextActionKind::DeletePoint);
    EXPECT_EQ(action.colliderId, "small");
    EXPECT_EQ(action.pointIndex, 2u);
}

TEST_F(ContextMenuTest, ThresholdScalesWithZoom) {
    controller.setView(ViewTransform{0.0f, 0.0f, 4.0f});
    // 3 world units off the edge: beyond 8px / 4.
    const ContextAction action = resolveAt(20, -3);
    EXPECT_EQ(action.kind, ContextActionKind::CreateCollider);

    const ContextAction near = resolveAt(20, -1.5f);
    EXPECT_EQ(near.kind, ContextActionKind::InsertPoint);
}

TEST_F(ContextMenuTest, NothingResolvesWhileDrawing) {
    controller.startDrawing();
    const ContextAction action = resolveAt(1, 1);
    EXPECT_EQ(action.kind, ContextActionKind::None);

    ContextAction stale;
    stale.kind = ContextActionKind::DeleteCollider;
    stale.colliderId = "box";
    EXPECT_EQ(controller.applyContextAction(stale), EditorError::InvalidState);
    EXPECT_NE(collider("box"), nullptr);
}

TEST_F(ContextMenuTest, RightButtonDoesNotChangeSelection) {
    controller.selectCollider("box");
    down(300, 300, 0, PointerButton::Right);
    EXPECT_EQ(controller.mode(), InteractionMode::Idle);
    EXPECT_EQ(controller.selectedColliderId(), "box");
}
