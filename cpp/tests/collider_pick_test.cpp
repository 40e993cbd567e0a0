#include <gtest/gtest.h>
#include "editor/interaction/collider_pick.h"
#include "tests/controller_test_common.h"

using namespace editor;
using editor_test::makeCollider;
using editor_test::square;

TEST(ColliderPickTest, BodyPrefersTopmost) {
    const std::vector<Collider> colliders = {
        makeCollider("bottom", square(0, 0, 10)),
        makeCollider("top", square(5, 5, 10)),
    };
    const auto overlap = pickColliderBody(colliders, 7, 7);
    ASSERT_TRUE(overlap.has_value());
    EXPECT_EQ(*overlap, 1u);

    const auto onlyBottom = pickColliderBody(colliders, 2, 2);
    ASSERT_TRUE(onlyBottom.has_value());
    EXPECT_EQ(*onlyBottom, 0u);

    EXPECT_FALSE(pickColliderBody(colliders, 50, 50).has_value());
}

TEST(ColliderPickTest, IncompleteCollidersAreNeverHit) {
    const std::vector<Collider> colliders = {
        makeCollider("line", {{0, 0}, {10, 0}}),
    };
    EXPECT_FALSE(pickColliderBody(colliders, 5, 0).has_value());
    EXPECT_FALSE(pickColliders(colliders, 0, 0, 2).has_value());
    EXPECT_FALSE(pickColliders(colliders, 5, 0, 2).has_value());
}

TEST(ColliderPickTest, VertexBeatsEdgeBeatsBody) {
    const std::vector<Collider> colliders = {makeCollider("a", square(0, 0, 20))};

    const auto vertex = pickColliders(colliders, 1, 1, 2);
    ASSERT_TRUE(vertex.has_value());
    EXPECT_EQ(vertex->subTarget, PickSubTarget::Vertex);
    EXPECT_EQ(vertex->subIndex, 0u);

    const auto edge = pickColliders(colliders, 10, 1, 2);
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->subTarget, PickSubTarget::Edge);
    EXPECT_EQ(edge->subIndex, 0u);
    EXPECT_FLOAT_EQ(edge->hit.x, 10.0f);
    EXPECT_FLOAT_EQ(edge->hit.y, 0.0f);

    const auto body = pickColliders(colliders, 10, 10, 2);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->subTarget, PickSubTarget::Body);
    EXPECT_EQ(body->colliderIndex, 0u);
}

TEST(ColliderPickTest, VertexOfLowerColliderBeatsBodyOfUpper) {
    const std::vector<Collider> colliders = {
        makeCollider("lower", square(0, 0, 10)),
        makeCollider("upper", square(-20, -20, 60)),
    };
    const auto hit = pickColliders(colliders, 10, 10, 1);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->subTarget, PickSubTarget::Vertex);
    EXPECT_EQ(hit->colliderIndex, 0u);
    EXPECT_EQ(hit->subIndex, 2u);
}
