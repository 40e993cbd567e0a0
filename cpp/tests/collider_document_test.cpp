#include <gtest/gtest.h>
#include "editor/document/collider_document.h"
#include "tests/controller_test_common.h"

using namespace editor;
using editor_test::makeCollider;
using editor_test::square;
using editor_test::triangle;

namespace {
ColliderDocument twoColliders() {
    ColliderDocument doc;
    doc.colliders.push_back(makeCollider("a", square(0, 0, 10)));
    doc.colliders.push_back(makeCollider("b", triangle(20, 20, 5)));
    return doc;
}
} // namespace

TEST(ColliderDocumentTest, FindCollider) {
    const ColliderDocument doc = twoColliders();
    ASSERT_NE(document::findCollider(doc, "b"), nullptr);
    EXPECT_EQ(document::findCollider(doc, "b")->points.size(), 3u);
    EXPECT_EQ(document::findCollider(doc, "missing"), nullptr);
    EXPECT_EQ(*document::findColliderIndex(doc, "b"), 1u);
    EXPECT_FALSE(document::findColliderIndex(doc, "missing").has_value());
}

TEST(ColliderDocumentTest, AllocateIdSkipsIdsInUse) {
    ColliderDocument doc;
    doc.colliders.push_back(makeCollider("collider-1", square(0, 0, 1)));
    std::uint32_t nextId = 1;
    EXPECT_EQ(document::allocateColliderId(doc, nextId), "collider-2");
    EXPECT_EQ(nextId, 3u);
    EXPECT_EQ(document::allocateColliderId(doc, nextId), "collider-3");
}

TEST(ColliderDocumentTest, NormalizeDropsEmptyCollidersAndFixesIds) {
    ColliderDocument doc;
    doc.colliders.push_back(makeCollider("", square(0, 0, 1)));
    doc.colliders.push_back(makeCollider("dup", square(2, 2, 1)));
    doc.colliders.push_back(makeCollider("dup", square(4, 4, 1)));
    doc.colliders.push_back(makeCollider("empty", {}));

    std::uint32_t nextId = 1;
    ColliderDocument out;
    EXPECT_TRUE(document::normalize(doc, nextId, out));
    ASSERT_EQ(out.colliders.size(), 3u);
    EXPECT_FALSE(out.colliders[0].id.empty());
    EXPECT_EQ(out.colliders[1].id, "dup");
    EXPECT_NE(out.colliders[2].id, "dup");
    EXPECT_NE(out.colliders[0].id, out.colliders[2].id);
    EXPECT_EQ(document::findCollider(out, "empty"), nullptr);
}

TEST(ColliderDocumentTest, NormalizeLeavesCleanDocumentAlone) {
    const ColliderDocument doc = twoColliders();
    std::uint32_t nextId = 1;
    ColliderDocument out;
    EXPECT_FALSE(document::normalize(doc, nextId, out));
    EXPECT_EQ(out, doc);
}

TEST(ColliderDocumentTest, AddColliderRejectsDuplicateAndEmptyIds) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::addCollider(doc, makeCollider("a", square(0, 0, 1)), out), EditorError::DuplicateKey);
    EXPECT_EQ(out, doc);
    EXPECT_EQ(document::addCollider(doc, makeCollider("", square(0, 0, 1)), out), EditorError::InvalidKey);
    EXPECT_EQ(document::addCollider(doc, makeCollider("c", square(0, 0, 1)), out), EditorError::Ok);
    EXPECT_EQ(out.colliders.size(), 3u);
    EXPECT_EQ(out.colliders.back().id, "c");
}

TEST(ColliderDocumentTest, MutationsLeaveInputUntouched) {
    const ColliderDocument doc = twoColliders();
    const ColliderDocument before = doc;
    ColliderDocument out;

    EXPECT_EQ(document::movePoint(doc, "a", 0, Point2{-5, -5}, out), EditorError::Ok);
    EXPECT_EQ(doc, before);
    EXPECT_NE(out, doc);
    EXPECT_EQ(document::findCollider(out, "a")->points[0], (Point2{-5, -5}));
}

TEST(ColliderDocumentTest, RemoveCollider) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::removeCollider(doc, "a", out), EditorError::Ok);
    ASSERT_EQ(out.colliders.size(), 1u);
    EXPECT_EQ(out.colliders[0].id, "b");
    EXPECT_EQ(document::removeCollider(doc, "zzz", out), EditorError::ColliderNotFound);
    EXPECT_EQ(out, doc);
}

TEST(ColliderDocumentTest, NameTypeAndPoints) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::setColliderName(doc, "a", "Floor", out), EditorError::Ok);
    EXPECT_EQ(document::findCollider(out, "a")->name, "Floor");
    EXPECT_EQ(document::setColliderType(doc, "a", "trigger", out), EditorError::Ok);
    EXPECT_EQ(document::findCollider(out, "a")->type, "trigger");
    EXPECT_EQ(document::setColliderPoints(doc, "b", square(1, 1, 1), out), EditorError::Ok);
    EXPECT_EQ(document::findCollider(out, "b")->points.size(), 4u);
    EXPECT_EQ(document::setColliderName(doc, "nope", "x", out), EditorError::ColliderNotFound);
}

TEST(ColliderDocumentTest, InsertPointGoesAfterEdgeStart) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::insertPoint(doc, "a", 0, Point2{5, 0}, out), EditorError::Ok);
    const auto& pts = document::findCollider(out, "a")->points;
    ASSERT_EQ(pts.size(), 5u);
    EXPECT_EQ(pts[1], (Point2{5, 0}));
    EXPECT_EQ(pts[2], (Point2{10, 0}));

    // Closing edge inserts at the end.
    EXPECT_EQ(document::insertPoint(doc, "a", 3, Point2{0, 5}, out), EditorError::Ok);
    EXPECT_EQ(document::findCollider(out, "a")->points.back(), (Point2{0, 5}));

    EXPECT_EQ(document::insertPoint(doc, "a", 4, Point2{0, 0}, out), EditorError::EdgeIndexOutOfRange);
    EXPECT_EQ(out, doc);
}

TEST(ColliderDocumentTest, DeletePointKeepsThreePointFloor) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::deletePoint(doc, "a", 1, out), EditorError::Ok);
    EXPECT_EQ(document::findCollider(out, "a")->points.size(), 3u);

    ColliderDocument again;
    EXPECT_EQ(document::deletePoint(out, "a", 0, again), EditorError::MinimumPointCount);
    EXPECT_EQ(again, out);
    EXPECT_EQ(document::deletePoint(doc, "a", 9, out), EditorError::PointIndexOutOfRange);
}

TEST(ColliderDocumentTest, TranslateCollider) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::translateCollider(doc, "b", 1, -2, out), EditorError::Ok);
    EXPECT_EQ(document::findCollider(out, "b")->points[0], (Point2{21, 18}));
    EXPECT_EQ(document::findCollider(out, "a")->points, document::findCollider(doc, "a")->points);
}

TEST(ColliderDocumentTest, PropertySetTrimsKey) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::setProperty(doc, "a", "  friction ", "0.5", out), EditorError::Ok);
    const PropertyMap* props = document::findProperties(out, "a");
    ASSERT_NE(props, nullptr);
    EXPECT_EQ(props->at("friction"), "0.5");

    EXPECT_EQ(document::setProperty(doc, "a", "   ", "x", out), EditorError::InvalidKey);
    EXPECT_EQ(document::setProperty(doc, "zzz", "k", "v", out), EditorError::ColliderNotFound);
}

TEST(ColliderDocumentTest, DocumentLevelPropertiesUseEmptyId) {
    const ColliderDocument doc = twoColliders();
    ColliderDocument out;
    EXPECT_EQ(document::setProperty(doc, "", "gravity", "9.8", out), EditorError::Ok);
    EXPECT_EQ(out.properties.at("gravity"), "9.8");
    EXPECT_TRUE(document::findCollider(out, "a")->properties.empty());
}

TEST(ColliderDocumentTest, RenamePropertyKeepsValue) {
    ColliderDocument doc = twoColliders();
    doc.colliders[0].properties = {{"a", "1"}, {"b", "2"}};
    ColliderDocument out;

    EXPECT_EQ(document::renameProperty(doc, "a", "a", "c", out), EditorError::Ok);
    const PropertyMap& props = document::findCollider(out, "a")->properties;
    EXPECT_EQ(props.count("a"), 0u);
    EXPECT_EQ(props.at("c"), "1");

    EXPECT_EQ(document::renameProperty(doc, "a", "a", "b", out), EditorError::DuplicateKey);
    EXPECT_EQ(out, doc);
    EXPECT_EQ(document::renameProperty(doc, "a", "a", " a ", out), EditorError::NoChange);
    EXPECT_EQ(document::renameProperty(doc, "a", "x", "y", out), EditorError::PropertyNotFound);
    EXPECT_EQ(document::renameProperty(doc, "a", "a", "", out), EditorError::InvalidKey);
}

TEST(ColliderDocumentTest, RemoveProperty) {
    ColliderDocument doc = twoColliders();
    doc.properties = {{"k", "v"}};
    ColliderDocument out;
    EXPECT_EQ(document::removeProperty(doc, "", "k", out), EditorError::Ok);
    EXPECT_TRUE(out.properties.empty());
    EXPECT_EQ(document::removeProperty(doc, "", "missing", out), EditorError::PropertyNotFound);
}

TEST(ColliderDocumentTest, EqualityIsDeep) {
    ColliderDocument a = twoColliders();
    ColliderDocument b = twoColliders();
    EXPECT_EQ(a, b);
    b.colliders[1].properties["x"] = "1";
    EXPECT_NE(a, b);
    b = a;
    b.colliders[0].points[2].x += 0.5f;
    EXPECT_NE(a, b);
}
