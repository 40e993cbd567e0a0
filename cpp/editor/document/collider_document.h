#pragma once

#include "editor/core/types.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace editor {

// Ordered string-keyed property bag. Keys are unique.
using PropertyMap = std::map<std::string, std::string>;

struct Collider {
    std::string id;
    std::string name;
    std::string type;
    std::vector<Point2> points;
    PropertyMap properties;
};

bool operator==(const Collider& a, const Collider& b);
inline bool operator!=(const Collider& a, const Collider& b) { return !(a == b); }

// The undo-tracked value. Compared structurally; every mutation below
// builds a new value instead of touching the input.
struct ColliderDocument {
    std::vector<Collider> colliders;
    PropertyMap properties;
};

bool operator==(const ColliderDocument& a, const ColliderDocument& b);
inline bool operator!=(const ColliderDocument& a, const ColliderDocument& b) { return !(a == b); }

namespace document {

const Collider* findCollider(const ColliderDocument& doc, const std::string& id);
std::optional<std::size_t> findColliderIndex(const ColliderDocument& doc, const std::string& id);

// Returns "collider-<n>" for the first n >= nextId not already used in `doc`
// and advances nextId past it.
std::string allocateColliderId(const ColliderDocument& doc, std::uint32_t& nextId);

// Drops colliders without points and gives every collider a unique,
// non-empty id. Returns true when `out` differs from `in`.
bool normalize(const ColliderDocument& in, std::uint32_t& nextId, ColliderDocument& out);

// ---------------------------------------------------------------------------
// Collider mutations. On failure `out` is set equal to `in`.
// ---------------------------------------------------------------------------
EditorError addCollider(const ColliderDocument& in, const Collider& collider, ColliderDocument& out);
EditorError removeCollider(const ColliderDocument& in, const std::string& id, ColliderDocument& out);
EditorError setColliderName(const ColliderDocument& in, const std::string& id, const std::string& name, ColliderDocument& out);
EditorError setColliderType(const ColliderDocument& in, const std::string& id, const std::string& type, ColliderDocument& out);
EditorError setColliderPoints(const ColliderDocument& in, const std::string& id, const std::vector<Point2>& points, ColliderDocument& out);

EditorError movePoint(const ColliderDocument& in, const std::string& id, std::size_t index, Point2 position, ColliderDocument& out);
// Inserts `position` after `edgeIndex`, i.e. at index edgeIndex + 1.
EditorError insertPoint(const ColliderDocument& in, const std::string& id, std::size_t edgeIndex, Point2 position, ColliderDocument& out);
// Refuses (MinimumPointCount) when the collider has kMinPolygonPoints or fewer.
EditorError deletePoint(const ColliderDocument& in, const std::string& id, std::size_t index, ColliderDocument& out);
EditorError translateCollider(const ColliderDocument& in, const std::string& id, float dx, float dy, ColliderDocument& out);

// ---------------------------------------------------------------------------
// Property bags. An empty colliderId addresses the document's own bag.
// ---------------------------------------------------------------------------
const PropertyMap* findProperties(const ColliderDocument& doc, const std::string& colliderId);
EditorError setProperty(const ColliderDocument& in, const std::string& colliderId, const std::string& key, const std::string& value, ColliderDocument& out);
EditorError renameProperty(const ColliderDocument& in, const std::string& colliderId, const std::string& oldKey, const std::string& newKey, ColliderDocument& out);
EditorError removeProperty(const ColliderDocument& in, const std::string& colliderId, const std::string& key, ColliderDocument& out);

} // namespace document
} // namespace editor
