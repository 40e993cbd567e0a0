#include "editor/document/collider_document.h"
#include "editor/core/string_utils.h"
#include <algorithm>
#include <unordered_set>

namespace editor {

bool operator==(const Collider& a, const Collider& b) {
    return a.id == b.id &&
           a.name == b.name &&
           a.type == b.type &&
           a.points == b.points &&
           a.properties == b.properties;
}

bool operator==(const ColliderDocument& a, const ColliderDocument& b) {
    return a.colliders == b.colliders && a.properties == b.properties;
}

namespace document {
namespace {

Collider* findMutable(ColliderDocument& doc, const std::string& id) {
    for (auto& c : doc.colliders) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

PropertyMap* findMutableProperties(ColliderDocument& doc, const std::string& colliderId) {
    if (colliderId.empty()) return &doc.properties;
    Collider* c = findMutable(doc, colliderId);
    return c ? &c->properties : nullptr;
}

EditorError fail(EditorError err, const ColliderDocument& in, ColliderDocument& out) {
    if (&in != &out) out = in;
    return err;
}

// Applies `fn` to a copy of the collider `id` and publishes the copy on success.
template <typename Fn>
EditorError editCollider(const ColliderDocument& in, const std::string& id, ColliderDocument& out, Fn&& fn) {
    ColliderDocument next = in;
    Collider* collider = findMutable(next, id);
    if (!collider) return fail(EditorError::ColliderNotFound, in, out);

    const EditorError err = fn(*collider);
    if (err != EditorError::Ok) return fail(err, in, out);

    out = std::move(next);
    return EditorError::Ok;
}

template <typename Fn>
EditorError editProperties(const ColliderDocument& in, const std::string& colliderId, ColliderDocument& out, Fn&& fn) {
    ColliderDocument next = in;
    PropertyMap* props = findMutableProperties(next, colliderId);
    if (!props) return fail(EditorError::ColliderNotFound, in, out);

    const EditorError err = fn(*props);
    if (err != EditorError::Ok) return fail(err, in, out);

    out = std::move(next);
    return EditorError::Ok;
}

} // namespace

const Collider* findCollider(const ColliderDocument& doc, const std::string& id) {
    for (const auto& c : doc.colliders) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

std::optional<std::size_t> findColliderIndex(const ColliderDocument& doc, const std::string& id) {
    for (std::size_t i = 0; i < doc.colliders.size(); ++i) {
        if (doc.colliders[i].id == id) return i;
    }
    return std::nullopt;
}

std::string allocateColliderId(const ColliderDocument& doc, std::uint32_t& nextId) {
    for (;;) {
        std::string candidate = "collider-" + std::to_string(nextId++);
        if (!findCollider(doc, candidate)) return candidate;
    }
}

bool normalize(const ColliderDocument& in, std::uint32_t& nextId, ColliderDocument& out) {
    ColliderDocument next;
    next.properties = in.properties;
    next.colliders.reserve(in.colliders.size());

    bool changed = false;
    std::unordered_set<std::string> seen;
    seen.reserve(in.colliders.size());

    for (const auto& c : in.colliders) {
        if (c.points.empty()) {
            changed = true;
            continue;
        }
        next.colliders.push_back(c);
    }

    for (auto& c : next.colliders) {
        if (!c.id.empty() && seen.insert(c.id).second) continue;
        // Empty or repeated id: pick one that is unused by both the input
        // and the ids already accepted.
        std::string fresh;
        do {
            fresh = allocateColliderId(in, nextId);
        } while (seen.count(fresh) != 0);
        c.id = fresh;
        seen.insert(c.id);
        changed = true;
    }

    out = std::move(next);
    return changed;
}

EditorError addCollider(const ColliderDocument& in, const Collider& collider, ColliderDocument& out) {
    if (collider.id.empty()) return fail(EditorError::InvalidKey, in, out);
    if (findCollider(in, collider.id)) return fail(EditorError::DuplicateKey, in, out);

    ColliderDocument next = in;
    next.colliders.push_back(collider);
    out = std::move(next);
    return EditorError::Ok;
}

EditorError removeCollider(const ColliderDocument& in, const std::string& id, ColliderDocument& out) {
    const auto index = findColliderIndex(in, id);
    if (!index) return fail(EditorError::ColliderNotFound, in, out);

    ColliderDocument next = in;
    next.colliders.erase(next.colliders.begin() + static_cast<std::ptrdiff_t>(*index));
    out = std::move(next);
    return EditorError::Ok;
}

EditorError setColliderName(const ColliderDocument& in, const std::string& id, const std::string& name, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        c.name = name;
        return EditorError::Ok;
    });
}

EditorError setColliderType(const ColliderDocument& in, const std::string& id, const std::string& type, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        c.type = type;
        return EditorError::Ok;
    });
}

EditorError setColliderPoints(const ColliderDocument& in, const std::string& id, const std::vector<Point2>& points, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        c.points = points;
        return EditorError::Ok;
    });
}

EditorError movePoint(const ColliderDocument& in, const std::string& id, std::size_t index, Point2 position, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        if (index >= c.points.size()) return EditorError::PointIndexOutOfRange;
        c.points[index] = position;
        return EditorError::Ok;
    });
}

EditorError insertPoint(const ColliderDocument& in, const std::string& id, std::size_t edgeIndex, Point2 position, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        if (edgeIndex >= c.points.size()) return EditorError::EdgeIndexOutOfRange;
        c.points.insert(c.points.begin() + static_cast<std::ptrdiff_t>(edgeIndex + 1), position);
        return EditorError::Ok;
    });
}

EditorError deletePoint(const ColliderDocument& in, const std::string& id, std::size_t index, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        if (index >= c.points.size()) return EditorError::PointIndexOutOfRange;
        if (c.points.size() <= kMinPolygonPoints) return EditorError::MinimumPointCount;
        c.points.erase(c.points.begin() + static_cast<std::ptrdiff_t>(index));
        return EditorError::Ok;
    });
}

EditorError translateCollider(const ColliderDocument& in, const std::string& id, float dx, float dy, ColliderDocument& out) {
    return editCollider(in, id, out, [&](Collider& c) {
        for (auto& p : c.points) {
            p.x += dx;
            p.y += dy;
        }
        return EditorError::Ok;
    });
}

const PropertyMap* findProperties(const ColliderDocument& doc, const std::string& colliderId) {
    if (colliderId.empty()) return &doc.properties;
    const Collider* c = findCollider(doc, colliderId);
    return c ? &c->properties : nullptr;
}

EditorError setProperty(const ColliderDocument& in, const std::string& colliderId, const std::string& key, const std::string& value, ColliderDocument& out) {
    const std::string trimmed = trimCopy(key);
    if (trimmed.empty()) return fail(EditorError::InvalidKey, in, out);

    return editProperties(in, colliderId, out, [&](PropertyMap& props) {
        props[trimmed] = value;
        return EditorError::Ok;
    });
}

EditorError renameProperty(const ColliderDocument& in, const std::string& colliderId, const std::string& oldKey, const std::string& newKey, ColliderDocument& out) {
    const std::string trimmed = trimCopy(newKey);
    if (trimmed.empty()) return fail(EditorError::InvalidKey, in, out);

    return editProperties(in, colliderId, out, [&](PropertyMap& props) {
        auto it = props.find(oldKey);
        if (it == props.end()) return EditorError::PropertyNotFound;
        if (trimmed == oldKey) return EditorError::NoChange;
        if (props.count(trimmed) != 0) return EditorError::DuplicateKey;

        std::string value = std::move(it->second);
        props.erase(it);
        props.emplace(trimmed, std::move(value));
        return EditorError::Ok;
    });
}

EditorError removeProperty(const ColliderDocument& in, const std::string& colliderId, const std::string& key, ColliderDocument& out) {
    return editProperties(in, colliderId, out, [&](PropertyMap& props) {
        if (props.erase(key) == 0) return EditorError::PropertyNotFound;
        return EditorError::Ok;
    });
}

} // namespace document
} // namespace editor
