#include "editor/interaction/collider_pick.h"
#include "editor/geometry/geometry_kit.h"

namespace editor {

namespace {
bool isPickable(const Collider& c) {
    return c.points.size() >= kMinPolygonPoints;
}
} // namespace

std::optional<std::size_t> pickColliderBody(const std::vector<Collider>& colliders, float x, float y) {
    for (std::size_t i = colliders.size(); i-- > 0;) {
        const Collider& c = colliders[i];
        if (!isPickable(c)) continue;
        if (geometry::pointInPolygon(x, y, c.points)) return i;
    }
    return std::nullopt;
}

std::optional<PickResult> pickColliders(const std::vector<Collider>& colliders, float x, float y, float threshold) {
    for (std::size_t i = 0; i < colliders.size(); ++i) {
        const Collider& c = colliders[i];
        if (!isPickable(c)) continue;
        if (const auto vertex = geometry::findPointAtPosition(c.points, x, y, threshold)) {
            PickResult out;
            out.subTarget = PickSubTarget::Vertex;
            out.colliderIndex = i;
            out.subIndex = *vertex;
            out.hit = c.points[*vertex];
            return out;
        }
    }

    for (std::size_t i = 0; i < colliders.size(); ++i) {
        const Collider& c = colliders[i];
        if (!isPickable(c)) continue;
        if (const auto edge = geometry::findEdgeAtPosition(c.points, x, y, threshold)) {
            PickResult out;
            out.subTarget = PickSubTarget::Edge;
            out.colliderIndex = i;
            out.subIndex = edge->edgeIndex;
            out.hit = edge->insertPosition;
            return out;
        }
    }

    if (const auto body = pickColliderBody(colliders, x, y)) {
        PickResult out;
        out.subTarget = PickSubTarget::Body;
        out.colliderIndex = *body;
        out.hit = Point2{x, y};
        return out;
    }

    return std::nullopt;
}

} // namespace editor
