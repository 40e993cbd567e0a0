#pragma once

#include "editor/core/types.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace editor::geometry {

// Result of an edge proximity query. `insertPosition` is the clamped
// projection of the query point onto the edge, i.e. where a point inserted
// after `edgeIndex` would sit.
struct EdgeHit {
    std::size_t edgeIndex;
    Point2 insertPosition;
};

float distance(float x1, float y1, float x2, float y2);

// Even-odd (ray casting) containment. Polygons with fewer than three points
// never contain anything.
bool pointInPolygon(float x, float y, const std::vector<Point2>& points);

// First point within `threshold` of (x, y), scanning in index order.
// `threshold` is in world units (screen pixels / view scale).
std::optional<std::size_t> findPointAtPosition(
    const std::vector<Point2>& points, float x, float y, float threshold);

// First edge i -> (i + 1) % n whose clamped projection lies within
// `threshold` of (x, y). Zero-length edges are skipped.
std::optional<EdgeHit> findEdgeAtPosition(
    const std::vector<Point2>& points, float x, float y, float threshold);

// True when a draw session with `points` would close on a click at (x, y).
bool canClosePolygon(const std::vector<Point2>& points, float x, float y, float threshold);

// Vertex average; (0, 0) for an empty polygon.
Point2 polygonCenter(const std::vector<Point2>& points);

std::vector<Point2> offsetPolygon(const std::vector<Point2>& points, float dx, float dy);

AABB polygonBounds(const std::vector<Point2>& points);

} // namespace editor::geometry
