#include "editor/geometry/geometry_kit.h"
#include <algorithm>
#include <cmath>

namespace editor::geometry {

float distance(float x1, float y1, float x2, float y2) {
    const float dx = x2 - x1;
    const float dy = y2 - y1;
    return std::sqrt(dx * dx + dy * dy);
}

bool pointInPolygon(float x, float y, const std::vector<Point2>& points) {
    const std::size_t n = points.size();
    if (n < kMinPolygonPoints) return false;

    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const float xi = points[i].x;
        const float yi = points[i].y;
        const float xj = points[j].x;
        const float yj = points[j].y;

        // (yi > y) != (yj > y) guarantees yj != yi, so the division is safe.
        const bool crosses = (yi > y) != (yj > y);
        if (crosses && x < (xj - xi) * (y - yi) / (yj - yi) + xi) {
            inside = !inside;
        }
    }
    return inside;
}

std::optional<std::size_t> findPointAtPosition(
    const std::vector<Point2>& points, float x, float y, float threshold) {
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (distance(points[i].x, points[i].y, x, y) <= threshold) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<EdgeHit> findEdgeAtPosition(
    const std::vector<Point2>& points, float x, float y, float threshold) {
    const std::size_t n = points.size();
    if (n < 2) return std::nullopt;

    for (std::size_t i = 0; i < n; ++i) {
        const Point2& p1 = points[i];
        const Point2& p2 = points[(i + 1) % n];

        const float dx = p2.x - p1.x;
        const float dy = p2.y - p1.y;
        const float lengthSq = dx * dx + dy * dy;
        if (lengthSq == 0.0f) continue;

        float t = ((x - p1.x) * dx + (y - p1.y) * dy) / lengthSq;
        t = std::max(0.0f, std::min(1.0f, t));

        const float projX = p1.x + t * dx;
        const float projY = p1.y + t * dy;
        if (distance(x, y, projX, projY) <= threshold) {
            return EdgeHit{i, Point2{projX, projY}};
        }
    }
    return std::nullopt;
}

bool canClosePolygon(const std::vector<Point2>& points, float x, float y, float threshold) {
    if (points.size() < kMinPolygonPoints) return false;
    const Point2& first = points.front();
    return distance(x, y, first.x, first.y) <= threshold;
}

Point2 polygonCenter(const std::vector<Point2>& points) {
    if (points.empty()) return Point2{0.0f, 0.0f};

    float sumX = 0.0f;
    float sumY = 0.0f;
    for (const Point2& p : points) {
        sumX += p.x;
        sumY += p.y;
    }
    const float count = static_cast<float>(points.size());
    return Point2{sumX / count, sumY / count};
}

std::vector<Point2> offsetPolygon(const std::vector<Point2>& points, float dx, float dy) {
    std::vector<Point2> out;
    out.reserve(points.size());
    for (const Point2& p : points) {
        out.push_back(Point2{p.x + dx, p.y + dy});
    }
    return out;
}

AABB polygonBounds(const std::vector<Point2>& points) {
    if (points.empty()) return AABB{0.0f, 0.0f, 0.0f, 0.0f, false};

    AABB out{points[0].x, points[0].y, points[0].x, points[0].y, true};
    for (const Point2& p : points) {
        out.minX = std::min(out.minX, p.x);
        out.minY = std::min(out.minY, p.y);
        out.maxX = std::max(out.maxX, p.x);
        out.maxY = std::max(out.maxY, p.y);
    }
    return out;
}

} // namespace editor::geometry
