#ifndef COLLIDER_EDITOR_TYPES_H
#define COLLIDER_EDITOR_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types shared by the geometry, document and interaction layers.

namespace editor {

struct Point2 {
    float x;
    float y;
};

inline bool operator==(const Point2& a, const Point2& b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point2& a, const Point2& b) noexcept {
    return !(a == b);
}

struct AABB {
    float minX, minY, maxX, maxY;
    bool valid;
};

// Status codes for document mutations. Mutations never throw; on anything
// other than Ok the output value equals the input.
enum class EditorError : std::uint32_t {
    Ok = 0,
    ColliderNotFound = 1,
    PointIndexOutOfRange = 2,
    EdgeIndexOutOfRange = 3,
    MinimumPointCount = 4,
    PropertyNotFound = 5,
    DuplicateKey = 6,
    InvalidKey = 7,
    NoChange = 8,
    InvalidState = 9,
};

inline const char* editorErrorName(EditorError err) noexcept {
    switch (err) {
        case EditorError::Ok: return "Ok";
        case EditorError::ColliderNotFound: return "ColliderNotFound";
        case EditorError::PointIndexOutOfRange: return "PointIndexOutOfRange";
        case EditorError::EdgeIndexOutOfRange: return "EdgeIndexOutOfRange";
        case EditorError::MinimumPointCount: return "MinimumPointCount";
        case EditorError::PropertyNotFound: return "PropertyNotFound";
        case EditorError::DuplicateKey: return "DuplicateKey";
        case EditorError::InvalidKey: return "InvalidKey";
        case EditorError::NoChange: return "NoChange";
        case EditorError::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

// A polygon being edited never drops below this many points.
static constexpr std::size_t kMinPolygonPoints = 3;

} // namespace editor

#endif // COLLIDER_EDITOR_TYPES_H
