#pragma once

#include "editor/core/types.h"
#include "editor/document/collider_document.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace editor {

// Ordered by resolution priority: Vertex beats Edge beats Body.
enum class PickSubTarget : std::uint8_t {
    None = 0,
    Body = 1,
    Edge = 2,
    Vertex = 3
};

struct PickResult {
    PickSubTarget subTarget = PickSubTarget::None;
    std::size_t colliderIndex = 0;
    std::size_t subIndex = 0;        // Vertex or edge index
    Point2 hit{0.0f, 0.0f};          // Vertex position, edge projection, or query point
};

// Topmost collider (last in document order) whose body contains (x, y).
// Colliders with fewer than three points are skipped.
std::optional<std::size_t> pickColliderBody(const std::vector<Collider>& colliders, float x, float y);

// Full priority pick across every collider:
//   1. Vertex within threshold (document order, lowest index first)
//   2. Edge within threshold (document order, lowest edge index first)
//   3. Body containment (topmost first)
//   4. None
std::optional<PickResult> pickColliders(const std::vector<Collider>& colliders, float x, float y, float threshold);

} // namespace editor
