#pragma once

/**
 * @file interaction_constants.h
 * @brief Default values for the collider editor interaction layer.
 *
 * EditorConfig starts from these; hosts override per editor surface.
 */

#include <cstddef>

namespace interaction_constants {

// =============================================================================
// Hit-test Tolerances (in screen pixels, converted to world via view scale)
// =============================================================================

/// Radius for point, edge and polygon-closing hits
constexpr float HIT_THRESHOLD_PX = 8.0f;

// =============================================================================
// View
// =============================================================================

constexpr float MIN_SCALE = 0.5f;
constexpr float MAX_SCALE = 16.0f;
constexpr float INITIAL_SCALE = 4.0f;
constexpr float INITIAL_PAN_X = 50.0f;
constexpr float INITIAL_PAN_Y = 50.0f;

/// Scale change per wheel delta unit
constexpr float ZOOM_SPEED = 0.01f;

/// Mouse wheels report about +/-100 per notch, trackpads much less
constexpr float WHEEL_DELTA_CLAMP = 20.0f;

// =============================================================================
// Editing
// =============================================================================

constexpr float GRID_SIZE = 1.0f;
constexpr float NUDGE_STEP = 1.0f;
constexpr float NUDGE_STEP_LARGE = 10.0f;
constexpr std::size_t MAX_HISTORY_ENTRIES = 50;

constexpr const char* DEFAULT_COLLIDER_NAME = "Collider";
constexpr const char* DEFAULT_COLLIDER_TYPE = "solid";

} // namespace interaction_constants
