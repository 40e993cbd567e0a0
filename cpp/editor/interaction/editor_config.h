#pragma once

#include "editor/interaction/interaction_constants.h"
#include <cstddef>
#include <string>

namespace editor {

struct EditorConfig {
    bool gridSnapEnabled = true;
    float gridSize = interaction_constants::GRID_SIZE;

    float hitThresholdPx = interaction_constants::HIT_THRESHOLD_PX;

    float minScale = interaction_constants::MIN_SCALE;
    float maxScale = interaction_constants::MAX_SCALE;
    float zoomSpeed = interaction_constants::ZOOM_SPEED;
    float wheelDeltaClamp = interaction_constants::WHEEL_DELTA_CLAMP;
    float initialScale = interaction_constants::INITIAL_SCALE;
    float initialPanX = interaction_constants::INITIAL_PAN_X;
    float initialPanY = interaction_constants::INITIAL_PAN_Y;

    // Canvas extent in world units; points are clamped to [0, bounds].
    // Zero disables clamping on that axis.
    float boundsWidth = 0.0f;
    float boundsHeight = 0.0f;

    std::size_t maxHistoryEntries = interaction_constants::MAX_HISTORY_ENTRIES;

    float nudgeStep = interaction_constants::NUDGE_STEP;
    float nudgeStepLarge = interaction_constants::NUDGE_STEP_LARGE;

    std::string defaultColliderName = interaction_constants::DEFAULT_COLLIDER_NAME;
    std::string defaultColliderType = interaction_constants::DEFAULT_COLLIDER_TYPE;
};

} // namespace editor
