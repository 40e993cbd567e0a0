#include "editor/interaction/interaction_controller.h"
#include "editor/core/logging.h"
#include "editor/interaction/interaction_helpers.h"
#include <algorithm>

namespace editor {

namespace {
bool arrowDelta(Key key, float step, float& dx, float& dy) {
    dx = 0.0f;
    dy = 0.0f;
    switch (key) {
        case Key::ArrowUp: dy = -step; return true;
        case Key::ArrowDown: dy = step; return true;
        case Key::ArrowLeft: dx = -step; return true;
        case Key::ArrowRight: dx = step; return true;
        default: return false;
    }
}
} // namespace

void InteractionController::handleKeyDown(const KeyEvent& e) {
    // A drag only ends on release.
    if (isDragging() || state_.mode == InteractionMode::Panning) return;

    switch (e.key) {
        case Key::Escape:
            if (state_.mode == InteractionMode::Drawing) {
                cancelDrawing();
            } else if (state_.pendingProperty) {
                cancelPropertyEdit();
            } else {
                clearSelection();
            }
            return;
        case Key::Enter:
            if (state_.mode == InteractionMode::Drawing) {
                finishDrawing();
            }
            return;
        case Key::Delete:
        case Key::Backspace:
            if (state_.mode == InteractionMode::Idle && state_.selectedPointIndex) {
                deleteSelectedPoint();
            }
            return;
        default:
            break;
    }

    if (state_.mode != InteractionMode::Idle) return;

    const float step = interaction_detail::hasShift(e.modifiers) ? config_.nudgeStepLarge : config_.nudgeStep;
    float dx = 0.0f;
    float dy = 0.0f;
    if (arrowDelta(e.key, step, dx, dy)) {
        nudgeSelection(dx, dy);
    }
}

void InteractionController::handleWheel(const WheelEvent& e) {
    ViewTransform& view = state_.view;

    if (!interaction_detail::isZoomModifier(e.modifiers)) {
        view.panX -= e.deltaX;
        view.panY -= e.deltaY;
        return;
    }

    const float limit = config_.wheelDeltaClamp;
    const float delta = limit > 0.0f ? std::max(-limit, std::min(limit, e.deltaY)) : e.deltaY;
    const float newScale = std::max(config_.minScale, std::min(config_.maxScale, view.scale - delta * config_.zoomSpeed));

    // Keep the world point under the cursor fixed on screen.
    const Point2 anchor = interaction_detail::screenToWorld(e.x, e.y, view);
    view.panX = e.x - anchor.x * newScale;
    view.panY = e.y - anchor.y * newScale;
    view.scale = newScale;

    EDITOR_LOG_DEBUG("interaction: zoom %.3f", static_cast<double>(newScale));
}

} // namespace editor
