#include "editor/interaction/interaction_controller.h"
#include "editor/core/logging.h"
#include "editor/geometry/geometry_kit.h"
#include "editor/interaction/collider_pick.h"
#include "editor/interaction/interaction_helpers.h"

namespace editor {

void InteractionController::handlePointerDown(const PointerEvent& e) {
    if (isDragging() || state_.mode == InteractionMode::Panning) return;

    const bool panGesture = e.button == PointerButton::Middle ||
        (e.button == PointerButton::Left && interaction_detail::hasShift(e.modifiers));
    if (panGesture) {
        const InteractionMode returnMode =
            state_.mode == InteractionMode::Drawing ? InteractionMode::Drawing : InteractionMode::Idle;
        enterMode(InteractionMode::Panning);
        state_.pan.startX = e.x - state_.view.panX;
        state_.pan.startY = e.y - state_.view.panY;
        state_.pan.returnMode = returnMode;
        return;
    }

    // Right clicks go through resolveContextMenu.
    if (e.button != PointerButton::Left) return;

    if (state_.mode == InteractionMode::Drawing) {
        const Point2 snapped = toWorld(e.x, e.y, true);
        state_.cursorWorld = snapped;
        if (geometry::canClosePolygon(state_.draft.points, snapped.x, snapped.y, hitThreshold())) {
            finalizeDrawing();
            return;
        }
        state_.draft.points.push_back(snapped);
        return;
    }

    const Point2 world = toWorld(e.x, e.y, false);
    const float threshold = hitThreshold();

    if (const Collider* selected = selectedCollider()) {
        if (selected->points.size() >= kMinPolygonPoints) {
            if (const auto index = geometry::findPointAtPosition(selected->points, world.x, world.y, threshold)) {
                state_.selectedPointIndex = *index;
                beginPointDrag(*index);
                return;
            }
        }
    }

    const auto& colliders = committedDocument().colliders;
    if (const auto hit = pickColliderBody(colliders, world.x, world.y)) {
        const std::string id = colliders[*hit].id;
        const bool wasSelected = id == state_.selectedColliderId;
        selectCollider(id);
        if (wasSelected) {
            beginPolygonDrag(toWorld(e.x, e.y, true));
        }
        return;
    }

    clearSelection();
}

void InteractionController::handlePointerMove(const PointerEvent& e) {
    switch (state_.mode) {
        case InteractionMode::Panning:
            state_.view.panX = e.x - state_.pan.startX;
            state_.view.panY = e.y - state_.pan.startY;
            break;
        case InteractionMode::DraggingPoint:
        case InteractionMode::DraggingPolygon:
            updateDrag(e.x, e.y);
            break;
        case InteractionMode::Drawing:
            state_.cursorWorld = toWorld(e.x, e.y, true);
            break;
        case InteractionMode::Idle:
            state_.cursorWorld = toWorld(e.x, e.y, false);
            break;
    }
}

void InteractionController::handlePointerUp(const PointerEvent& e) {
    (void)e;
    switch (state_.mode) {
        case InteractionMode::DraggingPoint:
        case InteractionMode::DraggingPolygon:
            endDrag();
            break;
        case InteractionMode::Panning:
            enterMode(state_.pan.returnMode);
            break;
        default:
            break;
    }
}

// ==============================================================================
// Drag Gestures
// ==============================================================================

void InteractionController::beginPointDrag(std::size_t pointIndex) {
    const std::string id = state_.selectedColliderId;
    enterMode(InteractionMode::DraggingPoint);
    state_.drag.colliderId = id;
    state_.drag.pointIndex = pointIndex;

    working_ = committedDocument();
    history_.startBatch();
}

void InteractionController::beginPolygonDrag(const Point2& anchor) {
    const Collider* collider = selectedCollider();
    if (!collider) return;

    const std::string id = collider->id;
    std::vector<Point2> original = collider->points;

    enterMode(InteractionMode::DraggingPolygon);
    state_.drag.colliderId = id;
    state_.drag.anchor = anchor;
    state_.drag.originalPoints = std::move(original);

    working_ = committedDocument();
    history_.startBatch();
}

void InteractionController::updateDrag(float screenX, float screenY) {
    const Point2 current = toWorld(screenX, screenY, true);
    state_.cursorWorld = current;

    const Collider* collider = document::findCollider(working_, state_.drag.colliderId);
    if (!collider) {
        abortDrag("collider no longer exists");
        return;
    }

    ColliderDocument next;
    EditorError err = EditorError::Ok;

    if (state_.mode == InteractionMode::DraggingPoint) {
        err = document::movePoint(working_, state_.drag.colliderId, state_.drag.pointIndex, current, next);
    } else {
        // Offsets are always taken from the points captured at drag start so
        // rounding never accumulates across move events.
        const float dx = current.x - state_.drag.anchor.x;
        const float dy = current.y - state_.drag.anchor.y;
        std::vector<Point2> moved = geometry::offsetPolygon(state_.drag.originalPoints, dx, dy);
        for (auto& p : moved) {
            p = interaction_detail::applyGridSnap(p, config_);
        }
        err = document::setColliderPoints(working_, state_.drag.colliderId, moved, next);
    }

    if (err != EditorError::Ok) {
        abortDrag(editorErrorName(err));
        return;
    }

    working_ = std::move(next);
    notifyPreview();
}

void InteractionController::endDrag() {
    ColliderDocument finalValue;
    document::normalize(working_, nextColliderId_, finalValue);

    enterMode(InteractionMode::Idle);
    const bool pushed = history_.endBatch(finalValue);
    working_ = history_.current();

    if (pushed) {
        reconcileSelection();
        notifyCommit();
    }
}

void InteractionController::abortDrag(const char* reason) {
    EDITOR_LOG_WARN("interaction: drag dropped (%s)", reason);
    (void)reason;

    // Closing against the committed value records nothing.
    history_.endBatch(history_.current());
    enterMode(InteractionMode::Idle);
    working_ = history_.current();
    reconcileSelection();
    notifyPreview();
}

// ==============================================================================
// Drawing
// ==============================================================================

void InteractionController::startDrawing() {
    if (isDragging()) return;
    clearSelection();
    state_.draft.points.clear();
    enterMode(InteractionMode::Drawing);
}

void InteractionController::cancelDrawing() {
    if (state_.mode != InteractionMode::Drawing) return;
    enterMode(InteractionMode::Idle);
}

bool InteractionController::finishDrawing() {
    if (state_.mode != InteractionMode::Drawing) return false;
    if (state_.draft.points.size() < kMinPolygonPoints) return false;
    return finalizeDrawing();
}

bool InteractionController::finalizeDrawing() {
    const ColliderDocument& committed = committedDocument();

    Collider collider;
    collider.id = document::allocateColliderId(committed, nextColliderId_);
    collider.name = config_.defaultColliderName;
    collider.type = config_.defaultColliderType;
    collider.points = state_.draft.points;

    ColliderDocument next;
    const EditorError err = document::addCollider(committed, collider, next);

    enterMode(InteractionMode::Idle);
    if (applyEdit(err, next) != EditorError::Ok) return false;

    selectCollider(collider.id);
    return true;
}

} // namespace editor
