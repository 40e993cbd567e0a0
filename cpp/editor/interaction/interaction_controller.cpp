#include "editor/interaction/interaction_controller.h"
#include "editor/core/logging.h"
#include "editor/geometry/geometry_kit.h"
#include "editor/interaction/interaction_helpers.h"
#include <algorithm>

namespace editor {

InteractionController::InteractionController(const ColliderDocument& initial, const EditorConfig& config)
    : config_(config), history_(initial, config.maxHistoryEntries)
{
    state_.view = ViewTransform{config_.initialPanX, config_.initialPanY, config_.initialScale};

    ColliderDocument normalized;
    if (document::normalize(initial, nextColliderId_, normalized)) {
        history_.reset(normalized);
    }
    working_ = history_.current();
}

const ColliderDocument& InteractionController::document() const noexcept {
    return isDragging() ? working_ : history_.current();
}

const Collider* InteractionController::selectedCollider() const {
    if (state_.selectedColliderId.empty()) return nullptr;
    return document::findCollider(document(), state_.selectedColliderId);
}

bool InteractionController::canCloseAtCursor() const {
    if (state_.mode != InteractionMode::Drawing || !state_.cursorWorld) return false;
    const Point2& c = *state_.cursorWorld;
    return geometry::canClosePolygon(state_.draft.points, c.x, c.y, hitThreshold());
}

void InteractionController::setView(const ViewTransform& view) {
    state_.view.panX = view.panX;
    state_.view.panY = view.panY;
    state_.view.scale = std::max(config_.minScale, std::min(config_.maxScale, interaction_detail::normalizeViewScale(view.scale)));
}

void InteractionController::loadDocument(const ColliderDocument& doc) {
    if (isDragging()) {
        EDITOR_LOG_WARN("interaction: edit target switched during a drag; gesture dropped");
    }
    history_.cancelBatch();
    enterMode(InteractionMode::Idle);

    ColliderDocument normalized;
    document::normalize(doc, nextColliderId_, normalized);
    history_.reset(normalized);
    working_ = history_.current();

    state_.selectedColliderId.clear();
    state_.selectedPointIndex.reset();
    state_.pendingProperty.reset();
    state_.cursorWorld.reset();
    lastError_ = EditorError::Ok;
}

// ==============================================================================
// History
// ==============================================================================

bool InteractionController::undo() {
    if (isDragging()) return false;
    if (!history_.undo()) return false;
    working_ = history_.current();
    reconcileSelection();
    notifyCommit();
    return true;
}

bool InteractionController::redo() {
    if (isDragging()) return false;
    if (!history_.redo()) return false;
    working_ = history_.current();
    reconcileSelection();
    notifyCommit();
    return true;
}

bool InteractionController::commitDocument(const ColliderDocument& next) {
    ColliderDocument normalized;
    document::normalize(next, nextColliderId_, normalized);
    if (!history_.commit(normalized)) return false;

    working_ = history_.current();
    reconcileSelection();
    notifyCommit();
    return true;
}

EditorError InteractionController::applyEdit(EditorError err, const ColliderDocument& next) {
    lastError_ = err;
    if (err != EditorError::Ok) {
        EDITOR_LOG_WARN("interaction: edit rejected (%s)", editorErrorName(err));
        return err;
    }
    commitDocument(next);
    return err;
}

void InteractionController::notifyCommit() {
    if (onCommit_) onCommit_(history_.current());
}

void InteractionController::notifyPreview() {
    if (onPreview_) onPreview_(document());
}

// ==============================================================================
// Mode / Selection
// ==============================================================================

void InteractionController::enterMode(InteractionMode mode) {
    if (mode != state_.mode) {
        EDITOR_LOG_DEBUG("interaction: %s -> %s", interactionModeName(state_.mode), interactionModeName(mode));
    }

    // Panning is view-only and hands control back to the draw session, so
    // it is the one transition that keeps the pending draft points.
    if (mode != InteractionMode::Panning && mode != InteractionMode::Drawing) {
        state_.draft.points.clear();
    }
    state_.drag = DragState{};
    state_.pan = PanState{};
    state_.mode = mode;
}

Point2 InteractionController::toWorld(float screenX, float screenY, bool snap) const {
    Point2 world = interaction_detail::screenToWorld(screenX, screenY, state_.view);
    if (snap) world = interaction_detail::applyGridSnap(world, config_);
    return interaction_detail::clampToBounds(world, config_);
}

float InteractionController::hitThreshold() const {
    return interaction_detail::worldThreshold(config_, state_.view);
}

bool InteractionController::selectCollider(const std::string& id) {
    const Collider* collider = document::findCollider(committedDocument(), id);
    if (!collider) return false;

    if (state_.pendingProperty && state_.pendingProperty->colliderId != id) {
        state_.pendingProperty.reset();
    }
    state_.selectedColliderId = id;
    state_.selectedPointIndex.reset();
    return true;
}

bool InteractionController::selectPoint(std::size_t index) {
    const Collider* collider = selectedCollider();
    if (!collider || index >= collider->points.size()) return false;
    state_.selectedPointIndex = index;
    return true;
}

void InteractionController::clearSelection() {
    if (state_.pendingProperty && !state_.pendingProperty->colliderId.empty()) {
        state_.pendingProperty.reset();
    }
    state_.selectedColliderId.clear();
    state_.selectedPointIndex.reset();
}

void InteractionController::reconcileSelection() {
    const ColliderDocument& doc = committedDocument();

    if (!state_.selectedColliderId.empty()) {
        const Collider* collider = document::findCollider(doc, state_.selectedColliderId);
        if (!collider) {
            state_.selectedColliderId.clear();
            state_.selectedPointIndex.reset();
        } else if (state_.selectedPointIndex && *state_.selectedPointIndex >= collider->points.size()) {
            state_.selectedPointIndex.reset();
        }
    }

    if (state_.pendingProperty) {
        const PendingPropertyEdit& pending = *state_.pendingProperty;
        const PropertyMap* props = document::findProperties(doc, pending.colliderId);
        if (!props || (!pending.isNew && props->count(pending.originalKey) == 0)) {
            state_.pendingProperty.reset();
        }
    }
}

} // namespace editor
