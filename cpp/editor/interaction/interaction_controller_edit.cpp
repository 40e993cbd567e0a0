#include "editor/interaction/interaction_controller.h"
#include "editor/core/string_utils.h"
#include "editor/interaction/collider_pick.h"
#include "editor/interaction/interaction_helpers.h"

namespace editor {

// ==============================================================================
// Discrete Edits
// ==============================================================================

EditorError InteractionController::deleteSelectedPoint() {
    if (isDragging()) return lastError_ = EditorError::InvalidState;
    if (state_.selectedColliderId.empty() || !state_.selectedPointIndex) {
        return lastError_ = EditorError::PointIndexOutOfRange;
    }

    ColliderDocument next;
    const EditorError err = document::deletePoint(
        committedDocument(), state_.selectedColliderId, *state_.selectedPointIndex, next);
    if (applyEdit(err, next) == EditorError::Ok) {
        state_.selectedPointIndex.reset();
    }
    return err;
}

EditorError InteractionController::deleteCollider(const std::string& id) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    ColliderDocument next;
    const EditorError err = document::removeCollider(committedDocument(), id, next);
    if (applyEdit(err, next) == EditorError::Ok && state_.selectedColliderId == id) {
        clearSelection();
    }
    return err;
}

EditorError InteractionController::insertPoint(const std::string& id, std::size_t edgeIndex, Point2 position) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    const Point2 snapped = interaction_detail::applyGridSnap(position, config_);
    ColliderDocument next;
    const EditorError err = document::insertPoint(committedDocument(), id, edgeIndex, snapped, next);
    if (applyEdit(err, next) == EditorError::Ok) {
        selectCollider(id);
        state_.selectedPointIndex = edgeIndex + 1;
    }
    return err;
}

EditorError InteractionController::setPointPosition(const std::string& id, std::size_t index, Point2 position) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    const Point2 snapped = interaction_detail::applyGridSnap(position, config_);
    ColliderDocument next;
    const EditorError err = document::movePoint(committedDocument(), id, index, snapped, next);
    return applyEdit(err, next);
}

EditorError InteractionController::setColliderName(const std::string& id, const std::string& name) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    ColliderDocument next;
    const EditorError err = document::setColliderName(committedDocument(), id, name, next);
    return applyEdit(err, next);
}

EditorError InteractionController::setColliderType(const std::string& id, const std::string& type) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    ColliderDocument next;
    const EditorError err = document::setColliderType(committedDocument(), id, type, next);
    return applyEdit(err, next);
}

EditorError InteractionController::nudgeSelection(float dx, float dy) {
    if (state_.mode != InteractionMode::Idle) return lastError_ = EditorError::InvalidState;

    const Collider* collider = selectedCollider();
    if (!collider) return lastError_ = EditorError::ColliderNotFound;

    ColliderDocument next;
    EditorError err = EditorError::Ok;
    if (state_.selectedPointIndex) {
        const std::size_t index = *state_.selectedPointIndex;
        if (index >= collider->points.size()) return lastError_ = EditorError::PointIndexOutOfRange;
        const Point2 moved{collider->points[index].x + dx, collider->points[index].y + dy};
        err = document::movePoint(committedDocument(), collider->id, index, moved, next);
    } else {
        err = document::translateCollider(committedDocument(), collider->id, dx, dy, next);
    }
    return applyEdit(err, next);
}

// ==============================================================================
// Properties
// ==============================================================================

EditorError InteractionController::beginAddProperty() {
    const std::string& target = state_.selectedColliderId;
    if (!document::findProperties(committedDocument(), target)) {
        return lastError_ = EditorError::ColliderNotFound;
    }
    state_.pendingProperty = PendingPropertyEdit{target, std::string(), true};
    return lastError_ = EditorError::Ok;
}

EditorError InteractionController::beginRenameProperty(const std::string& key) {
    const std::string& target = state_.selectedColliderId;
    const PropertyMap* props = document::findProperties(committedDocument(), target);
    if (!props) return lastError_ = EditorError::ColliderNotFound;
    if (props->count(key) == 0) return lastError_ = EditorError::PropertyNotFound;

    state_.pendingProperty = PendingPropertyEdit{target, key, false};
    return lastError_ = EditorError::Ok;
}

EditorError InteractionController::commitPropertyKey(const std::string& newKey) {
    if (isDragging() || !state_.pendingProperty) return lastError_ = EditorError::InvalidState;

    const PendingPropertyEdit pending = *state_.pendingProperty;
    const std::string key = trimCopy(newKey);
    const ColliderDocument& committed = committedDocument();
    ColliderDocument next;

    if (key.empty()) {
        // Clearing the key removes the property; a new one is simply abandoned.
        state_.pendingProperty.reset();
        if (pending.isNew) return lastError_ = EditorError::Ok;
        const EditorError err = document::removeProperty(committed, pending.colliderId, pending.originalKey, next);
        return applyEdit(err, next);
    }

    if (pending.isNew) {
        const PropertyMap* props = document::findProperties(committed, pending.colliderId);
        if (!props) {
            state_.pendingProperty.reset();
            return lastError_ = EditorError::ColliderNotFound;
        }
        if (props->count(key) != 0) return lastError_ = EditorError::DuplicateKey;

        const EditorError err = document::setProperty(committed, pending.colliderId, key, std::string(), next);
        if (err == EditorError::Ok) state_.pendingProperty.reset();
        return applyEdit(err, next);
    }

    const EditorError err = document::renameProperty(committed, pending.colliderId, pending.originalKey, key, next);
    if (err == EditorError::NoChange) {
        state_.pendingProperty.reset();
        return lastError_ = EditorError::Ok;
    }
    if (err != EditorError::DuplicateKey) {
        state_.pendingProperty.reset();
    }
    return applyEdit(err, next);
}

void InteractionController::cancelPropertyEdit() {
    state_.pendingProperty.reset();
}

EditorError InteractionController::setPropertyValue(const std::string& key, const std::string& value) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    ColliderDocument next;
    const EditorError err = document::setProperty(committedDocument(), state_.selectedColliderId, key, value, next);
    return applyEdit(err, next);
}

EditorError InteractionController::deleteProperty(const std::string& key) {
    if (isDragging()) return lastError_ = EditorError::InvalidState;

    ColliderDocument next;
    const EditorError err = document::removeProperty(committedDocument(), state_.selectedColliderId, key, next);
    if (err == EditorError::Ok && state_.pendingProperty && state_.pendingProperty->originalKey == key) {
        state_.pendingProperty.reset();
    }
    return applyEdit(err, next);
}

// ==============================================================================
// Context Menu
// ==============================================================================

ContextAction InteractionController::resolveContextMenu(float screenX, float screenY) const {
    ContextAction action;
    if (state_.mode != InteractionMode::Idle) return action;

    const Point2 world = toWorld(screenX, screenY, false);
    const auto& colliders = committedDocument().colliders;
    const auto hit = pickColliders(colliders, world.x, world.y, hitThreshold());

    if (!hit) {
        action.kind = ContextActionKind::CreateCollider;
        action.position = world;
        return action;
    }

    action.colliderId = colliders[hit->colliderIndex].id;
    action.position = hit->hit;
    switch (hit->subTarget) {
        case PickSubTarget::Vertex:
            action.kind = ContextActionKind::DeletePoint;
            action.pointIndex = hit->subIndex;
            break;
        case PickSubTarget::Edge:
            action.kind = ContextActionKind::InsertPoint;
            action.edgeIndex = hit->subIndex;
            break;
        case PickSubTarget::Body:
            action.kind = ContextActionKind::DeleteCollider;
            break;
        case PickSubTarget::None:
            action.kind = ContextActionKind::None;
            break;
    }
    return action;
}

EditorError InteractionController::applyContextAction(const ContextAction& action) {
    if (state_.mode != InteractionMode::Idle) return lastError_ = EditorError::InvalidState;

    switch (action.kind) {
        case ContextActionKind::DeletePoint: {
            ColliderDocument next;
            const EditorError err = document::deletePoint(committedDocument(), action.colliderId, action.pointIndex, next);
            if (applyEdit(err, next) == EditorError::Ok && state_.selectedColliderId == action.colliderId) {
                state_.selectedPointIndex.reset();
            }
            return err;
        }
        case ContextActionKind::InsertPoint:
            return insertPoint(action.colliderId, action.edgeIndex, action.position);
        case ContextActionKind::DeleteCollider:
            return deleteCollider(action.colliderId);
        case ContextActionKind::CreateCollider:
            startDrawing();
            return lastError_ = EditorError::Ok;
        case ContextActionKind::None:
            break;
    }
    return lastError_ = EditorError::NoChange;
}

} // namespace editor
