#pragma once

#include "editor/core/types.h"
#include "editor/document/collider_document.h"
#include "editor/history/history_manager.h"
#include "editor/interaction/editor_config.h"
#include "editor/interaction/interaction_types.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace editor {

using DocumentHistory = HistoryManager<ColliderDocument>;
using DocumentCallback = std::function<void(const ColliderDocument&)>;

// Turns pointer, keyboard and wheel events into document edits. Drags are
// batched in the history so a whole gesture becomes a single undo step;
// every other edit is committed as soon as it is applied.
class InteractionController {
public:
    // Transient editing state. Never persisted and never part of history.
    struct DraftState {
        std::vector<Point2> points;
    };

    struct DragState {
        std::string colliderId;
        std::size_t pointIndex = 0;
        Point2 anchor{0.0f, 0.0f};
        std::vector<Point2> originalPoints;
    };

    struct PanState {
        float startX = 0.0f;
        float startY = 0.0f;
        InteractionMode returnMode = InteractionMode::Idle;
    };

    struct InteractionState {
        InteractionMode mode = InteractionMode::Idle;
        DraftState draft;
        DragState drag;
        PanState pan;
        std::string selectedColliderId;
        std::optional<std::size_t> selectedPointIndex;
        std::optional<Point2> cursorWorld;
        std::optional<PendingPropertyEdit> pendingProperty;
        ViewTransform view{0.0f, 0.0f, 1.0f};
    };

    explicit InteractionController(const ColliderDocument& initial = ColliderDocument{}, const EditorConfig& config = EditorConfig{});

    // ==============================================================================
    // State Query
    // ==============================================================================
    InteractionMode mode() const noexcept { return state_.mode; }
    const InteractionState& state() const noexcept { return state_; }
    const EditorConfig& config() const noexcept { return config_; }
    const ViewTransform& view() const noexcept { return state_.view; }
    EditorError lastError() const noexcept { return lastError_; }

    // Live value while a drag is in progress, otherwise the committed value.
    const ColliderDocument& document() const noexcept;
    const ColliderDocument& committedDocument() const noexcept { return history_.current(); }

    const std::vector<Point2>& drawingPoints() const noexcept { return state_.draft.points; }
    const std::string& selectedColliderId() const noexcept { return state_.selectedColliderId; }
    std::optional<std::size_t> selectedPointIndex() const noexcept { return state_.selectedPointIndex; }
    const Collider* selectedCollider() const;
    std::optional<Point2> cursorWorld() const noexcept { return state_.cursorWorld; }
    bool canCloseAtCursor() const;
    const std::optional<PendingPropertyEdit>& pendingPropertyEdit() const noexcept { return state_.pendingProperty; }

    // ==============================================================================
    // Configuration / Output
    // ==============================================================================
    void setGridSnapEnabled(bool enabled) { config_.gridSnapEnabled = enabled; }
    void setView(const ViewTransform& view);
    void setCommitCallback(DocumentCallback callback) { onCommit_ = std::move(callback); }
    void setPreviewCallback(DocumentCallback callback) { onPreview_ = std::move(callback); }

    // Switches the edit target. History and all transient state are discarded.
    void loadDocument(const ColliderDocument& doc);

    // ==============================================================================
    // History
    // ==============================================================================
    bool canUndo() const noexcept { return !isDragging() && history_.canUndo(); }
    bool canRedo() const noexcept { return !isDragging() && history_.canRedo(); }
    bool undo();
    bool redo();
    const DocumentHistory& history() const noexcept { return history_; }

    // ==============================================================================
    // Input Events (screen space)
    // ==============================================================================
    void handlePointerDown(const PointerEvent& e);
    void handlePointerMove(const PointerEvent& e);
    void handlePointerUp(const PointerEvent& e);
    void handleKeyDown(const KeyEvent& e);
    void handleWheel(const WheelEvent& e);

    // ==============================================================================
    // Drawing
    // ==============================================================================
    void startDrawing();
    void cancelDrawing();
    // Closes the draw session when it has at least three points.
    bool finishDrawing();

    // ==============================================================================
    // Selection
    // ==============================================================================
    bool selectCollider(const std::string& id);
    bool selectPoint(std::size_t index);
    void clearSelection();

    // ==============================================================================
    // Discrete Edits (committed immediately)
    // ==============================================================================
    EditorError deleteSelectedPoint();
    EditorError deleteCollider(const std::string& id);
    EditorError insertPoint(const std::string& id, std::size_t edgeIndex, Point2 position);
    EditorError setPointPosition(const std::string& id, std::size_t index, Point2 position);
    EditorError setColliderName(const std::string& id, const std::string& name);
    EditorError setColliderType(const std::string& id, const std::string& type);
    EditorError nudgeSelection(float dx, float dy);

    // Property bag of the selected collider, or of the document when nothing
    // is selected.
    EditorError beginAddProperty();
    EditorError beginRenameProperty(const std::string& key);
    EditorError commitPropertyKey(const std::string& newKey);
    void cancelPropertyEdit();
    EditorError setPropertyValue(const std::string& key, const std::string& value);
    EditorError deleteProperty(const std::string& key);

    // ==============================================================================
    // Context Menu
    // ==============================================================================
    ContextAction resolveContextMenu(float screenX, float screenY) const;
    EditorError applyContextAction(const ContextAction& action);

private:
    bool isDragging() const noexcept {
        return state_.mode == InteractionMode::DraggingPoint || state_.mode == InteractionMode::DraggingPolygon;
    }

    void enterMode(InteractionMode mode);
    Point2 toWorld(float screenX, float screenY, bool snap) const;
    float hitThreshold() const;

    // Normalizes, pushes to history and notifies. Returns true when an entry was added.
    bool commitDocument(const ColliderDocument& next);
    // Shared tail of every discrete edit.
    EditorError applyEdit(EditorError err, const ColliderDocument& next);
    void reconcileSelection();
    void notifyCommit();
    void notifyPreview();

    void beginPointDrag(std::size_t pointIndex);
    void beginPolygonDrag(const Point2& anchor);
    void updateDrag(float screenX, float screenY);
    void endDrag();
    void abortDrag(const char* reason);
    bool finalizeDrawing();

    EditorConfig config_;
    DocumentHistory history_;
    InteractionState state_;
    ColliderDocument working_;
    std::uint32_t nextColliderId_ = 1;
    EditorError lastError_ = EditorError::Ok;

    DocumentCallback onCommit_;
    DocumentCallback onPreview_;
};

} // namespace editor
