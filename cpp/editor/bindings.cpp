#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "editor/interaction/interaction_controller.h"
#include "editor/geometry/geometry_kit.h"

#ifdef EMSCRIPTEN
namespace {
using editor::InteractionController;

// Optional indices cross the boundary as -1 when absent.
int optionalIndex(const std::optional<std::size_t>& index) {
    return index ? static_cast<int>(*index) : -1;
}

const editor::Collider* colliderAt(const InteractionController& self, std::uint32_t index) {
    const auto& colliders = self.document().colliders;
    return index < colliders.size() ? &colliders[index] : nullptr;
}

std::vector<std::string> propertyKeys(const editor::PropertyMap* props) {
    std::vector<std::string> keys;
    if (!props) return keys;
    for (const auto& kv : *props) keys.push_back(kv.first);
    return keys;
}
} // namespace

EMSCRIPTEN_BINDINGS(collider_editor_module) {
    using namespace editor;

    emscripten::enum_<InteractionMode>("InteractionMode")
        .value("Idle", InteractionMode::Idle)
        .value("Drawing", InteractionMode::Drawing)
        .value("DraggingPoint", InteractionMode::DraggingPoint)
        .value("DraggingPolygon", InteractionMode::DraggingPolygon)
        .value("Panning", InteractionMode::Panning);

    emscripten::enum_<EditorError>("EditorError")
        .value("Ok", EditorError::Ok)
        .value("ColliderNotFound", EditorError::ColliderNotFound)
        .value("PointIndexOutOfRange", EditorError::PointIndexOutOfRange)
        .value("EdgeIndexOutOfRange", EditorError::EdgeIndexOutOfRange)
        .value("MinimumPointCount", EditorError::MinimumPointCount)
        .value("PropertyNotFound", EditorError::PropertyNotFound)
        .value("DuplicateKey", EditorError::DuplicateKey)
        .value("InvalidKey", EditorError::InvalidKey)
        .value("NoChange", EditorError::NoChange)
        .value("InvalidState", EditorError::InvalidState);

    emscripten::enum_<PointerButton>("PointerButton")
        .value("Left", PointerButton::Left)
        .value("Middle", PointerButton::Middle)
        .value("Right", PointerButton::Right);

    emscripten::enum_<Key>("Key")
        .value("Unknown", Key::Unknown)
        .value("Escape", Key::Escape)
        .value("Enter", Key::Enter)
        .value("Delete", Key::Delete)
        .value("Backspace", Key::Backspace)
        .value("ArrowUp", Key::ArrowUp)
        .value("ArrowDown", Key::ArrowDown)
        .value("ArrowLeft", Key::ArrowLeft)
        .value("ArrowRight", Key::ArrowRight);

    emscripten::enum_<ContextActionKind>("ContextActionKind")
        .value("None", ContextActionKind::None)
        .value("DeletePoint", ContextActionKind::DeletePoint)
        .value("InsertPoint", ContextActionKind::InsertPoint)
        .value("DeleteCollider", ContextActionKind::DeleteCollider)
        .value("CreateCollider", ContextActionKind::CreateCollider);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<ViewTransform>("ViewTransform")
        .field("panX", &ViewTransform::panX)
        .field("panY", &ViewTransform::panY)
        .field("scale", &ViewTransform::scale);

    emscripten::value_object<PointerEvent>("PointerEvent")
        .field("button", &PointerEvent::button)
        .field("x", &PointerEvent::x)
        .field("y", &PointerEvent::y)
        .field("modifiers", &PointerEvent::modifiers);

    emscripten::value_object<KeyEvent>("KeyEvent")
        .field("key", &KeyEvent::key)
        .field("modifiers", &KeyEvent::modifiers);

    emscripten::value_object<WheelEvent>("WheelEvent")
        .field("x", &WheelEvent::x)
        .field("y", &WheelEvent::y)
        .field("deltaX", &WheelEvent::deltaX)
        .field("deltaY", &WheelEvent::deltaY)
        .field("modifiers", &WheelEvent::modifiers);

    emscripten::value_object<ContextAction>("ContextAction")
        .field("kind", &ContextAction::kind)
        .field("colliderId", &ContextAction::colliderId)
        .field("pointIndex", &ContextAction::pointIndex)
        .field("edgeIndex", &ContextAction::edgeIndex)
        .field("position", &ContextAction::position);

    emscripten::register_vector<Point2>("VectorPoint2");
    emscripten::register_vector<std::string>("VectorString");

    emscripten::class_<InteractionController>("InteractionController")
        .constructor<>()
        .function("getMode", emscripten::optional_override([](const InteractionController& self) { return self.mode(); }))
        .function("getLastError", emscripten::optional_override([](const InteractionController& self) { return self.lastError(); }))
        .function("getView", emscripten::optional_override([](const InteractionController& self) {
            return self.view();
        }))
        .function("setView", &InteractionController::setView)
        .function("setGridSnapEnabled", &InteractionController::setGridSnapEnabled)
        // Input
        .function("handlePointerDown", &InteractionController::handlePointerDown)
        .function("handlePointerMove", &InteractionController::handlePointerMove)
        .function("handlePointerUp", &InteractionController::handlePointerUp)
        .function("handleKeyDown", &InteractionController::handleKeyDown)
        .function("handleWheel", &InteractionController::handleWheel)
        // History
        .function("canUndo", emscripten::optional_override([](const InteractionController& self) { return self.canUndo(); }))
        .function("canRedo", emscripten::optional_override([](const InteractionController& self) { return self.canRedo(); }))
        .function("undo", &InteractionController::undo)
        .function("redo", &InteractionController::redo)
        .function("getHistoryGeneration", emscripten::optional_override([](const InteractionController& self) {
            return self.history().getGeneration();
        }))
        // Drawing
        .function("startDrawing", &InteractionController::startDrawing)
        .function("cancelDrawing", &InteractionController::cancelDrawing)
        .function("finishDrawing", &InteractionController::finishDrawing)
        .function("getDrawingPoints", emscripten::optional_override([](const InteractionController& self) {
            return self.drawingPoints();
        }))
        .function("canCloseAtCursor", &InteractionController::canCloseAtCursor)
        // Selection
        .function("selectCollider", &InteractionController::selectCollider)
        .function("selectPoint", emscripten::optional_override([](InteractionController& self, std::uint32_t index) {
            return self.selectPoint(index);
        }))
        .function("clearSelection", &InteractionController::clearSelection)
        .function("getSelectedColliderId", emscripten::optional_override([](const InteractionController& self) {
            return self.selectedColliderId();
        }))
        .function("getSelectedPointIndex", emscripten::optional_override([](const InteractionController& self) {
            return optionalIndex(self.selectedPointIndex());
        }))
        // Document reads
        .function("getColliderCount", emscripten::optional_override([](const InteractionController& self) {
            return static_cast<std::uint32_t>(self.document().colliders.size());
        }))
        .function("getColliderId", emscripten::optional_override([](const InteractionController& self, std::uint32_t index) {
            const Collider* c = colliderAt(self, index);
            return c ? c->id : std::string();
        }))
        .function("getColliderName", emscripten::optional_override([](const InteractionController& self, std::uint32_t index) {
            const Collider* c = colliderAt(self, index);
            return c ? c->name : std::string();
        }))
        .function("getColliderType", emscripten::optional_override([](const InteractionController& self, std::uint32_t index) {
            const Collider* c = colliderAt(self, index);
            return c ? c->type : std::string();
        }))
        .function("getColliderPoints", emscripten::optional_override([](const InteractionController& self, std::uint32_t index) {
            const Collider* c = colliderAt(self, index);
            return c ? c->points : std::vector<Point2>();
        }))
        .function("getColliderCenter", emscripten::optional_override([](const InteractionController& self, std::uint32_t index) {
            const Collider* c = colliderAt(self, index);
            return c ? geometry::polygonCenter(c->points) : Point2{0.0f, 0.0f};
        }))
        .function("getPropertyKeys", emscripten::optional_override([](const InteractionController& self, const std::string& colliderId) {
            return propertyKeys(document::findProperties(self.document(), colliderId));
        }))
        .function("getPropertyValue", emscripten::optional_override([](const InteractionController& self, const std::string& colliderId, const std::string& key) {
            const PropertyMap* props = document::findProperties(self.document(), colliderId);
            if (!props) return std::string();
            const auto it = props->find(key);
            return it != props->end() ? it->second : std::string();
        }))
        // Edits
        .function("deleteSelectedPoint", &InteractionController::deleteSelectedPoint)
        .function("deleteCollider", &InteractionController::deleteCollider)
        .function("insertPoint", emscripten::optional_override([](InteractionController& self, const std::string& id, std::uint32_t edgeIndex, float x, float y) {
            return self.insertPoint(id, edgeIndex, Point2{x, y});
        }))
        .function("setPointPosition", emscripten::optional_override([](InteractionController& self, const std::string& id, std::uint32_t index, float x, float y) {
            return self.setPointPosition(id, index, Point2{x, y});
        }))
        .function("setColliderName", &InteractionController::setColliderName)
        .function("setColliderType", &InteractionController::setColliderType)
        .function("nudgeSelection", &InteractionController::nudgeSelection)
        // Properties
        .function("beginAddProperty", &InteractionController::beginAddProperty)
        .function("beginRenameProperty", &InteractionController::beginRenameProperty)
        .function("commitPropertyKey", &InteractionController::commitPropertyKey)
        .function("cancelPropertyEdit", &InteractionController::cancelPropertyEdit)
        .function("setPropertyValue", &InteractionController::setPropertyValue)
        .function("deleteProperty", &InteractionController::deleteProperty)
        // Context menu
        .function("resolveContextMenu", &InteractionController::resolveContextMenu)
        .function("applyContextAction", &InteractionController::applyContextAction);
}
#endif
