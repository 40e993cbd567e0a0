#pragma once

#include "editor/core/types.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace editor {

enum class InteractionMode : std::uint8_t {
    Idle = 0,
    Drawing = 1,
    DraggingPoint = 2,
    DraggingPolygon = 3,
    Panning = 4
};

inline const char* interactionModeName(InteractionMode mode) noexcept {
    switch (mode) {
        case InteractionMode::Idle: return "Idle";
        case InteractionMode::Drawing: return "Drawing";
        case InteractionMode::DraggingPoint: return "DraggingPoint";
        case InteractionMode::DraggingPolygon: return "DraggingPolygon";
        case InteractionMode::Panning: return "Panning";
    }
    return "Unknown";
}

// DOM button numbering.
enum class PointerButton : std::uint8_t {
    Left = 0,
    Middle = 1,
    Right = 2
};

enum class Modifier : std::uint32_t {
    Shift = 1 << 0,
    Ctrl = 1 << 1,
    Alt = 1 << 2,
    Meta = 1 << 3,
};

enum class Key : std::uint8_t {
    Unknown = 0,
    Escape,
    Enter,
    Delete,
    Backspace,
    ArrowUp,
    ArrowDown,
    ArrowLeft,
    ArrowRight
};

// Screen-space pointer sample (pixels relative to the canvas origin).
struct PointerEvent {
    PointerButton button;
    float x;
    float y;
    std::uint32_t modifiers;
};

struct KeyEvent {
    Key key;
    std::uint32_t modifiers;
};

struct WheelEvent {
    float x;
    float y;
    float deltaX;
    float deltaY;
    std::uint32_t modifiers;
};

struct ViewTransform {
    float panX;
    float panY;
    float scale;
};

// Action a right-click resolves to. Which fields are meaningful depends on
// `kind`; `position` is in world units and unsnapped.
enum class ContextActionKind : std::uint8_t {
    None = 0,
    DeletePoint = 1,
    InsertPoint = 2,
    DeleteCollider = 3,
    CreateCollider = 4
};

struct ContextAction {
    ContextActionKind kind = ContextActionKind::None;
    std::string colliderId;
    std::size_t pointIndex = 0;
    std::size_t edgeIndex = 0;
    Point2 position{0.0f, 0.0f};
};

// Key currently being typed in a property editor. An empty originalKey
// means the property does not exist yet.
struct PendingPropertyEdit {
    std::string colliderId;
    std::string originalKey;
    bool isNew = false;
};

} // namespace editor
