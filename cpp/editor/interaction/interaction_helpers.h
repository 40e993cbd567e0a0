#pragma once

#include "editor/interaction/editor_config.h"
#include "editor/interaction/interaction_types.h"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace interaction_detail {
constexpr std::uint32_t kShiftMask = static_cast<std::uint32_t>(editor::Modifier::Shift);
constexpr std::uint32_t kCtrlMask = static_cast<std::uint32_t>(editor::Modifier::Ctrl);
constexpr std::uint32_t kMetaMask = static_cast<std::uint32_t>(editor::Modifier::Meta);

inline bool hasShift(std::uint32_t modifiers) { return (modifiers & kShiftMask) != 0; }

inline bool isZoomModifier(std::uint32_t modifiers) {
    return (modifiers & (kCtrlMask | kMetaMask)) != 0;
}

inline float normalizeViewScale(float viewScale) {
    return (viewScale > 1e-6f && std::isfinite(viewScale)) ? viewScale : 1.0f;
}

// Canvas space has Y pointing down like the screen, so no flip here.
inline editor::Point2 screenToWorld(float screenX, float screenY, const editor::ViewTransform& view) {
    const float scale = normalizeViewScale(view.scale);
    return editor::Point2{(screenX - view.panX) / scale, (screenY - view.panY) / scale};
}

inline bool isGridSnapEnabled(const editor::EditorConfig& config) {
    return config.gridSnapEnabled && config.gridSize > 0.0001f;
}

inline float snapCoord(float v, const editor::EditorConfig& config) {
    if (!isGridSnapEnabled(config)) return v;
    const float s = config.gridSize;
    return std::round(v / s) * s;
}

inline editor::Point2 applyGridSnap(const editor::Point2& p, const editor::EditorConfig& config) {
    return editor::Point2{snapCoord(p.x, config), snapCoord(p.y, config)};
}

inline editor::Point2 clampToBounds(const editor::Point2& p, const editor::EditorConfig& config) {
    editor::Point2 out = p;
    if (config.boundsWidth > 0.0f) out.x = std::max(0.0f, std::min(config.boundsWidth, out.x));
    if (config.boundsHeight > 0.0f) out.y = std::max(0.0f, std::min(config.boundsHeight, out.y));
    return out;
}

// Screen-pixel tolerance expressed in world units at the current zoom.
inline float worldThreshold(const editor::EditorConfig& config, const editor::ViewTransform& view) {
    return config.hitThresholdPx / normalizeViewScale(view.scale);
}
} // namespace interaction_detail
