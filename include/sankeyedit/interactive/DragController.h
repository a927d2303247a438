#pragma once

#include "../core/Types.h"
#include "../core/EditStatus.h"

#include <optional>
#include <string>

namespace sankeyedit {

class OverlayStore;
class ActionLog;
class LayoutSynchronizer;
class IRenderTarget;
struct EditorConfig;

/// State of the single in-flight interactive move
struct DragSession {
    ElementKind kind = ElementKind::Node;
    std::string targetId;
    float startX = 0.0f;
    float startY = 0.0f;
    float currentX = 0.0f;
    float currentY = 0.0f;
    float baselineX = 0.0f;      ///< Effective position when the drag started
    float baselineY = 0.0f;
};

/// What endDrag() did
enum class DragOutcome {
    Ignored,     ///< No active session, or the move left the finite range
    Committed,   ///< Overlay written and one action recorded
    Click        ///< Moved less than the drag threshold; treated as a cancel
};

const char* toString(DragOutcome outcome);

/// Drag state machine (Idle <-> Active).
///
/// While Active, pointer samples only move the element on the render target.
/// Nothing reaches the overlay store until endDrag(), so cancelDrag() leaves
/// both the store and the action log untouched.
///
/// Usage:
///   drag.startDrag(ElementKind::Node, "N1", 0, 0);
///   drag.updateDrag(10, 5);       // visual feedback only
///   drag.endDrag();               // offset {10, 5}, one action recorded
///
class DragController {
public:
    DragController(OverlayStore& overlays,
                   ActionLog& history,
                   LayoutSynchronizer& synchronizer,
                   IRenderTarget& renderTarget,
                   const EditorConfig& config);

    // =========================================================================
    // Transitions
    // =========================================================================

    /// Idle -> Active. An already active session is cancelled first.
    /// Rejects an empty id, non-finite coordinates or an element that is not
    /// laid out, without touching the current session.
    EditStatus startDrag(ElementKind kind, const std::string& targetId, float startX, float startY);

    /// Ignored while Idle
    void updateDrag(float currentX, float currentY);

    /// Active -> Idle, committing the move
    DragOutcome endDrag();

    /// Active -> Idle, restoring the baseline. Returns false while Idle.
    bool cancelDrag();

    // =========================================================================
    // Queries
    // =========================================================================

    bool isDragging() const { return session_.has_value(); }
    std::optional<ElementKind> dragKind() const;
    std::optional<std::string> targetId() const;

    /// current - start, or {0, 0} while Idle
    Point delta() const;

    /// baseline + delta, or std::nullopt while Idle
    std::optional<Point> transientPosition() const;

    const std::optional<DragSession>& session() const { return session_; }

private:
    OverlayStore& overlays_;
    ActionLog& history_;
    LayoutSynchronizer& synchronizer_;
    IRenderTarget& renderTarget_;
    const EditorConfig& config_;

    std::optional<DragSession> session_;

    void place(ElementKind kind, const std::string& id, const Point& position);
};

}  // namespace sankeyedit
