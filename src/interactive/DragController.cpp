#include "sankeyedit/interactive/DragController.h"
#include "sankeyedit/overlay/OverlayStore.h"
#include "sankeyedit/history/ActionLog.h"
#include "sankeyedit/history/EditCommands.h"
#include "sankeyedit/sync/LayoutSynchronizer.h"
#include "sankeyedit/render/IRenderTarget.h"
#include "sankeyedit/editor/EditorConfig.h"
#include "sankeyedit/common/Logger.h"

namespace sankeyedit {

const char* toString(DragOutcome outcome) {
    switch (outcome) {
        case DragOutcome::Ignored: return "ignored";
        case DragOutcome::Committed: return "committed";
        case DragOutcome::Click: return "click";
    }
    return "ignored";
}

DragController::DragController(OverlayStore& overlays,
                               ActionLog& history,
                               LayoutSynchronizer& synchronizer,
                               IRenderTarget& renderTarget,
                               const EditorConfig& config)
    : overlays_(overlays)
    , history_(history)
    , synchronizer_(synchronizer)
    , renderTarget_(renderTarget)
    , config_(config) {}

// =============================================================================
// Transitions
// =============================================================================

EditStatus DragController::startDrag(ElementKind kind, const std::string& targetId,
                                     float startX, float startY) {
    if (targetId.empty()) {
        LOG_WARN("startDrag rejected: empty {} id", toString(kind));
        return EditStatus::fail("empty target id");
    }
    if (!isFinite(startX) || !isFinite(startY)) {
        LOG_WARN("startDrag rejected: non-finite start ({}, {}) for '{}'", startX, startY, targetId);
        return EditStatus::fail("non-finite start coordinates");
    }

    bool laidOut = (kind == ElementKind::Node) ? synchronizer_.getBasePosition(targetId).has_value()
                                               : synchronizer_.getLabelBasePosition(targetId).has_value();
    auto effective = synchronizer_.getEffectivePosition(kind, targetId);
    if (!laidOut || !effective) {
        LOG_WARN("startDrag rejected: {} '{}' is not laid out", toString(kind), targetId);
        return EditStatus::fail("target is not laid out");
    }

    if (session_) {
        LOG_DEBUG("Cancelling stale drag of '{}' before starting '{}'", session_->targetId, targetId);
        cancelDrag();
    }

    Point baseline = *effective;

    DragSession session;
    session.kind = kind;
    session.targetId = targetId;
    session.startX = startX;
    session.startY = startY;
    session.currentX = startX;
    session.currentY = startY;
    session.baselineX = baseline.x;
    session.baselineY = baseline.y;
    session_ = session;

    LOG_DEBUG("Drag started: {} '{}' baseline ({}, {})", toString(kind), targetId, baseline.x, baseline.y);
    return EditStatus::ok();
}

void DragController::updateDrag(float currentX, float currentY) {
    if (!session_) {
        return;
    }
    if (!isFinite(currentX) || !isFinite(currentY)) {
        LOG_WARN("Ignoring non-finite drag sample ({}, {})", currentX, currentY);
        return;
    }

    session_->currentX = currentX;
    session_->currentY = currentY;
    place(session_->kind, session_->targetId, *transientPosition());
}

DragOutcome DragController::endDrag() {
    if (!session_) {
        return DragOutcome::Ignored;
    }

    Point moved = delta();
    Point start{session_->startX, session_->startY};
    Point current{session_->currentX, session_->currentY};
    if (config_.dragThreshold > 0.0f && start.distanceTo(current) < config_.dragThreshold) {
        LOG_DEBUG("Drag of '{}' below threshold, treating as click", session_->targetId);
        cancelDrag();
        return DragOutcome::Click;
    }

    // The session is consumed before the action is performed so listeners
    // observe the controller as Idle
    DragSession session = *session_;
    session_.reset();

    if (session.kind == ElementKind::Node) {
        auto oldOffset = overlays_.getNodeOffset(session.targetId);
        Offset newOffset = oldOffset.value_or(Offset{}) + Offset{moved.x, moved.y};
        if (!isFinite(newOffset.dx) || !isFinite(newOffset.dy)) {
            LOG_WARN("Drag of '{}' overflowed, nothing committed", session.targetId);
            place(session.kind, session.targetId, Point{session.baselineX, session.baselineY});
            return DragOutcome::Ignored;
        }
        history_.perform(EditCommands::createNodePositionAction(session.targetId, oldOffset, newOffset));
    } else {
        auto oldPosition = overlays_.getLabelPosition(session.targetId);
        Point newPosition = Point{session.baselineX, session.baselineY} + moved;
        if (!isFinite(newPosition.x) || !isFinite(newPosition.y)) {
            LOG_WARN("Drag of label '{}' overflowed, nothing committed", session.targetId);
            place(session.kind, session.targetId, Point{session.baselineX, session.baselineY});
            return DragOutcome::Ignored;
        }
        history_.perform(EditCommands::createLabelPositionAction(session.targetId, oldPosition, newPosition));
    }

    LOG_DEBUG("Drag committed: {} '{}' by ({}, {})", toString(session.kind), session.targetId, moved.x, moved.y);
    return DragOutcome::Committed;
}

bool DragController::cancelDrag() {
    if (!session_) {
        return false;
    }

    place(session_->kind, session_->targetId, Point{session_->baselineX, session_->baselineY});
    LOG_DEBUG("Drag cancelled: {} '{}'", toString(session_->kind), session_->targetId);
    session_.reset();
    return true;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<ElementKind> DragController::dragKind() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->kind;
}

std::optional<std::string> DragController::targetId() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->targetId;
}

Point DragController::delta() const {
    if (!session_) {
        return Point{};
    }
    return {session_->currentX - session_->startX, session_->currentY - session_->startY};
}

std::optional<Point> DragController::transientPosition() const {
    if (!session_) {
        return std::nullopt;
    }
    return Point{session_->baselineX, session_->baselineY} + delta();
}

// =============================================================================
// Helpers
// =============================================================================

void DragController::place(ElementKind kind, const std::string& id, const Point& position) {
    if (kind == ElementKind::Node) {
        renderTarget_.placeNode(id, position);
    } else {
        renderTarget_.placeLabel(id, position);
    }
}

}  // namespace sankeyedit
