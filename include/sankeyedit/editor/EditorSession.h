#pragma once

#include "EditorConfig.h"
#include "../core/DiagramModel.h"
#include "../overlay/OverlayStore.h"
#include "../sync/LayoutSynchronizer.h"
#include "../history/ActionLog.h"
#include "../history/EditCommands.h"
#include "../interactive/DragController.h"

#include <memory>

namespace sankeyedit {

class ILayoutEngine;
class IRenderTarget;

/// Counters describing the current session (diagnostics and tests)
struct SessionState {
    bool hasData = false;
    size_t flowCount = 0;
    size_t propertyCount = 0;
    size_t nodeOffsetCount = 0;
    size_t labelPositionCount = 0;
    size_t undoCount = 0;
    size_t redoCount = 0;
    bool dragging = false;
};

/// One editing session: owns every store and controller and wires them.
///
/// The layout engine and render target are external collaborators and must
/// outlive the session.
///
/// Usage:
///   ColumnLayoutEngine engine;
///   RecordingRenderTarget target;
///   EditorSession session(engine, target);
///   session.commands().addFlow("Salary", "Budget", 3000);
///   session.drag().startDrag(ElementKind::Node, "Budget", 0, 0);
///   session.drag().updateDrag(10, 5);
///   session.drag().endDrag();
///   session.history().undo();
///
class EditorSession {
public:
    EditorSession(ILayoutEngine& engine, IRenderTarget& renderTarget, EditorConfig config = EditorConfig{});
    ~EditorSession();

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    const EditorConfig& config() const { return config_; }

    const DiagramModel& model() const { return model_; }

    OverlayStore& overlays() { return overlays_; }
    const OverlayStore& overlays() const { return overlays_; }

    LayoutSynchronizer& synchronizer() { return synchronizer_; }
    const LayoutSynchronizer& synchronizer() const { return synchronizer_; }

    ActionLog& history() { return history_; }
    const ActionLog& history() const { return history_; }

    DragController& drag() { return drag_; }
    const DragController& drag() const { return drag_; }

    EditCommands& commands() { return commands_; }

    /// Clear diagram data, overrides, base positions and history, then run
    /// an empty layout pass. Listeners registered on the history survive.
    void resetSession();

    bool hasData() const { return !model_.empty(); }

    SessionState sessionState() const;

private:
    EditorConfig config_;
    DiagramModel model_;
    OverlayStore overlays_;
    LayoutSynchronizer synchronizer_;
    std::unique_ptr<IActionApplier> applier_;
    ActionLog history_;
    DragController drag_;
    EditCommands commands_;
};

}  // namespace sankeyedit
