#pragma once

/// @file sankeyedit.h
/// @brief Main header for the SankeyEdit diagram editing core
///
/// SankeyEdit keeps user position overrides for automatically laid-out
/// diagram elements, merges them with every fresh layout pass and makes
/// each edit undoable.
///
/// Example usage:
/// @code
/// #include <sankeyedit/sankeyedit.h>
///
/// sankeyedit::ColumnLayoutEngine engine;
/// sankeyedit::RecordingRenderTarget target;
/// sankeyedit::EditorSession session(engine, target);
///
/// session.commands().addFlow("Salary", "Budget", 3000);
/// session.drag().startDrag(sankeyedit::ElementKind::Node, "Budget", 0, 0);
/// session.drag().updateDrag(10, 5);
/// session.drag().endDrag();
/// session.history().undo();
/// @endcode

// Core module - Value types and diagram data
#include "core/Types.h"
#include "core/EditStatus.h"
#include "core/DiagramModel.h"

// Overlay module - User position overrides
#include "overlay/OverlayState.h"
#include "overlay/OverlayStore.h"
#include "overlay/OverlaySerializer.h"

// Layout and render collaborators
#include "layout/ILayoutEngine.h"
#include "layout/ColumnLayoutEngine.h"
#include "render/IRenderTarget.h"
#include "render/RecordingRenderTarget.h"

// Editing
#include "sync/LayoutSynchronizer.h"
#include "history/Action.h"
#include "history/ActionLog.h"
#include "history/EditCommands.h"
#include "interactive/DragController.h"
#include "editor/EditorConfig.h"
#include "editor/EditorSession.h"
#include "util/ValidationUtils.h"

namespace sankeyedit {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace sankeyedit
