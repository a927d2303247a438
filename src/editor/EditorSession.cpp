#include "sankeyedit/editor/EditorSession.h"
#include "sankeyedit/common/Logger.h"
#include "SessionActionApplier.h"

namespace sankeyedit {

EditorSession::EditorSession(ILayoutEngine& engine, IRenderTarget& renderTarget, EditorConfig config)
    : config_(std::move(config))
    , synchronizer_(overlays_, model_, engine, renderTarget, config_)
    , applier_(std::make_unique<SessionActionApplier>(model_, overlays_, synchronizer_))
    , history_(*applier_, config_.maxUndoStack)
    , drag_(overlays_, history_, synchronizer_, renderTarget, config_)
    , commands_(history_, model_, overlays_, config_) {
    if (!config_.logDirectory.empty()) {
        Logger::initialize(config_.logDirectory, config_.logToFile);
    }
    LOG_DEBUG("Editor session created (undo bound {})", history_.maxStackSize());
}

EditorSession::~EditorSession() = default;

void EditorSession::resetSession() {
    drag_.cancelDrag();
    model_.clear();
    overlays_.clearAll();
    synchronizer_.clearBasePositions();
    history_.clear();
    synchronizer_.triggerRerender();
    LOG_INFO("Session reset");
}

SessionState EditorSession::sessionState() const {
    SessionState state;
    state.hasData = hasData();
    state.flowCount = model_.flowCount();
    state.propertyCount = model_.propertyCount();
    state.nodeOffsetCount = overlays_.nodeOffsetCount();
    state.labelPositionCount = overlays_.labelPositionCount();
    state.undoCount = history_.undoCount();
    state.redoCount = history_.redoCount();
    state.dragging = drag_.isDragging();
    return state;
}

}  // namespace sankeyedit
