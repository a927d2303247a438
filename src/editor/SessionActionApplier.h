#pragma once

#include "sankeyedit/history/Action.h"

namespace sankeyedit {

class DiagramModel;
class OverlayStore;
class LayoutSynchronizer;

/// Routes undo/redo/commit payloads to the session's stores.
///
/// Position and reset payloads only re-apply overlays; structural and
/// property payloads go through a full layout recompute.
class SessionActionApplier : public IActionApplier {
public:
    SessionActionApplier(DiagramModel& model, OverlayStore& overlays, LayoutSynchronizer& synchronizer);

    void apply(const ActionPayload& payload) override;

private:
    DiagramModel& model_;
    OverlayStore& overlays_;
    LayoutSynchronizer& synchronizer_;

    void applyPayload(const NodePositionPayload& payload);
    void applyPayload(const LabelPositionPayload& payload);
    void applyPayload(const PropertyChangePayload& payload);
    void applyPayload(const FlowPayload& payload);
    void applyPayload(const NodePayload& payload);
    void applyPayload(const OverlayResetPayload& payload);
};

}  // namespace sankeyedit
