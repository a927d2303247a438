#include "SessionActionApplier.h"
#include "sankeyedit/core/DiagramModel.h"
#include "sankeyedit/overlay/OverlayStore.h"
#include "sankeyedit/sync/LayoutSynchronizer.h"
#include "sankeyedit/common/Logger.h"

namespace sankeyedit {

SessionActionApplier::SessionActionApplier(DiagramModel& model,
                                           OverlayStore& overlays,
                                           LayoutSynchronizer& synchronizer)
    : model_(model)
    , overlays_(overlays)
    , synchronizer_(synchronizer) {}

void SessionActionApplier::apply(const ActionPayload& payload) {
    std::visit([this](const auto& p) { applyPayload(p); }, payload);
}

void SessionActionApplier::applyPayload(const NodePositionPayload& payload) {
    if (payload.offset) {
        EditStatus status = overlays_.setNodeOffset(payload.nodeId, payload.offset->dx, payload.offset->dy);
        if (!status) {
            LOG_WARN("Node position for '{}' not applied: {}", payload.nodeId, status.reason);
            return;
        }
    } else {
        overlays_.clearNodeOffset(payload.nodeId);
    }
    synchronizer_.applyOverlays();
}

void SessionActionApplier::applyPayload(const LabelPositionPayload& payload) {
    if (payload.position) {
        EditStatus status = overlays_.setLabelPosition(payload.nodeId, payload.position->x, payload.position->y);
        if (!status) {
            LOG_WARN("Label position for '{}' not applied: {}", payload.nodeId, status.reason);
            return;
        }
    } else {
        overlays_.clearLabelPosition(payload.nodeId);
    }
    synchronizer_.applyOverlays();
}

void SessionActionApplier::applyPayload(const PropertyChangePayload& payload) {
    model_.setProperty(payload.elementType, payload.elementId, payload.property, payload.value);
    synchronizer_.triggerRerender();
}

void SessionActionApplier::applyPayload(const FlowPayload& payload) {
    if (payload.value) {
        EditStatus status = model_.addFlow(payload.source, payload.target, *payload.value);
        if (!status) {
            LOG_WARN("Flow {} -> {} not applied: {}", payload.source, payload.target, status.reason);
            return;
        }
    } else if (!model_.removeFlow(payload.source, payload.target)) {
        // Already gone
        LOG_DEBUG("No flow {} -> {} to remove", payload.source, payload.target);
        return;
    }
    synchronizer_.triggerRerender();
}

void SessionActionApplier::applyPayload(const NodePayload& payload) {
    if (payload.flows) {
        model_.insertFlows(*payload.flows);
    } else if (model_.removeNode(payload.name).empty()) {
        LOG_DEBUG("No node '{}' to remove", payload.name);
        return;
    }
    synchronizer_.triggerRerender();
}

void SessionActionApplier::applyPayload(const OverlayResetPayload& payload) {
    if (payload.kind == ElementKind::Node) {
        overlays_.replaceNodeOffsets(payload.nodeOffsets);
    } else {
        overlays_.replaceLabelPositions(payload.labelPositions);
    }
    synchronizer_.applyOverlays();
}

}  // namespace sankeyedit
