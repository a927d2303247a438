#include "sankeyedit/history/EditCommands.h"
#include "sankeyedit/history/ActionLog.h"
#include "sankeyedit/overlay/OverlayStore.h"
#include "sankeyedit/editor/EditorConfig.h"
#include "sankeyedit/common/Logger.h"

#include <cmath>

namespace sankeyedit {

EditCommands::EditCommands(ActionLog& log,
                           const DiagramModel& model,
                           const OverlayStore& overlays,
                           const EditorConfig& config)
    : log_(log)
    , model_(model)
    , overlays_(overlays)
    , config_(config) {}

EditStatus EditCommands::reject(const std::string& reason) {
    LOG_WARN("Edit rejected: {}", reason);
    return EditStatus::fail(reason);
}

// =============================================================================
// Action Factories
// =============================================================================

Action EditCommands::createNodePositionAction(const std::string& nodeId,
                                              const std::optional<Offset>& oldOffset,
                                              const Offset& newOffset) {
    Action action;
    action.type = ActionType::NodePosition;
    action.forward = NodePositionPayload{nodeId, newOffset};
    action.inverse = NodePositionPayload{nodeId, oldOffset};
    action.description = std::format("Move node \"{}\"", nodeId);
    return action;
}

Action EditCommands::createLabelPositionAction(const std::string& nodeId,
                                               const std::optional<Point>& oldPosition,
                                               const Point& newPosition) {
    Action action;
    action.type = ActionType::LabelPosition;
    action.forward = LabelPositionPayload{nodeId, newPosition};
    action.inverse = LabelPositionPayload{nodeId, oldPosition};
    action.description = std::format("Move label for \"{}\"", nodeId);
    return action;
}

Action EditCommands::createPropertyChangeAction(const std::string& elementType,
                                                const std::string& elementId,
                                                const std::string& property,
                                                const std::optional<PropertyValue>& oldValue,
                                                const std::optional<PropertyValue>& newValue) {
    Action action;
    action.type = ActionType::PropertyChange;
    action.forward = PropertyChangePayload{elementType, elementId, property, newValue};
    action.inverse = PropertyChangePayload{elementType, elementId, property, oldValue};
    action.description = std::format("Change {} of {} \"{}\"", property, elementType, elementId);
    return action;
}

Action EditCommands::createFlowAddAction(const std::string& source, const std::string& target, double value) {
    Action action;
    action.type = ActionType::FlowAdd;
    action.forward = FlowPayload{source, target, value};
    action.inverse = FlowPayload{source, target, std::nullopt};
    action.description = std::format("Add flow {} → {}", source, target);
    return action;
}

Action EditCommands::createFlowDeleteAction(const std::string& source, const std::string& target, double value) {
    Action action;
    action.type = ActionType::FlowDelete;
    action.forward = FlowPayload{source, target, std::nullopt};
    action.inverse = FlowPayload{source, target, value};
    action.description = std::format("Delete flow {} → {}", source, target);
    return action;
}

Action EditCommands::createNodeAddAction(const std::string& name, const std::vector<Flow>& flows) {
    Action action;
    action.type = ActionType::NodeAdd;
    action.forward = NodePayload{name, flows};
    action.inverse = NodePayload{name, std::nullopt};
    action.description = std::format("Add node \"{}\"", name);
    return action;
}

Action EditCommands::createNodeDeleteAction(const std::string& name, const std::vector<Flow>& flows) {
    Action action;
    action.type = ActionType::NodeDelete;
    action.forward = NodePayload{name, std::nullopt};
    action.inverse = NodePayload{name, flows};
    action.description = std::format("Delete node \"{}\"", name);
    return action;
}

Action EditCommands::createResetAction(ElementKind kind, const OverlayState& before) {
    OverlayResetPayload cleared;
    cleared.kind = kind;

    OverlayResetPayload restored;
    restored.kind = kind;
    if (kind == ElementKind::Node) {
        restored.nodeOffsets = before.nodeOffsets;
    } else {
        restored.labelPositions = before.labelPositions;
    }

    Action action;
    action.type = ActionType::LayoutReset;
    action.forward = cleared;
    action.inverse = restored;
    action.description = (kind == ElementKind::Node) ? "Reset node positions" : "Reset label positions";
    return action;
}

// =============================================================================
// Recorded Edits
// =============================================================================

EditStatus EditCommands::setNodeOffset(const std::string& nodeId, const Offset& offset) {
    if (nodeId.empty()) {
        return reject("node id must be non-empty");
    }
    if (!isFinite(offset.dx) || !isFinite(offset.dy)) {
        return reject(std::format("non-finite offset for node '{}'", nodeId));
    }

    log_.perform(createNodePositionAction(nodeId, overlays_.getNodeOffset(nodeId), offset));
    return EditStatus::ok();
}

EditStatus EditCommands::setLabelPosition(const std::string& nodeId, const Point& position) {
    if (nodeId.empty()) {
        return reject("node id must be non-empty");
    }
    if (!isFinite(position.x) || !isFinite(position.y)) {
        return reject(std::format("non-finite label position for '{}'", nodeId));
    }

    log_.perform(createLabelPositionAction(nodeId, overlays_.getLabelPosition(nodeId), position));
    return EditStatus::ok();
}

EditStatus EditCommands::changeProperty(const std::string& elementType,
                                        const std::string& elementId,
                                        const std::string& property,
                                        const std::optional<PropertyValue>& newValue) {
    if (elementType.empty() || elementId.empty() || property.empty()) {
        return reject("element type, element id and property must be non-empty");
    }

    auto oldValue = model_.getProperty(elementType, elementId, property);
    if (oldValue == newValue) {
        return EditStatus::ok();
    }

    log_.perform(createPropertyChangeAction(elementType, elementId, property, oldValue, newValue));
    return EditStatus::ok();
}

EditStatus EditCommands::addFlow(const std::string& source, const std::string& target,
                                 std::optional<double> value) {
    if (source.empty() || target.empty()) {
        return reject("source and target must be non-empty");
    }
    if (source == target) {
        return reject(std::format("self-loop flow on '{}'", source));
    }
    double flowValue = value.value_or(config_.defaultFlowValue);
    if (!std::isfinite(flowValue)) {
        return reject("flow value must be finite");
    }
    if (model_.hasFlow(source, target)) {
        return reject(std::format("flow {} -> {} already exists", source, target));
    }

    log_.perform(createFlowAddAction(source, target, flowValue));
    return EditStatus::ok();
}

EditStatus EditCommands::deleteFlow(const std::string& source, const std::string& target) {
    auto flow = model_.findFlow(source, target);
    if (!flow) {
        return reject(std::format("no flow {} -> {}", source, target));
    }

    log_.perform(createFlowDeleteAction(source, target, flow->value));
    return EditStatus::ok();
}

EditStatus EditCommands::addNode(const std::string& name, const NodeOptions& opts) {
    if (name.empty()) {
        return reject("node name must be non-empty");
    }
    if (model_.hasNode(name)) {
        return reject(std::format("node '{}' already exists", name));
    }

    std::string target = opts.targetName.empty() ? name + " Output" : opts.targetName;
    if (target == name) {
        return reject(std::format("self-loop flow on '{}'", name));
    }
    double value = opts.value.value_or(config_.defaultFlowValue);
    if (!std::isfinite(value)) {
        return reject("flow value must be finite");
    }

    log_.perform(createNodeAddAction(name, {Flow{name, target, value}}));
    return EditStatus::ok();
}

EditStatus EditCommands::deleteNode(const std::string& name) {
    if (!model_.hasNode(name)) {
        return reject(std::format("no node '{}'", name));
    }

    log_.perform(createNodeDeleteAction(name, model_.flowsOf(name)));
    return EditStatus::ok();
}

EditStatus EditCommands::resetNodePositions() {
    if (overlays_.nodeOffsetCount() == 0) {
        return EditStatus::ok();
    }
    log_.perform(createResetAction(ElementKind::Node, overlays_.state()));
    return EditStatus::ok();
}

EditStatus EditCommands::resetLabelPositions() {
    if (overlays_.labelPositionCount() == 0) {
        return EditStatus::ok();
    }
    log_.perform(createResetAction(ElementKind::Label, overlays_.state()));
    return EditStatus::ok();
}

}  // namespace sankeyedit
