#pragma once

#include "Action.h"
#include "../core/EditStatus.h"
#include "../core/DiagramModel.h"

#include <optional>
#include <string>

namespace sankeyedit {

class ActionLog;
class OverlayStore;
struct OverlayState;
struct EditorConfig;

/// Undoable property and structural edits.
///
/// The static create*Action() factories build the forward/inverse payload
/// pairs. The instance methods validate against the current model, perform
/// the forward payload and record the action in one step, so every
/// successful call leaves exactly one entry on the undo stack.
class EditCommands {
public:
    EditCommands(ActionLog& log,
                 const DiagramModel& model,
                 const OverlayStore& overlays,
                 const EditorConfig& config);

    // =========================================================================
    // Action Factories
    // =========================================================================

    /// @param oldOffset Previous offset, or std::nullopt when none existed
    static Action createNodePositionAction(const std::string& nodeId,
                                           const std::optional<Offset>& oldOffset,
                                           const Offset& newOffset);

    /// @param oldPosition Previous absolute position, or std::nullopt
    static Action createLabelPositionAction(const std::string& nodeId,
                                            const std::optional<Point>& oldPosition,
                                            const Point& newPosition);

    static Action createPropertyChangeAction(const std::string& elementType,
                                             const std::string& elementId,
                                             const std::string& property,
                                             const std::optional<PropertyValue>& oldValue,
                                             const std::optional<PropertyValue>& newValue);

    static Action createFlowAddAction(const std::string& source, const std::string& target, double value);

    /// @param value Value of the deleted flow, restored on undo
    static Action createFlowDeleteAction(const std::string& source, const std::string& target, double value);

    static Action createNodeAddAction(const std::string& name, const std::vector<Flow>& flows);

    /// @param flows Every flow the node took part in, restored on undo
    static Action createNodeDeleteAction(const std::string& name, const std::vector<Flow>& flows);

    /// Clearing every override of @p kind; @p before is restored on undo
    static Action createResetAction(ElementKind kind, const OverlayState& before);

    // =========================================================================
    // Recorded Edits
    // =========================================================================

    /// Set a node offset outside of a drag (numeric entry in a panel)
    EditStatus setNodeOffset(const std::string& nodeId, const Offset& offset);

    /// Set a label position outside of a drag
    EditStatus setLabelPosition(const std::string& nodeId, const Point& position);

    /// Set (or erase, with std::nullopt) a named property. Setting the value
    /// already stored succeeds without recording anything.
    EditStatus changeProperty(const std::string& elementType,
                              const std::string& elementId,
                              const std::string& property,
                              const std::optional<PropertyValue>& newValue);

    EditStatus addFlow(const std::string& source, const std::string& target,
                       std::optional<double> value = std::nullopt);
    EditStatus deleteFlow(const std::string& source, const std::string& target);

    /// Add a node through a placeholder flow to opts.targetName
    EditStatus addNode(const std::string& name, const NodeOptions& opts = NodeOptions{});
    EditStatus deleteNode(const std::string& name);

    /// "Reset positions" as one undoable action (no-op when nothing is set)
    EditStatus resetNodePositions();

    /// "Reset labels" as one undoable action (no-op when nothing is set)
    EditStatus resetLabelPositions();

private:
    ActionLog& log_;
    const DiagramModel& model_;
    const OverlayStore& overlays_;
    const EditorConfig& config_;

    static EditStatus reject(const std::string& reason);
};

}  // namespace sankeyedit
