#pragma once

#include "../core/Types.h"
#include "../core/DiagramModel.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sankeyedit {

/// Kinds of undoable edits
enum class ActionType {
    NodePosition,
    LabelPosition,
    PropertyChange,
    FlowAdd,
    FlowDelete,
    NodeAdd,
    NodeDelete,
    LayoutReset
};

const char* toString(ActionType type);

/// Set (offset present) or clear (std::nullopt) one node offset
struct NodePositionPayload {
    std::string nodeId;
    std::optional<Offset> offset;

    bool operator==(const NodePositionPayload&) const = default;
};

/// Set (position present) or clear (std::nullopt) one label position
struct LabelPositionPayload {
    std::string nodeId;
    std::optional<Point> position;

    bool operator==(const LabelPositionPayload&) const = default;
};

/// Set (value present) or erase (std::nullopt) one element property
struct PropertyChangePayload {
    std::string elementType;
    std::string elementId;
    std::string property;
    std::optional<PropertyValue> value;

    bool operator==(const PropertyChangePayload&) const = default;
};

/// Ensure the flow exists with this value, or remove it when value is empty
struct FlowPayload {
    std::string source;
    std::string target;
    std::optional<double> value;

    bool operator==(const FlowPayload&) const = default;
};

/// Restore a node with these flows, or remove the node and all of its flows
/// when flows is empty
struct NodePayload {
    std::string name;
    std::optional<std::vector<Flow>> flows;

    bool operator==(const NodePayload&) const = default;
};

/// Replace every override of one kind with this set
struct OverlayResetPayload {
    ElementKind kind = ElementKind::Node;
    std::map<std::string, Offset> nodeOffsets;
    std::map<std::string, Point> labelPositions;

    bool operator==(const OverlayResetPayload&) const = default;
};

using ActionPayload = std::variant<NodePositionPayload,
                                   LabelPositionPayload,
                                   PropertyChangePayload,
                                   FlowPayload,
                                   NodePayload,
                                   OverlayResetPayload>;

/// One reversible edit: applying forward performs it, applying inverse
/// reverts it. Both go through the same apply routine.
struct Action {
    ActionType type = ActionType::NodePosition;
    ActionPayload forward;
    ActionPayload inverse;
    std::string description;
    int64_t timestamp = 0;   ///< ms since epoch, set when recorded

    /// Description, or "<type> action" when none was given
    std::string displayName() const;
};

/// Applies one payload to the editor state.
///
/// Payloads that reference elements which no longer exist are tolerated as
/// no-ops: the diagram is edited live and an unrelated action may have
/// removed the element in between.
class IActionApplier {
public:
    virtual ~IActionApplier() = default;
    virtual void apply(const ActionPayload& payload) = 0;
};

}  // namespace sankeyedit
