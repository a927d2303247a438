#pragma once

#include "EditStatus.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sankeyedit {

/// One source -> target flow of the diagram data
struct Flow {
    std::string source;
    std::string target;
    double value = 1.0;

    bool operator==(const Flow& o) const {
        return source == o.source && target == o.target && value == o.value;
    }
};

/// Value of a named element property (color, opacity, label text, ...)
using PropertyValue = std::variant<double, bool, std::string>;

/// Options for adding a node through a placeholder flow
struct NodeOptions {
    std::string targetName;             ///< Empty = "<name> Output"
    std::optional<double> value;        ///< Empty = EditorConfig::defaultFlowValue
};

/// Structural data the diagram is laid out from.
///
/// Nodes are not stored explicitly: a node exists while at least one flow
/// names it. Flows are keyed by (source, target) so removing and re-inserting
/// a flow restores the model exactly.
class DiagramModel {
public:
    using FlowKey = std::pair<std::string, std::string>;
    using PropertyKey = std::pair<std::string, std::string>;  ///< (elementType, elementId)

    DiagramModel() = default;

    // Flow operations
    EditStatus addFlow(const std::string& source, const std::string& target, double value);
    bool removeFlow(const std::string& source, const std::string& target);
    std::optional<Flow> findFlow(const std::string& source, const std::string& target) const;
    bool hasFlow(const std::string& source, const std::string& target) const;

    /// Remove every flow touching the node and return them in model order
    std::vector<Flow> removeNode(const std::string& name);

    /// Re-insert flows previously returned by removeNode()
    void insertFlows(const std::vector<Flow>& flows);

    // Queries
    bool hasNode(const std::string& name) const;
    std::vector<std::string> nodes() const;
    std::vector<Flow> flows() const;
    std::vector<Flow> flowsOf(const std::string& name) const;
    size_t flowCount() const { return flows_.size(); }
    bool empty() const { return flows_.empty(); }

    // Element properties
    /// Set (value present) or erase (std::nullopt) one property
    void setProperty(const std::string& elementType, const std::string& elementId,
                     const std::string& property, const std::optional<PropertyValue>& value);
    std::optional<PropertyValue> getProperty(const std::string& elementType,
                                             const std::string& elementId,
                                             const std::string& property) const;
    size_t propertyCount() const;

    void clear();

private:
    std::map<FlowKey, double> flows_;
    std::map<PropertyKey, std::map<std::string, PropertyValue>> properties_;
};

}  // namespace sankeyedit
