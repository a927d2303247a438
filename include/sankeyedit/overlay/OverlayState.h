#pragma once

#include "../core/Types.h"
#include <map>
#include <string>

namespace sankeyedit {

/// Complete set of user overrides layered on top of the automatic layout
struct OverlayState {
    /// Node offsets relative to the computed base position
    std::map<std::string, Offset> nodeOffsets;

    /// Absolute label positions (independent from the node)
    std::map<std::string, Point> labelPositions;

    /// Label box size overrides
    std::map<std::string, Size> labelDimensions;

    bool hasNodeOffset(const std::string& id) const {
        return nodeOffsets.find(id) != nodeOffsets.end();
    }

    bool hasLabelPosition(const std::string& id) const {
        return labelPositions.find(id) != labelPositions.end();
    }

    bool hasLabelDimensions(const std::string& id) const {
        return labelDimensions.find(id) != labelDimensions.end();
    }

    void clear() {
        nodeOffsets.clear();
        labelPositions.clear();
        labelDimensions.clear();
    }

    bool isEmpty() const {
        return nodeOffsets.empty() && labelPositions.empty() && labelDimensions.empty();
    }

    bool operator==(const OverlayState& o) const {
        return nodeOffsets == o.nodeOffsets &&
               labelPositions == o.labelPositions &&
               labelDimensions == o.labelDimensions;
    }
};

}  // namespace sankeyedit
