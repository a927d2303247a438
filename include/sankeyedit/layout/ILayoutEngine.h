#pragma once

#include "../core/Types.h"
#include <vector>

namespace sankeyedit {

class DiagramModel;

/// Automatic layout collaborator.
///
/// The editor never computes geometry itself: it asks the engine to
/// recompute and then reads back the positions of every visible node and
/// label. Nothing beyond "id -> {x, y} for all visible elements" is assumed
/// about the algorithm.
class ILayoutEngine {
public:
    virtual ~ILayoutEngine() = default;

    /// Re-run the automatic layout for the current diagram data
    virtual void recompute(const DiagramModel& model) = 0;

    /// Positions produced by the last recompute (nodes and labels)
    virtual std::vector<BasePosition> snapshot() const = 0;
};

}  // namespace sankeyedit
