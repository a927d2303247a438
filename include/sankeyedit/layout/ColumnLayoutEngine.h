#pragma once

#include "ILayoutEngine.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace sankeyedit {

/// Options for the column layout (pixels)
struct ColumnLayoutOptions {
    float columnSpacing = 200.0f;   ///< Horizontal distance between columns
    float nodeWidth = 20.0f;
    float nodePadding = 20.0f;      ///< Vertical gap between nodes in a column
    float minNodeHeight = 10.0f;
    float valueScale = 10.0f;       ///< Node height per unit of throughput
    float labelGap = 6.0f;          ///< Gap between node and its label
};

/// Minimal sankey-style layout used by the example program and tests.
///
/// Nodes are placed in columns by longest path from the sources; within a
/// column they are stacked in name order with height proportional to their
/// throughput (max of inflow and outflow). Each label sits to the right of
/// its node, vertically centered.
class ColumnLayoutEngine : public ILayoutEngine {
public:
    explicit ColumnLayoutEngine(const ColumnLayoutOptions& options = ColumnLayoutOptions{});

    void recompute(const DiagramModel& model) override;
    std::vector<BasePosition> snapshot() const override { return positions_; }

    const ColumnLayoutOptions& options() const { return options_; }

    /// Number of recompute() calls so far
    int recomputeCount() const { return recomputeCount_; }

    /// Column assigned to a node by the last pass (-1 if unknown)
    int columnOf(const std::string& node) const;

private:
    ColumnLayoutOptions options_;
    std::vector<BasePosition> positions_;
    std::unordered_map<std::string, int> columns_;
    int recomputeCount_ = 0;

    static std::unordered_map<std::string, int> assignColumns(const DiagramModel& model);
};

}  // namespace sankeyedit
