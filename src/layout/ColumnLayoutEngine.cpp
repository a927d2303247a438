#include "sankeyedit/layout/ColumnLayoutEngine.h"
#include "sankeyedit/core/DiagramModel.h"
#include "sankeyedit/common/Logger.h"

#include <algorithm>
#include <map>

namespace sankeyedit {

ColumnLayoutEngine::ColumnLayoutEngine(const ColumnLayoutOptions& options)
    : options_(options) {}

int ColumnLayoutEngine::columnOf(const std::string& node) const {
    auto it = columns_.find(node);
    return it != columns_.end() ? it->second : -1;
}

std::unordered_map<std::string, int> ColumnLayoutEngine::assignColumns(const DiagramModel& model) {
    std::unordered_map<std::string, int> column;
    for (const auto& name : model.nodes()) {
        column[name] = 0;
    }

    // Longest path by relaxation; bounded by node count so cycles terminate
    const auto flows = model.flows();
    const size_t maxPasses = column.size();
    for (size_t pass = 0; pass < maxPasses; ++pass) {
        bool changed = false;
        for (const auto& flow : flows) {
            int candidate = column[flow.source] + 1;
            if (candidate > column[flow.target] && candidate < static_cast<int>(maxPasses)) {
                column[flow.target] = candidate;
                changed = true;
            }
        }
        if (!changed) {
            break;
        }
    }
    return column;
}

void ColumnLayoutEngine::recompute(const DiagramModel& model) {
    ++recomputeCount_;
    positions_.clear();
    columns_ = assignColumns(model);

    // Throughput per node = max(inflow, outflow)
    std::unordered_map<std::string, double> inflow;
    std::unordered_map<std::string, double> outflow;
    for (const auto& flow : model.flows()) {
        outflow[flow.source] += flow.value;
        inflow[flow.target] += flow.value;
    }

    std::map<int, std::vector<std::string>> byColumn;
    for (const auto& name : model.nodes()) {
        byColumn[columns_[name]].push_back(name);
    }

    for (const auto& [col, names] : byColumn) {
        float x = static_cast<float>(col) * options_.columnSpacing;
        float y = 0.0f;
        for (const auto& name : names) {
            double throughput = std::max(inflow[name], outflow[name]);
            float height = std::max(options_.minNodeHeight,
                                    static_cast<float>(throughput) * options_.valueScale);

            positions_.push_back({name, x, y, ElementKind::Node});
            positions_.push_back({name, x + options_.nodeWidth + options_.labelGap,
                                  y + height / 2.0f, ElementKind::Label});
            y += height + options_.nodePadding;
        }
    }

    LOG_DEBUG("Laid out {} nodes in {} columns", columns_.size(), byColumn.size());
}

}  // namespace sankeyedit
