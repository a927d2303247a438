#include "sankeyedit/sync/LayoutSynchronizer.h"
#include "sankeyedit/overlay/OverlayStore.h"
#include "sankeyedit/layout/ILayoutEngine.h"
#include "sankeyedit/render/IRenderTarget.h"
#include "sankeyedit/editor/EditorConfig.h"
#include "sankeyedit/common/Logger.h"

#include <cmath>
#include <exception>

namespace sankeyedit {

LayoutSynchronizer::LayoutSynchronizer(OverlayStore& overlays,
                                       DiagramModel& model,
                                       ILayoutEngine& engine,
                                       IRenderTarget& renderTarget,
                                       const EditorConfig& config)
    : overlays_(overlays)
    , model_(model)
    , engine_(engine)
    , renderTarget_(renderTarget)
    , config_(config) {}

// =============================================================================
// Layout Pass
// =============================================================================

void LayoutSynchronizer::onLayoutRecomputed() {
    // Base positions are authoritative for the current pass: no merge
    nodeBases_.clear();
    labelBases_.clear();

    for (const auto& pos : engine_.snapshot()) {
        if (pos.id.empty()) {
            LOG_DEBUG("Ignoring layout entry without id");
            continue;
        }
        auto& table = (pos.kind == ElementKind::Node) ? nodeBases_ : labelBases_;
        table[pos.id] = pos;
    }

    LOG_DEBUG("Captured {} node and {} label base positions", nodeBases_.size(), labelBases_.size());

    applyOverlays();
    executeRenderCallbacks();
}

void LayoutSynchronizer::triggerRerender() {
    engine_.recompute(model_);
    onLayoutRecomputed();
}

void LayoutSynchronizer::applyOverlays() {
    for (const auto& [id, base] : nodeBases_) {
        renderTarget_.placeNode(id, base.point() + overlays_.getNodeOffset(id).value_or(Offset{}));
    }

    // Label overrides without a laid-out label are kept but not drawn
    for (const auto& [id, base] : labelBases_) {
        renderTarget_.placeLabel(id, overlays_.getLabelPosition(id).value_or(base.point()));
    }
}

// =============================================================================
// Position Queries
// =============================================================================

std::optional<BasePosition> LayoutSynchronizer::getBasePosition(const std::string& id) const {
    auto it = nodeBases_.find(id);
    if (it == nodeBases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<BasePosition> LayoutSynchronizer::getLabelBasePosition(const std::string& id) const {
    auto it = labelBases_.find(id);
    if (it == labelBases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Point> LayoutSynchronizer::getFinalPosition(const std::string& id) const {
    auto base = getBasePosition(id);
    if (!base) {
        return std::nullopt;
    }
    if (auto offset = overlays_.getNodeOffset(id)) {
        return base->point() + *offset;
    }
    return base->point();
}

std::optional<Point> LayoutSynchronizer::getFinalLabelPosition(const std::string& id) const {
    if (auto custom = overlays_.getLabelPosition(id)) {
        return custom;
    }
    auto base = getLabelBasePosition(id);
    if (!base) {
        return std::nullopt;
    }
    return base->point();
}

std::optional<Point> LayoutSynchronizer::getEffectivePosition(ElementKind kind, const std::string& id) const {
    return (kind == ElementKind::Node) ? getFinalPosition(id) : getFinalLabelPosition(id);
}

bool LayoutSynchronizer::hasCustomPosition(const std::string& id) const {
    return overlays_.hasNodeOffset(id);
}

bool LayoutSynchronizer::hasCustomLabelPosition(const std::string& id) const {
    return overlays_.hasLabelPosition(id);
}

void LayoutSynchronizer::clearBasePositions() {
    nodeBases_.clear();
    labelBases_.clear();
}

// =============================================================================
// Self-checks
// =============================================================================

bool LayoutSynchronizer::withinTolerance(const Point& a, const Point& b) const {
    return std::abs(a.x - b.x) < config_.verifyTolerance &&
           std::abs(a.y - b.y) < config_.verifyTolerance;
}

PositionCheck LayoutSynchronizer::verifyPosition(const std::string& id) const {
    PositionCheck check;
    check.kind = ElementKind::Node;
    check.customOffset = overlays_.getNodeOffset(id);
    check.rendered = renderTarget_.renderedPosition(ElementKind::Node, id);

    auto base = getBasePosition(id);
    if (!base) {
        check.reason = "no base position";
        return check;
    }
    check.base = base->point();
    check.expected = base->point() + check.customOffset.value_or(Offset{});

    if (!check.rendered) {
        check.reason = "not rendered";
        return check;
    }

    check.valid = withinTolerance(*check.expected, *check.rendered);
    if (!check.valid) {
        check.reason = std::format("rendered ({}, {}) differs from expected ({}, {})",
                                   check.rendered->x, check.rendered->y,
                                   check.expected->x, check.expected->y);
    }
    return check;
}

PositionCheck LayoutSynchronizer::verifyLabelPosition(const std::string& id) const {
    PositionCheck check;
    check.kind = ElementKind::Label;
    check.customLabelPosition = overlays_.getLabelPosition(id);
    check.rendered = renderTarget_.renderedPosition(ElementKind::Label, id);

    if (auto base = getLabelBasePosition(id)) {
        check.base = base->point();
    }
    check.expected = getFinalLabelPosition(id);
    if (!check.base) {
        check.reason = "no base position";
        return check;
    }

    if (!check.rendered) {
        check.reason = "not rendered";
        return check;
    }

    check.valid = withinTolerance(*check.expected, *check.rendered);
    if (!check.valid) {
        check.reason = std::format("rendered ({}, {}) differs from expected ({}, {})",
                                   check.rendered->x, check.rendered->y,
                                   check.expected->x, check.expected->y);
    }
    return check;
}

// =============================================================================
// Structural Additions
// =============================================================================

EditStatus LayoutSynchronizer::addNode(const std::string& name, const NodeOptions& opts) {
    if (name.empty()) {
        LOG_WARN("Invalid node name");
        return EditStatus::fail("node name must be non-empty");
    }

    std::string target = opts.targetName.empty() ? name + " Output" : opts.targetName;
    EditStatus status = model_.addFlow(name, target, opts.value.value_or(config_.defaultFlowValue));
    if (!status) {
        return status;
    }

    triggerRerender();
    return status;
}

EditStatus LayoutSynchronizer::addFlow(const std::string& source, const std::string& target,
                                       std::optional<double> value) {
    EditStatus status = model_.addFlow(source, target, value.value_or(config_.defaultFlowValue));
    if (!status) {
        return status;
    }

    triggerRerender();
    return status;
}

// =============================================================================
// Render Callbacks
// =============================================================================

LayoutSynchronizer::CallbackId LayoutSynchronizer::onRenderComplete(RenderCallback callback) {
    if (!callback) {
        return 0;
    }
    CallbackId id = nextCallbackId_++;
    renderCallbacks_.emplace_back(id, std::move(callback));
    return id;
}

void LayoutSynchronizer::offRenderComplete(CallbackId id) {
    std::erase_if(renderCallbacks_, [id](const auto& entry) { return entry.first == id; });
}

void LayoutSynchronizer::executeRenderCallbacks() {
    // Copy so a callback may unregister itself
    auto callbacks = renderCallbacks_;
    for (const auto& [id, callback] : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR("Render callback {} failed: {}", id, e.what());
        } catch (...) {
            LOG_ERROR("Render callback {} failed with a non-standard exception", id);
        }
    }
}

}  // namespace sankeyedit
