#pragma once

#include "../core/Types.h"
#include "../core/EditStatus.h"
#include "../core/DiagramModel.h"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sankeyedit {

class OverlayStore;
class ILayoutEngine;
class IRenderTarget;
struct EditorConfig;

/// Result of comparing an element's expected final position with what the
/// render target actually shows
struct PositionCheck {
    bool valid = false;
    ElementKind kind = ElementKind::Node;
    std::optional<Point> base;
    std::optional<Point> expected;              ///< base + overlay
    std::optional<Point> rendered;
    std::optional<Offset> customOffset;         ///< Node overlay, if any
    std::optional<Point> customLabelPosition;   ///< Label overlay, if any
    std::string reason;                         ///< Empty when valid
};

/// Bridge between the automatic layout pass and the overlay store.
///
/// Base positions are captured wholesale after every recompute and are never
/// computed here. Final positions follow:
///   final(node)  = base(node) + overlay offset      (or base when no overlay)
///   final(label) = overlay position                 (or base when no overlay)
///
/// Structural additions are routed through the engine so a new element always
/// has a base position before any overlay can apply to it.
class LayoutSynchronizer {
public:
    using RenderCallback = std::function<void()>;
    using CallbackId = size_t;

    LayoutSynchronizer(OverlayStore& overlays,
                       DiagramModel& model,
                       ILayoutEngine& engine,
                       IRenderTarget& renderTarget,
                       const EditorConfig& config);

    // =========================================================================
    // Layout Pass
    // =========================================================================

    /// Capture the engine's fresh positions (replacing the previous snapshot),
    /// push final positions to the render target and run render callbacks
    void onLayoutRecomputed();

    /// Recompute through the engine, then onLayoutRecomputed()
    void triggerRerender();

    /// Push final positions of every captured element to the render target
    void applyOverlays();

    // =========================================================================
    // Position Queries
    // =========================================================================

    std::optional<BasePosition> getBasePosition(const std::string& id) const;
    std::optional<BasePosition> getLabelBasePosition(const std::string& id) const;

    /// std::nullopt when the node has no base position (not laid out / removed)
    std::optional<Point> getFinalPosition(const std::string& id) const;
    std::optional<Point> getFinalLabelPosition(const std::string& id) const;

    /// Final position for either kind
    std::optional<Point> getEffectivePosition(ElementKind kind, const std::string& id) const;

    bool hasCustomPosition(const std::string& id) const;
    bool hasCustomLabelPosition(const std::string& id) const;

    size_t basePositionCount() const { return nodeBases_.size() + labelBases_.size(); }
    void clearBasePositions();

    // =========================================================================
    // Self-checks
    // =========================================================================

    PositionCheck verifyPosition(const std::string& id) const;
    PositionCheck verifyLabelPosition(const std::string& id) const;

    // =========================================================================
    // Structural Additions (always through the layout engine)
    // =========================================================================

    /// Add a node via a placeholder flow to opts.targetName ("<name> Output")
    EditStatus addNode(const std::string& name, const NodeOptions& opts = NodeOptions{});

    EditStatus addFlow(const std::string& source, const std::string& target,
                       std::optional<double> value = std::nullopt);

    // =========================================================================
    // Render Callbacks
    // =========================================================================

    CallbackId onRenderComplete(RenderCallback callback);
    void offRenderComplete(CallbackId id);

private:
    OverlayStore& overlays_;
    DiagramModel& model_;
    ILayoutEngine& engine_;
    IRenderTarget& renderTarget_;
    const EditorConfig& config_;

    std::unordered_map<std::string, BasePosition> nodeBases_;
    std::unordered_map<std::string, BasePosition> labelBases_;

    std::vector<std::pair<CallbackId, RenderCallback>> renderCallbacks_;
    CallbackId nextCallbackId_ = 1;

    void executeRenderCallbacks();
    bool withinTolerance(const Point& a, const Point& b) const;
};

}  // namespace sankeyedit
