#pragma once

#include "../core/Types.h"
#include <optional>
#include <string>

namespace sankeyedit {

/// Rendering collaborator (scene graph, SVG, canvas...).
///
/// Receives final positions after every layout pass, undo/redo and commit,
/// and transient positions while a drag is in flight.
class IRenderTarget {
public:
    virtual ~IRenderTarget() = default;

    virtual void placeNode(const std::string& id, const Point& position) = 0;
    virtual void placeLabel(const std::string& id, const Point& position) = 0;

    /// Position actually displayed for the element, if it is on screen
    virtual std::optional<Point> renderedPosition(ElementKind kind, const std::string& id) const = 0;
};

}  // namespace sankeyedit
