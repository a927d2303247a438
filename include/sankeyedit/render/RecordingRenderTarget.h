#pragma once

#include "IRenderTarget.h"
#include <map>
#include <string>

namespace sankeyedit {

/// In-memory render target: remembers the last position placed per element
class RecordingRenderTarget : public IRenderTarget {
public:
    void placeNode(const std::string& id, const Point& position) override;
    void placeLabel(const std::string& id, const Point& position) override;
    std::optional<Point> renderedPosition(ElementKind kind, const std::string& id) const override;

    /// Total number of place* calls
    size_t placeCount() const { return placeCount_; }

    const std::map<std::string, Point>& nodes() const { return nodes_; }
    const std::map<std::string, Point>& labels() const { return labels_; }

    void clear();

private:
    std::map<std::string, Point> nodes_;
    std::map<std::string, Point> labels_;
    size_t placeCount_ = 0;
};

}  // namespace sankeyedit
