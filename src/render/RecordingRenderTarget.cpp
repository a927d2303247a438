#include "sankeyedit/render/RecordingRenderTarget.h"

namespace sankeyedit {

void RecordingRenderTarget::placeNode(const std::string& id, const Point& position) {
    nodes_[id] = position;
    ++placeCount_;
}

void RecordingRenderTarget::placeLabel(const std::string& id, const Point& position) {
    labels_[id] = position;
    ++placeCount_;
}

std::optional<Point> RecordingRenderTarget::renderedPosition(ElementKind kind, const std::string& id) const {
    const auto& table = (kind == ElementKind::Node) ? nodes_ : labels_;
    auto it = table.find(id);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RecordingRenderTarget::clear() {
    nodes_.clear();
    labels_.clear();
    placeCount_ = 0;
}

}  // namespace sankeyedit
