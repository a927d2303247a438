#include "sankeyedit/overlay/OverlayStore.h"
#include "sankeyedit/overlay/OverlaySerializer.h"
#include "sankeyedit/common/Logger.h"

namespace sankeyedit {

EditStatus OverlayStore::validateId(const std::string& id) {
    if (id.empty()) {
        LOG_WARN("Invalid nodeId: empty identifier");
        return EditStatus::fail("id must be a non-empty identifier");
    }
    return EditStatus::ok();
}

// =============================================================================
// Node Offsets
// =============================================================================

EditStatus OverlayStore::setNodeOffset(const std::string& id, float dx, float dy) {
    EditStatus status = validateId(id);
    if (!status) {
        return status;
    }
    if (!isFinite(dx) || !isFinite(dy)) {
        LOG_WARN("Rejected non-finite offset for node '{}'", id);
        return EditStatus::fail("offset must be finite");
    }
    state_.nodeOffsets[id] = {dx, dy};
    return EditStatus::ok();
}

std::optional<Offset> OverlayStore::getNodeOffset(const std::string& id) const {
    auto it = state_.nodeOffsets.find(id);
    if (it != state_.nodeOffsets.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool OverlayStore::hasNodeOffset(const std::string& id) const {
    return state_.hasNodeOffset(id);
}

void OverlayStore::clearNodeOffset(const std::string& id) {
    state_.nodeOffsets.erase(id);
}

// =============================================================================
// Label Positions
// =============================================================================

EditStatus OverlayStore::setLabelPosition(const std::string& id, float x, float y) {
    EditStatus status = validateId(id);
    if (!status) {
        return status;
    }
    if (!isFinite(x) || !isFinite(y)) {
        LOG_WARN("Rejected non-finite label position for '{}'", id);
        return EditStatus::fail("position must be finite");
    }
    state_.labelPositions[id] = {x, y};
    return EditStatus::ok();
}

std::optional<Point> OverlayStore::getLabelPosition(const std::string& id) const {
    auto it = state_.labelPositions.find(id);
    if (it != state_.labelPositions.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool OverlayStore::hasLabelPosition(const std::string& id) const {
    return state_.hasLabelPosition(id);
}

void OverlayStore::clearLabelPosition(const std::string& id) {
    state_.labelPositions.erase(id);
}

// =============================================================================
// Label Dimensions
// =============================================================================

EditStatus OverlayStore::setLabelDimensions(const std::string& id, float width, float height) {
    EditStatus status = validateId(id);
    if (!status) {
        return status;
    }
    if (!isFinite(width) || !isFinite(height)) {
        LOG_WARN("Rejected non-finite label dimensions for '{}'", id);
        return EditStatus::fail("dimensions must be finite");
    }
    state_.labelDimensions[id] = {width, height};
    return EditStatus::ok();
}

std::optional<Size> OverlayStore::getLabelDimensions(const std::string& id) const {
    auto it = state_.labelDimensions.find(id);
    if (it != state_.labelDimensions.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool OverlayStore::hasLabelDimensions(const std::string& id) const {
    return state_.hasLabelDimensions(id);
}

void OverlayStore::clearLabelDimensions(const std::string& id) {
    state_.labelDimensions.erase(id);
}

// =============================================================================
// Bulk Operations
// =============================================================================

void OverlayStore::replaceNodeOffsets(const std::map<std::string, Offset>& offsets) {
    state_.nodeOffsets = offsets;
}

void OverlayStore::replaceLabelPositions(const std::map<std::string, Point>& positions) {
    state_.labelPositions = positions;
}

void OverlayStore::clearNodeOffsets() {
    state_.nodeOffsets.clear();
}

void OverlayStore::clearLabelPositions() {
    state_.labelPositions.clear();
}

void OverlayStore::clearAll() {
    state_.clear();
}

// =============================================================================
// Persistence
// =============================================================================

std::string OverlayStore::serialize() const {
    return OverlaySerializer::toJson(state_);
}

bool OverlayStore::deserialize(const std::string& json) {
    OverlayState parsed;
    if (!OverlaySerializer::fromJson(json, parsed)) {
        return false;
    }
    state_ = std::move(parsed);
    return true;
}

bool OverlayStore::saveToFile(const std::string& path) const {
    return OverlaySerializer::saveToFile(*this, path);
}

bool OverlayStore::loadFromFile(const std::string& path) {
    return OverlaySerializer::loadFromFile(*this, path);
}

}  // namespace sankeyedit
