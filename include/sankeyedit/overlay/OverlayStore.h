#pragma once

#include "OverlayState.h"
#include "../core/EditStatus.h"
#include <optional>
#include <string>

namespace sankeyedit {

/// Single source of truth for user-applied position and dimension overrides.
///
/// Setters validate the id (non-empty) and coordinates (finite); a rejected
/// call logs a warning, leaves existing entries untouched and returns a
/// failed EditStatus. Getters return std::nullopt when nothing is stored.
class OverlayStore {
public:
    OverlayStore() = default;

    const OverlayState& state() const { return state_; }

    // Node offsets
    EditStatus setNodeOffset(const std::string& id, float dx, float dy);
    std::optional<Offset> getNodeOffset(const std::string& id) const;
    bool hasNodeOffset(const std::string& id) const;
    void clearNodeOffset(const std::string& id);
    size_t nodeOffsetCount() const { return state_.nodeOffsets.size(); }

    // Label positions
    EditStatus setLabelPosition(const std::string& id, float x, float y);
    std::optional<Point> getLabelPosition(const std::string& id) const;
    bool hasLabelPosition(const std::string& id) const;
    void clearLabelPosition(const std::string& id);
    size_t labelPositionCount() const { return state_.labelPositions.size(); }

    // Label dimensions
    EditStatus setLabelDimensions(const std::string& id, float width, float height);
    std::optional<Size> getLabelDimensions(const std::string& id) const;
    bool hasLabelDimensions(const std::string& id) const;
    void clearLabelDimensions(const std::string& id);

    /// Replace every node offset at once (layout reset and its undo)
    void replaceNodeOffsets(const std::map<std::string, Offset>& offsets);

    /// Replace every label position at once (label reset and its undo)
    void replaceLabelPositions(const std::map<std::string, Point>& positions);

    /// "Reset positions"
    void clearNodeOffsets();

    /// "Reset labels"
    void clearLabelPositions();

    void clearAll();

    // Persistence
    std::string serialize() const;

    /// Returns false and leaves the store unchanged on a malformed document
    bool deserialize(const std::string& json);

    bool saveToFile(const std::string& path) const;
    bool loadFromFile(const std::string& path);

private:
    OverlayState state_;

    static EditStatus validateId(const std::string& id);
};

}  // namespace sankeyedit
