#pragma once

#include <string>

namespace sankeyedit {

class OverlayStore;
struct OverlayState;

/// Handles JSON serialization and file I/O for the overlay store.
///
/// Document layout:
/// @code
/// {
///   "version": 1,
///   "nodePositions":   [["A", {"dx": 10, "dy": 5}], ...],
///   "labelPositions":  [["A", {"x": 120, "y": 40}], ...],
///   "labelDimensions": [["A", {"width": 80, "height": 20}], ...]
/// }
/// @endcode
class OverlaySerializer {
public:
    /// Serialize overlay state to JSON string
    static std::string toJson(const OverlayState& state);

    /// Parse a JSON document into @p out.
    /// Malformed entries are skipped; a malformed document returns false
    /// and leaves @p out untouched.
    static bool fromJson(const std::string& json, OverlayState& out);

    /// Save the store to file
    static bool saveToFile(const OverlayStore& store, const std::string& path);

    /// Load the store from file
    static bool loadFromFile(OverlayStore& store, const std::string& path);
};

}  // namespace sankeyedit
