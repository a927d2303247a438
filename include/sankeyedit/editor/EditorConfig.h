#pragma once

#include "../history/ActionLog.h"

#include <cstddef>
#include <string>

namespace sankeyedit {

/// Tunables for one editor session
struct EditorConfig {
    /// Undo stack bound; the oldest action is evicted beyond this
    size_t maxUndoStack = ActionLog::MAX_STACK_SIZE;

    /// Tolerance used by position self-checks (diagram units)
    float verifyTolerance = 0.01f;

    /// Pointer travel below which a release counts as a click, not a drag.
    /// 0 disables the rule so every release commits.
    float dragThreshold = 0.0f;

    /// Value used for placeholder flows when none is given
    double defaultFlowValue = 1.0;

    /// Log output
    std::string logDirectory;
    bool logToFile = false;
};

/// JSON round trip for EditorConfig
///
/// Unknown keys are ignored; keys with an unusable value keep their default
/// and log a warning.
class EditorConfigSerializer {
public:
    static std::string toJson(const EditorConfig& config);

    /// Never throws: a malformed document yields the default config
    static EditorConfig fromJson(const std::string& json);

    /// Returns the default config when the file cannot be read
    static EditorConfig loadFromFile(const std::string& path);
};

}  // namespace sankeyedit
