#pragma once

#include <string>

namespace sankeyedit {

/// Outcome of a best-effort edit entry point.
///
/// Editing calls never throw: invalid input is rejected, logged, and reported
/// here so callers (and tests) can tell "nothing happened" from success.
struct EditStatus {
    bool success = false;
    std::string reason;

    static EditStatus ok() {
        return {true, ""};
    }

    static EditStatus fail(const std::string& reason) {
        return {false, reason};
    }

    explicit operator bool() const { return success; }
};

}  // namespace sankeyedit
