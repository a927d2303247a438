#pragma once

#include <string>

namespace sankeyedit {

/// Result of validating a numeric field
struct ValidationResult {
    bool valid = false;
    double value = 0.0;     ///< Clamped value, or the field default when invalid
    bool adjusted = false;  ///< Input was out of range and clamped
    std::string error;      ///< Empty when valid and unadjusted
};

/// Result of validating a color field
struct ColorValidationResult {
    bool valid = false;
    std::string normalized;  ///< "#rrggbb" in lowercase
    std::string error;
};

/// Result of validating a free-text field
struct TextValidationResult {
    bool valid = false;
    std::string sanitized;   ///< Trimmed and truncated text
    bool adjusted = false;
    std::string error;
};

/// Input validation for property panels.
///
/// Values arrive as the raw text of an input field. Numeric fields accept a
/// leading number followed by anything ("12px" reads as 12); fields that are
/// integral in the UI drop the fractional part. Out-of-range values are
/// clamped and reported with adjusted = true.
class ValidationUtils {
public:
    static constexpr size_t MAX_TEXT_LENGTH = 500;

    /// "#abc", "abc", "#AABBCC" or "aabbcc"
    static ColorValidationResult validateHexColor(const std::string& hex);

    /// 0-100, default 100
    static ValidationResult validateOpacity(const std::string& input);

    /// 0-100 integral, default 0
    static ValidationResult validateMargin(const std::string& input);

    /// 8-72 integral, default 16
    static ValidationResult validateFontSize(const std::string& input);

    /// -1000..1000 integral, default 0
    static ValidationResult validatePositionOffset(const std::string& input);

    /// Positive finite amount; never clamped
    static ValidationResult validateFlowAmount(const std::string& input);

    /// Non-empty; trimmed and truncated to MAX_TEXT_LENGTH characters
    static TextValidationResult validateText(const std::string& text);

private:
    static bool parseLeadingNumber(const std::string& input, double& out);
    static ValidationResult clampField(const std::string& input, const char* field,
                                       double minValue, double maxValue,
                                       double defaultValue, bool integral);
};

}  // namespace sankeyedit
