#include "sankeyedit/util/ValidationUtils.h"
#include "sankeyedit/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace sankeyedit {

namespace {

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

ColorValidationResult ValidationUtils::validateHexColor(const std::string& hex) {
    ColorValidationResult result;
    if (hex.empty()) {
        result.error = "Color is required";
        return result;
    }

    std::string clean = (hex.front() == '#') ? hex.substr(1) : hex;
    if (clean.size() == 3) {
        clean = {clean[0], clean[0], clean[1], clean[1], clean[2], clean[2]};
    }

    if (clean.size() != 6 || !std::all_of(clean.begin(), clean.end(), isHexDigit)) {
        result.error = "Invalid hex color format";
        return result;
    }

    std::transform(clean.begin(), clean.end(), clean.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    result.valid = true;
    result.normalized = "#" + clean;
    return result;
}

ValidationResult ValidationUtils::validateOpacity(const std::string& input) {
    return clampField(input, "Opacity", 0.0, 100.0, 100.0, false);
}

ValidationResult ValidationUtils::validateMargin(const std::string& input) {
    return clampField(input, "Margin", 0.0, 100.0, 0.0, true);
}

ValidationResult ValidationUtils::validateFontSize(const std::string& input) {
    return clampField(input, "Font size", 8.0, 72.0, 16.0, true);
}

ValidationResult ValidationUtils::validatePositionOffset(const std::string& input) {
    return clampField(input, "Position", -1000.0, 1000.0, 0.0, true);
}

ValidationResult ValidationUtils::validateFlowAmount(const std::string& input) {
    ValidationResult result;
    double num = 0.0;
    if (!parseLeadingNumber(input, num)) {
        result.error = "Amount must be a number";
        return result;
    }
    if (!std::isfinite(num)) {
        result.error = "Amount must be finite";
        return result;
    }
    if (num <= 0.0) {
        result.error = "Amount must be positive";
        return result;
    }
    result.valid = true;
    result.value = num;
    return result;
}

TextValidationResult ValidationUtils::validateText(const std::string& text) {
    TextValidationResult result;
    if (text.empty()) {
        result.error = "Text is required";
        return result;
    }

    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    std::string trimmed = (first < last) ? std::string(first, last) : std::string{};

    result.valid = true;
    result.sanitized = trimmed.substr(0, MAX_TEXT_LENGTH);
    if (text.size() > MAX_TEXT_LENGTH) {
        result.adjusted = true;
        result.error = "Text truncated to 500 characters";
        LOG_WARN("{}", result.error);
    }
    return result;
}

// =============================================================================
// Helpers
// =============================================================================

bool ValidationUtils::parseLeadingNumber(const std::string& input, double& out) {
    auto begin = std::find_if_not(input.begin(), input.end(), isSpace);
    const char* first = input.data() + (begin - input.begin());
    const char* last = input.data() + input.size();
    if (first != last && *first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr != first;
}

ValidationResult ValidationUtils::clampField(const std::string& input, const char* field,
                                             double minValue, double maxValue,
                                             double defaultValue, bool integral) {
    ValidationResult result;
    double num = 0.0;
    if (!parseLeadingNumber(input, num) || std::isnan(num)) {
        result.value = defaultValue;
        result.error = std::format("{} must be a number", field);
        return result;
    }
    if (integral) {
        num = std::trunc(num);
    }

    result.valid = true;
    result.value = std::clamp(num, minValue, maxValue);
    if (num < minValue || num > maxValue) {
        result.adjusted = true;
        result.error = std::format("{} clamped to {} to {} range", field, minValue, maxValue);
        LOG_WARN("{} (got {})", result.error, num);
    }
    return result;
}

}  // namespace sankeyedit
