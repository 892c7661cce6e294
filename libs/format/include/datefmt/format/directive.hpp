#pragma once
// =============================================================================
// datefmt - Field Directive Table
// Version: 1.2.0
// Pattern letters and the calendar fields they stand for
// =============================================================================

#include "datefmt/common/types.hpp"

namespace datefmt::format {

enum class FieldKind : UInt8 {
    ERA,
    CENTURY_OF_ERA,
    YEAR_OF_ERA,
    WEEK_YEAR,
    WEEK_OF_WEEK_YEAR,
    DAY_OF_WEEK,
    YEAR,
    DAY_OF_YEAR,
    MONTH_OF_YEAR,
    DAY_OF_MONTH,
    HALFDAY_OF_DAY,
    HOUR_OF_HALFDAY,
    CLOCKHOUR_OF_HALFDAY,
    HOUR_OF_DAY,
    CLOCKHOUR_OF_DAY,
    MINUTE_OF_HOUR,
    SECOND_OF_MINUTE,
    FRACTION_OF_SECOND,
    TIME_ZONE_NAME,
    TIME_ZONE_OFFSET
};

enum class RenderMode : UInt8 {
    NUMERIC,         // minimal digits
    ZERO_PADDED,     // padded to min digits
    TWO_DIGIT_YEAR,  // year mod 100, pivot-resolved when parsed
    FRACTION,        // leading digits of the second fraction
    SHORT_NAME,
    LONG_NAME,
    OFFSET,
    ZONE_ID,
    ZONE_NAME
};

// How a letter's repeat count is interpreted
enum class Presentation : UInt8 {
    NUMBER,
    YEAR,
    TEXT,
    MONTH,       // number up to two letters, text from three
    FRACTION,
    ZONE_NAME,
    ZONE_OFFSET
};

struct DirectiveInfo {
    char letter;
    FieldKind kind;
    Presentation presentation;
    // Inclusive bounds checked when the field is parsed as a number
    Int32 min_value;
    Int32 max_value;
    // Digits a parse may consume when the width is not constrained by a neighbour
    Int32 default_max_digits;
    bool signed_value;
    bool print_only;
};

// Directive for a pattern letter, nullopt for reserved letters
[[nodiscard]] Optional<DirectiveInfo> directive_for(char letter);

[[nodiscard]] const Vector<DirectiveInfo>& directive_table();

[[nodiscard]] const DirectiveInfo& directive_info(FieldKind kind);

[[nodiscard]] StringView to_string(FieldKind kind);
[[nodiscard]] StringView to_string(RenderMode mode);

[[nodiscard]] constexpr bool is_numeric(RenderMode mode) {
    return mode == RenderMode::NUMERIC || mode == RenderMode::ZERO_PADDED ||
           mode == RenderMode::TWO_DIGIT_YEAR || mode == RenderMode::FRACTION;
}

[[nodiscard]] constexpr bool is_pattern_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace datefmt::format
