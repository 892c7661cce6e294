// =============================================================================
// datefmt - Field Directive Table Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/directive.hpp>
#include <algorithm>
#include <stdexcept>

namespace datefmt::format {

namespace {

constexpr Int32 MAX_YEAR_VALUE = 292278993;

} // anonymous namespace

const Vector<DirectiveInfo>& directive_table() {
    using P = Presentation;
    using K = FieldKind;
    static const Vector<DirectiveInfo> table = {
        // letter kind                    presentation  min  max             digits signed print_only
        {'G', K::ERA,                  P::TEXT,        0, 1,              0, false, false},
        {'C', K::CENTURY_OF_ERA,       P::NUMBER,      0, 2922789,        7, false, false},
        {'Y', K::YEAR_OF_ERA,          P::YEAR,        1, MAX_YEAR_VALUE, 9, false, false},
        {'x', K::WEEK_YEAR,            P::YEAR,  -MAX_YEAR_VALUE, MAX_YEAR_VALUE, 9, true, false},
        {'w', K::WEEK_OF_WEEK_YEAR,    P::NUMBER,      1, 53,             2, false, false},
        {'e', K::DAY_OF_WEEK,          P::NUMBER,      1, 7,              2, false, false},
        {'E', K::DAY_OF_WEEK,          P::TEXT,        1, 7,              0, false, false},
        {'y', K::YEAR,                 P::YEAR,  -MAX_YEAR_VALUE, MAX_YEAR_VALUE, 9, true, false},
        {'D', K::DAY_OF_YEAR,          P::NUMBER,      1, 366,            3, false, false},
        {'M', K::MONTH_OF_YEAR,        P::MONTH,       1, 12,             2, false, false},
        {'d', K::DAY_OF_MONTH,         P::NUMBER,      1, 31,             2, false, false},
        {'a', K::HALFDAY_OF_DAY,       P::TEXT,        0, 1,              0, false, false},
        {'K', K::HOUR_OF_HALFDAY,      P::NUMBER,      0, 11,             2, false, false},
        {'h', K::CLOCKHOUR_OF_HALFDAY, P::NUMBER,      1, 12,             2, false, false},
        {'H', K::HOUR_OF_DAY,          P::NUMBER,      0, 23,             2, false, false},
        {'k', K::CLOCKHOUR_OF_DAY,     P::NUMBER,      1, 24,             2, false, false},
        {'m', K::MINUTE_OF_HOUR,       P::NUMBER,      0, 59,             2, false, false},
        {'s', K::SECOND_OF_MINUTE,     P::NUMBER,      0, 59,             2, false, false},
        {'S', K::FRACTION_OF_SECOND,   P::FRACTION,    0, 999,            3, false, false},
        {'z', K::TIME_ZONE_NAME,       P::ZONE_NAME,   0, 0,              0, false, true},
        {'Z', K::TIME_ZONE_OFFSET,     P::ZONE_OFFSET, 0, 0,              0, true,  false},
    };
    return table;
}

Optional<DirectiveInfo> directive_for(char letter) {
    const auto& table = directive_table();
    auto it = std::find_if(table.begin(), table.end(),
                           [letter](const DirectiveInfo& d) { return d.letter == letter; });
    if (it == table.end()) return nullopt;
    return *it;
}

const DirectiveInfo& directive_info(FieldKind kind) {
    // First entry per kind is the numeric form ('e' before 'E')
    for (const auto& d : directive_table()) {
        if (d.kind == kind) return d;
    }
    throw std::logic_error("field kind missing from directive table");
}

StringView to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::ERA:                  return "era";
        case FieldKind::CENTURY_OF_ERA:       return "centuryOfEra";
        case FieldKind::YEAR_OF_ERA:          return "yearOfEra";
        case FieldKind::WEEK_YEAR:            return "weekyear";
        case FieldKind::WEEK_OF_WEEK_YEAR:    return "weekOfWeekyear";
        case FieldKind::DAY_OF_WEEK:          return "dayOfWeek";
        case FieldKind::YEAR:                 return "year";
        case FieldKind::DAY_OF_YEAR:          return "dayOfYear";
        case FieldKind::MONTH_OF_YEAR:        return "monthOfYear";
        case FieldKind::DAY_OF_MONTH:         return "dayOfMonth";
        case FieldKind::HALFDAY_OF_DAY:       return "halfdayOfDay";
        case FieldKind::HOUR_OF_HALFDAY:      return "hourOfHalfday";
        case FieldKind::CLOCKHOUR_OF_HALFDAY: return "clockhourOfHalfday";
        case FieldKind::HOUR_OF_DAY:          return "hourOfDay";
        case FieldKind::CLOCKHOUR_OF_DAY:     return "clockhourOfDay";
        case FieldKind::MINUTE_OF_HOUR:       return "minuteOfHour";
        case FieldKind::SECOND_OF_MINUTE:     return "secondOfMinute";
        case FieldKind::FRACTION_OF_SECOND:   return "fractionOfSecond";
        case FieldKind::TIME_ZONE_NAME:       return "timeZoneName";
        case FieldKind::TIME_ZONE_OFFSET:     return "timeZoneOffset";
    }
    return "unknown";
}

StringView to_string(RenderMode mode) {
    switch (mode) {
        case RenderMode::NUMERIC:        return "numeric";
        case RenderMode::ZERO_PADDED:    return "zero-padded";
        case RenderMode::TWO_DIGIT_YEAR: return "two-digit-year";
        case RenderMode::FRACTION:       return "fraction";
        case RenderMode::SHORT_NAME:     return "short-name";
        case RenderMode::LONG_NAME:      return "long-name";
        case RenderMode::OFFSET:         return "offset";
        case RenderMode::ZONE_ID:        return "zone-id";
        case RenderMode::ZONE_NAME:      return "zone-name";
    }
    return "unknown";
}

} // namespace datefmt::format
