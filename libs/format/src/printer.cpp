// =============================================================================
// datefmt - Printer Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/printer.hpp>
#include <format>

namespace datefmt::format {

using chrono::CalendarFields;
using chrono::NameStyle;

namespace {

void append_number(String& out, Int64 value, Int32 min_digits) {
    if (value < 0) {
        out += '-';
        out += zero_padded(static_cast<UInt64>(-value), static_cast<Size>(min_digits));
    } else {
        out += zero_padded(static_cast<UInt64>(value), static_cast<Size>(min_digits));
    }
}

Int32 year_of_era(Int32 year) {
    return year > 0 ? year : 1 - year;
}

void append_year(String& out, const FieldDirective& d, Int32 year) {
    if (d.mode == RenderMode::TWO_DIGIT_YEAR) {
        Int32 two = (year < 0 ? -year : year) % 100;
        out += zero_padded(static_cast<UInt64>(two), 2);
    } else {
        append_number(out, year, d.min_digits);
    }
}

void append_fraction(String& out, const FieldDirective& d, Int32 millis) {
    String digits = zero_padded(static_cast<UInt64>(millis), 3);
    Size count = static_cast<Size>(d.min_digits);
    if (count <= digits.size()) {
        out += digits.substr(0, count);
    } else {
        out += digits;
        out.append(count - digits.size(), '0');
    }
}

NameStyle style_of(const FieldDirective& d) {
    return d.mode == RenderMode::LONG_NAME ? NameStyle::LONG : NameStyle::SHORT;
}

bool is_text(const FieldDirective& d) {
    return d.mode == RenderMode::SHORT_NAME || d.mode == RenderMode::LONG_NAME;
}

void append_field(String& out, const FieldDirective& d, const CalendarFields& f,
                  chrono::Instant instant, const chrono::TimeZone& zone,
                  const chrono::Locale& locale) {
    switch (d.kind) {
        case FieldKind::ERA:
            out += locale.era_text(f.year > 0);
            break;
        case FieldKind::CENTURY_OF_ERA:
            append_number(out, year_of_era(f.year) / 100, d.min_digits);
            break;
        case FieldKind::YEAR_OF_ERA:
            append_year(out, d, year_of_era(f.year));
            break;
        case FieldKind::WEEK_YEAR:
            append_year(out, d, f.week_year);
            break;
        case FieldKind::YEAR:
            append_year(out, d, f.year);
            break;
        case FieldKind::WEEK_OF_WEEK_YEAR:
            append_number(out, f.week_of_week_year, d.min_digits);
            break;
        case FieldKind::DAY_OF_WEEK:
            if (is_text(d)) out += locale.weekday_name(f.day_of_week, style_of(d));
            else append_number(out, f.day_of_week, d.min_digits);
            break;
        case FieldKind::DAY_OF_YEAR:
            append_number(out, f.day_of_year, d.min_digits);
            break;
        case FieldKind::MONTH_OF_YEAR:
            if (is_text(d)) out += locale.month_name(f.month, style_of(d));
            else append_number(out, f.month, d.min_digits);
            break;
        case FieldKind::DAY_OF_MONTH:
            append_number(out, f.day, d.min_digits);
            break;
        case FieldKind::HALFDAY_OF_DAY:
            out += locale.halfday_text(f.hour >= 12);
            break;
        case FieldKind::HOUR_OF_HALFDAY:
            append_number(out, f.hour % 12, d.min_digits);
            break;
        case FieldKind::CLOCKHOUR_OF_HALFDAY:
            append_number(out, f.hour % 12 == 0 ? 12 : f.hour % 12, d.min_digits);
            break;
        case FieldKind::HOUR_OF_DAY:
            append_number(out, f.hour, d.min_digits);
            break;
        case FieldKind::CLOCKHOUR_OF_DAY:
            append_number(out, f.hour == 0 ? 24 : f.hour, d.min_digits);
            break;
        case FieldKind::MINUTE_OF_HOUR:
            append_number(out, f.minute, d.min_digits);
            break;
        case FieldKind::SECOND_OF_MINUTE:
            append_number(out, f.second, d.min_digits);
            break;
        case FieldKind::FRACTION_OF_SECOND:
            append_fraction(out, d, f.millis);
            break;
        case FieldKind::TIME_ZONE_NAME:
            out += zone.short_name(instant);
            break;
        case FieldKind::TIME_ZONE_OFFSET:
            if (d.mode == RenderMode::ZONE_ID) {
                out += zone.id();
            } else if (f.offset_millis == 0 && !d.zero_offset_text.empty()) {
                out += d.zero_offset_text;
            } else {
                out += format_offset(f.offset_millis, d.offset_colon, d.max_digits);
            }
            break;
    }
}

} // anonymous namespace

String format_offset(Int64 offset_millis, bool colon, Int32 max_fields) {
    String out = offset_millis < 0 ? "-" : "+";
    Int64 rest = offset_millis < 0 ? -offset_millis : offset_millis;
    const char* sep = colon ? ":" : "";

    out += zero_padded(static_cast<UInt64>(rest / chrono::MILLIS_PER_HOUR), 2);
    rest %= chrono::MILLIS_PER_HOUR;
    out += sep;
    out += zero_padded(static_cast<UInt64>(rest / chrono::MILLIS_PER_MINUTE), 2);
    rest %= chrono::MILLIS_PER_MINUTE;

    if (max_fields > 2 && rest != 0) {
        out += sep;
        out += zero_padded(static_cast<UInt64>(rest / chrono::MILLIS_PER_SECOND), 2);
        rest %= chrono::MILLIS_PER_SECOND;
        if (rest != 0) {
            out += '.';
            out += zero_padded(static_cast<UInt64>(rest), 3);
        }
    }
    return out;
}

String render(const CompiledPlan& plan, chrono::Instant instant,
              const chrono::TimeZone& zone, const chrono::Locale& locale,
              const chrono::Chronology& chronology) {
    if (!instant.is_supported()) {
        throw FormatException(ErrorCode::INVALID_ARGUMENT,
                              std::format("Instant {} is outside the supported range",
                                          instant.epoch_millis()));
    }
    CalendarFields fields = chronology.fields_of(instant, zone);

    String out;
    for (const auto& ins : plan.instructions()) {
        if (const auto* lit = std::get_if<LiteralText>(&ins)) {
            out += lit->text;
        } else if (const auto* field = std::get_if<FieldDirective>(&ins)) {
            append_field(out, *field, fields, instant, zone, locale);
        } else {
            throw FormatException(ErrorCode::UNSUPPORTED,
                                  std::format("Plan '{}' is parse-only", plan.source()));
        }
    }
    return out;
}

} // namespace datefmt::format
