// =============================================================================
// datefmt - Parser Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/parser.hpp>
#include <datefmt/chrono/time_zone.hpp>
#include <format>

namespace datefmt::format {

using chrono::FieldValues;
using chrono::NameStyle;

namespace {

// Widest digit run read into one value
constexpr Int32 MAX_PARSED_DIGITS = 18;

// A number that matched its digits but lies outside the field's range
struct OutOfRange {
    FieldKind kind;
    Int64 value = 0;
    Size position = 0;
};

// Fields that need combining before they map onto FieldValues
struct Accumulator {
    FieldValues values;
    Optional<OutOfRange> out_of_range;
    Optional<bool> ad;
    Optional<Int32> century;
    Optional<Int32> year_of_era;
    Optional<bool> pm;
    Optional<Int32> hour_of_halfday;
};

struct Cursor {
    Size pos = 0;
    Accumulator acc;
};

struct Failure {
    Size position = 0;
    String detail;
    String expected;
};

bool is_zone_id_char(char c) {
    return is_pattern_letter(c) || is_digit(c) || c == '+' || c == '-' || c == ':' ||
           c == '_' || c == '/' || c == '.';
}

class Executor {
private:
    StringView text_;
    const chrono::Locale& locale_;
    Optional<Int32> pivot_year_;
    Optional<Failure> furthest_;

public:
    Executor(StringView text, const chrono::Locale& locale, Optional<Int32> pivot_year)
        : text_(text), locale_(locale), pivot_year_(pivot_year) {}

    [[nodiscard]] const Optional<Failure>& furthest() const { return furthest_; }

    bool run(const InstructionList& list, Cursor& cursor) {
        for (const auto& ins : list) {
            bool ok = std::visit([&](const auto& step) { return execute(step, cursor); }, ins);
            if (!ok) return false;
        }
        return true;
    }

private:
    // Reads the clock only for the first two-digit year
    Int32 pivot_year() {
        if (!pivot_year_) pivot_year_ = default_pivot_year();
        return *pivot_year_;
    }

    bool fail(Size pos, String detail, String expected) {
        if (!furthest_ || pos > furthest_->position) {
            furthest_ = Failure{pos, std::move(detail), std::move(expected)};
        }
        return false;
    }

    bool execute(const LiteralText& lit, Cursor& cursor) {
        StringView rest = text_.substr(cursor.pos);
        if (!starts_with_ignore_case(rest, lit.text)) {
            return fail(cursor.pos, "Expected '" + lit.text + "'", lit.text);
        }
        cursor.pos += lit.text.size();
        return true;
    }

    bool execute(const OptionalGroup& group, Cursor& cursor) {
        Cursor trial = cursor;
        if (run(group.body, trial)) cursor = std::move(trial);
        return true;
    }

    bool execute(const ChoiceGroup& group, Cursor& cursor) {
        Optional<Cursor> best;
        for (const auto& alternative : group.alternatives) {
            Cursor trial = cursor;
            if (run(alternative, trial) && (!best || trial.pos > best->pos)) {
                best = std::move(trial);
            }
        }
        if (!best) return false;
        cursor = std::move(*best);
        return true;
    }

    bool execute(const FieldDirective& d, Cursor& cursor) {
        switch (d.mode) {
            case RenderMode::NUMERIC:
            case RenderMode::ZERO_PADDED:
            case RenderMode::TWO_DIGIT_YEAR:
            case RenderMode::FRACTION:
                return parse_number(d, cursor);
            case RenderMode::SHORT_NAME:
            case RenderMode::LONG_NAME:
                return parse_text(d, cursor);
            case RenderMode::OFFSET:
                return parse_offset(d, cursor);
            case RenderMode::ZONE_ID:
                return parse_zone_id(cursor);
            case RenderMode::ZONE_NAME:
                return fail(cursor.pos, "Time zone names cannot be parsed", "zone name");
        }
        return false;
    }

    // -------------------------------------------------------------------------
    // Numbers
    // -------------------------------------------------------------------------

    bool parse_number(const FieldDirective& d, Cursor& cursor) {
        const Size start = cursor.pos;
        Size pos = start;
        bool negative = false;
        bool has_sign = false;

        if (d.sign != SignRule::NONE && pos < text_.size() &&
            (text_[pos] == '-' || text_[pos] == '+')) {
            negative = text_[pos] == '-';
            has_sign = true;
            ++pos;
        }

        Int32 limit = d.fixed_width ? d.min_digits : d.max_digits;
        if (limit > MAX_PARSED_DIGITS) limit = MAX_PARSED_DIGITS;

        const Size digits_start = pos;
        Int64 value = 0;
        while (pos < text_.size() && is_digit(text_[pos]) &&
               static_cast<Int32>(pos - digits_start) < limit) {
            value = value * 10 + (text_[pos] - '0');
            ++pos;
        }
        const Int32 digits = static_cast<Int32>(pos - digits_start);
        const String field_name(to_string(d.kind));

        if (digits == 0) {
            return fail(digits_start, "Expected digits for " + field_name, field_name);
        }
        if (d.fixed_width && digits < d.min_digits) {
            return fail(start, std::format("Expected {} digits for {}", d.min_digits, field_name),
                        field_name);
        }
        if (negative) value = -value;

        if (d.mode == RenderMode::FRACTION) {
            // Millisecond precision; further digits are dropped
            Int64 millis = 0;
            for (Int32 i = 0; i < 3; ++i) {
                millis *= 10;
                if (i < digits) millis += text_[digits_start + static_cast<Size>(i)] - '0';
            }
            cursor.acc.values.millis = static_cast<Int32>(millis);
            cursor.pos = pos;
            return true;
        }

        if (d.mode == RenderMode::TWO_DIGIT_YEAR && digits == 2 && !has_sign) {
            value = resolve_two_digit_year(static_cast<Int32>(value), pivot_year());
        }

        // The digits match either way; the range is reported after the whole text matched
        const DirectiveInfo& info = directive_info(d.kind);
        if (value < info.min_value || value > info.max_value) {
            if (!cursor.acc.out_of_range) cursor.acc.out_of_range = OutOfRange{d.kind, value, start};
        } else {
            store_number(d.kind, static_cast<Int32>(value), cursor.acc);
        }
        cursor.pos = pos;
        return true;
    }

    static void store_number(FieldKind kind, Int32 value, Accumulator& acc) {
        FieldValues& v = acc.values;
        switch (kind) {
            case FieldKind::CENTURY_OF_ERA:       acc.century = value; break;
            case FieldKind::YEAR_OF_ERA:          acc.year_of_era = value; break;
            case FieldKind::WEEK_YEAR:            v.week_year = value; break;
            case FieldKind::WEEK_OF_WEEK_YEAR:    v.week_of_week_year = value; break;
            case FieldKind::DAY_OF_WEEK:          v.day_of_week = value; break;
            case FieldKind::YEAR:                 v.year = value; break;
            case FieldKind::DAY_OF_YEAR:          v.day_of_year = value; break;
            case FieldKind::MONTH_OF_YEAR:        v.month = value; break;
            case FieldKind::DAY_OF_MONTH:         v.day = value; break;
            case FieldKind::HOUR_OF_HALFDAY:      acc.hour_of_halfday = value; break;
            case FieldKind::CLOCKHOUR_OF_HALFDAY: acc.hour_of_halfday = value % 12; break;
            case FieldKind::HOUR_OF_DAY:          v.hour = value; break;
            case FieldKind::CLOCKHOUR_OF_DAY:     v.hour = value % 24; break;
            case FieldKind::MINUTE_OF_HOUR:       v.minute = value; break;
            case FieldKind::SECOND_OF_MINUTE:     v.second = value; break;
            default: break;
        }
    }

    // -------------------------------------------------------------------------
    // Names
    // -------------------------------------------------------------------------

    // Longest case-insensitive match; ties keep the first candidate
    Optional<std::pair<Int32, Size>> match_name(Size pos,
                                                const Vector<std::pair<const String*, Int32>>& names) const {
        StringView rest = text_.substr(pos);
        Optional<std::pair<Int32, Size>> best;
        for (const auto& [name, value] : names) {
            if (name->empty() || !starts_with_ignore_case(rest, *name)) continue;
            if (!best || name->size() > best->second) best = std::make_pair(value, name->size());
        }
        return best;
    }

    bool parse_text(const FieldDirective& d, Cursor& cursor) {
        Vector<std::pair<const String*, Int32>> names;
        switch (d.kind) {
            case FieldKind::ERA:
                names.emplace_back(&locale_.era_text(false), 0);
                names.emplace_back(&locale_.era_text(true), 1);
                break;
            case FieldKind::HALFDAY_OF_DAY:
                names.emplace_back(&locale_.halfday_text(false), 0);
                names.emplace_back(&locale_.halfday_text(true), 1);
                break;
            case FieldKind::MONTH_OF_YEAR:
                for (Int32 m = 1; m <= 12; ++m) {
                    names.emplace_back(&locale_.month_name(m, NameStyle::LONG), m);
                    names.emplace_back(&locale_.month_name(m, NameStyle::SHORT), m);
                }
                break;
            case FieldKind::DAY_OF_WEEK:
                for (Int32 dow = 1; dow <= 7; ++dow) {
                    names.emplace_back(&locale_.weekday_name(dow, NameStyle::LONG), dow);
                    names.emplace_back(&locale_.weekday_name(dow, NameStyle::SHORT), dow);
                }
                break;
            default:
                break;
        }

        const String field_name(to_string(d.kind));
        auto match = match_name(cursor.pos, names);
        if (!match) {
            return fail(cursor.pos, "Expected a " + field_name + " name", field_name);
        }

        Accumulator& acc = cursor.acc;
        switch (d.kind) {
            case FieldKind::ERA:            acc.ad = match->first == 1; break;
            case FieldKind::HALFDAY_OF_DAY: acc.pm = match->first == 1; break;
            case FieldKind::MONTH_OF_YEAR:  acc.values.month = match->first; break;
            case FieldKind::DAY_OF_WEEK:    acc.values.day_of_week = match->first; break;
            default: break;
        }
        cursor.pos += match->second;
        return true;
    }

    // -------------------------------------------------------------------------
    // Zones
    // -------------------------------------------------------------------------

    Optional<Int64> two_digits_at(Size pos) const {
        if (pos + 2 > text_.size() || !is_digit(text_[pos]) || !is_digit(text_[pos + 1])) {
            return nullopt;
        }
        return (text_[pos] - '0') * 10 + (text_[pos + 1] - '0');
    }

    // Reads [':']NN after an offset component
    Optional<Int64> next_component(Size& pos) const {
        Size at = pos;
        if (at < text_.size() && text_[at] == ':') ++at;
        auto value = two_digits_at(at);
        if (!value || *value > 59) return nullopt;
        pos = at + 2;
        return value;
    }

    bool parse_offset(const FieldDirective& d, Cursor& cursor) {
        Size pos = cursor.pos;
        if (pos < text_.size() && (text_[pos] == 'Z' || text_[pos] == 'z')) {
            cursor.acc.values.offset_millis = 0;
            cursor.pos = pos + 1;
            return true;
        }
        if (pos >= text_.size() || (text_[pos] != '+' && text_[pos] != '-')) {
            return fail(pos, "Expected a zone offset", "+HH:MM");
        }
        const Int64 sign = text_[pos] == '-' ? -1 : 1;
        ++pos;

        auto hours = two_digits_at(pos);
        if (!hours || *hours > 23) return fail(pos, "Expected offset hours", "HH");
        pos += 2;

        Int64 millis = *hours * chrono::MILLIS_PER_HOUR;
        if (auto minutes = next_component(pos)) {
            millis += *minutes * chrono::MILLIS_PER_MINUTE;
            if (d.max_digits > 2) {
                if (auto seconds = next_component(pos)) {
                    millis += *seconds * chrono::MILLIS_PER_SECOND;
                    if (pos + 4 <= text_.size() && text_[pos] == '.' && is_digit(text_[pos + 1]) &&
                        is_digit(text_[pos + 2]) && is_digit(text_[pos + 3])) {
                        millis += (text_[pos + 1] - '0') * 100 + (text_[pos + 2] - '0') * 10 +
                                  (text_[pos + 3] - '0');
                        pos += 4;
                    }
                }
            }
        }
        cursor.acc.values.offset_millis = sign * millis;
        cursor.pos = pos;
        return true;
    }

    bool parse_zone_id(Cursor& cursor) {
        Size end = cursor.pos;
        while (end < text_.size() && is_zone_id_char(text_[end])) ++end;
        for (Size len = end - cursor.pos; len > 0; --len) {
            auto zone = chrono::zones::for_id(text_.substr(cursor.pos, len));
            if (zone.is_success()) {
                cursor.acc.values.zone = zone.value();
                cursor.pos += len;
                return true;
            }
        }
        return fail(cursor.pos, "Expected a time zone id", "zone id");
    }
};

FieldValues combine(const Accumulator& acc) {
    FieldValues values = acc.values;

    if (acc.year_of_era || acc.century) {
        Int32 yoe = acc.year_of_era.value_or(0);
        if (acc.century) yoe = *acc.century * 100 + yoe % 100;
        values.year = acc.ad.value_or(true) ? yoe : 1 - yoe;
    }

    if (acc.hour_of_halfday) {
        values.hour = *acc.hour_of_halfday + (acc.pm.value_or(false) ? 12 : 0);
    } else if (acc.pm) {
        values.hour = values.hour.value_or(0) % 12 + (*acc.pm ? 12 : 0);
    }
    return values;
}

ErrorInfo malformed(StringView text, const Failure& failure) {
    String message = failure.position >= text.size()
        ? std::format("Invalid format: \"{}\" is too short", text)
        : std::format("Invalid format: \"{}\" is malformed at \"{}\"", text,
                      text.substr(failure.position));
    ErrorInfo err(ErrorCode::PARSE_ERROR, message, "parser");
    err.at_position(failure.position);
    err.with_context("expected", failure.expected);
    err.with_context("detail", failure.detail);
    return err;
}

ErrorInfo out_of_range(StringView text, const OutOfRange& bad) {
    const DirectiveInfo& info = directive_info(bad.kind);
    const String field_name(to_string(bad.kind));
    ErrorInfo err(ErrorCode::INVALID_FIELDS,
                  std::format("Cannot parse \"{}\": Value {} for {} must be in the range [{},{}]",
                              text, bad.value, field_name, info.min_value, info.max_value),
                  "parser");
    err.at_position(bad.position);
    err.with_context("field", field_name);
    err.with_context("text", String(text));
    return err;
}

} // anonymous namespace

Int32 default_pivot_year() {
    auto fields = chrono::chronologies::iso()->fields_of(chrono::Instant::now(), *chrono::zones::utc());
    return fields.year;
}

Int32 resolve_two_digit_year(Int32 two_digits, Int32 pivot_year) {
    return pivot_year - static_cast<Int32>(chrono::floor_mod(Int64(pivot_year) - two_digits, 100));
}

Result<ParsedFields> parse_fields(const CompiledPlan& plan, StringView text,
                                  const chrono::Locale& locale, Optional<Int32> pivot_year,
                                  ParseOptions options) {
    if (!plan.is_parseable()) {
        return ErrorInfo(ErrorCode::UNSUPPORTED,
                         std::format("Plan '{}' cannot be used for parsing", plan.source()), "parser");
    }

    Executor executor(text, locale, pivot_year);
    Cursor cursor;

    if (!executor.run(plan.instructions(), cursor)) {
        return malformed(text, executor.furthest().value_or(Failure{cursor.pos, "No match", ""}));
    }

    if (!options.allow_trailing && cursor.pos < text.size()) {
        const auto& furthest = executor.furthest();
        if (furthest && furthest->position > cursor.pos) {
            return malformed(text, *furthest);
        }
        ErrorInfo err(ErrorCode::TRAILING_INPUT,
                      std::format("Invalid format: \"{}\" is malformed at \"{}\"", text,
                                  text.substr(cursor.pos)),
                      "parser");
        err.at_position(cursor.pos);
        err.with_context("expected", "end of text");
        return err;
    }

    if (cursor.acc.out_of_range) {
        return out_of_range(text.substr(0, cursor.pos), *cursor.acc.out_of_range);
    }

    return ParsedFields{combine(cursor.acc), cursor.pos};
}

namespace {

Result<chrono::Instant> resolve(const ParsedFields& parsed, StringView text,
                                const chrono::TimeZone& zone,
                                const chrono::Chronology& chronology) {
    auto instant = chronology.instant_of(parsed.fields, zone);
    if (instant.is_error()) {
        ErrorInfo err = instant.error();
        err.message = std::format("Cannot parse \"{}\": {}", text, err.message);
        err.with_context("text", String(text));
        return err;
    }
    return instant;
}

} // anonymous namespace

Result<chrono::Instant> parse(const CompiledPlan& plan, StringView text,
                              const chrono::TimeZone& zone, const chrono::Locale& locale,
                              const chrono::Chronology& chronology, Optional<Int32> pivot_year,
                              ParseOptions options) {
    auto parsed = parse_fields(plan, text, locale, pivot_year, options);
    if (parsed.is_error()) return parsed.error();
    return resolve(parsed.value(), text, zone, chronology);
}

Result<PrefixParse> parse_prefix(const CompiledPlan& plan, StringView text,
                                 const chrono::TimeZone& zone, const chrono::Locale& locale,
                                 const chrono::Chronology& chronology,
                                 Optional<Int32> pivot_year) {
    ParseOptions options;
    options.allow_trailing = true;
    auto parsed = parse_fields(plan, text, locale, pivot_year, options);
    if (parsed.is_error()) return parsed.error();

    auto instant = resolve(parsed.value(), text.substr(0, parsed->consumed), zone, chronology);
    if (instant.is_error()) return instant.error();
    return PrefixParse{instant.value(), parsed->consumed};
}

} // namespace datefmt::format
