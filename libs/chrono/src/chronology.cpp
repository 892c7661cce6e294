// =============================================================================
// datefmt - Chronologies Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/chrono/chronology.hpp>
#include <format>

namespace datefmt::chrono {

namespace {

// Years whose whole span fits in a signed 64-bit millisecond count
constexpr Int64 MIN_YEAR = -292275054;
constexpr Int64 MAX_YEAR = 292278993;

constexpr Int64 MIN_SUPPORTED_DAY = floor_div(MIN_SUPPORTED_MILLIS, MILLIS_PER_DAY);
constexpr Int64 MAX_SUPPORTED_DAY = floor_div(MAX_SUPPORTED_MILLIS, MILLIS_PER_DAY);

ErrorInfo invalid_fields(const String& message) {
    return ErrorInfo(ErrorCode::INVALID_FIELDS, message, "chronology");
}

Result<Int32> checked(const Optional<Int32>& value, Int32 fallback, Int32 min, Int32 max,
                      const char* name) {
    Int32 v = value.value_or(fallback);
    if (v < min || v > max) {
        ErrorInfo err = invalid_fields(
            std::format("Value {} for {} must be in the range [{},{}]", v, name, min, max));
        err.with_context("field", name);
        return err;
    }
    return v;
}

} // anonymous namespace

// =============================================================================
// BasicChronology
// =============================================================================

Int32 BasicChronology::day_of_week_of(Int64 epoch_day) {
    // 1970-01-01 was a Thursday
    return static_cast<Int32>(floor_mod(epoch_day + 3, 7)) + 1;
}

Int64 BasicChronology::week_year_start(Int64 week_year) const {
    Int64 jan4 = days_from_civil(week_year, 1, 4);
    return jan4 - (day_of_week_of(jan4) - 1);
}

Int32 BasicChronology::days_in_month(Int32 year, Int32 month) const {
    static constexpr std::array<Int32, 12> days{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[static_cast<Size>(month - 1)];
}

Int32 BasicChronology::weeks_in_week_year(Int32 week_year) const {
    return static_cast<Int32>((week_year_start(Int64(week_year) + 1) - week_year_start(week_year)) / 7);
}

CalendarFields BasicChronology::fields_of(Instant instant, const TimeZone& zone) const {
    CalendarFields f;
    f.offset_millis = zone.offset_at(instant);

    Int64 local = instant.epoch_millis() + f.offset_millis;
    Int64 days = floor_div(local, MILLIS_PER_DAY);
    Int64 millis_of_day = local - days * MILLIS_PER_DAY;

    Int64 year = 0;
    civil_from_days(days, year, f.month, f.day);
    f.year = static_cast<Int32>(year);

    f.hour = static_cast<Int32>(millis_of_day / MILLIS_PER_HOUR);
    f.minute = static_cast<Int32>(millis_of_day / MILLIS_PER_MINUTE % 60);
    f.second = static_cast<Int32>(millis_of_day / MILLIS_PER_SECOND % 60);
    f.millis = static_cast<Int32>(millis_of_day % MILLIS_PER_SECOND);

    f.day_of_week = day_of_week_of(days);
    f.day_of_year = static_cast<Int32>(days - days_from_civil(year, 1, 1)) + 1;

    Int64 week_year = year;
    Int64 start = week_year_start(year);
    if (days < start) {
        week_year = year - 1;
        start = week_year_start(week_year);
    } else {
        Int64 next = week_year_start(year + 1);
        if (days >= next) {
            week_year = year + 1;
            start = next;
        }
    }
    f.week_year = static_cast<Int32>(week_year);
    f.week_of_week_year = static_cast<Int32>((days - start) / 7) + 1;
    return f;
}

Result<Instant> BasicChronology::instant_of(const FieldValues& fields, const TimeZone& zone) const {
    Int64 days = 0;

    if (fields.week_year || fields.week_of_week_year) {
        Int32 week_year = fields.week_year.value_or(fields.year.value_or(1970));
        if (week_year < MIN_YEAR || week_year > MAX_YEAR) {
            return invalid_fields(std::format("Week year {} is out of range", week_year));
        }
        auto week = checked(fields.week_of_week_year, 1, 1, weeks_in_week_year(week_year),
                            "weekOfWeekyear");
        DATEFMT_TRY(week);
        auto dow = checked(fields.day_of_week, 1, 1, 7, "dayOfWeek");
        DATEFMT_TRY(dow);
        days = week_year_start(week_year) + Int64(*week - 1) * 7 + (*dow - 1);
    } else {
        Int32 year = fields.year.value_or(1970);
        if (year < MIN_YEAR || year > MAX_YEAR) {
            return invalid_fields(std::format("Year {} is out of range", year));
        }
        if (fields.day_of_year) {
            auto doy = checked(fields.day_of_year, 1, 1, days_in_year(year), "dayOfYear");
            DATEFMT_TRY(doy);
            days = days_from_civil(year, 1, 1) + (*doy - 1);
        } else {
            auto month = checked(fields.month, 1, 1, 12, "monthOfYear");
            DATEFMT_TRY(month);
            auto day = checked(fields.day, 1, 1, days_in_month(year, *month), "dayOfMonth");
            DATEFMT_TRY(day);
            days = days_from_civil(year, *month, *day);
        }
        // A day-of-week read next to a full date must agree with it
        if (fields.day_of_week) {
            auto dow = checked(fields.day_of_week, 1, 1, 7, "dayOfWeek");
            DATEFMT_TRY(dow);
            if (*dow != day_of_week_of(days)) {
                ErrorInfo err = invalid_fields(
                    std::format("Day of week {} does not match the date", *dow));
                err.with_context("field", "dayOfWeek");
                return err;
            }
        }
    }

    // Julian dates near the year bounds lie beyond the ISO ones
    if (days < MIN_SUPPORTED_DAY || days > MAX_SUPPORTED_DAY) {
        return invalid_fields("Date is outside the supported range");
    }

    auto hour = checked(fields.hour, 0, 0, 23, "hourOfDay");
    DATEFMT_TRY(hour);
    auto minute = checked(fields.minute, 0, 0, 59, "minuteOfHour");
    DATEFMT_TRY(minute);
    auto second = checked(fields.second, 0, 0, 59, "secondOfMinute");
    DATEFMT_TRY(second);
    auto millis = checked(fields.millis, 0, 0, 999, "millisOfSecond");
    DATEFMT_TRY(millis);

    Int64 local = days * MILLIS_PER_DAY + *hour * MILLIS_PER_HOUR +
                  *minute * MILLIS_PER_MINUTE + *second * MILLIS_PER_SECOND + *millis;

    Int64 offset = 0;
    if (fields.offset_millis) {
        offset = *fields.offset_millis;
    } else if (fields.zone) {
        offset = fields.zone->offset_from_local(local);
    } else {
        offset = zone.offset_from_local(local);
    }
    Instant instant(local - offset);
    if (!instant.is_supported()) {
        return invalid_fields(
            std::format("Instant {} is outside the supported range", instant.epoch_millis()));
    }
    return instant;
}

// =============================================================================
// IsoChronology
// =============================================================================

bool IsoChronology::is_leap_year(Int32 year) const {
    return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0);
}

Int64 IsoChronology::days_from_civil(Int64 year, Int32 month, Int32 day) const {
    Int64 y = year - (month <= 2 ? 1 : 0);
    Int64 era = (y >= 0 ? y : y - 399) / 400;
    Int64 yoe = y - era * 400;
    Int64 doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    Int64 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void IsoChronology::civil_from_days(Int64 days, Int64& year, Int32& month, Int32& day) const {
    Int64 z = days + 719468;
    Int64 era = (z >= 0 ? z : z - 146096) / 146097;
    Int64 doe = z - era * 146097;
    Int64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    Int64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    Int64 mp = (5 * doy + 2) / 153;
    day = static_cast<Int32>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<Int32>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

// =============================================================================
// JulianChronology
// =============================================================================

bool JulianChronology::is_leap_year(Int32 year) const {
    return year % 4 == 0;
}

Int64 JulianChronology::days_from_civil(Int64 year, Int32 month, Int32 day) const {
    Int64 y = year - (month <= 2 ? 1 : 0);
    Int64 era = (y >= 0 ? y : y - 3) / 4;
    Int64 yoe = y - era * 4;
    Int64 doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    Int64 doe = yoe * 365 + doy;
    return era * 1461 + doe - 719470;
}

void JulianChronology::civil_from_days(Int64 days, Int64& year, Int32& month, Int32& day) const {
    Int64 z = days + 719470;
    Int64 era = (z >= 0 ? z : z - 1460) / 1461;
    Int64 doe = z - era * 1461;
    Int64 yoe = (doe - doe / 1460) / 365;
    Int64 doy = doe - 365 * yoe;
    Int64 mp = (5 * doy + 2) / 153;
    day = static_cast<Int32>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<Int32>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 4 + (month <= 2 ? 1 : 0);
}

// =============================================================================
// Chronology Lookup
// =============================================================================

namespace chronologies {

ChronologyPtr iso() {
    static const ChronologyPtr chronology = std::make_shared<IsoChronology>();
    return chronology;
}

ChronologyPtr julian() {
    static const ChronologyPtr chronology = std::make_shared<JulianChronology>();
    return chronology;
}

Result<ChronologyPtr> for_id(StringView id) {
    String name = trim(id);
    if (equals_ignore_case(name, "ISO") || equals_ignore_case(name, "Gregorian")) return iso();
    if (equals_ignore_case(name, "Julian")) return julian();
    return ErrorInfo(ErrorCode::UNKNOWN_CHRONOLOGY, "Unknown chronology '" + name + "'",
                     "chronologies");
}

} // namespace chronologies

} // namespace datefmt::chrono
