#pragma once
// =============================================================================
// datefmt - Chronologies
// Version: 1.2.0
// Calendar systems mapping instants to field values and back
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/chrono/instant.hpp"
#include "datefmt/chrono/time_zone.hpp"

namespace datefmt::chrono {

// =============================================================================
// Field Values
// =============================================================================

// Fields of an instant as seen in one zone
struct CalendarFields {
    Int32 year = 1970;        // proleptic, year 0 is 1 BC
    Int32 month = 1;          // 1-12
    Int32 day = 1;            // 1-31
    Int32 hour = 0;           // 0-23
    Int32 minute = 0;         // 0-59
    Int32 second = 0;         // 0-59
    Int32 millis = 0;         // 0-999

    Int32 day_of_week = 4;    // 1=Monday, 7=Sunday
    Int32 day_of_year = 1;    // 1-366
    Int32 week_year = 1970;
    Int32 week_of_week_year = 1;  // 1-53

    Int64 offset_millis = 0;  // zone offset in effect

    bool operator==(const CalendarFields&) const = default;
};

// Partially known fields collected by a parser. Resolution order is
// week date, then ordinal date, then year/month/day; absent fields default
// to 1970-01-01T00:00:00.000.
struct FieldValues {
    Optional<Int32> year;
    Optional<Int32> month;
    Optional<Int32> day;
    Optional<Int32> day_of_year;
    Optional<Int32> week_year;
    Optional<Int32> week_of_week_year;
    Optional<Int32> day_of_week;
    Optional<Int32> hour;
    Optional<Int32> minute;
    Optional<Int32> second;
    Optional<Int32> millis;

    // Offset read from the text; overrides the zone when set
    Optional<Int64> offset_millis;
    // Zone read from the text; used when no offset was read
    ZonePtr zone;

    bool operator==(const FieldValues&) const = default;
};

// =============================================================================
// Chronology
// =============================================================================

class Chronology {
public:
    virtual ~Chronology() = default;

    [[nodiscard]] virtual const String& id() const = 0;

    // Total for supported instants (Instant::is_supported)
    [[nodiscard]] virtual CalendarFields fields_of(Instant instant, const TimeZone& zone) const = 0;

    // Fails with INVALID_FIELDS when the combination is not a valid date/time
    // or falls outside the supported instant range
    [[nodiscard]] virtual Result<Instant> instant_of(const FieldValues& fields,
                                                     const TimeZone& zone) const = 0;

    [[nodiscard]] virtual bool is_leap_year(Int32 year) const = 0;
    [[nodiscard]] virtual Int32 days_in_month(Int32 year, Int32 month) const = 0;
    [[nodiscard]] Int32 days_in_year(Int32 year) const { return is_leap_year(year) ? 366 : 365; }
    [[nodiscard]] virtual Int32 weeks_in_week_year(Int32 week_year) const = 0;
};

using ChronologyPtr = SharedPtr<const Chronology>;

// Shared field logic over an epoch-day conversion supplied by subclasses.
// Weeks start on Monday and week 1 contains the year's first Thursday.
class BasicChronology : public Chronology {
protected:
    [[nodiscard]] virtual Int64 days_from_civil(Int64 year, Int32 month, Int32 day) const = 0;
    virtual void civil_from_days(Int64 days, Int64& year, Int32& month, Int32& day) const = 0;

    // Epoch day of the Monday starting week 1 of the week year
    [[nodiscard]] Int64 week_year_start(Int64 week_year) const;

public:
    [[nodiscard]] CalendarFields fields_of(Instant instant, const TimeZone& zone) const override;
    [[nodiscard]] Result<Instant> instant_of(const FieldValues& fields,
                                             const TimeZone& zone) const override;
    [[nodiscard]] Int32 days_in_month(Int32 year, Int32 month) const override;
    [[nodiscard]] Int32 weeks_in_week_year(Int32 week_year) const override;

    // 1=Monday .. 7=Sunday
    [[nodiscard]] static Int32 day_of_week_of(Int64 epoch_day);
};

// Proleptic Gregorian calendar
class IsoChronology : public BasicChronology {
private:
    String id_ = "ISO";

protected:
    [[nodiscard]] Int64 days_from_civil(Int64 year, Int32 month, Int32 day) const override;
    void civil_from_days(Int64 days, Int64& year, Int32& month, Int32& day) const override;

public:
    [[nodiscard]] const String& id() const override { return id_; }
    [[nodiscard]] bool is_leap_year(Int32 year) const override;
};

// Proleptic Julian calendar
class JulianChronology : public BasicChronology {
private:
    String id_ = "Julian";

protected:
    [[nodiscard]] Int64 days_from_civil(Int64 year, Int32 month, Int32 day) const override;
    void civil_from_days(Int64 days, Int64& year, Int32& month, Int32& day) const override;

public:
    [[nodiscard]] const String& id() const override { return id_; }
    [[nodiscard]] bool is_leap_year(Int32 year) const override;
};

// =============================================================================
// Chronology Lookup
// =============================================================================

namespace chronologies {

[[nodiscard]] ChronologyPtr iso();
[[nodiscard]] ChronologyPtr julian();

// "ISO" or "Julian", case-insensitive
[[nodiscard]] Result<ChronologyPtr> for_id(StringView id);

} // namespace chronologies

} // namespace datefmt::chrono
