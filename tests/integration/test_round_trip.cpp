#include "../framework/test_framework.hpp"
#include "datefmt/format/datefmt.hpp"
#include "datefmt/format/parser.hpp"

using namespace datefmt;
using namespace datefmt::format;
using namespace datefmt::test;

namespace {

const Int64 SAMPLES[] = {
    1268315130123,    // 2010-03-11T13:45:30.123Z
    0,                // epoch
    -1,               // 1969-12-31T23:59:59.999Z
    1262476800000,    // 2010-01-03, week-year 2009
    1330516800000,    // 2012-02-29T12:00Z
    951782400999,     // 2000-02-29T00:00:00.999Z
    -2208988800000,   // 1900-01-01T00:00Z
    253402171200000,  // 9999-12-30T12:00Z
};

const char* const ZONES[] = {"UTC", "+05:30", "-08:00", "+14:00"};

// Entries printing every field down to the millisecond
const char* const EXACT[] = {
    "basic-date-time", "basic-ordinal-date-time", "basic-week-date-time",
    "date-hour-minute-second-fraction", "date-hour-minute-second-ms", "date-time",
    "ordinal-date-time", "week-date-time",
};

chrono::ZonePtr zone(StringView id) {
    auto result = chrono::zones::for_id(id);
    DATEFMT_THROW_IF_ERROR(result);
    return *result;
}

String describe(StringView name, StringView zone_id, Int64 millis) {
    return String(name) + " in " + String(zone_id) + " at " + std::to_string(millis);
}

} // namespace

// print(parse(print(x))) == print(x) for every built-in that prints and parses
void test_registry_text_round_trip() {
    for (const auto* entry : Registry::instance().printers()) {
        if (!entry->capabilities.can_parse) continue;
        for (const char* zone_id : ZONES) {
            Formatter formatter = entry->formatter.with_zone(zone(zone_id));
            for (Int64 millis : SAMPLES) {
                auto text = formatter.print(chrono::Instant(millis));
                ASSERT_OK(text);
                auto parsed = formatter.parse(*text);
                if (parsed.is_error()) {
                    throw std::runtime_error(describe(entry->name, zone_id, millis) + ": \"" + *text +
                                             "\" failed: " + parsed.error().to_string());
                }
                auto reprinted = formatter.print(*parsed);
                ASSERT_OK(reprinted);
                if (*reprinted != *text) {
                    throw std::runtime_error(describe(entry->name, zone_id, millis) + ": \"" + *text +
                                             "\" reprinted as \"" + *reprinted + "\"");
                }
            }
        }
    }
}

// parse(print(x)) == x where nothing below the millisecond is dropped
void test_registry_exact_round_trip() {
    for (const char* name : EXACT) {
        for (const char* zone_id : ZONES) {
            Formatter formatter = Registry::instance().at(name).formatter.with_zone(zone(zone_id));
            for (Int64 millis : SAMPLES) {
                auto text = formatter.print(chrono::Instant(millis));
                ASSERT_OK(text);
                auto parsed = formatter.parse(*text);
                ASSERT_OK(parsed);
                if (parsed->epoch_millis() != millis) {
                    throw std::runtime_error(describe(name, zone_id, millis) + ": \"" + *text +
                                             "\" parsed as " + std::to_string(parsed->epoch_millis()));
                }
            }
        }
    }
}

void test_pattern_round_trip_in_locales() {
    const char* patterns[] = {
        "EEEE, d MMMM yyyy G HH:mm:ss.SSS ZZ",
        "EEE dd MMM yyyy hh:mm:ss.SSS a Z",
        "yyyy-DDD'T'HH'h'mm''ss.SSS",
        "xxxx-'W'ww-e HH:mm:ss.SSS ZZZ",
    };
    for (const char* pattern : patterns) {
        auto compiled = compile(pattern);
        ASSERT_OK(compiled);
        for (const String& locale_id : chrono::locales::ids()) {
            auto locale = chrono::locales::for_id(locale_id);
            ASSERT_OK(locale);
            for (const char* zone_id : ZONES) {
                Formatter formatter = compiled->with_locale(*locale).with_zone(zone(zone_id));
                for (Int64 millis : SAMPLES) {
                    auto text = formatter.print(chrono::Instant(millis));
                    ASSERT_OK(text);
                    auto parsed = formatter.parse(*text);
                    if (parsed.is_error() || parsed->epoch_millis() != millis) {
                        throw std::runtime_error(String(pattern) + " [" + locale_id + "] " +
                                                 describe("", zone_id, millis) + ": \"" + *text + "\"");
                    }
                }
            }
        }
    }
}

void test_julian_round_trip() {
    auto compiled = compile("yyyy-MM-dd HH:mm:ss.SSS");
    ASSERT_OK(compiled);
    Formatter julian = compiled->with_chronology(chrono::chronologies::julian());
    for (Int64 millis : SAMPLES) {
        auto text = julian.print(chrono::Instant(millis));
        ASSERT_OK(text);
        auto parsed = julian.parse(*text);
        ASSERT_OK(parsed);
        ASSERT_EQ(parsed->epoch_millis(), millis);
    }
    // Thirteen days behind in the twentieth and twenty-first centuries
    ASSERT_STR_EQ(*julian.print(chrono::Instant(1268315130123)), "2010-02-26 13:45:30.123");
}

void test_two_digit_years_stay_in_window() {
    auto compiled = compile("yy-MM-dd");
    ASSERT_OK(compiled);
    for (Int32 pivot : {1950, 1999, 2000, 2049, 2050, 2099}) {
        Formatter formatter = compiled->with_pivot_year(pivot);
        for (Int32 two_digits = 0; two_digits < 100; ++two_digits) {
            String text = zero_padded(static_cast<UInt64>(two_digits), 2) + "-06-15";
            auto fields = formatter.parse_fields(text);
            ASSERT_OK(fields);
            auto year = resolve_two_digit_year(two_digits, pivot);
            ASSERT_GE(year, pivot - 99);
            ASSERT_LE(year, pivot);
            ASSERT_EQ(chrono::floor_mod(year, 100), two_digits);
            auto parsed = formatter.parse(text);
            ASSERT_OK(parsed);
            ASSERT_EQ(*formatter.print(*parsed), text);
        }
    }
}

void test_escaped_literals_round_trip() {
    auto compiled = compile("'Today is' EEEE', the' d'th of' MMMM yyyy 'at' h 'o''clock' a");
    ASSERT_OK(compiled);
    auto instant = chrono::Instant(1268312400000);  // 2010-03-11T13:00Z
    auto text = compiled->print(instant);
    ASSERT_OK(text);
    ASSERT_STR_EQ(*text, "Today is Thursday, the 11th of March 2010 at 1 o'clock PM");
    auto parsed = compiled->parse(*text);
    ASSERT_OK(parsed);
    ASSERT_EQ(*parsed, instant);
}

void test_parse_any_accepts_every_printed_form() {
    const auto instant = chrono::Instant(1268315130123);
    for (const char* name : {"date-time", "date-time-no-ms", "ordinal-date-time", "week-date-time",
                             "basic-date-time", "rfc822", "date"}) {
        auto text = Registry::instance().at(name).formatter.print(instant);
        ASSERT_OK(text);
        auto resolved = datefmt::parse_any(*text);
        if (resolved.is_error()) {
            throw std::runtime_error(String(name) + ": \"" + *text + "\" not resolved");
        }
        auto direct = Registry::instance().at(name).formatter.parse(*text);
        ASSERT_OK(direct);
        ASSERT_EQ(*resolved, *direct);
    }
}

int main() {
    TestSuite suite("Round Trip Integration Tests");

    suite.add_test("Registry Text Round Trip", test_registry_text_round_trip);
    suite.add_test("Registry Exact Round Trip", test_registry_exact_round_trip);
    suite.add_test("Pattern Round Trip in Locales", test_pattern_round_trip_in_locales);
    suite.add_test("Julian Round Trip", test_julian_round_trip);
    suite.add_test("Two-Digit Years Stay in Window", test_two_digit_years_stay_in_window);
    suite.add_test("Escaped Literals Round Trip", test_escaped_literals_round_trip);
    suite.add_test("parse_any Accepts Every Printed Form", test_parse_any_accepts_every_printed_form);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
