#include "../framework/test_framework.hpp"
#include "datefmt/chrono/time_zone.hpp"
#include "datefmt/chrono/locale.hpp"

using namespace datefmt;
using namespace datefmt::chrono;
using namespace datefmt::test;

void test_utc() {
    auto utc = zones::utc();
    ASSERT_EQ(utc->id(), "UTC");
    ASSERT_EQ(utc->offset_at(Instant(0)), 0);
    ASSERT_EQ(utc->short_name(Instant(0)), "UTC");
    ASSERT_EQ(utc, zones::utc());
}

void test_zone_ids() {
    ASSERT_EQ((*zones::for_id("UTC"))->id(), "UTC");
    ASSERT_EQ((*zones::for_id("gmt"))->id(), "UTC");
    ASSERT_EQ((*zones::for_id("Z"))->id(), "UTC");
    ASSERT_EQ((*zones::for_id("+00:00"))->id(), "UTC");

    auto india = zones::for_id("+05:30");
    ASSERT_OK(india);
    ASSERT_EQ((*india)->id(), "+05:30");
    ASSERT_EQ((*india)->offset_at(Instant(0)), 5 * MILLIS_PER_HOUR + 30 * MILLIS_PER_MINUTE);

    ASSERT_EQ((*zones::for_id("+0530"))->id(), "+05:30");
    ASSERT_EQ((*zones::for_id("-08"))->offset_at(Instant(0)), -8 * MILLIS_PER_HOUR);
    ASSERT_EQ((*zones::for_id("UTC+01:00"))->id(), "+01:00");
    ASSERT_EQ((*zones::for_id("GMT-03"))->id(), "-03:00");
}

void test_unknown_zones() {
    ASSERT_ERROR(zones::for_id("Mars/Olympus"), ErrorCode::UNKNOWN_ZONE);
    ASSERT_ERROR(zones::for_id("+24:00"), ErrorCode::UNKNOWN_ZONE);
    ASSERT_ERROR(zones::for_id("+05:3"), ErrorCode::UNKNOWN_ZONE);
    ASSERT_ERROR(zones::for_id(""), ErrorCode::UNKNOWN_ZONE);
    ASSERT_ERROR(zones::for_offset_millis(MILLIS_PER_DAY), ErrorCode::UNKNOWN_ZONE);
}

void test_offset_ids() {
    ASSERT_EQ(zones::offset_id(0), "+00:00");
    ASSERT_EQ(zones::offset_id(-(5 * MILLIS_PER_HOUR + 45 * MILLIS_PER_MINUTE)), "-05:45");
    ASSERT_EQ(zones::offset_id(MILLIS_PER_HOUR + 30 * MILLIS_PER_SECOND), "+01:00:30");
    ASSERT_EQ(zones::offset_id(MILLIS_PER_HOUR + 30 * MILLIS_PER_SECOND + 5), "+01:00:30.005");

    auto zone = zones::for_offset_millis(-MILLIS_PER_HOUR);
    ASSERT_OK(zone);
    ASSERT_EQ((*zone)->id(), "-01:00");
    ASSERT_TRUE((*zone)->equals(**zones::for_id("-0100")));
}

void test_english_names() {
    auto en = locales::english();
    ASSERT_EQ(en->id(), "en");
    ASSERT_EQ(en->month_name(1, NameStyle::LONG), "January");
    ASSERT_EQ(en->month_name(9, NameStyle::SHORT), "Sep");
    ASSERT_EQ(en->weekday_name(1, NameStyle::LONG), "Monday");
    ASSERT_EQ(en->weekday_name(7, NameStyle::SHORT), "Sun");
    ASSERT_EQ(en->halfday_text(false), "AM");
    ASSERT_EQ(en->halfday_text(true), "PM");
    ASSERT_EQ(en->era_text(false), "BC");
    ASSERT_EQ(en->era_text(true), "AD");
    ASSERT_EQ(en->month_name(13, NameStyle::LONG), "");
    ASSERT_EQ(en->weekday_name(0, NameStyle::LONG), "");
}

void test_other_locales() {
    auto fr = locales::french();
    ASSERT_EQ(fr->month_name(3, NameStyle::LONG), "mars");
    ASSERT_EQ(fr->weekday_name(4, NameStyle::LONG), "jeudi");
    ASSERT_EQ(fr->month_name(8, NameStyle::LONG), "ao\xC3\xBBt");

    auto de = locales::german();
    ASSERT_EQ(de->month_name(3, NameStyle::LONG), "M\xC3\xA4rz");
    ASSERT_EQ(de->weekday_name(4, NameStyle::LONG), "Donnerstag");
    ASSERT_EQ(de->era_text(true), "n. Chr.");
}

void test_locale_lookup() {
    ASSERT_EQ((*locales::for_id("en"))->id(), "en");
    ASSERT_EQ((*locales::for_id("en_US"))->id(), "en");
    ASSERT_EQ((*locales::for_id("de-AT"))->id(), "de");
    ASSERT_EQ((*locales::for_id("FR"))->id(), "fr");
    ASSERT_ERROR(locales::for_id("xx"), ErrorCode::UNKNOWN_LOCALE);

    auto ids = locales::ids();
    ASSERT_EQ(ids.size(), 3u);
    ASSERT_EQ(ids[0], "de");
    ASSERT_TRUE(locales::english()->equals(**locales::for_id("en_GB")));
}

int main() {
    TestSuite suite("Zone and Locale Tests");

    suite.add_test("UTC", test_utc);
    suite.add_test("Zone Ids", test_zone_ids);
    suite.add_test("Unknown Zones", test_unknown_zones);
    suite.add_test("Offset Ids", test_offset_ids);
    suite.add_test("English Names", test_english_names);
    suite.add_test("Other Locales", test_other_locales);
    suite.add_test("Locale Lookup", test_locale_lookup);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
