#include "../framework/test_framework.hpp"
#include "datefmt/format/registry.hpp"
#include <algorithm>
#include <iterator>

using namespace datefmt;
using namespace datefmt::format;
using namespace datefmt::test;

using chrono::Instant;

namespace {

const Instant AFTERNOON(1268315130123);  // 2010-03-11T13:45:30.123Z
constexpr Int64 MARCH_11 = 1268265600000;

struct Expected {
    const char* name;
    const char* text;
};

const Expected PRINTED[] = {
    {"basic-date", "20100311"},
    {"basic-date-time", "20100311T134530.123Z"},
    {"basic-date-time-no-ms", "20100311T134530Z"},
    {"basic-ordinal-date", "2010070"},
    {"basic-ordinal-date-time", "2010070T134530.123Z"},
    {"basic-ordinal-date-time-no-ms", "2010070T134530Z"},
    {"basic-t-time", "T134530.123Z"},
    {"basic-t-time-no-ms", "T134530Z"},
    {"basic-time", "134530.123Z"},
    {"basic-time-no-ms", "134530Z"},
    {"basic-week-date", "2010W104"},
    {"basic-week-date-time", "2010W104T134530.123Z"},
    {"basic-week-date-time-no-ms", "2010W104T134530Z"},
    {"date", "2010-03-11"},
    {"date-hour", "2010-03-11T13"},
    {"date-hour-minute", "2010-03-11T13:45"},
    {"date-hour-minute-second", "2010-03-11T13:45:30"},
    {"date-hour-minute-second-fraction", "2010-03-11T13:45:30.123"},
    {"date-hour-minute-second-ms", "2010-03-11T13:45:30.123"},
    {"date-time", "2010-03-11T13:45:30.123Z"},
    {"date-time-no-ms", "2010-03-11T13:45:30Z"},
    {"hour", "13"},
    {"hour-minute", "13:45"},
    {"hour-minute-second", "13:45:30"},
    {"hour-minute-second-fraction", "13:45:30.123"},
    {"hour-minute-second-ms", "13:45:30.123"},
    {"ordinal-date", "2010-070"},
    {"ordinal-date-time", "2010-070T13:45:30.123Z"},
    {"ordinal-date-time-no-ms", "2010-070T13:45:30Z"},
    {"rfc822", "Thu, 11 Mar 2010 13:45:30 +0000"},
    {"t-time", "T13:45:30.123Z"},
    {"t-time-no-ms", "T13:45:30Z"},
    {"time", "13:45:30.123Z"},
    {"time-no-ms", "13:45:30Z"},
    {"week-date", "2010-W10-4"},
    {"week-date-time", "2010-W10-4T13:45:30.123Z"},
    {"week-date-time-no-ms", "2010-W10-4T13:45:30Z"},
    {"weekyear", "2010"},
    {"weekyear-week", "2010-W10"},
    {"weekyear-week-day", "2010-W10-4"},
    {"year", "2010"},
    {"year-month", "2010-03"},
    {"year-month-day", "2010-03-11"},
};

const char* const PARSE_ONLY[] = {
    "date-element-parser", "date-opt-time", "date-parser", "date-time-parser",
    "local-date", "local-date-opt-time", "local-time", "time-element-parser", "time-parser",
};

Int64 parse_with(StringView name, StringView text) {
    auto instant = Registry::instance().at(name).formatter.parse(text);
    DATEFMT_THROW_IF_ERROR(instant);
    return instant->epoch_millis();
}

} // namespace

void test_catalog_contents() {
    const auto& registry = Registry::instance();
    ASSERT_EQ(registry.size(), 52u);
    ASSERT_EQ(registry.printers().size(), std::size(PRINTED));
    ASSERT_EQ(registry.parsers().size(), std::size(PARSE_ONLY));

    for (const char* name : PARSE_ONLY) {
        auto entry = registry.find(name);
        ASSERT_TRUE(entry.has_value());
        ASSERT_TRUE((*entry)->capabilities.can_parse);
        ASSERT_FALSE((*entry)->capabilities.can_print);
    }
    for (const auto& expected : PRINTED) {
        const auto& entry = registry.at(expected.name);
        ASSERT_TRUE(entry.capabilities.can_parse);
        ASSERT_TRUE(entry.capabilities.can_print);
    }
}

void test_lookup() {
    const auto& registry = Registry::instance();
    ASSERT_TRUE(registry.find("date-time").has_value());
    ASSERT_FALSE(registry.find("Date-Time").has_value());
    ASSERT_FALSE(registry.find("mysql").has_value());
    ASSERT_THROW((void)registry.at("mysql"), FormatException);

    try {
        (void)registry.at("mysql");
    } catch (const FormatException& e) {
        ASSERT_EQ(e.code(), ErrorCode::UNKNOWN_FORMATTER);
    }
}

void test_name_order() {
    auto entries = Registry::instance().entries();
    ASSERT_TRUE(std::is_sorted(entries.begin(), entries.end(),
        [](const RegistryEntry* a, const RegistryEntry* b) { return a->name < b->name; }));

    auto listing = Registry::instance().list();
    ASSERT_EQ(listing.size(), entries.size());
    ASSERT_EQ(listing.front().name, "basic-date");
    ASSERT_EQ(listing.back().name, "year-month-day");
    for (Size i = 0; i < listing.size(); ++i) {
        ASSERT_EQ(listing[i].name, entries[i]->name);
        ASSERT_TRUE(listing[i].capabilities == entries[i]->capabilities);
    }
}

void test_printed_layouts() {
    for (const auto& expected : PRINTED) {
        auto text = Registry::instance().at(expected.name).formatter.print(AFTERNOON);
        ASSERT_OK(text);
        if (*text != expected.text) {
            throw std::runtime_error(String(expected.name) + " printed \"" + *text +
                                     "\", expected \"" + expected.text + "\"");
        }
    }
}

void test_printed_in_zone() {
    auto india = chrono::zones::for_id("+05:30");
    ASSERT_OK(india);
    const auto& registry = Registry::instance();
    ASSERT_STR_EQ(*registry.at("date-time").formatter.with_zone(*india).print(AFTERNOON),
                  "2010-03-11T19:15:30.123+05:30");
    ASSERT_STR_EQ(*registry.at("basic-date-time").formatter.with_zone(*india).print(AFTERNOON),
                  "20100311T191530.123+0530");
    ASSERT_STR_EQ(*registry.at("rfc822").formatter.with_zone(*india).print(AFTERNOON),
                  "Thu, 11 Mar 2010 19:15:30 +0530");
}

void test_entries_bound_to_utc() {
    for (const auto* entry : Registry::instance().entries()) {
        ASSERT_EQ(entry->formatter.zone()->id(), "UTC");
        ASSERT_EQ(entry->formatter.locale()->id(), "en");
    }
}

void test_date_parsers() {
    ASSERT_EQ(parse_with("date-element-parser", "2010-03-11"), MARCH_11);
    ASSERT_EQ(parse_with("date-element-parser", "2010-070"), MARCH_11);
    ASSERT_EQ(parse_with("date-element-parser", "2010-W10-4"), MARCH_11);
    ASSERT_EQ(parse_with("date-element-parser", "2010-W10"), MARCH_11 - 3 * chrono::MILLIS_PER_DAY);
    ASSERT_EQ(parse_with("date-element-parser", "2010-03"), 1267401600000);
    ASSERT_EQ(parse_with("date-element-parser", "2010"), 1262304000000);
    ASSERT_EQ(parse_with("local-date", "2010-03-11"), MARCH_11);
    ASSERT_EQ(parse_with("date-parser", "2010-03-11TZ"), MARCH_11);
    ASSERT_EQ(parse_with("date-parser", "2010-03-11T+01:00"), MARCH_11 - chrono::MILLIS_PER_HOUR);
}

void test_time_parsers() {
    ASSERT_EQ(parse_with("local-time", "13"), 13 * chrono::MILLIS_PER_HOUR);
    ASSERT_EQ(parse_with("local-time", "13:45:30,5"), 49530500);
    ASSERT_EQ(parse_with("time-element-parser", "13:45:30.123456"), 49530123);
    ASSERT_EQ(parse_with("time-parser", "T13:45Z"), 49500000);
    ASSERT_EQ(parse_with("time-parser", "13:45:30.123-01:00"), 49530123 + chrono::MILLIS_PER_HOUR);
    ASSERT_EQ(parse_with("date-time-parser", "T13:45:30"), 49530000);
}

void test_date_time_parsers() {
    ASSERT_EQ(parse_with("date-opt-time", "2010-03-11"), MARCH_11);
    ASSERT_EQ(parse_with("date-opt-time", "2010-03-11T13:45:30.123Z"), AFTERNOON.epoch_millis());
    ASSERT_EQ(parse_with("date-opt-time", "2010-03-11T19:15:30.123+05:30"), AFTERNOON.epoch_millis());
    ASSERT_EQ(parse_with("date-opt-time", "2010-070T13"), MARCH_11 + 13 * chrono::MILLIS_PER_HOUR);
    ASSERT_EQ(parse_with("date-time-parser", "2010-W10-4T13:45:30.123Z"), AFTERNOON.epoch_millis());
    ASSERT_EQ(parse_with("local-date-opt-time", "2010-03-11T13:45:30.123"), AFTERNOON.epoch_millis());

    // Offsets are not part of the local layouts
    auto local = Registry::instance().at("local-date-opt-time").formatter.parse("2010-03-11T13:45Z");
    ASSERT_ERROR(local, ErrorCode::TRAILING_INPUT);
}

void test_trailing_input() {
    auto result = Registry::instance().at("date-time").formatter.parse("2010-03-11T00:00:00.000Zxyz");
    ASSERT_ERROR(result, ErrorCode::TRAILING_INPUT);
    ASSERT_EQ(*result.error().position, 24u);
}

int main() {
    TestSuite suite("Registry Tests");

    suite.add_test("Catalog Contents", test_catalog_contents);
    suite.add_test("Lookup", test_lookup);
    suite.add_test("Name Order", test_name_order);
    suite.add_test("Printed Layouts", test_printed_layouts);
    suite.add_test("Printed in Zone", test_printed_in_zone);
    suite.add_test("Entries Bound to UTC", test_entries_bound_to_utc);
    suite.add_test("Date Parsers", test_date_parsers);
    suite.add_test("Time Parsers", test_time_parsers);
    suite.add_test("Date-Time Parsers", test_date_time_parsers);
    suite.add_test("Trailing Input", test_trailing_input);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
