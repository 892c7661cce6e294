#include "../framework/test_framework.hpp"
#include "datefmt/format/resolver.hpp"

using namespace datefmt;
using namespace datefmt::format;
using namespace datefmt::test;

namespace {

constexpr Int64 MARCH_11 = 1268265600000;   // 2010-03-11T00:00Z
constexpr Int64 AFTERNOON = 1268315130123;  // 2010-03-11T13:45:30.123Z

chrono::ZonePtr zone(StringView id) {
    auto result = chrono::zones::for_id(id);
    DATEFMT_THROW_IF_ERROR(result);
    return *result;
}

// Name of the first parse-capable entry, scanning by hand
Optional<String> first_accepting(StringView text) {
    for (const auto* entry : Registry::instance().entries()) {
        if (entry->capabilities.can_parse && entry->formatter.parse(text).is_success()) {
            return entry->name;
        }
    }
    return nullopt;
}

} // namespace

void test_first_match_wins() {
    const auto& registry = Registry::instance();
    auto utc = chrono::zones::utc();

    auto date = resolve("2010-03-11", registry, utc);
    ASSERT_OK(date);
    ASSERT_EQ(date->formatter_name, "date");
    ASSERT_EQ(date->instant.epoch_millis(), MARCH_11);

    auto full = resolve("2010-03-11T13:45:30.123Z", registry, utc);
    ASSERT_OK(full);
    ASSERT_EQ(full->formatter_name, "date-opt-time");
    ASSERT_EQ(full->instant.epoch_millis(), AFTERNOON);

    auto basic = resolve("20100311", registry, utc);
    ASSERT_OK(basic);
    ASSERT_EQ(basic->formatter_name, "basic-date");
    ASSERT_EQ(basic->instant.epoch_millis(), MARCH_11);

    auto clock = resolve("13:45", registry, utc);
    ASSERT_OK(clock);
    ASSERT_EQ(clock->formatter_name, "hour-minute");
    ASSERT_EQ(clock->instant.epoch_millis(), 49500000);

    auto mail = resolve("Thu, 11 Mar 2010 13:45:30 +0000", registry, utc);
    ASSERT_OK(mail);
    ASSERT_EQ(mail->formatter_name, "rfc822");
    ASSERT_EQ(mail->instant.epoch_millis(), AFTERNOON - 123);
}

void test_order_is_name_order() {
    const char* samples[] = {
        "2010-03-11", "2010-070", "2010-W10-4", "2010-03-11T13:45", "T13:45:30Z",
        "20100311T134530Z", "13:45:30,5", "2010",
    };
    for (const char* text : samples) {
        auto resolved = resolve(text, Registry::instance(), chrono::zones::utc());
        ASSERT_OK(resolved);
        auto expected = first_accepting(text);
        ASSERT_TRUE(expected.has_value());
        ASSERT_EQ(resolved->formatter_name, *expected);
    }
}

void test_repeatable() {
    auto first = resolve("2010-W10-4T13:45:30.123Z", Registry::instance(), chrono::zones::utc());
    auto second = resolve("2010-W10-4T13:45:30.123Z", Registry::instance(), chrono::zones::utc());
    ASSERT_OK(first);
    ASSERT_OK(second);
    ASSERT_EQ(first->formatter_name, second->formatter_name);
    ASSERT_EQ(first->instant, second->instant);
    ASSERT_EQ(first->instant.epoch_millis(), AFTERNOON);
}

void test_no_match() {
    auto result = resolve("not a date", Registry::instance(), chrono::zones::utc());
    ASSERT_ERROR(result, ErrorCode::NO_MATCH);
    ASSERT_EQ(result.error().context_value("text"), "not a date");

    ASSERT_ERROR(resolve("", Registry::instance(), chrono::zones::utc()), ErrorCode::NO_MATCH);
    ASSERT_ERROR(parse_any("2010-13-45"), ErrorCode::NO_MATCH);
}

void test_zone_applies_to_local_text() {
    auto paris = zone("+01:00");

    auto local = resolve("2010-03-11", Registry::instance(), paris);
    ASSERT_OK(local);
    ASSERT_EQ(local->instant.epoch_millis(), MARCH_11 - chrono::MILLIS_PER_HOUR);

    // An offset in the text wins over the zone
    auto offset = resolve("2010-03-11T00:00Z", Registry::instance(), paris);
    ASSERT_OK(offset);
    ASSERT_EQ(offset->formatter_name, "date-opt-time");
    ASSERT_EQ(offset->instant.epoch_millis(), MARCH_11);
}

void test_parse_any() {
    auto utc = parse_any("2010-03-11T13:45:30.123Z");
    ASSERT_OK(utc);
    ASSERT_EQ(utc->epoch_millis(), AFTERNOON);

    auto shifted = parse_any("2010-03-11T13:45:30.123", Registry::instance(), zone("-05:00"));
    ASSERT_OK(shifted);
    ASSERT_EQ(shifted->epoch_millis(), AFTERNOON + 5 * chrono::MILLIS_PER_HOUR);
}

int main() {
    TestSuite suite("Resolver Tests");

    suite.add_test("First Match Wins", test_first_match_wins);
    suite.add_test("Order Is Name Order", test_order_is_name_order);
    suite.add_test("Repeatable", test_repeatable);
    suite.add_test("No Match", test_no_match);
    suite.add_test("Zone Applies to Local Text", test_zone_applies_to_local_text);
    suite.add_test("parse_any", test_parse_any);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
