#include "../framework/test_framework.hpp"
#include "datefmt/format/datefmt.hpp"

using namespace datefmt;
using namespace datefmt::test;

namespace {

const Instant AFTERNOON(1268315130123);  // 2010-03-11T13:45:30.123Z

chrono::ZonePtr zone(StringView id) {
    auto z = chrono::zones::for_id(id);
    DATEFMT_THROW_IF_ERROR(z);
    return z.value();
}

} // namespace

void test_compile_defaults() {
    auto f = compile("yyyy-MM-dd HH:mm");
    ASSERT_OK(f);
    ASSERT_EQ(f->zone()->id(), "UTC");
    ASSERT_EQ(f->locale()->id(), "en");
    ASSERT_EQ(f->chronology()->id(), "ISO");
    ASSERT_FALSE(f->pivot_year().has_value());
    ASSERT_TRUE(f->can_print());
    ASSERT_TRUE(f->can_parse());

    ASSERT_ERROR(compile("yyyy-'MM"), ErrorCode::PATTERN_ERROR);
}

void test_modifiers_are_immutable() {
    auto base = compile("yyyy-MM-dd HH:mm ZZ");
    ASSERT_OK(base);
    Formatter original = *base;

    Formatter shifted = with_zone(original, zone("+05:30"));
    ASSERT_EQ(shifted.zone()->id(), "+05:30");
    ASSERT_EQ(original.zone()->id(), "UTC");
    // The plan is shared, not copied
    ASSERT_EQ(shifted.plan(), original.plan());

    ASSERT_STR_EQ(*print(original, AFTERNOON), "2010-03-11 13:45 +00:00");
    ASSERT_STR_EQ(*print(shifted, AFTERNOON), "2010-03-11 19:15 +05:30");

    Formatter french = with_locale(original, chrono::locales::french());
    ASSERT_EQ(french.locale()->id(), "fr");
    ASSERT_EQ(original.locale()->id(), "en");

    Formatter julian = with_chronology(original, chrono::chronologies::julian());
    ASSERT_EQ(julian.chronology()->id(), "Julian");
    ASSERT_EQ(original.chronology()->id(), "ISO");

    Formatter pivoted = with_pivot_year(original, 2050);
    ASSERT_EQ(*pivoted.pivot_year(), 2050);
    ASSERT_FALSE(original.pivot_year().has_value());
    ASSERT_FALSE(pivoted.without_pivot_year().pivot_year().has_value());
}

void test_modifiers_compose() {
    auto base = compile("EEEE d MMMM yy HH:mm");
    ASSERT_OK(base);
    Formatter f = base->with_zone(zone("+01:00"))
                       .with_locale(chrono::locales::german())
                       .with_pivot_year(2050);
    ASSERT_STR_EQ(*f.print(AFTERNOON), "Donnerstag 11 M\xC3\xA4rz 10 14:45");

    auto back = f.parse("Donnerstag 11 M\xC3\xA4rz 10 14:45");
    ASSERT_OK(back);
    ASSERT_EQ(back->epoch_millis(), 1268315100000);
}

void test_null_arguments_rejected() {
    auto base = compile("yyyy");
    ASSERT_OK(base);
    ASSERT_THROW((void)base->with_zone(nullptr), FormatException);
    ASSERT_THROW((void)base->with_locale(nullptr), FormatException);
    ASSERT_THROW((void)base->with_chronology(nullptr), FormatException);
    ASSERT_THROW(Formatter(nullptr), FormatException);

    try {
        (void)base->with_zone(nullptr);
    } catch (const FormatException& e) {
        ASSERT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

void test_registry_lookup() {
    auto date = formatter("date");
    ASSERT_OK(date);
    ASSERT_STR_EQ(*print(*date, AFTERNOON), "2010-03-11");
    ASSERT_EQ(parse(*date, "2010-03-11")->epoch_millis(), 1268265600000);

    auto missing = formatter("no-such-formatter");
    ASSERT_ERROR(missing, ErrorCode::UNKNOWN_FORMATTER);
    ASSERT_EQ(missing.error().context_value("name"), "no-such-formatter");
}

void test_parse_only_formatter() {
    auto parser = formatter("date-opt-time");
    ASSERT_OK(parser);
    ASSERT_FALSE(parser->can_print());
    ASSERT_TRUE(parser->can_parse());
    ASSERT_ERROR(print(*parser, AFTERNOON), ErrorCode::UNSUPPORTED);
    ASSERT_OK(parse(*parser, "2010-03-11T13:45:30.123Z"));
}

void test_print_equivalence() {
    auto a = compile("yyyy-MM-dd");
    auto b = compile("yyyy-MM-dd");
    auto c = compile("yyyy/MM/dd");
    ASSERT_OK(a);
    ASSERT_OK(b);
    ASSERT_OK(c);
    ASSERT_TRUE(a->print_equivalent(*b));
    ASSERT_FALSE(a->print_equivalent(*c));
    ASSERT_FALSE(a->print_equivalent(a->with_zone(zone("+01:00"))));
    ASSERT_TRUE(a->print_equivalent(formatter("date").value()));
    // Pivot years only affect parsing
    ASSERT_TRUE(a->print_equivalent(a->with_pivot_year(1990)));
}

void test_free_functions_match_members() {
    auto f = compile("yyyy-MM-dd'T'HH:mm:ss.SSS");
    ASSERT_OK(f);
    ASSERT_EQ(*print(*f, AFTERNOON), *f->print(AFTERNOON));
    ASSERT_EQ(parse(*f, "2010-03-11T13:45:30.123")->epoch_millis(), AFTERNOON.epoch_millis());
    ASSERT_EQ(parse_any("2010-03-11")->epoch_millis(), 1268265600000);
    ASSERT_EQ(list_registry().size(), format::Registry::instance().size());
}

int main() {
    TestSuite suite("Formatter Tests");

    suite.add_test("Compile Defaults", test_compile_defaults);
    suite.add_test("Modifiers Are Immutable", test_modifiers_are_immutable);
    suite.add_test("Modifiers Compose", test_modifiers_compose);
    suite.add_test("Null Arguments Rejected", test_null_arguments_rejected);
    suite.add_test("Registry Lookup", test_registry_lookup);
    suite.add_test("Parse-only Formatter", test_parse_only_formatter);
    suite.add_test("Print Equivalence", test_print_equivalence);
    suite.add_test("Free Functions Match Members", test_free_functions_match_members);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
