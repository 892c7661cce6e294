// =============================================================================
// datefmt - Built-in Formatter Registry Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/registry.hpp>
#include <datefmt/format/pattern.hpp>
#include <datefmt/common/logging.hpp>
#include <format>

namespace datefmt::format {

namespace {

using K = FieldKind;

// -----------------------------------------------------------------------------
// Extended (separator) elements
// -----------------------------------------------------------------------------

PlanBuilder year_element() {
    PlanBuilder b;
    b.signed_decimal(K::YEAR, 4, 9);
    return b;
}

PlanBuilder month_element() {
    PlanBuilder b;
    b.literal('-').decimal(K::MONTH_OF_YEAR, 2, 2);
    return b;
}

PlanBuilder day_of_month_element() {
    PlanBuilder b;
    b.literal('-').decimal(K::DAY_OF_MONTH, 2, 2);
    return b;
}

PlanBuilder weekyear_element() {
    PlanBuilder b;
    b.signed_decimal(K::WEEK_YEAR, 4, 9);
    return b;
}

PlanBuilder week_element() {
    PlanBuilder b;
    b.literal("-W").decimal(K::WEEK_OF_WEEK_YEAR, 2, 2);
    return b;
}

PlanBuilder day_of_week_element() {
    PlanBuilder b;
    b.literal('-').decimal(K::DAY_OF_WEEK, 1, 1);
    return b;
}

PlanBuilder day_of_year_element() {
    PlanBuilder b;
    b.literal('-').decimal(K::DAY_OF_YEAR, 3, 3);
    return b;
}

PlanBuilder hour_element() {
    PlanBuilder b;
    b.decimal(K::HOUR_OF_DAY, 2, 2);
    return b;
}

PlanBuilder minute_element() {
    PlanBuilder b;
    b.literal(':').decimal(K::MINUTE_OF_HOUR, 2, 2);
    return b;
}

PlanBuilder second_element() {
    PlanBuilder b;
    b.literal(':').decimal(K::SECOND_OF_MINUTE, 2, 2);
    return b;
}

PlanBuilder fraction_element() {
    PlanBuilder b;
    b.literal('.').fraction(3, 9);
    return b;
}

PlanBuilder millis_element() {
    PlanBuilder b;
    b.literal('.').fraction(3, 3);
    return b;
}

PlanBuilder offset_element() {
    PlanBuilder b;
    b.offset("Z", true);
    return b;
}

PlanBuilder t_literal() {
    PlanBuilder b;
    b.literal('T');
    return b;
}

PlanBuilder concat(std::initializer_list<PlanBuilder> parts) {
    PlanBuilder b;
    for (const auto& part : parts) b.append(part);
    return b;
}

// -----------------------------------------------------------------------------
// Extended printers
// -----------------------------------------------------------------------------

PlanBuilder iso_date() { return concat({year_element(), month_element(), day_of_month_element()}); }
PlanBuilder ordinal_date() { return concat({year_element(), day_of_year_element()}); }
PlanBuilder week_date() { return concat({weekyear_element(), week_element(), day_of_week_element()}); }

PlanBuilder hour_minute() { return concat({hour_element(), minute_element()}); }
PlanBuilder hour_minute_second() { return concat({hour_minute(), second_element()}); }

PlanBuilder iso_time() { return concat({hour_minute_second(), fraction_element(), offset_element()}); }
PlanBuilder time_no_ms() { return concat({hour_minute_second(), offset_element()}); }
PlanBuilder t_time() { return concat({t_literal(), iso_time()}); }
PlanBuilder t_time_no_ms() { return concat({t_literal(), time_no_ms()}); }

// -----------------------------------------------------------------------------
// Basic (compact) printers
// -----------------------------------------------------------------------------

PlanBuilder basic_date() {
    PlanBuilder b;
    b.fixed_signed_decimal(K::YEAR, 4)
     .fixed_decimal(K::MONTH_OF_YEAR, 2)
     .fixed_decimal(K::DAY_OF_MONTH, 2);
    return b;
}

PlanBuilder basic_ordinal_date() {
    PlanBuilder b;
    b.fixed_signed_decimal(K::YEAR, 4).fixed_decimal(K::DAY_OF_YEAR, 3);
    return b;
}

PlanBuilder basic_week_date() {
    PlanBuilder b;
    b.fixed_signed_decimal(K::WEEK_YEAR, 4)
     .literal('W')
     .fixed_decimal(K::WEEK_OF_WEEK_YEAR, 2)
     .fixed_decimal(K::DAY_OF_WEEK, 1);
    return b;
}

PlanBuilder basic_hms() {
    PlanBuilder b;
    b.fixed_decimal(K::HOUR_OF_DAY, 2)
     .fixed_decimal(K::MINUTE_OF_HOUR, 2)
     .fixed_decimal(K::SECOND_OF_MINUTE, 2);
    return b;
}

PlanBuilder basic_offset() {
    PlanBuilder b;
    b.offset("Z", false);
    return b;
}

PlanBuilder basic_time() { return concat({basic_hms(), fraction_element(), basic_offset()}); }
PlanBuilder basic_time_no_ms() { return concat({basic_hms(), basic_offset()}); }
PlanBuilder basic_t_time() { return concat({t_literal(), basic_time()}); }
PlanBuilder basic_t_time_no_ms() { return concat({t_literal(), basic_time_no_ms()}); }

// -----------------------------------------------------------------------------
// Parsers
// -----------------------------------------------------------------------------

PlanBuilder date_element_parser() {
    PlanBuilder calendar = year_element();
    PlanBuilder month_day = month_element();
    month_day.optional(day_of_month_element());
    calendar.optional(month_day);

    PlanBuilder week = concat({weekyear_element(), week_element()});
    week.optional(day_of_week_element());

    PlanBuilder ordinal = ordinal_date();

    PlanBuilder b;
    b.choice({calendar, week, ordinal});
    return b;
}

PlanBuilder time_element_parser() {
    PlanBuilder dot;
    dot.literal('.');
    PlanBuilder comma;
    comma.literal(',');
    PlanBuilder fraction;
    fraction.choice({dot, comma}).fraction(1, 9);

    PlanBuilder seconds = second_element();
    seconds.optional(fraction);
    PlanBuilder minutes = minute_element();
    minutes.optional(seconds);

    PlanBuilder b = hour_element();
    b.optional(minutes);
    return b;
}

PlanBuilder date_opt_time_parser() {
    PlanBuilder time_part = t_literal();
    time_part.optional(time_element_parser()).optional(offset_element());
    PlanBuilder b = date_element_parser();
    b.optional(time_part);
    return b;
}

PlanBuilder date_parser() {
    PlanBuilder b = date_element_parser();
    b.optional(concat({t_literal(), offset_element()}));
    return b;
}

PlanBuilder local_date_opt_time_parser() {
    PlanBuilder b = date_element_parser();
    b.optional(concat({t_literal(), time_element_parser()}));
    return b;
}

PlanBuilder time_parser() {
    PlanBuilder b;
    b.optional(t_literal()).append(time_element_parser()).optional(offset_element());
    return b;
}

PlanBuilder date_time_parser() {
    PlanBuilder time_only = concat({t_literal(), time_element_parser()});
    time_only.optional(offset_element());
    PlanBuilder b;
    b.choice({time_only, date_opt_time_parser()});
    return b;
}

} // anonymous namespace

// =============================================================================
// Registry
// =============================================================================

void Registry::add(String name, CompiledPlan plan) {
    Capabilities caps{plan.is_parseable(), plan.is_printable()};
    Formatter formatter(std::make_shared<CompiledPlan>(std::move(plan)));
    String key = name;
    entries_.emplace(std::move(key), RegistryEntry{std::move(name), std::move(formatter), caps});
}

Registry::Registry() {
    auto logger = logging::LogManager::instance().get_logger("registry");

    const PlanBuilder date_t = concat({iso_date(), t_literal()});

    add("basic-date", basic_date().build("yyyyMMdd"));
    add("basic-date-time", concat({basic_date(), basic_t_time()}).build("yyyyMMdd'T'HHmmss.SSSZ"));
    add("basic-date-time-no-ms", concat({basic_date(), basic_t_time_no_ms()}).build("yyyyMMdd'T'HHmmssZ"));
    add("basic-ordinal-date", basic_ordinal_date().build("yyyyDDD"));
    add("basic-ordinal-date-time",
        concat({basic_ordinal_date(), basic_t_time()}).build("yyyyDDD'T'HHmmss.SSSZ"));
    add("basic-ordinal-date-time-no-ms",
        concat({basic_ordinal_date(), basic_t_time_no_ms()}).build("yyyyDDD'T'HHmmssZ"));
    add("basic-time", basic_time().build("HHmmss.SSSZ"));
    add("basic-time-no-ms", basic_time_no_ms().build("HHmmssZ"));
    add("basic-t-time", basic_t_time().build("'T'HHmmss.SSSZ"));
    add("basic-t-time-no-ms", basic_t_time_no_ms().build("'T'HHmmssZ"));
    add("basic-week-date", basic_week_date().build("xxxx'W'wwe"));
    add("basic-week-date-time",
        concat({basic_week_date(), basic_t_time()}).build("xxxx'W'wwe'T'HHmmss.SSSZ"));
    add("basic-week-date-time-no-ms",
        concat({basic_week_date(), basic_t_time_no_ms()}).build("xxxx'W'wwe'T'HHmmssZ"));

    add("date", iso_date().build("yyyy-MM-dd"));
    add("date-hour", concat({date_t, hour_element()}).build("yyyy-MM-dd'T'HH"));
    add("date-hour-minute", concat({date_t, hour_minute()}).build("yyyy-MM-dd'T'HH:mm"));
    add("date-hour-minute-second",
        concat({date_t, hour_minute_second()}).build("yyyy-MM-dd'T'HH:mm:ss"));
    add("date-hour-minute-second-fraction",
        concat({date_t, hour_minute_second(), fraction_element()}).build("yyyy-MM-dd'T'HH:mm:ss.SSS"));
    add("date-hour-minute-second-ms",
        concat({date_t, hour_minute_second(), millis_element()}).build("yyyy-MM-dd'T'HH:mm:ss.SSS"));
    add("date-time", concat({iso_date(), t_time()}).build("yyyy-MM-dd'T'HH:mm:ss.SSSZZ"));
    add("date-time-no-ms", concat({iso_date(), t_time_no_ms()}).build("yyyy-MM-dd'T'HH:mm:ssZZ"));

    add("hour", hour_element().build("HH"));
    add("hour-minute", hour_minute().build("HH:mm"));
    add("hour-minute-second", hour_minute_second().build("HH:mm:ss"));
    add("hour-minute-second-fraction",
        concat({hour_minute_second(), fraction_element()}).build("HH:mm:ss.SSS"));
    add("hour-minute-second-ms", concat({hour_minute_second(), millis_element()}).build("HH:mm:ss.SSS"));

    add("ordinal-date", ordinal_date().build("yyyy-DDD"));
    add("ordinal-date-time", concat({ordinal_date(), t_time()}).build("yyyy-DDD'T'HH:mm:ss.SSSZZ"));
    add("ordinal-date-time-no-ms",
        concat({ordinal_date(), t_time_no_ms()}).build("yyyy-DDD'T'HH:mm:ssZZ"));

    add("time", iso_time().build("HH:mm:ss.SSSZZ"));
    add("time-no-ms", time_no_ms().build("HH:mm:ssZZ"));
    add("t-time", t_time().build("'T'HH:mm:ss.SSSZZ"));
    add("t-time-no-ms", t_time_no_ms().build("'T'HH:mm:ssZZ"));

    add("week-date", week_date().build("xxxx-'W'ww-e"));
    add("week-date-time", concat({week_date(), t_time()}).build("xxxx-'W'ww-e'T'HH:mm:ss.SSSZZ"));
    add("week-date-time-no-ms",
        concat({week_date(), t_time_no_ms()}).build("xxxx-'W'ww-e'T'HH:mm:ssZZ"));
    add("weekyear", weekyear_element().build("xxxx"));
    add("weekyear-week", concat({weekyear_element(), week_element()}).build("xxxx-'W'ww"));
    add("weekyear-week-day", week_date().build("xxxx-'W'ww-e"));

    add("year", year_element().build("yyyy"));
    add("year-month", concat({year_element(), month_element()}).build("yyyy-MM"));
    add("year-month-day", iso_date().build("yyyy-MM-dd"));

    add("date-element-parser", date_element_parser().build("date element parser"));
    add("date-opt-time", date_opt_time_parser().build("date optional time parser"));
    add("date-parser", date_parser().build("date parser"));
    add("date-time-parser", date_time_parser().build("date time parser"));
    add("local-date-opt-time", local_date_opt_time_parser().build("local date optional time parser"));
    add("local-date", date_element_parser().build("local date parser"));
    add("local-time", time_element_parser().build("local time parser"));
    add("time-element-parser", time_element_parser().build("time element parser"));
    add("time-parser", time_parser().build("time parser"));

    // The layout compiles unconditionally; a failure here is a programming error
    auto rfc822 = compile_pattern("EEE, dd MMM yyyy HH:mm:ss Z");
    DATEFMT_THROW_IF_ERROR(rfc822);
    add("rfc822", std::move(rfc822).value());

    logger->debug(std::format("Registered {} built-in formatters", entries_.size()));
}

const Registry& Registry::instance() {
    static const Registry registry;
    return registry;
}

Optional<const RegistryEntry*> Registry::find(StringView name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return nullopt;
    return &it->second;
}

const RegistryEntry& Registry::at(StringView name) const {
    auto entry = find(name);
    if (!entry) {
        ErrorInfo err(ErrorCode::UNKNOWN_FORMATTER,
                      std::format("Unknown formatter '{}'", name), "registry");
        err.with_context("name", String(name));
        throw FormatException(std::move(err));
    }
    return **entry;
}

Vector<const RegistryEntry*> Registry::entries() const {
    Vector<const RegistryEntry*> result;
    result.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) result.push_back(&entry);
    return result;
}

Vector<RegistryListing> Registry::list() const {
    Vector<RegistryListing> result;
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) result.push_back({name, entry.capabilities});
    return result;
}

Vector<const RegistryEntry*> Registry::parsers() const {
    Vector<const RegistryEntry*> result;
    for (const auto& [_, entry] : entries_) {
        if (!entry.capabilities.can_print) result.push_back(&entry);
    }
    return result;
}

Vector<const RegistryEntry*> Registry::printers() const {
    Vector<const RegistryEntry*> result;
    for (const auto& [_, entry] : entries_) {
        if (entry.capabilities.can_print) result.push_back(&entry);
    }
    return result;
}

} // namespace datefmt::format
