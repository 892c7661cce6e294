// =============================================================================
// datefmt - Public Interface Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/datefmt.hpp>
#include <format>

namespace datefmt {

Result<Formatter> compile(StringView pattern) {
    return Formatter::for_pattern(pattern);
}

Result<Formatter> formatter(StringView name) {
    auto entry = format::Registry::instance().find(name);
    if (!entry) {
        ErrorInfo err(ErrorCode::UNKNOWN_FORMATTER, std::format("Unknown formatter '{}'", name), "registry");
        err.with_context("name", String(name));
        return err;
    }
    return (*entry)->formatter;
}

Result<String> print(const Formatter& formatter, Instant instant) {
    return formatter.print(instant);
}

Result<Instant> parse(const Formatter& formatter, StringView text) {
    return formatter.parse(text);
}

Result<Instant> parse_any(StringView text) {
    return format::parse_any(text);
}

Formatter with_zone(const Formatter& formatter, chrono::ZonePtr zone) {
    return formatter.with_zone(std::move(zone));
}

Formatter with_locale(const Formatter& formatter, chrono::LocalePtr locale) {
    return formatter.with_locale(std::move(locale));
}

Formatter with_chronology(const Formatter& formatter, chrono::ChronologyPtr chronology) {
    return formatter.with_chronology(std::move(chronology));
}

Formatter with_pivot_year(const Formatter& formatter, Int32 pivot_year) {
    return formatter.with_pivot_year(pivot_year);
}

Vector<RegistryListing> list_registry() {
    return format::Registry::instance().list();
}

} // namespace datefmt
