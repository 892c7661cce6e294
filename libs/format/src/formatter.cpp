// =============================================================================
// datefmt - Formatter Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/formatter.hpp>
#include <datefmt/format/pattern.hpp>
#include <datefmt/format/printer.hpp>
#include <format>

namespace datefmt::format {

namespace {

template<typename T>
SharedPtr<T> require(SharedPtr<T> ptr, const char* what) {
    if (!ptr) {
        throw FormatException(ErrorCode::INVALID_ARGUMENT, String("Formatter requires a ") + what);
    }
    return ptr;
}

} // anonymous namespace

Formatter::Formatter(PlanPtr plan, chrono::ZonePtr zone, chrono::LocalePtr locale,
                     chrono::ChronologyPtr chronology, Optional<Int32> pivot_year)
    : plan_(require(std::move(plan), "plan")),
      zone_(require(std::move(zone), "zone")),
      locale_(require(std::move(locale), "locale")),
      chronology_(require(std::move(chronology), "chronology")),
      pivot_year_(pivot_year) {}

Result<Formatter> Formatter::for_pattern(StringView pattern) {
    auto plan = compile_pattern(pattern);
    if (plan.is_error()) return plan.error();
    return Formatter(std::make_shared<CompiledPlan>(std::move(plan).value()));
}

Formatter Formatter::with_zone(chrono::ZonePtr zone) const {
    Formatter copy = *this;
    copy.zone_ = require(std::move(zone), "zone");
    return copy;
}

Formatter Formatter::with_locale(chrono::LocalePtr locale) const {
    Formatter copy = *this;
    copy.locale_ = require(std::move(locale), "locale");
    return copy;
}

Formatter Formatter::with_chronology(chrono::ChronologyPtr chronology) const {
    Formatter copy = *this;
    copy.chronology_ = require(std::move(chronology), "chronology");
    return copy;
}

Formatter Formatter::with_pivot_year(Int32 pivot_year) const {
    Formatter copy = *this;
    copy.pivot_year_ = pivot_year;
    return copy;
}

Formatter Formatter::without_pivot_year() const {
    Formatter copy = *this;
    copy.pivot_year_ = nullopt;
    return copy;
}

Result<String> Formatter::print(chrono::Instant instant) const {
    if (!can_print()) {
        return ErrorInfo(ErrorCode::UNSUPPORTED,
                         std::format("Formatter '{}' does not support printing", plan_->source()),
                         "formatter");
    }
    if (!instant.is_supported()) {
        ErrorInfo err(ErrorCode::INVALID_ARGUMENT,
                      std::format("Instant {} is outside the supported range [{},{}]",
                                  instant.epoch_millis(), chrono::MIN_SUPPORTED_MILLIS,
                                  chrono::MAX_SUPPORTED_MILLIS),
                      "formatter");
        err.with_context("millis", std::to_string(instant.epoch_millis()));
        return err;
    }
    return render(*plan_, instant, *zone_, *locale_, *chronology_);
}

Result<chrono::Instant> Formatter::parse(StringView text) const {
    return format::parse(*plan_, text, *zone_, *locale_, *chronology_, pivot_year_);
}

Result<PrefixParse> Formatter::parse_prefix(StringView text) const {
    return format::parse_prefix(*plan_, text, *zone_, *locale_, *chronology_, pivot_year_);
}

Result<ParsedFields> Formatter::parse_fields(StringView text) const {
    return format::parse_fields(*plan_, text, *locale_, pivot_year_);
}

bool Formatter::print_equivalent(const Formatter& other) const {
    bool same_plan = plan_ == other.plan_ || *plan_ == *other.plan_;
    return same_plan && zone_->equals(*other.zone_) && locale_->equals(*other.locale_) &&
           chronology_->id() == other.chronology_->id();
}

} // namespace datefmt::format
