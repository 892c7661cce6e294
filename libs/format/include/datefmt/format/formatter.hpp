#pragma once
// =============================================================================
// datefmt - Formatter
// Version: 1.2.0
// Immutable pairing of a compiled plan with zone, locale, chronology and
// pivot year. The with_* modifiers return new formatters sharing the plan.
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/chrono/chronology.hpp"
#include "datefmt/chrono/locale.hpp"
#include "datefmt/chrono/time_zone.hpp"
#include "datefmt/format/parser.hpp"
#include "datefmt/format/plan.hpp"

namespace datefmt::format {

using PlanPtr = SharedPtr<const CompiledPlan>;

class Formatter {
private:
    PlanPtr plan_;
    chrono::ZonePtr zone_;
    chrono::LocalePtr locale_;
    chrono::ChronologyPtr chronology_;
    Optional<Int32> pivot_year_;

public:
    // UTC, English and ISO unless given. Throws FormatException(INVALID_ARGUMENT)
    // for a null plan, zone, locale or chronology.
    explicit Formatter(PlanPtr plan,
                       chrono::ZonePtr zone = chrono::zones::utc(),
                       chrono::LocalePtr locale = chrono::locales::english(),
                       chrono::ChronologyPtr chronology = chrono::chronologies::iso(),
                       Optional<Int32> pivot_year = nullopt);

    // Compiles the pattern; bound to UTC, English and ISO
    [[nodiscard]] static Result<Formatter> for_pattern(StringView pattern);

    [[nodiscard]] Formatter with_zone(chrono::ZonePtr zone) const;
    [[nodiscard]] Formatter with_locale(chrono::LocalePtr locale) const;
    [[nodiscard]] Formatter with_chronology(chrono::ChronologyPtr chronology) const;
    [[nodiscard]] Formatter with_pivot_year(Int32 pivot_year) const;
    [[nodiscard]] Formatter without_pivot_year() const;

    // UNSUPPORTED when the plan is parse-only, INVALID_ARGUMENT for an
    // instant outside the supported range
    [[nodiscard]] Result<String> print(chrono::Instant instant) const;

    // UNSUPPORTED when the plan holds print-only directives
    [[nodiscard]] Result<chrono::Instant> parse(StringView text) const;
    [[nodiscard]] Result<PrefixParse> parse_prefix(StringView text) const;
    [[nodiscard]] Result<ParsedFields> parse_fields(StringView text) const;

    [[nodiscard]] bool can_print() const { return plan_->is_printable(); }
    [[nodiscard]] bool can_parse() const { return plan_->is_parseable(); }

    [[nodiscard]] const PlanPtr& plan() const { return plan_; }
    [[nodiscard]] const chrono::ZonePtr& zone() const { return zone_; }
    [[nodiscard]] const chrono::LocalePtr& locale() const { return locale_; }
    [[nodiscard]] const chrono::ChronologyPtr& chronology() const { return chronology_; }
    [[nodiscard]] const Optional<Int32>& pivot_year() const { return pivot_year_; }

    // True when both print the same text for every instant
    [[nodiscard]] bool print_equivalent(const Formatter& other) const;
};

} // namespace datefmt::format
