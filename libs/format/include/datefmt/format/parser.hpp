#pragma once
// =============================================================================
// datefmt - Parser
// Version: 1.2.0
// Executes a plan against text and resolves the collected fields to an instant
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/chrono/chronology.hpp"
#include "datefmt/chrono/locale.hpp"
#include "datefmt/format/plan.hpp"

namespace datefmt::format {

struct ParseOptions {
    // Stop after the last instruction instead of failing with TRAILING_INPUT
    bool allow_trailing = false;
};

struct ParsedFields {
    chrono::FieldValues fields;
    Size consumed = 0;
};

struct PrefixParse {
    chrono::Instant instant;
    Size consumed = 0;
};

// Current year in UTC; the pivot when none is set, read only once a
// two-digit year is parsed
[[nodiscard]] Int32 default_pivot_year();

// The year y with y mod 100 == two_digits and pivot_year - 99 <= y <= pivot_year
[[nodiscard]] Int32 resolve_two_digit_year(Int32 two_digits, Int32 pivot_year);

// Matches text against the plan without resolving a date. Errors:
// UNSUPPORTED for print-only plans, PARSE_ERROR at the furthest failure,
// TRAILING_INPUT at the first unconsumed character, INVALID_FIELDS when
// matched digits lie outside their field's range (month 13, hour 25).
[[nodiscard]] Result<ParsedFields> parse_fields(const CompiledPlan& plan, StringView text,
                                                const chrono::Locale& locale,
                                                Optional<Int32> pivot_year,
                                                ParseOptions options = {});

// parse_fields followed by chronology.instant_of; INVALID_FIELDS when the
// fields do not form a valid date/time
[[nodiscard]] Result<chrono::Instant> parse(const CompiledPlan& plan, StringView text,
                                            const chrono::TimeZone& zone,
                                            const chrono::Locale& locale,
                                            const chrono::Chronology& chronology,
                                            Optional<Int32> pivot_year,
                                            ParseOptions options = {});

// Parses the longest prefix the plan accepts and reports its length
[[nodiscard]] Result<PrefixParse> parse_prefix(const CompiledPlan& plan, StringView text,
                                               const chrono::TimeZone& zone,
                                               const chrono::Locale& locale,
                                               const chrono::Chronology& chronology,
                                               Optional<Int32> pivot_year);

} // namespace datefmt::format
