#pragma once
// =============================================================================
// datefmt - Public Interface
// Version: 1.2.0
// Free functions over formatters, the registry and the resolver
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/chrono/chronology.hpp"
#include "datefmt/chrono/instant.hpp"
#include "datefmt/chrono/locale.hpp"
#include "datefmt/chrono/time_zone.hpp"
#include "datefmt/format/formatter.hpp"
#include "datefmt/format/pattern.hpp"
#include "datefmt/format/registry.hpp"
#include "datefmt/format/resolver.hpp"

namespace datefmt {

using chrono::Instant;
using format::Formatter;
using format::RegistryListing;

// Formatter for a pattern, bound to UTC, English and the ISO chronology
[[nodiscard]] Result<Formatter> compile(StringView pattern);

// Built-in formatter by registry name; UNKNOWN_FORMATTER when absent
[[nodiscard]] Result<Formatter> formatter(StringView name);

[[nodiscard]] Result<String> print(const Formatter& formatter, Instant instant);
[[nodiscard]] Result<Instant> parse(const Formatter& formatter, StringView text);
[[nodiscard]] Result<Instant> parse_any(StringView text);

[[nodiscard]] Formatter with_zone(const Formatter& formatter, chrono::ZonePtr zone);
[[nodiscard]] Formatter with_locale(const Formatter& formatter, chrono::LocalePtr locale);
[[nodiscard]] Formatter with_chronology(const Formatter& formatter, chrono::ChronologyPtr chronology);
[[nodiscard]] Formatter with_pivot_year(const Formatter& formatter, Int32 pivot_year);

// Registry names with their capabilities, in name order
[[nodiscard]] Vector<RegistryListing> list_registry();

} // namespace datefmt
