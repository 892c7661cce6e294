#pragma once
// =============================================================================
// datefmt - Printer
// Version: 1.2.0
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/chrono/chronology.hpp"
#include "datefmt/chrono/locale.hpp"
#include "datefmt/format/plan.hpp"

namespace datefmt::format {

// Renders the instant as seen in zone. Total for printable plans and
// supported instants; throws FormatException(UNSUPPORTED) when the plan holds
// optional or choice groups and FormatException(INVALID_ARGUMENT) when
// Instant::is_supported() is false.
[[nodiscard]] String render(const CompiledPlan& plan, chrono::Instant instant,
                            const chrono::TimeZone& zone, const chrono::Locale& locale,
                            const chrono::Chronology& chronology);

// "+HH:MM" or "+HHMM"; seconds and millis are appended when max_fields > 2
// and they are not zero
[[nodiscard]] String format_offset(Int64 offset_millis, bool colon, Int32 max_fields = 2);

} // namespace datefmt::format
