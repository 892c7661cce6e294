#pragma once
// =============================================================================
// datefmt - Pattern Compiler
// Version: 1.2.0
// Turns a pattern string such as "yyyy-MM-dd'T'HH:mm" into a CompiledPlan
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/format/plan.hpp"

namespace datefmt::format {

// Fails with PATTERN_ERROR for an empty pattern, a reserved letter or an
// unterminated quote. The error position is the offending character and the
// "character" context holds it.
[[nodiscard]] Result<CompiledPlan> compile_pattern(StringView pattern);

} // namespace datefmt::format
