#pragma once
// =============================================================================
// datefmt - Best-Effort Resolver
// Version: 1.2.0
// Parses text whose layout is unknown by trying the built-in formatters
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/format/registry.hpp"

namespace datefmt::format {

struct Resolution {
    chrono::Instant instant;
    String formatter_name;
};

// Tries every parse-capable registry entry in name order, each bound to
// zone, and returns the first success. NO_MATCH when none accepts the text.
[[nodiscard]] Result<Resolution> resolve(StringView text, const Registry& registry,
                                         const chrono::ZonePtr& zone);

// Built-in registry, UTC
[[nodiscard]] Result<chrono::Instant> parse_any(StringView text);

[[nodiscard]] Result<chrono::Instant> parse_any(StringView text, const Registry& registry,
                                                const chrono::ZonePtr& zone);

} // namespace datefmt::format
