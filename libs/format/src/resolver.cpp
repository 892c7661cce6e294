// =============================================================================
// datefmt - Best-Effort Resolver Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/resolver.hpp>
#include <datefmt/common/logging.hpp>
#include <format>

namespace datefmt::format {

Result<Resolution> resolve(StringView text, const Registry& registry, const chrono::ZonePtr& zone) {
    auto logger = logging::LogManager::instance().get_logger("resolver");

    for (const RegistryEntry* entry : registry.entries()) {
        if (!entry->capabilities.can_parse) continue;

        auto parsed = entry->formatter.with_zone(zone).parse(text);
        if (parsed.is_success()) {
            logger->debug(std::format("'{}' matched {}", text, entry->name));
            return Resolution{parsed.value(), entry->name};
        }
        logger->trace(std::format("{} rejected '{}': {}", entry->name, text, parsed.error().message));
    }

    logger->debug(std::format("No built-in formatter matched '{}'", text));
    ErrorInfo err(ErrorCode::NO_MATCH, std::format("No formatter matches \"{}\"", text), "resolver");
    err.with_context("text", String(text));
    return err;
}

Result<chrono::Instant> parse_any(StringView text, const Registry& registry,
                                  const chrono::ZonePtr& zone) {
    auto resolution = resolve(text, registry, zone);
    if (resolution.is_error()) return resolution.error();
    return resolution->instant;
}

Result<chrono::Instant> parse_any(StringView text) {
    return parse_any(text, Registry::instance(), chrono::zones::utc());
}

} // namespace datefmt::format
