#pragma once
// =============================================================================
// datefmt - Time Zones
// Version: 1.2.0
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/chrono/instant.hpp"

namespace datefmt::chrono {

// =============================================================================
// TimeZone - opaque zone rules consumed by a Chronology
// =============================================================================

class TimeZone {
public:
    virtual ~TimeZone() = default;

    [[nodiscard]] virtual const String& id() const = 0;

    // Offset from UTC in effect at the instant, in milliseconds
    [[nodiscard]] virtual Int64 offset_at(Instant instant) const = 0;

    // Offset to subtract from a local wall time to obtain UTC
    [[nodiscard]] virtual Int64 offset_from_local(Int64 local_millis) const = 0;

    // Display name printed for the 'z' directive
    [[nodiscard]] virtual String short_name(Instant instant) const = 0;

    [[nodiscard]] bool equals(const TimeZone& other) const { return id() == other.id(); }
};

using ZonePtr = SharedPtr<const TimeZone>;

// Zone with one constant offset for all instants
class FixedOffsetZone : public TimeZone {
private:
    String id_;
    Int64 offset_millis_;

public:
    FixedOffsetZone(String id, Int64 offset_millis)
        : id_(std::move(id)), offset_millis_(offset_millis) {}

    [[nodiscard]] const String& id() const override { return id_; }
    [[nodiscard]] Int64 offset_at(Instant) const override { return offset_millis_; }
    [[nodiscard]] Int64 offset_from_local(Int64) const override { return offset_millis_; }
    [[nodiscard]] String short_name(Instant) const override { return id_; }

    [[nodiscard]] Int64 offset_millis() const { return offset_millis_; }
};

// =============================================================================
// Zone Lookup
// =============================================================================

namespace zones {

// Largest accepted offset magnitude, exclusive: 24 hours
inline constexpr Int64 MAX_OFFSET_MILLIS = MILLIS_PER_DAY;

[[nodiscard]] ZonePtr utc();

// Zero returns utc(); otherwise a zone with id "+HH:MM" (seconds and millis
// appended when present)
[[nodiscard]] Result<ZonePtr> for_offset_millis(Int64 offset_millis);

// Accepts "UTC", "GMT", "Z", "+HH", "+HH:MM", "+HHMM", "UTC+HH:MM", "GMT-HH"
[[nodiscard]] Result<ZonePtr> for_id(StringView id);

// "+05:30" style id of an offset; "+00:00" for zero
[[nodiscard]] String offset_id(Int64 offset_millis);

} // namespace zones

} // namespace datefmt::chrono
