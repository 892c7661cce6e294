#pragma once
// =============================================================================
// datefmt - Instant
// Version: 1.2.0
// A zone-independent point on the timeline, in milliseconds since
// 1970-01-01T00:00:00Z
// =============================================================================

#include "datefmt/common/types.hpp"

namespace datefmt::chrono {

inline constexpr Int64 MILLIS_PER_SECOND = 1000;
inline constexpr Int64 MILLIS_PER_MINUTE = 60 * MILLIS_PER_SECOND;
inline constexpr Int64 MILLIS_PER_HOUR = 60 * MILLIS_PER_MINUTE;
inline constexpr Int64 MILLIS_PER_DAY = 24 * MILLIS_PER_HOUR;

// ISO years -292275054 to 292278993. Inside this range an instant can be
// shifted by any zone offset without leaving Int64.
inline constexpr Int64 MIN_SUPPORTED_MILLIS = -9223372017129600000;
inline constexpr Int64 MAX_SUPPORTED_MILLIS = 9223372017129599999;

class Instant {
private:
    Int64 millis_ = 0;

public:
    constexpr Instant() noexcept = default;
    constexpr explicit Instant(Int64 epoch_millis) noexcept : millis_(epoch_millis) {}

    [[nodiscard]] static constexpr Instant from_epoch_millis(Int64 millis) noexcept {
        return Instant(millis);
    }

    [[nodiscard]] static Instant from_system_time(SystemTimePoint tp) {
        return Instant(std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count());
    }

    [[nodiscard]] static Instant now() { return from_system_time(SystemClock::now()); }

    [[nodiscard]] constexpr Int64 epoch_millis() const noexcept { return millis_; }

    [[nodiscard]] constexpr bool is_supported() const noexcept {
        return millis_ >= MIN_SUPPORTED_MILLIS && millis_ <= MAX_SUPPORTED_MILLIS;
    }

    constexpr auto operator<=>(const Instant&) const = default;
};

// Division rounding towards negative infinity
[[nodiscard]] constexpr Int64 floor_div(Int64 a, Int64 b) noexcept {
    Int64 q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

[[nodiscard]] constexpr Int64 floor_mod(Int64 a, Int64 b) noexcept {
    return a - floor_div(a, b) * b;
}

} // namespace datefmt::chrono
