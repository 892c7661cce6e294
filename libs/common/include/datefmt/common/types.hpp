#pragma once
// =============================================================================
// datefmt - Core Types (C++20)
// Version: 1.2.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <chrono>
#include <compare>
#include <concepts>
#include <type_traits>
#include <filesystem>
#include <format>
#include <source_location>
#include <unordered_map>

namespace datefmt {

// =============================================================================
// Fundamental Types
// =============================================================================
using UInt8 = std::uint8_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using UInt64 = std::uint64_t;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;

// =============================================================================
// Container Types
// =============================================================================
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using SharedPtr = std::shared_ptr<T>;

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = SystemClock::time_point;
using Milliseconds = std::chrono::milliseconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// C++20 Concepts
// =============================================================================
template<typename T>
concept Integral = std::is_integral_v<T>;

// =============================================================================
// Version
// =============================================================================
struct Version {
    UInt16 major = 0;
    UInt16 minor = 0;
    UInt16 patch = 0;

    [[nodiscard]] String to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }

    auto operator<=>(const Version&) const = default;
};

// Reported by `datefmt --version`
[[nodiscard]] const Version& library_version();

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String trim(StringView str);

// Case folding covers ASCII and the Latin-1 letters of UTF-8 (U+00C0-U+00DE
// against U+00E0-U+00FE), enough for the bundled locale tables
[[nodiscard]] bool equals_ignore_case(StringView a, StringView b);
[[nodiscard]] bool starts_with_ignore_case(StringView str, StringView prefix);

[[nodiscard]] String pad_left(StringView str, Size width, char pad = ' ');

// Decimal rendering of an unsigned value, left-padded with zeros to min_digits
[[nodiscard]] String zero_padded(UInt64 value, Size min_digits);

template<Integral T>
[[nodiscard]] constexpr bool is_digit(T c) noexcept {
    return c >= '0' && c <= '9';
}

} // namespace datefmt
