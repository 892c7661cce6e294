#pragma once
// =============================================================================
// datefmt - Error Handling (C++20)
// Version: 1.2.0
// =============================================================================

#include "datefmt/common/types.hpp"
#include <system_error>
#include <stdexcept>

namespace datefmt {

// =============================================================================
// Error Codes
// =============================================================================
enum class ErrorCode : Int32 {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1000,
    INVALID_ARGUMENT = 1001,
    OUT_OF_RANGE = 1003,
    UNSUPPORTED = 1006,

    // I/O and configuration Errors (1100-1199)
    IO_ERROR = 1100,
    FILE_NOT_FOUND = 1101,
    CONFIG_ERROR = 1110,

    // Pattern Errors (2000-2099)
    PATTERN_ERROR = 2000,

    // Parse Errors (3000-3099)
    PARSE_ERROR = 3000,
    TRAILING_INPUT = 3001,
    INVALID_FIELDS = 3002,
    NO_MATCH = 3003,

    // Context Errors (4000-4099)
    UNKNOWN_ZONE = 4000,
    UNKNOWN_LOCALE = 4001,
    UNKNOWN_CHRONOLOGY = 4002,
    UNKNOWN_FORMATTER = 4003
};

// =============================================================================
// Error Category
// =============================================================================
class DatefmtErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override;
    [[nodiscard]] String message(int code) const override;
};

[[nodiscard]] const std::error_category& datefmt_error_category() noexcept;
[[nodiscard]] std::error_code make_error_code(ErrorCode e) noexcept;

} // namespace datefmt

namespace std {
    template<>
    struct is_error_code_enum<datefmt::ErrorCode> : true_type {};
}

namespace datefmt {

// =============================================================================
// ErrorInfo - Detailed error information
// =============================================================================
struct ErrorInfo {
    ErrorCode code = ErrorCode::SUCCESS;
    String message;
    String component;
    Optional<Size> position;  // offset into the pattern or the parsed text
    std::source_location location = std::source_location::current();
    std::unordered_map<String, String> context;

    ErrorInfo() = default;
    ErrorInfo(ErrorCode c, String msg, String comp = "",
              std::source_location loc = std::source_location::current());

    ErrorInfo& with_context(String key, String value);
    ErrorInfo& at_position(Size pos);

    [[nodiscard]] String context_value(const String& key) const;
    [[nodiscard]] String to_string() const;
    [[nodiscard]] String format_full() const;
};

// =============================================================================
// Result<T> - Monadic error handling
// =============================================================================
template<typename T>
class Result {
private:
    Variant<T, ErrorInfo> data_;

public:
    Result(T value) : data_(std::move(value)) {}
    Result(ErrorInfo error) : data_(std::move(error)) {}

    [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_error() const { return std::holds_alternative<ErrorInfo>(data_); }

    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] ErrorInfo& error() & { return std::get<ErrorInfo>(data_); }
    [[nodiscard]] const ErrorInfo& error() const& { return std::get<ErrorInfo>(data_); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T value_or(T default_val) const {
        return is_success() ? value() : std::move(default_val);
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const -> Result<decltype(f(std::declval<T>()))> {
        if (is_success()) return f(value());
        return error();
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> decltype(f(std::declval<T>())) {
        if (is_success()) return f(value());
        return error();
    }

    explicit operator bool() const { return is_success(); }
};

// Specialization for void
template<>
class Result<void> {
private:
    Optional<ErrorInfo> error_;

public:
    Result() = default;
    Result(ErrorInfo err) : error_(std::move(err)) {}

    [[nodiscard]] bool is_success() const { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const { return error_.has_value(); }
    [[nodiscard]] const ErrorInfo& error() const { return *error_; }

    explicit operator bool() const { return is_success(); }
};

// =============================================================================
// Result Factory Functions
// =============================================================================
template<typename T>
[[nodiscard]] Result<T> make_success(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> make_success() {
    return Result<void>();
}

template<typename T>
[[nodiscard]] Result<T> make_error(ErrorCode code, String message,
                                   std::source_location loc = std::source_location::current()) {
    return Result<T>(ErrorInfo(code, std::move(message), "", loc));
}

template<typename T>
[[nodiscard]] Result<T> make_error(const ErrorInfo& info) {
    return Result<T>(info);
}

// =============================================================================
// Exception Hierarchy
// =============================================================================
class FormatException : public std::runtime_error {
protected:
    ErrorInfo error_info_;

public:
    explicit FormatException(ErrorInfo info);
    FormatException(ErrorCode code, const String& message,
                    std::source_location loc = std::source_location::current());

    [[nodiscard]] ErrorCode code() const { return error_info_.code; }
    [[nodiscard]] const ErrorInfo& error_info() const { return error_info_; }
    [[nodiscard]] String detailed_message() const;
};

// =============================================================================
// Helper Functions
// =============================================================================

// PARSE_ERROR and its TRAILING_INPUT specialisation
[[nodiscard]] bool is_parse_error(ErrorCode code);
[[nodiscard]] StringView error_category_name(ErrorCode code);
[[nodiscard]] String format_error_code(ErrorCode code);

// =============================================================================
// Macros
// =============================================================================
#define DATEFMT_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) return _result.error(); \
    } while(0)

#define DATEFMT_THROW_IF_ERROR(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) throw datefmt::FormatException(_result.error()); \
    } while(0)

} // namespace datefmt
