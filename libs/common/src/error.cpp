#include "datefmt/common/error.hpp"
#include <format>
#include <sstream>

namespace datefmt {

const char* DatefmtErrorCategory::name() const noexcept { return "datefmt"; }

String DatefmtErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OUT_OF_RANGE: return "Out of range";
        case ErrorCode::UNSUPPORTED: return "Operation not supported";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::PATTERN_ERROR: return "Malformed pattern";
        case ErrorCode::PARSE_ERROR: return "Text does not match format";
        case ErrorCode::TRAILING_INPUT: return "Unparsed trailing input";
        case ErrorCode::INVALID_FIELDS: return "Invalid date/time fields";
        case ErrorCode::NO_MATCH: return "No format matches text";
        case ErrorCode::UNKNOWN_ZONE: return "Unknown time zone";
        case ErrorCode::UNKNOWN_LOCALE: return "Unknown locale";
        case ErrorCode::UNKNOWN_CHRONOLOGY: return "Unknown chronology";
        case ErrorCode::UNKNOWN_FORMATTER: return "Unknown formatter";
    }
    return "Unknown datefmt error";
}

const std::error_category& datefmt_error_category() noexcept {
    static DatefmtErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), datefmt_error_category()};
}

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp)), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context[std::move(key)] = std::move(value);
    return *this;
}

ErrorInfo& ErrorInfo::at_position(Size pos) {
    position = pos;
    return *this;
}

String ErrorInfo::context_value(const String& key) const {
    auto it = context.find(key);
    return it != context.end() ? it->second : String();
}

String ErrorInfo::to_string() const {
    String text = std::format("[{}] {}: {}", static_cast<int>(code),
                              datefmt_error_category().message(static_cast<int>(code)), message);
    if (position) text += std::format(" (at {})", *position);
    return text;
}

String ErrorInfo::format_full() const {
    std::ostringstream oss;
    oss << "Error: " << to_string() << "\n";
    oss << "  Component: " << (component.empty() ? "unknown" : component) << "\n";
    oss << "  Location: " << location.file_name() << ":" << location.line() << "\n";
    oss << "  Function: " << location.function_name() << "\n";
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [k, v] : context) {
            oss << "    " << k << ": " << v << "\n";
        }
    }
    return oss.str();
}

FormatException::FormatException(ErrorInfo info)
    : std::runtime_error(info.to_string()), error_info_(std::move(info)) {}

FormatException::FormatException(ErrorCode code, const String& message, std::source_location loc)
    : std::runtime_error(message), error_info_(code, message, "", loc) {}

String FormatException::detailed_message() const {
    return error_info_.format_full();
}

bool is_parse_error(ErrorCode code) {
    return code == ErrorCode::PARSE_ERROR || code == ErrorCode::TRAILING_INPUT;
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c >= 1000 && c < 1100) return "General";
    if (c >= 1100 && c < 2000) return "I/O";
    if (c >= 2000 && c < 3000) return "Pattern";
    if (c >= 3000 && c < 4000) return "Parse";
    if (c >= 4000 && c < 5000) return "Context";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("DTF{:04d}", static_cast<int>(code));
}

} // namespace datefmt
