#pragma once
// =============================================================================
// datefmt - Configuration
// Version: 1.2.0
// INI files and environment overrides for formatter and logging defaults
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/common/logging.hpp"
#include "datefmt/format/formatter.hpp"
#include <map>

namespace datefmt::config {

// =============================================================================
// Configuration Value
// =============================================================================

class ConfigValue {
private:
    String value_;

public:
    ConfigValue() = default;
    explicit ConfigValue(String value) : value_(std::move(value)) {}

    [[nodiscard]] const String& str() const { return value_; }
    [[nodiscard]] StringView view() const { return value_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }

    [[nodiscard]] Result<Int64> to_int() const;
    [[nodiscard]] String to_string_or(StringView default_val) const;
};

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    String name_;
    std::map<String, ConfigValue, std::less<>> values_;

public:
    ConfigSection() = default;
    explicit ConfigSection(String name) : name_(std::move(name)) {}

    [[nodiscard]] const String& name() const { return name_; }

    [[nodiscard]] bool has(StringView key) const;
    [[nodiscard]] const ConfigValue& get(StringView key) const;

    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;

    void set(StringView key, StringView value);
    void set(StringView key, Int64 value);

    [[nodiscard]] Size size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    String default_section_name_ = "default";
    std::map<String, ConfigSection, std::less<>> sections_;

public:
    ConfigFile();

    [[nodiscard]] Result<void> load(const Path& path);

    // Replaces the contents with the parsed text. Lines are "[SECTION]",
    // "key = value" or "key: value"; '#' and ';' start comments.
    void parse(StringView content);

    [[nodiscard]] bool has_section(StringView name) const;
    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    [[nodiscard]] const ConfigSection& default_section() const { return section(default_section_name_); }

    ConfigSection& add_section(StringView name);

    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Environment Variable Support
// =============================================================================

[[nodiscard]] Optional<String> get_env(StringView name);

// Expands ${VAR}; unset variables expand to nothing
[[nodiscard]] String expand_env(StringView str);

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] Result<ConfigFile> load_config(const Path& path);

// =============================================================================
// Formatter Settings
// =============================================================================

namespace sections {
    constexpr StringView FORMAT = "FORMAT";
    constexpr StringView LOGGING = "LOGGING";
}

namespace env {
    constexpr StringView ZONE = "DATEFMT_ZONE";
    constexpr StringView LOCALE = "DATEFMT_LOCALE";
    constexpr StringView CHRONOLOGY = "DATEFMT_CHRONOLOGY";
    constexpr StringView PIVOT_YEAR = "DATEFMT_PIVOT_YEAR";
    constexpr StringView LOG_LEVEL = "DATEFMT_LOG_LEVEL";
}

struct FormatSettings {
    String zone = "UTC";
    String locale = "en";
    String chronology = "ISO";
    Optional<Int32> pivot_year;
    logging::LogLevel log_level = logging::LogLevel::WARN;
    Optional<Path> log_file;

    // Reads [FORMAT] zone, locale, chronology, pivot_year and [LOGGING]
    // level, file. Unknown zones, locales and chronologies fail with their
    // lookup error; malformed numbers and levels with CONFIG_ERROR.
    [[nodiscard]] static Result<FormatSettings> from_config(const ConfigFile& config);

    // Applies the DATEFMT_* environment variables on top
    [[nodiscard]] Result<void> apply_env();

    // Formatter with these settings' zone, locale, chronology and pivot year
    [[nodiscard]] Result<format::Formatter> apply(const format::Formatter& formatter) const;

    void configure_logging() const;

    [[nodiscard]] ConfigFile to_config() const;
};

// Defaults, then the file when given, then the environment
[[nodiscard]] Result<FormatSettings> load_settings(const Optional<Path>& path);

} // namespace datefmt::config
