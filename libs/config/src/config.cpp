// =============================================================================
// datefmt - Configuration Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/config/config.hpp>
#include <datefmt/chrono/chronology.hpp>
#include <datefmt/chrono/locale.hpp>
#include <datefmt/chrono/time_zone.hpp>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace datefmt::config {

namespace {

String unquote(String value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

ErrorInfo config_error(StringView section, StringView key, const String& message) {
    ErrorInfo err(ErrorCode::CONFIG_ERROR, message, "config");
    err.with_context("section", String(section));
    err.with_context("key", String(key));
    return err;
}

Result<Int32> parse_pivot_year(StringView text, StringView origin) {
    ConfigValue value{String(trim(text))};
    auto number = value.to_int();
    if (number.is_error() || *number < std::numeric_limits<Int32>::min() ||
        *number > std::numeric_limits<Int32>::max()) {
        return config_error(origin, "pivot_year", std::format("Invalid pivot year '{}'", text));
    }
    return static_cast<Int32>(*number);
}

Result<logging::LogLevel> parse_log_level(StringView text, StringView origin) {
    auto level = logging::parse_level(trim(text));
    if (!level) {
        return config_error(origin, "level", std::format("Invalid log level '{}'", text));
    }
    return *level;
}

// Lookups run eagerly so a bad name fails when the settings are read
Result<void> validate(const FormatSettings& settings) {
    auto zone = chrono::zones::for_id(settings.zone);
    if (zone.is_error()) return zone.error();
    auto locale = chrono::locales::for_id(settings.locale);
    if (locale.is_error()) return locale.error();
    auto chronology = chrono::chronologies::for_id(settings.chronology);
    if (chronology.is_error()) return chronology.error();
    return {};
}

} // anonymous namespace

// =============================================================================
// ConfigValue Implementation
// =============================================================================

Result<Int64> ConfigValue::to_int() const {
    if (value_.empty()) {
        return make_error<Int64>(ErrorCode::INVALID_ARGUMENT, "Empty value");
    }
    Int64 result = 0;
    const char* begin = value_.data();
    const char* end = begin + value_.size();
    if (*begin == '+') ++begin;
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc() || ptr != end) {
        return make_error<Int64>(ErrorCode::INVALID_ARGUMENT,
                                 std::format("Invalid integer format: {}", value_));
    }
    return result;
}

String ConfigValue::to_string_or(StringView default_val) const {
    return value_.empty() ? String(default_val) : value_;
}

// =============================================================================
// ConfigSection Implementation
// =============================================================================

static const ConfigValue EMPTY_VALUE;

bool ConfigSection::has(StringView key) const {
    return values_.find(key) != values_.end();
}

const ConfigValue& ConfigSection::get(StringView key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : EMPTY_VALUE;
}

String ConfigSection::get_string(StringView key, StringView default_val) const {
    return get(key).to_string_or(default_val);
}

void ConfigSection::set(StringView key, StringView value) {
    values_[String(key)] = ConfigValue(String(value));
}

void ConfigSection::set(StringView key, Int64 value) {
    values_[String(key)] = ConfigValue(std::to_string(value));
}

// =============================================================================
// ConfigFile Implementation
// =============================================================================

ConfigFile::ConfigFile() {
    add_section(default_section_name_);
}

void ConfigFile::parse(StringView content) {
    sections_.clear();
    String current_section = default_section_name_;
    add_section(current_section);

    std::istringstream iss{String(content)};
    String line;
    while (std::getline(iss, line)) {
        String trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

        // Section header [section]
        if (trimmed[0] == '[' && trimmed.back() == ']') {
            current_section = trim(trimmed.substr(1, trimmed.size() - 2));
            if (!has_section(current_section)) add_section(current_section);
            continue;
        }

        // key=value or key:value
        size_t sep_pos = std::min(trimmed.find('='), trimmed.find(':'));
        if (sep_pos != String::npos) {
            String key = trim(trimmed.substr(0, sep_pos));
            String value = unquote(trim(trimmed.substr(sep_pos + 1)));
            section(current_section).set(key, value);
        }
    }
}

Result<void> ConfigFile::load(const Path& path) {
    std::ifstream file(path);
    if (!file) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
            std::format("Cannot open config file: {}", path.string()));
    }
    std::ostringstream content;
    content << file.rdbuf();
    parse(content.str());
    return {};
}

bool ConfigFile::has_section(StringView name) const {
    return sections_.find(name) != sections_.end();
}

static const ConfigSection EMPTY_SECTION;

ConfigSection& ConfigFile::section(StringView name) {
    auto it = sections_.find(name);
    if (it == sections_.end()) return add_section(name);
    return it->second;
}

const ConfigSection& ConfigFile::section(StringView name) const {
    auto it = sections_.find(name);
    return it != sections_.end() ? it->second : EMPTY_SECTION;
}

ConfigSection& ConfigFile::add_section(StringView name) {
    auto [it, _] = sections_.emplace(String(name), ConfigSection(String(name)));
    return it->second;
}

String ConfigFile::to_string() const {
    std::ostringstream oss;

    const auto& def = default_section();
    if (!def.empty()) {
        for (const auto& [key, value] : def) {
            oss << key << " = " << value.str() << "\n";
        }
        oss << "\n";
    }

    for (const auto& [name, sec] : sections_) {
        if (name == default_section_name_ || sec.empty()) continue;
        oss << "[" << name << "]\n";
        for (const auto& [key, value] : sec) {
            oss << key << " = " << value.str() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

// =============================================================================
// Environment Variable Support
// =============================================================================

Optional<String> get_env(StringView name) {
    const char* value = std::getenv(String(name).c_str());
    if (value) return String(value);
    return nullopt;
}

String expand_env(StringView str) {
    String result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '$' && i + 1 < str.size() && str[i + 1] == '{') {
            size_t end = str.find('}', i + 2);
            if (end != StringView::npos) {
                auto value = get_env(str.substr(i + 2, end - i - 2));
                if (value) result += value.value();
                i = end;
                continue;
            }
        }
        result += str[i];
    }
    return result;
}

// =============================================================================
// Factory Functions
// =============================================================================

Result<ConfigFile> load_config(const Path& path) {
    ConfigFile config;
    auto result = config.load(path);
    if (result.is_error()) return result.error();
    return config;
}

// =============================================================================
// FormatSettings Implementation
// =============================================================================

Result<FormatSettings> FormatSettings::from_config(const ConfigFile& config) {
    FormatSettings settings;
    const auto& format_section = config.section(sections::FORMAT);
    const auto& logging_section = config.section(sections::LOGGING);

    settings.zone = format_section.get_string("zone", settings.zone);
    settings.locale = format_section.get_string("locale", settings.locale);
    settings.chronology = format_section.get_string("chronology", settings.chronology);

    if (format_section.has("pivot_year")) {
        auto pivot = parse_pivot_year(format_section.get("pivot_year").view(), sections::FORMAT);
        if (pivot.is_error()) return pivot.error();
        settings.pivot_year = *pivot;
    }
    if (logging_section.has("level")) {
        auto level = parse_log_level(logging_section.get("level").view(), sections::LOGGING);
        if (level.is_error()) return level.error();
        settings.log_level = *level;
    }
    if (logging_section.has("file")) {
        String file = expand_env(logging_section.get_string("file"));
        if (!file.empty()) settings.log_file = Path(file);
    }

    auto valid = validate(settings);
    if (valid.is_error()) return valid.error();
    return settings;
}

Result<void> FormatSettings::apply_env() {
    if (auto value = get_env(env::ZONE)) zone = *value;
    if (auto value = get_env(env::LOCALE)) locale = *value;
    if (auto value = get_env(env::CHRONOLOGY)) chronology = *value;
    if (auto value = get_env(env::PIVOT_YEAR)) {
        auto pivot = parse_pivot_year(*value, env::PIVOT_YEAR);
        if (pivot.is_error()) return pivot.error();
        pivot_year = *pivot;
    }
    if (auto value = get_env(env::LOG_LEVEL)) {
        auto level = parse_log_level(*value, env::LOG_LEVEL);
        if (level.is_error()) return level.error();
        log_level = *level;
    }
    return validate(*this);
}

Result<format::Formatter> FormatSettings::apply(const format::Formatter& formatter) const {
    auto zone_ptr = chrono::zones::for_id(zone);
    if (zone_ptr.is_error()) return zone_ptr.error();
    auto locale_ptr = chrono::locales::for_id(locale);
    if (locale_ptr.is_error()) return locale_ptr.error();
    auto chronology_ptr = chrono::chronologies::for_id(chronology);
    if (chronology_ptr.is_error()) return chronology_ptr.error();

    format::Formatter result = formatter.with_zone(zone_ptr.value())
                                        .with_locale(locale_ptr.value())
                                        .with_chronology(chronology_ptr.value());
    if (pivot_year) result = result.with_pivot_year(*pivot_year);
    return result;
}

void FormatSettings::configure_logging() const {
    logging::LogManager::instance().configure_default(log_level, log_file, logging::LogLevel::DBG);
}

ConfigFile FormatSettings::to_config() const {
    ConfigFile config;
    auto& format_section = config.add_section(sections::FORMAT);
    format_section.set("zone", zone);
    format_section.set("locale", locale);
    format_section.set("chronology", chronology);
    if (pivot_year) format_section.set("pivot_year", static_cast<Int64>(*pivot_year));

    auto& logging_section = config.add_section(sections::LOGGING);
    logging_section.set("level", logging::to_string(log_level));
    if (log_file) logging_section.set("file", log_file->string());
    return config;
}

Result<FormatSettings> load_settings(const Optional<Path>& path) {
    FormatSettings settings;
    if (path) {
        auto config = load_config(*path);
        if (config.is_error()) return config.error();
        auto from_file = FormatSettings::from_config(config.value());
        if (from_file.is_error()) return from_file.error();
        settings = from_file.value();
    }
    auto env_result = settings.apply_env();
    if (env_result.is_error()) return env_result.error();
    return settings;
}

} // namespace datefmt::config
