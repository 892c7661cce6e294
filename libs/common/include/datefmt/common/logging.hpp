// =============================================================================
// datefmt - Logging System
// =============================================================================
#pragma once

#include "datefmt/common/types.hpp"
#include <fstream>
#include <mutex>
#include <source_location>

namespace datefmt::logging {

using namespace datefmt;

// Log levels - avoid DEBUG name due to Windows macro conflict
enum class LogLevel : UInt8 {
    TRACE = 0,
    DBG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    OFF = 5
};

[[nodiscard]] constexpr StringView to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DBG:   return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr StringView level_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";   // Gray
        case LogLevel::DBG:   return "\033[36m";   // Cyan
        case LogLevel::INFO:  return "\033[32m";   // Green
        case LogLevel::WARN:  return "\033[33m";   // Yellow
        case LogLevel::ERR:   return "\033[31m";   // Red
        default: return "\033[0m";
    }
}

// Accepts the names printed by to_string(), case-insensitively
[[nodiscard]] Optional<LogLevel> parse_level(StringView name);

// Log entry
struct LogEntry {
    LogLevel level = LogLevel::INFO;
    SystemTimePoint timestamp = SystemClock::now();
    String message;
    String logger_name;
    std::source_location location;

    [[nodiscard]] String format(bool colored = false, bool include_location = false) const;
};

// Abstract sink interface
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
    [[nodiscard]] virtual LogLevel get_level() const = 0;
    virtual void set_level(LogLevel level) = 0;
};

// Console sink, writes to stderr so printed dates on stdout stay clean
class ConsoleSink : public LogSink {
private:
    LogLevel level_;
    bool colored_;
    mutable std::mutex mutex_;

public:
    explicit ConsoleSink(LogLevel level = LogLevel::WARN, bool colored = true);

    void write(const LogEntry& entry) override;
    void flush() override;
    [[nodiscard]] LogLevel get_level() const override { return level_; }
    void set_level(LogLevel level) override { level_ = level; }
};

// File sink with rotation
class FileSink : public LogSink {
private:
    LogLevel level_;
    Path file_path_;
    std::ofstream file_;
    Size max_file_size_;
    UInt32 max_backup_count_;
    Size current_size_ = 0;
    mutable std::mutex mutex_;

    void rotate_if_needed();
    void rotate_files();

public:
    FileSink(const Path& path, LogLevel level = LogLevel::DBG,
             Size max_size = 10 * 1024 * 1024, UInt32 max_backups = 5);
    ~FileSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;
    [[nodiscard]] LogLevel get_level() const override { return level_; }
    void set_level(LogLevel level) override { level_ = level; }
};

// Logger class
class Logger {
    friend class LogManager;
private:
    String name_;
    LogLevel level_ = LogLevel::INFO;
    std::vector<SharedPtr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    Logger() = default;
    explicit Logger(String name);

    void add_sink(SharedPtr<LogSink> sink);
    void remove_all_sinks();

    void log(LogLevel level, StringView message,
             std::source_location loc = std::source_location::current());

    void trace(StringView message, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::TRACE)) log(LogLevel::TRACE, message, loc);
    }

    void debug(StringView message, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::DBG)) log(LogLevel::DBG, message, loc);
    }

    void info(StringView message, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::INFO)) log(LogLevel::INFO, message, loc);
    }

    void warn(StringView message, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::WARN)) log(LogLevel::WARN, message, loc);
    }

    void error(StringView message, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::ERR)) log(LogLevel::ERR, message, loc);
    }

    void flush();

    [[nodiscard]] const String& name() const { return name_; }
    [[nodiscard]] LogLevel level() const { return level_; }
    void set_level(LogLevel level) { level_ = level; }

    [[nodiscard]] bool should_log(LogLevel level) const {
        return level >= level_ && level != LogLevel::OFF;
    }
};

// Log manager singleton
class LogManager {
private:
    SharedPtr<Logger> root_logger_;
    std::unordered_map<String, SharedPtr<Logger>> loggers_;
    mutable std::mutex mutex_;

    LogManager();

public:
    static LogManager& instance();

    [[nodiscard]] SharedPtr<Logger> get_logger(const String& name);
    [[nodiscard]] SharedPtr<Logger> get_root_logger();

    void set_global_level(LogLevel level);
    void add_global_sink(SharedPtr<LogSink> sink);
    void shutdown();

    void configure_default(LogLevel console_level = LogLevel::WARN,
                           Optional<Path> log_file = std::nullopt,
                           LogLevel file_level = LogLevel::DBG);
};

} // namespace datefmt::logging
