// =============================================================================
// datefmt - Logging Implementation
// =============================================================================

#include "datefmt/common/logging.hpp"
#include <ctime>
#include <format>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace datefmt::logging {

Optional<LogLevel> parse_level(StringView name) {
    for (auto level : {LogLevel::TRACE, LogLevel::DBG, LogLevel::INFO,
                       LogLevel::WARN, LogLevel::ERR, LogLevel::OFF}) {
        if (equals_ignore_case(name, to_string(level))) return level;
    }
    return nullopt;
}

// LogEntry implementation
String LogEntry::format(bool colored, bool include_location) const {
    std::ostringstream oss;

    // Timestamp (UTC)
    auto time_t = SystemClock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<Milliseconds>(
        timestamp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    // Level with optional color
    if (colored) {
        oss << std::format(" [{}{:>5}\033[0m] ", level_color(level), to_string(level));
    } else {
        oss << std::format(" [{:>5}] ", to_string(level));
    }

    if (!logger_name.empty()) {
        oss << std::format("[{}] ", logger_name);
    }

    oss << message;

    if (include_location && location.file_name() != nullptr) {
        oss << std::format(" ({}:{})", location.file_name(), location.line());
    }

    return oss.str();
}

// ConsoleSink implementation
ConsoleSink::ConsoleSink(LogLevel level, bool colored)
    : level_(level), colored_(colored) {}

void ConsoleSink::write(const LogEntry& entry) {
    if (entry.level < level_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << entry.format(colored_, entry.level >= LogLevel::ERR) << "\n";
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// FileSink implementation
FileSink::FileSink(const Path& path, LogLevel level, Size max_size, UInt32 max_backups)
    : level_(level), file_path_(path), max_file_size_(max_size), max_backup_count_(max_backups) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
    file_.open(path, std::ios::app);
    current_size_ = std::filesystem::exists(path) ? std::filesystem::file_size(path) : 0;
}

FileSink::~FileSink() {
    if (file_.is_open()) file_.close();
}

void FileSink::write(const LogEntry& entry) {
    if (entry.level < level_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    rotate_if_needed();

    String line = entry.format(false, true) + "\n";
    file_ << line;
    current_size_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.flush();
}

void FileSink::rotate_if_needed() {
    if (current_size_ >= max_file_size_) rotate_files();
}

void FileSink::rotate_files() {
    file_.close();
    for (int i = static_cast<int>(max_backup_count_) - 1; i >= 0; --i) {
        Path old_path = i > 0 ? std::format("{}.{}", file_path_.string(), i) : file_path_.string();
        Path new_path = std::format("{}.{}", file_path_.string(), i + 1);
        if (std::filesystem::exists(old_path)) {
            if (i + 1 >= static_cast<int>(max_backup_count_)) std::filesystem::remove(old_path);
            else std::filesystem::rename(old_path, new_path);
        }
    }
    file_.open(file_path_, std::ios::out);
    current_size_ = 0;
}

// Logger implementation
Logger::Logger(String name) : name_(std::move(name)) {}

void Logger::add_sink(SharedPtr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_all_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, StringView message, std::source_location loc) {
    if (!should_log(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp = SystemClock::now();
    entry.message = String(message);
    entry.logger_name = name_;
    entry.location = loc;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) sink->flush();
}

// LogManager implementation
LogManager::LogManager() {
    root_logger_ = std::make_shared<Logger>("datefmt");
    root_logger_->set_level(LogLevel::WARN);
    root_logger_->add_sink(std::make_shared<ConsoleSink>(LogLevel::WARN));
}

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

SharedPtr<Logger> LogManager::get_logger(const String& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;

    auto logger = std::make_shared<Logger>(name);
    {
        std::lock_guard<std::mutex> root_lock(root_logger_->mutex_);
        for (auto& sink : root_logger_->sinks_) {
            logger->sinks_.push_back(sink);
        }
    }
    logger->set_level(root_logger_->level());
    loggers_[name] = logger;
    return logger;
}

SharedPtr<Logger> LogManager::get_root_logger() {
    return root_logger_;
}

void LogManager::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    root_logger_->set_level(level);
    for (auto& [_, logger] : loggers_) logger->set_level(level);
}

void LogManager::add_global_sink(SharedPtr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    root_logger_->add_sink(sink);
    for (auto& [_, logger] : loggers_) logger->add_sink(sink);
}

void LogManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, logger] : loggers_) logger->flush();
    root_logger_->flush();
}

void LogManager::configure_default(LogLevel console_level, Optional<Path> log_file, LogLevel file_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    Vector<SharedPtr<LogSink>> sinks;
    sinks.push_back(std::make_shared<ConsoleSink>(console_level));
    if (log_file) {
        sinks.push_back(std::make_shared<FileSink>(*log_file, file_level));
    }
    LogLevel level = console_level;
    if (log_file && file_level < level) level = file_level;

    auto reset = [&](Logger& logger) {
        logger.remove_all_sinks();
        for (auto& sink : sinks) logger.add_sink(sink);
        logger.set_level(level);
    };
    reset(*root_logger_);
    for (auto& [_, logger] : loggers_) reset(*logger);
}

} // namespace datefmt::logging
