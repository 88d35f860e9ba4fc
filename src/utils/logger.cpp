#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace gpudash::tui {

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return std::nullopt;
}

std::string LogEntry::format_timestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string LogEntry::level_str() const {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARN:     return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string LogEntry::format_line() const {
    return std::format("{} [{}] {}: {}", format_timestamp(), level_str(), source, message);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::DEBUG, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::INFO, source, message);
}

void Logger::warn(const std::string& source, const std::string& message) {
    log(LogLevel::WARN, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::ERROR, source, message);
}

void Logger::critical(const std::string& source, const std::string& message) {
    log(LogLevel::CRITICAL, source, message);
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    LogEntry entry{
        .timestamp = std::chrono::system_clock::now(),
        .level = level,
        .source = source,
        .message = message
    };

    if (output_.is_open()) {
        output_ << entry.format_line() << '\n';
        output_.flush();
    }

    entries_.push_back(std::move(entry));

    // Trim if exceeding max
    if (entries_.size() > max_entries_) {
        entries_.erase(entries_.begin(),
                      entries_.begin() + (entries_.size() - max_entries_));
    }
}

std::vector<LogEntry> Logger::get_recent_logs(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.size() <= count) {
        return entries_;
    }

    return std::vector<LogEntry>(
        entries_.end() - count,
        entries_.end()
    );
}

std::vector<LogEntry> Logger::get_logs_at_least(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<LogEntry> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [level](const LogEntry& e) { return e.level >= level; });
    return result;
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::set_max_entries(size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_entries_ = max;
    if (entries_.size() > max_entries_) {
        entries_.erase(entries_.begin(),
                      entries_.begin() + (entries_.size() - max_entries_));
    }
}

bool Logger::set_output_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (output_.is_open()) {
        output_.close();
    }
    output_.open(path, std::ios::out | std::ios::app);
    return output_.is_open();
}

void Logger::close_output_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (output_.is_open()) {
        output_.close();
    }
}

} // namespace gpudash::tui
