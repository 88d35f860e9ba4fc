#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <fstream>
#include <optional>

namespace gpudash::tui {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

// Case-insensitive; nullopt for unknown names
std::optional<LogLevel> parse_log_level(const std::string& name);

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string source;
    std::string message;

    std::string format_timestamp() const;
    std::string level_str() const;
    std::string format_line() const;
};

class Logger {
public:
    static Logger& instance();

    // Logging methods
    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warn(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);
    void critical(const std::string& source, const std::string& message);

    // Get recent log entries, oldest first
    std::vector<LogEntry> get_recent_logs(size_t count = 100) const;

    // Entries at or above a level, used to echo problems after the screen is gone
    std::vector<LogEntry> get_logs_at_least(LogLevel level) const;

    void clear();

    // Configuration
    void set_min_level(LogLevel level);
    void set_max_entries(size_t max);

    // Append every accepted entry to a file. Returns false if it can't be opened.
    bool set_output_file(const std::string& path);
    void close_output_file();

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& source, const std::string& message);

    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
    LogLevel min_level_ = LogLevel::DEBUG;
    size_t max_entries_ = 1000;
    std::ofstream output_;
};

// Convenience macros
#define LOG_DEBUG(source, msg) gpudash::tui::Logger::instance().debug(source, msg)
#define LOG_INFO(source, msg) gpudash::tui::Logger::instance().info(source, msg)
#define LOG_WARN(source, msg) gpudash::tui::Logger::instance().warn(source, msg)
#define LOG_ERROR(source, msg) gpudash::tui::Logger::instance().error(source, msg)
#define LOG_CRITICAL(source, msg) gpudash::tui::Logger::instance().critical(source, msg)

} // namespace gpudash::tui
