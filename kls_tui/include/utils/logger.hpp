#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <fstream>
#include <optional>

namespace kls::tui {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string source;
    std::string message;

    std::string format_timestamp() const;
    std::string level_str() const;
    std::string format() const;
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

    // Most recent entry at or above the given level
    std::optional<LogEntry> last_at_least(LogLevel level) const;

    void clear_entries();

    // Configuration
    void set_min_level(LogLevel level);

    // Append every accepted entry to a file; an empty path closes the sink.
    // Returns false if the file cannot be opened.
    bool set_file(const std::string& path);

    // Level from its name, case-insensitive ("warn", "ERROR", ...)
    static std::optional<LogLevel> parse_level(const std::string& name);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& source, const std::string& message);

    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
    LogLevel min_level_ = LogLevel::INFO;
    static constexpr size_t MAX_ENTRIES = 1000;
    std::ofstream file_;
};

// Convenience macros
#define LOG_DEBUG(source, msg) kls::tui::Logger::instance().debug(source, msg)
#define LOG_INFO(source, msg) kls::tui::Logger::instance().info(source, msg)
#define LOG_WARN(source, msg) kls::tui::Logger::instance().warn(source, msg)
#define LOG_ERROR(source, msg) kls::tui::Logger::instance().error(source, msg)
#define LOG_CRITICAL(source, msg) kls::tui::Logger::instance().critical(source, msg)

} // namespace kls::tui
