#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace kls::tui {

std::string LogEntry::format_timestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
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

std::string LogEntry::format() const {
    return format_timestamp() + " [" + level_str() + "] " + source + ": " + message;
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

    if (file_.is_open()) {
        file_ << entry.format() << '\n';
        file_.flush();
    }

    entries_.push_back(std::move(entry));

    // Trim if exceeding max
    if (entries_.size() > MAX_ENTRIES) {
        entries_.erase(entries_.begin(),
                      entries_.begin() + (entries_.size() - MAX_ENTRIES));
    }
}

std::optional<LogEntry> Logger::last_at_least(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(entries_.rbegin(), entries_.rend(),
                           [level](const LogEntry& e) { return e.level >= level; });
    if (it == entries_.rend()) {
        return std::nullopt;
    }
    return *it;
}

void Logger::clear_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }

    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

std::optional<LogLevel> Logger::parse_level(const std::string& name) {
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

} // namespace kls::tui
