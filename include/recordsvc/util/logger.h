#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace recordsvc {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

const char* logLevelName(LogLevel level);

struct LogEntry {
    std::uint64_t timestamp = 0;   // seconds since epoch
    LogLevel      level = LogLevel::Info;
    std::string   component;
    std::string   message;
};

/// Thread-safe logger used by the service and the server executable.
///
/// Each accepted entry is written as one line to the sink stream (if any)
/// and kept in a bounded ring of recent entries. Logging is best effort:
/// a failing sink never surfaces to the caller.
class Logger {
public:
    /// `sink` may be null to keep entries in memory only.
    explicit Logger(std::ostream* sink, size_t maxEntries = 500);

    /// Logger writing to std::clog.
    Logger();

    void log(LogLevel level, const std::string& component,
             const std::string& message);
    void debug(const std::string& component, const std::string& message);
    void info(const std::string& component, const std::string& message);
    void warning(const std::string& component, const std::string& message);
    void error(const std::string& component, const std::string& message);

    /// Copy of the retained entries, oldest first.
    std::vector<LogEntry> entries() const;
    size_t size() const;
    void clear();

    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    /// "[<timestamp>] [<LEVEL>] [<component>] <message>"
    static std::string format(const LogEntry& entry);

private:
    std::ostream*         sink_;
    size_t                maxEntries_;
    std::deque<LogEntry>  entries_;
    LogLevel              minLevel_ = LogLevel::Debug;
    mutable std::mutex    mutex_;

    static std::uint64_t nowSeconds();
};

} // namespace recordsvc
