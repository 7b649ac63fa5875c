#include <recordsvc/util/logger.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>

namespace recordsvc {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(std::ostream* sink, size_t maxEntries)
    : sink_(sink), maxEntries_(std::max<size_t>(1, maxEntries)) {}

Logger::Logger() : Logger(&std::clog) {}

void Logger::log(LogLevel level, const std::string& component,
                 const std::string& message) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(minLevel_)) {
            return;
        }

        if (entries_.size() >= maxEntries_) {
            entries_.pop_front();
        }
        entries_.push_back(LogEntry{nowSeconds(), level, component, message});

        if (sink_) {
            *sink_ << format(entries_.back()) << '\n';
        }
    } catch (const std::exception&) {
        // Dropped: a log line must never fail the operation that wrote it.
    }
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::Debug, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::Info, component, message);
}

void Logger::warning(const std::string& component, const std::string& message) {
    log(LogLevel::Warning, component, message);
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::Error, component, message);
}

std::vector<LogEntry> Logger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

size_t Logger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

LogLevel Logger::minLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

std::string Logger::format(const LogEntry& entry) {
    std::string out;
    out.reserve(entry.component.size() + entry.message.size() + 32);
    out += "[";
    out += std::to_string(entry.timestamp);
    out += "] [";
    out += logLevelName(entry.level);
    out += "] [";
    out += entry.component;
    out += "] ";
    out += entry.message;
    return out;
}

std::uint64_t Logger::nowSeconds() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace recordsvc
