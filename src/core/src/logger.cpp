#include "cemkit/core/logger.hpp"
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <cstdio>
#include <ctime>

namespace cemkit {

// ============================================================================
// Global state
// ============================================================================

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    LogLevel global_level{LogLevel::Info};
    // Level given to loggers created by get()
    LogLevel logger_level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// Caller holds s.mutex
void init_locked(LoggingState& s, std::vector<std::unique_ptr<LogSink>> sinks) {
    if (s.initialized) return;

    s.sinks = std::move(sinks);
    s.initialized = true;
}

std::vector<std::unique_ptr<LogSink>> default_sinks() {
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    return sinks;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);

    char result[64];
    std::snprintf(result, sizeof(result), "%s.%03d", buffer, static_cast<int>(ms.count()));
    return result;
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    auto lowered = String(name).to_lowercase();
    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// ConsoleSink implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    const char* color_start = "";
    const char* color_end = "";

    if (m_use_colors) {
        switch (record.level) {
            case LogLevel::Trace: color_start = "\033[90m"; break;  // Gray
            case LogLevel::Debug: color_start = "\033[36m"; break;  // Cyan
            case LogLevel::Info:  color_start = "\033[34m"; break;  // Blue
            case LogLevel::Warn:  color_start = "\033[33m"; break;  // Yellow
            case LogLevel::Error: color_start = "\033[31m"; break;  // Red
            default: break;
        }
        color_end = "\033[0m";
    }

    auto timestamp = format_timestamp(record.timestamp);
    auto level_name = log_level_name(record.level);

    // Format: [timestamp] [LEVEL] [logger] message (file:line)
    std::ostream& out = std::cerr;

    out << "[" << timestamp << "] "
        << color_start << "[" << level_name << "]" << color_end << " ";

    if (!record.logger_name.empty()) {
        out << "[" << record.logger_name << "] ";
    }

    out << record.message;

    if (record.level <= LogLevel::Debug) {
        out << " (" << record.location.file_name()
            << ":" << record.location.line_number() << ")";
    }

    out << "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// Logger implementation
// ============================================================================

Logger::Logger(std::string_view name) : m_name(name) {}

void Logger::trace(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Trace, msg, loc);
}

void Logger::debug(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Debug, msg, loc);
}

void Logger::info(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Info, msg, loc);
}

void Logger::warn(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Warn, msg, loc);
}

void Logger::error(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Error, msg, loc);
}

void Logger::log_impl(LogLevel level, std::string_view message, SourceLocation loc) {
    if (!is_enabled(level)) return;

    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (level < s.global_level) return;

    LogRecord record{
        .level = level,
        .message = message,
        .logger_name = m_name,
        .location = loc,
        .timestamp = std::chrono::system_clock::now()
    };

    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global logging functions
// ============================================================================

namespace logging {

void init() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    init_locked(s, default_sinks());
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    init_locked(s, std::move(sinks));
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
    s.initialized = false;
    // Named loggers stay alive: callers may hold references obtained from
    // get() across a shutdown/init cycle.
}

void set_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

void set_all_levels(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
    s.logger_level = level;
    for (auto& entry : s.loggers) {
        entry.second->set_level(level);
    }
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    std::string name_str(name);
    auto it = s.loggers.find(name_str);
    if (it != s.loggers.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(name);
    logger->set_level(s.logger_level);
    auto& ref = *logger;
    s.loggers.emplace(std::move(name_str), std::move(logger));
    return ref;
}

} // namespace logging

} // namespace cemkit
