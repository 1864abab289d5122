#pragma once

#include "types.hpp"
#include "string.hpp"
#include <string_view>
#include <chrono>
#include <vector>
#include <memory>
#include <optional>
#include <format>

namespace cemkit {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Case-insensitive; accepts the names above plus "warning"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Source location (GCC 9 compatible)
// ============================================================================

struct SourceLocation {
    const char* file;
    int line;
    const char* function;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                   int line = __builtin_LINE(),
                                   const char* func = __builtin_FUNCTION()) {
        return {file, line, func};
    }

    [[nodiscard]] const char* file_name() const { return file; }
    [[nodiscard]] int line_number() const { return line; }
    [[nodiscard]] const char* function_name() const { return function; }
};

// ============================================================================
// Log record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log sink interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Console sink. Everything goes to stderr: stdout belongs to whatever
// protocol layer is serving the registry.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current());

    // Format-style logging (C++20 std::format)
    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Trace)) {
            trace(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Debug)) {
            debug(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Info)) {
            info(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Warn)) {
            warn(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Error)) {
            error(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    // Configuration
    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return level >= m_level;
    }

private:
    void log_impl(LogLevel level, std::string_view message, SourceLocation loc);

    std::string m_name;
    LogLevel m_level{LogLevel::Info};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Initialize logging system with default console sink
void init();

// Initialize with custom sinks
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Shutdown logging; the next init() starts from scratch
void shutdown();

// Global minimum level, checked before any sink sees a record
void set_level(LogLevel level);

// Sets the global level and the level of every named logger, existing or
// created later
void set_all_levels(LogLevel level);

// Get or create a named logger
[[nodiscard]] Logger& get(std::string_view name);

} // namespace logging

} // namespace cemkit

template<>
struct std::formatter<cemkit::String> : std::formatter<std::string_view> {
    auto format(const cemkit::String& s, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(s.view(), ctx);
    }
};
