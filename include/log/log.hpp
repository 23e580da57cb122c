//! # BASIS Logging
//!
//! A small structured logging library shared by the resolver, the locator and
//! the process runner:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Output sinks (Console, File, Stream, Null)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via BASIS_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! BASIS_LOG_DEBUG("locate", "Resolved " << name << " -> " << path);
//! BASIS_LOG_WARN("manifest", "Unknown section [" << section << "]");
//! ```
//!
//! Log output is diagnostics only. The command echo and the child's output
//! produced by `execute()` never go through the logger.

#ifndef BASIS_LOG_HPP
#define BASIS_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace basis::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a log level (e.g., "TRACE", "DEBUG").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level name (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "exec", "locate")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Renders a record as one text line: "HH:MM:SS.mmm LEVEL [module] message".
std::string format_record(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool colors_enabled() const {
        return colors_enabled_;
    }

private:
    bool colors_enabled_;

    static const char* level_color(LogLevel level);
};

/// File sink that appends log lines to a file.
/// Flushes immediately for Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Sink writing plain text lines to a caller-owned stream.
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
};

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "exec=trace,locate=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Module names without "=level" are enabled at Trace.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given module passes.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn; ///< Global minimum log level
    std::string filter_spec;         ///< Module filter string
    std::string log_file;            ///< Path to log file (empty = no file)
    bool console = true;             ///< Enable console (stderr) output
    bool colors = true;              ///< Enable ANSI colors on console
};

// ============================================================================
// Logger
// ============================================================================

/// Thread-safe process logger.
///
/// Configured once via `Logger::init()`. Until then it logs warnings and
/// above to stderr.
class Logger {
public:
    /// Initialize the logger with the given configuration, replacing all sinks.
    static void init(const LogConfig& config);

    /// Get the logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-built record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink to the logger.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging options from argv.
/// Extracts: --log-level, --log-filter, --log-file, -q, -v/-vv/-vvv.
/// Falls back to the BASIS_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef BASIS_MIN_LOG_LEVEL
#define BASIS_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define BASIS_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= BASIS_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::basis::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: BASIS_LOG_TRACE("module", "message " << value);
#define BASIS_LOG_TRACE(module, msg) BASIS_LOG_IMPL(::basis::log::LogLevel::Trace, module, msg)
#define BASIS_LOG_DEBUG(module, msg) BASIS_LOG_IMPL(::basis::log::LogLevel::Debug, module, msg)
#define BASIS_LOG_INFO(module, msg) BASIS_LOG_IMPL(::basis::log::LogLevel::Info, module, msg)
#define BASIS_LOG_WARN(module, msg) BASIS_LOG_IMPL(::basis::log::LogLevel::Warn, module, msg)
#define BASIS_LOG_ERROR(module, msg) BASIS_LOG_IMPL(::basis::log::LogLevel::Error, module, msg)
#define BASIS_LOG_FATAL(module, msg) BASIS_LOG_IMPL(::basis::log::LogLevel::Fatal, module, msg)

} // namespace basis::log

#endif // BASIS_LOG_HPP
