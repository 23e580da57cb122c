//! # Logger Implementation
//!
//! Implements the Logger, the console/file/stream sinks and LogFilter.

#include "log/log.hpp"

#include <cstdlib>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define BASIS_ISATTY(fd) _isatty(fd)
#define BASIS_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define BASIS_ISATTY(fd) isatty(fd)
#define BASIS_FILENO(f) fileno(f)
#endif

namespace basis::log {

// ============================================================================
// Terminal Color Detection
// ============================================================================

/// Detects if stderr supports ANSI color codes.
static bool detect_terminal_colors() {
#ifdef _WIN32
    HANDLE h_err = GetStdHandle(STD_ERROR_HANDLE);
    if (h_err == INVALID_HANDLE_VALUE)
        return false;

    DWORD mode = 0;
    if (!GetConsoleMode(h_err, &mode))
        return false;

    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    return SetConsoleMode(h_err, mode) != 0;
#else
    if (!BASIS_ISATTY(BASIS_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

std::string format_record(const LogRecord& record) {
    std::ostringstream oss;
    oss << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level) << " ["
        << record.module << "] " << record.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    std::ostringstream oss;
    oss << get_timestamp() << " ";
    if (colors_enabled_) {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors_enabled_) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << "\n";

    // One write per record keeps lines from interleaving with child stderr.
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << format_record(record) << "\n";
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// StreamSink
// ============================================================================

void StreamSink::write(const LogRecord& record) {
    out_ << format_record(record) << "\n";
}

void StreamSink::flush() {
    out_.flush();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>(true));
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter();
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Per-module overrides may go below the global level.
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.colors));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace basis::log
