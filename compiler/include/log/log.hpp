//! # Engine Logging
//!
//! Structured, module-tagged logging for waot:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags per component (`engine`, `compiler`, `codegen`,
//!   `trampoline`, `serialize`, `linker`, `loader`, `instance`)
//! - Console, file and null sinks, thread-safe dispatch
//! - Compile-time level elision via WAOT_MIN_LOG_LEVEL
//! - Runtime configuration from the `WAOT_LOG` / `WAOT_LOG_FILE` /
//!   `WAOT_LOG_FORMAT` environment variables
//!
//! ## Usage
//!
//! ```cpp
//! WAOT_LOG_INFO("engine", "compiled " << name << " in " << ms << " ms");
//! WAOT_LOG_DEBUG("codegen", "function " << index << ": " << ir.size() << " bytes of IR");
//! ```

#ifndef WAOT_LOG_HPP
#define WAOT_LOG_HPP

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

namespace waot::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
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
    if (s == "warn" || s == "WARN")
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
    std::string_view module; ///< Module tag (e.g., "engine", "codegen")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Renders a record as one text line without the trailing newline.
std::string format_text(const LogRecord& record);

/// Renders a record as one JSON object without the trailing newline.
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "codegen=trace,loader=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// A bare module name enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Builds a LogConfig from the environment.
///
/// - `WAOT_LOG`: a level name ("debug") or a filter spec ("codegen=trace,*=warn")
/// - `WAOT_LOG_FILE`: additionally log to this file
/// - `WAOT_LOG_FORMAT`: "json" or "text"
LogConfig config_from_env();

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Configures itself from `config_from_env()` on first use; `init()`
/// replaces that configuration.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (records are dropped until one is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    void apply(const LogConfig& config);

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

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef WAOT_MIN_LOG_LEVEL
#define WAOT_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define WAOT_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= WAOT_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::waot::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define WAOT_LOG_TRACE(module, msg) WAOT_LOG_IMPL(::waot::log::LogLevel::Trace, module, msg)
#define WAOT_LOG_DEBUG(module, msg) WAOT_LOG_IMPL(::waot::log::LogLevel::Debug, module, msg)
#define WAOT_LOG_INFO(module, msg) WAOT_LOG_IMPL(::waot::log::LogLevel::Info, module, msg)
#define WAOT_LOG_WARN(module, msg) WAOT_LOG_IMPL(::waot::log::LogLevel::Warn, module, msg)
#define WAOT_LOG_ERROR(module, msg) WAOT_LOG_IMPL(::waot::log::LogLevel::Error, module, msg)
#define WAOT_LOG_FATAL(module, msg) WAOT_LOG_IMPL(::waot::log::LogLevel::Fatal, module, msg)

} // namespace waot::log

#endif // WAOT_LOG_HPP
