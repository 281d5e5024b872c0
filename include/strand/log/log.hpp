//! # strand Logging
//!
//! Structured logging for the strand command-line tool:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal) plus Off
//! - Module-tagged messages with per-module filtering
//! - Console, file and null sinks, text or JSON-lines output
//! - Mutex-protected dispatch from a process-wide logger
//! - Compile-time level elision via STRAND_MIN_LOG_LEVEL
//!
//! The JSON engine itself never logs; only the CLI layer does.
//!
//! ## Usage
//!
//! ```cpp
//! STRAND_LOG_DEBUG("cli", "reading " << path);
//! STRAND_LOG_WARN("cli", "ignoring unknown option " << arg);
//! ```

#ifndef STRAND_LOG_HPP
#define STRAND_LOG_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strand::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name for a level (`"TRACE"`, `"DEBUG"`, ...).
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case.
///
/// # Returns
///
/// The level, or `std::nullopt` if `s` names no level.
[[nodiscard]] auto parse_level(std::string_view s) -> std::optional<LogLevel>;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module; ///< Module tag (e.g. "cli", "main")
    std::string message;
    const char* file = nullptr; ///< Source file (__FILE__)
    int line = 0;               ///< Source line (__LINE__)
    int64_t timestamp_ms = 0;   ///< Milliseconds since epoch
};

/// Output format for log lines.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    Json  ///< One JSON object per line
};

/// Formats a record as one text line (no trailing newline).
///
/// With `colors`, the level name is wrapped in an ANSI color sequence.
[[nodiscard]] auto format_text(const LogRecord& record, bool colors = false) -> std::string;

/// Formats a record as one JSON object (no trailing newline):
/// `{"ts":<ms>,"level":"INFO","module":"cli","msg":"..."}`.
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

/// Formats the time-of-day part of an epoch timestamp as `HH:MM:SS.mmm` (local time).
[[nodiscard]] auto format_timestamp(int64_t epoch_ms) -> std::string;

/// Milliseconds since the epoch.
[[nodiscard]] auto epoch_ms() -> int64_t;

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

/// Writes to a stream, stderr by default. Colors are used only when asked for
/// and the stream is stderr attached to a color-capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    /// Writes to `out` instead of stderr, never colored.
    explicit ConsoleSink(std::ostream& out);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto colors_enabled() const -> bool {
        return colors_enabled_;
    }

private:
    std::ostream* out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends log lines to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
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

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like `"cli=debug,main=trace,*=warn"`. A bare module name
/// (`"cli"`) enables everything from that module; `*` sets the default.
/// Entries with an unknown level name are ignored.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) lets through.
    [[nodiscard]] auto min_level() const -> LogLevel;

    /// Whether the last `parse()` set the default through `*=level`.
    [[nodiscard]] auto has_wildcard() const -> bool {
        return has_wildcard_;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    bool has_wildcard_ = false;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum level
    LogFormat format = LogFormat::Text; ///< Output format for every sink
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = none)
    bool console = true;                ///< Log to stderr
    bool colors = true;                 ///< ANSI colors on a terminal
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger.
///
/// Usable without `init()`: it then logs Info and above to stderr.
class Logger {
public:
    /// Replaces all sinks and levels with the given configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel;

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds a `LogConfig` from logging flags in `args`.
///
/// Recognizes `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=text|json`, `-v`/`-vv`/`-vvv`, `--verbose` and `-q`/`--quiet`.
/// When neither a level nor a filter is given on the command line,
/// `env_value` (the `STRAND_LOG` variable) is used: a value containing `=`
/// or `,` is a filter spec, anything else a level name. Other arguments are
/// ignored, and so is everything after `--`. An unknown level or format name
/// prints a warning to stderr. `args` excludes the program name.
[[nodiscard]] auto parse_log_options(const std::vector<std::string>& args,
                                     const char* env_value) -> LogConfig;

/// Same, reading `argv[1..argc)` and the `STRAND_LOG` environment variable.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Whether `arg` is one of the logging flags `parse_log_options` consumes.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef STRAND_MIN_LOG_LEVEL
#define STRAND_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define STRAND_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= STRAND_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::strand::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: STRAND_LOG_TRACE("module", "message " << value);
#define STRAND_LOG_TRACE(module, msg) STRAND_LOG_IMPL(::strand::log::LogLevel::Trace, module, msg)

#define STRAND_LOG_DEBUG(module, msg) STRAND_LOG_IMPL(::strand::log::LogLevel::Debug, module, msg)

#define STRAND_LOG_INFO(module, msg) STRAND_LOG_IMPL(::strand::log::LogLevel::Info, module, msg)

#define STRAND_LOG_WARN(module, msg) STRAND_LOG_IMPL(::strand::log::LogLevel::Warn, module, msg)

#define STRAND_LOG_ERROR(module, msg) STRAND_LOG_IMPL(::strand::log::LogLevel::Error, module, msg)

#define STRAND_LOG_FATAL(module, msg) STRAND_LOG_IMPL(::strand::log::LogLevel::Fatal, module, msg)

} // namespace strand::log

#endif // STRAND_LOG_HPP
