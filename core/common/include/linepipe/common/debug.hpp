#pragma once

/**
 * @file debug.hpp
 * @brief Debug and logging system for linepipe
 *
 * Features:
 * - Hierarchical log levels
 * - Category-based filtering
 * - Automatic source location capture
 * - Scope-based timing (spans)
 * - Thread-safe logging
 * - No message formatting when a level is disabled
 *
 * Log output never goes to stdout: stdout carries the transformed stream.
 */

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace linepipe::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    TRACE = 0,  // Finest granularity, one record per line
    DEBUG = 1,  // Debugging information
    INFO  = 2,  // Informational messages
    WARN  = 3,  // Warning conditions
    ERROR = 4,  // Error conditions
    FATAL = 5,  // Unrecoverable errors
    OFF   = 6   // Logging disabled
};

namespace detail {
struct LevelInfo {
    std::string_view name;
    char letter;
};

// Indexed by LogLevel
constexpr std::array<LevelInfo, 7> LEVELS = {{{"TRACE", 'T'},
                                              {"DEBUG", 'D'},
                                              {"INFO", 'I'},
                                              {"WARN", 'W'},
                                              {"ERROR", 'E'},
                                              {"FATAL", 'F'},
                                              {"OFF", '-'}}};
}  // namespace detail

constexpr std::string_view level_name(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < detail::LEVELS.size() ? detail::LEVELS[index].name : "UNKNOWN";
}

constexpr char level_char(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < detail::LEVELS.size() ? detail::LEVELS[index].letter : '?';
}

/**
 * @brief Parse a level name, ignoring case
 *
 * Accepts the names above plus "warning", "err", "critical" and "none".
 */
LINEPIPE_API std::optional<LogLevel> try_parse_log_level(std::string_view name) noexcept;

// As try_parse_log_level(), INFO when unrecognized
LINEPIPE_API LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

/**
 * @brief Predefined log categories for filtering
 */
namespace category {
constexpr std::string_view GENERAL   = "general";
constexpr std::string_view TRANSFORM = "transform";
constexpr std::string_view STREAM    = "stream";
constexpr std::string_view CONFIG    = "config";
constexpr std::string_view CLI       = "cli";

constexpr std::array<std::string_view, 5> ALL = {GENERAL, TRANSFORM, STREAM, CONFIG, CLI};
}  // namespace category

// ============================================================================
// LOG RECORD
// ============================================================================

/**
 * @brief A single log entry with all context
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;

    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id = 0;
};

// ============================================================================
// LOG SINK INTERFACE
// ============================================================================

/**
 * @brief Interface for log output destinations
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;

    virtual bool is_ready() const noexcept = 0;
};

// ============================================================================
// BUILT-IN LOG SINKS
// ============================================================================

/**
 * @brief Console log sink writing to stderr
 *
 * Records are colored when stderr is a terminal.
 */
class ConsoleSink : public ILogSink {
public:
    ConsoleSink();
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    bool use_colors_;
    std::mutex mutex_;
};

/**
 * @brief File log sink with size-based rotation
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size = 10 * 1024 * 1024;  // 10MB, 0 disables rotation
        uint32_t max_files   = 5;                 // Keep last 5 files
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Callback-based sink for custom handling
 */
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void write(const LogRecord& record) override {
        if (callback_)
            callback_(record);
    }

    void flush() override {}
    bool is_ready() const noexcept override { return callback_ != nullptr; }

private:
    Callback callback_;
};

// ============================================================================
// LOG FILTER
// ============================================================================

/**
 * @brief Log filtering configuration
 */
class LogFilter {
public:
    LogFilter() = default;

    void set_level(LogLevel level) noexcept { global_level_ = level; }
    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Set level for specific category
     */
    void set_category_level(std::string_view category, LogLevel level);

    /**
     * @brief Check if a log should be emitted
     */
    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /**
     * @brief Reset all filters to defaults
     */
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogLevel> category_levels_;
};

// ============================================================================
// LOGGER
// ============================================================================

/**
 * @brief Thread-safe logger with multiple sinks
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);

    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = LINEPIPE_CURRENT_LOCATION);

    void flush();

private:
    Logger();
    ~Logger();

    void dispatch(const LogRecord& record);

    LogFilter filter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

// ============================================================================
// SPAN (TIMING SCOPE)
// ============================================================================

/**
 * @brief RAII scope for timing operations and logging duration
 */
class Span {
public:
    Span(std::string_view name, std::string_view category = category::GENERAL,
         SourceLocation loc = LINEPIPE_CURRENT_LOCATION);

    ~Span();

    Span(const Span&)            = delete;
    Span& operator=(const Span&) = delete;

    /**
     * @brief Add key-value context, reported when the span completes
     */
    Span& add_context(std::string_view key, std::string_view value);
    Span& add_context(std::string_view key, uint64_t value);

    /**
     * @brief Mark span as failed
     */
    void set_error(ErrorCode code, std::string_view message = {});

    std::chrono::nanoseconds elapsed() const noexcept;

private:
    std::string name_;
    std::string_view category_;
    SourceLocation location_;

    std::chrono::steady_clock::time_point start_time_;
    std::vector<std::pair<std::string, std::string>> context_;

    bool has_error_       = false;
    ErrorCode error_code_ = ErrorCode::SUCCESS;
    std::string error_message_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

// Core logging macro
#define LINEPIPE_LOG_IMPL(level, category, ...)                                                \
    do {                                                                                       \
        auto& _lp_logger = ::linepipe::common::debug::Logger::instance();                      \
        if (_lp_logger.is_enabled(::linepipe::common::debug::LogLevel::level, category)) {     \
            std::ostringstream _lp_oss;                                                        \
            _lp_oss << __VA_ARGS__;                                                            \
            _lp_logger.log(::linepipe::common::debug::LogLevel::level, category, _lp_oss.str(),\
                           LINEPIPE_CURRENT_LOCATION);                                         \
        }                                                                                      \
    } while (0)

// Category-specific macros
#define LINEPIPE_LOG_TRACE(cat, ...) LINEPIPE_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define LINEPIPE_LOG_DEBUG(cat, ...) LINEPIPE_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define LINEPIPE_LOG_INFO(cat, ...)  LINEPIPE_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define LINEPIPE_LOG_WARN(cat, ...)  LINEPIPE_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define LINEPIPE_LOG_ERROR(cat, ...) LINEPIPE_LOG_IMPL(ERROR, cat, __VA_ARGS__)

// Span creation macro
#define LINEPIPE_SPAN_CAT(var, name, cat) \
    ::linepipe::common::debug::Span var(name, cat, LINEPIPE_CURRENT_LOCATION)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Initialize the logging system
 *
 * LINEPIPE_LOG_LEVEL, when set to a valid level name, overrides @p level.
 */
LINEPIPE_API void init_logging(LogLevel level = LogLevel::WARN);

/**
 * @brief Shutdown logging system cleanly
 */
LINEPIPE_API void shutdown_logging();

}  // namespace linepipe::common::debug
