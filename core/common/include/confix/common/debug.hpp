#pragma once

/**
 * @file debug.hpp
 * @brief Logging system for confix
 *
 * Features:
 * - Hierarchical log levels
 * - Category-based filtering
 * - Automatic source location capture
 * - Thread-safe dispatch to pluggable sinks
 * - No message formatting when a level is disabled
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace confix::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    TRACE = 0,  // Finest granularity, very verbose
    DEBUG = 1,  // Debugging information
    INFO  = 2,  // Informational messages
    WARN  = 3,  // Warning conditions
    ERROR = 4,  // Error conditions
    FATAL = 5,  // Fatal errors
    OFF   = 6   // Logging disabled
};

/**
 * @brief Get log level name
 */
constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Get short level name (1 char)
 */
constexpr char level_char(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return 'T';
        case LogLevel::DEBUG:
            return 'D';
        case LogLevel::INFO:
            return 'I';
        case LogLevel::WARN:
            return 'W';
        case LogLevel::ERROR:
            return 'E';
        case LogLevel::FATAL:
            return 'F';
        default:
            return '?';
    }
}

/**
 * @brief Parse log level from string
 *
 * Case-insensitive; unknown names map to INFO.
 */
CONFIX_API LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

namespace category {
constexpr std::string_view GENERAL = "general";
constexpr std::string_view CONFIG  = "config";
constexpr std::string_view SOURCE  = "source";
constexpr std::string_view READER  = "reader";
constexpr std::string_view WRITER  = "writer";
constexpr std::string_view CLI     = "cli";
constexpr std::string_view LOADER  = "loader";
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

    /**
     * @brief Write a log record
     */
    virtual void write(const LogRecord& record) = 0;

    /**
     * @brief Flush pending writes
     */
    virtual void flush() = 0;

    /**
     * @brief Check if sink is ready to accept logs
     */
    virtual bool is_ready() const noexcept = 0;
};

// ============================================================================
// BUILT-IN LOG SINKS
// ============================================================================

/**
 * @brief Console log sink with optional color support
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool use_stderr        = true;  // Use stderr for warnings and errors
        bool include_timestamp = true;
        bool include_thread_id = false;
        bool include_location  = true;
    };

    ConsoleSink();  // Uses default config
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    Config config_;
    std::mutex mutex_;
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

    /**
     * @brief Set global minimum log level
     */
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
    std::atomic<LogLevel> global_level_{LogLevel::WARN};
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

    /**
     * @brief Add a log sink
     */
    void add_sink(std::shared_ptr<ILogSink> sink);

    /**
     * @brief Remove all sinks
     */
    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    /**
     * @brief Set global log level
     */
    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    /**
     * @brief Check if logging is enabled for level/category
     */
    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    /**
     * @brief Log a message
     */
    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = CONFIX_CURRENT_LOCATION);

    /**
     * @brief Flush all sinks
     */
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
// LOGGING MACROS
// ============================================================================

#define CONFIX_LOG_ENABLED(level, cat) \
    ::confix::common::debug::Logger::instance().is_enabled(::confix::common::debug::LogLevel::level, cat)

// Core logging macro
#define CONFIX_LOG_IMPL(level, category, ...)                                                      \
    do {                                                                                           \
        auto& _confix_logger = ::confix::common::debug::Logger::instance();                        \
        if (_confix_logger.is_enabled(::confix::common::debug::LogLevel::level, category)) {       \
            std::ostringstream _confix_oss;                                                        \
            _confix_oss << __VA_ARGS__;                                                            \
            _confix_logger.log(::confix::common::debug::LogLevel::level, category,                 \
                               _confix_oss.str(), CONFIX_CURRENT_LOCATION);                        \
        }                                                                                          \
    } while (0)

#define CONFIX_LOG_TRACE(cat, ...) CONFIX_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define CONFIX_LOG_DEBUG(cat, ...) CONFIX_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define CONFIX_LOG_INFO(cat, ...)  CONFIX_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define CONFIX_LOG_WARN(cat, ...)  CONFIX_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define CONFIX_LOG_ERROR(cat, ...) CONFIX_LOG_IMPL(ERROR, cat, __VA_ARGS__)
#define CONFIX_LOG_FATAL(cat, ...) CONFIX_LOG_IMPL(FATAL, cat, __VA_ARGS__)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Initialize the logging system
 *
 * CONFIX_LOG_LEVEL in the environment overrides @p level.
 */
CONFIX_API void init_logging(LogLevel level = LogLevel::WARN);

/**
 * @brief Shutdown logging system cleanly
 */
CONFIX_API void shutdown_logging();

}  // namespace confix::common::debug
