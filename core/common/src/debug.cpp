#include <confix/common/debug.hpp>
#include <confix/common/platform.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

#if defined(CONFIX_OS_POSIX)
#include <unistd.h>  // For isatty, fileno
#elif defined(CONFIX_OS_WINDOWS)
#include <io.h>
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace confix::common::debug {

namespace {

// Platform-safe localtime conversion
inline std::tm safe_localtime(const std::time_t* time) {
    std::tm result{};
#if defined(CONFIX_OS_WINDOWS)
    localtime_s(&result, time);
#else
    localtime_r(time, &result);
#endif
    return result;
}

}  // anonymous namespace

// ============================================================================
// Log Level Parsing
// ============================================================================

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR" || upper == "ERR")
        return LogLevel::ERROR;
    if (upper == "FATAL" || upper == "CRITICAL")
        return LogLevel::FATAL;
    if (upper == "OFF" || upper == "NONE")
        return LogLevel::OFF;

    return LogLevel::INFO;
}

// ============================================================================
// LogFilter Implementation
// ============================================================================

void LogFilter::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

bool LogFilter::should_log(LogLevel level, std::string_view category) const noexcept {
    if (level == LogLevel::OFF) {
        return false;
    }

    // A category override wins over the global level in both directions
    if (!category.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = category_levels_.find(std::string(category));
        if (it != category_levels_.end()) {
            return level >= it->second;
        }
    }

    return level >= global_level_.load(std::memory_order_relaxed);
}

void LogFilter::reset() noexcept {
    global_level_.store(LogLevel::WARN, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

namespace {

// ANSI color codes
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD  = "\033[1m";
constexpr const char* DIM   = "\033[2m";

constexpr const char* color_for_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "\033[90m";  // Dark gray
        case LogLevel::DEBUG:
            return "\033[36m";  // Cyan
        case LogLevel::INFO:
            return "\033[32m";  // Green
        case LogLevel::WARN:
            return "\033[33m";  // Yellow
        case LogLevel::ERROR:
            return "\033[31m";  // Red
        case LogLevel::FATAL:
            return "\033[35m";  // Magenta
        default:
            return "";
    }
}

bool should_use_colors() noexcept {
#if defined(CONFIX_OS_WINDOWS)
    return platform::get_env("WT_SESSION").length() > 0 || platform::get_env("ConEmuANSI") == "ON";
#else
    return isatty(fileno(stderr));
#endif
}

}  // anonymous namespace

ConsoleSink::ConsoleSink() : config_() {
    if (config_.use_colors) {
        config_.use_colors = should_use_colors();
    }
}

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {
    if (config_.use_colors) {
        config_.use_colors = should_use_colors();
    }
}

ConsoleSink::~ConsoleSink() {
    flush();
}

void ConsoleSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Diagnostics stay off stdout, which carries the tool's actual output
    std::ostream& out =
        (config_.use_stderr && record.level >= LogLevel::WARN) ? std::cerr : std::clog;

    if (config_.include_timestamp) {
        auto time = std::chrono::system_clock::to_time_t(record.timestamp);
        auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(
                      record.timestamp.time_since_epoch()) %
                  1000;
        auto tm_result = safe_localtime(&time);

        if (config_.use_colors)
            out << DIM;
        out << std::put_time(&tm_result, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count();
        if (config_.use_colors)
            out << RESET;
        out << ' ';
    }

    if (config_.use_colors) {
        out << color_for_level(record.level) << BOLD;
    }
    out << '[' << level_char(record.level) << ']';
    if (config_.use_colors)
        out << RESET;
    out << ' ';

    if (!record.category.empty()) {
        if (config_.use_colors)
            out << "\033[34m";  // Blue
        out << '[' << record.category << ']';
        if (config_.use_colors)
            out << RESET;
        out << ' ';
    }

    if (config_.include_thread_id) {
        if (config_.use_colors)
            out << DIM;
        out << "[T:" << std::hex << record.thread_id << std::dec << ']';
        if (config_.use_colors)
            out << RESET;
        out << ' ';
    }

    out << record.message;

    if (config_.include_location && record.location.is_valid()) {
        if (config_.use_colors)
            out << DIM;
        out << " (" << record.location.file << ':' << record.location.line << ')';
        if (config_.use_colors)
            out << RESET;
    }

    out << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog.flush();
    std::cerr.flush();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation loc) {
    if (!filter_.should_log(level, category)) {
        return;
    }

    LogRecord record;
    record.level     = level;
    record.category  = category;
    record.message   = std::move(message);
    record.location  = loc;
    record.timestamp = std::chrono::system_clock::now();
    record.thread_id = platform::get_thread_id();

    dispatch(record);
}

void Logger::dispatch(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink && sink->is_ready()) {
            sink->write(record);
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink)
            sink->flush();
    }
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(LogLevel level) {
    Logger::instance().set_level(level);

    std::string env_level = platform::get_env("CONFIX_LOG_LEVEL");
    if (!env_level.empty()) {
        Logger::instance().set_level(parse_log_level(env_level));
    }
}

void shutdown_logging() {
    Logger::instance().flush();
    Logger::instance().clear_sinks();
}

}  // namespace confix::common::debug
