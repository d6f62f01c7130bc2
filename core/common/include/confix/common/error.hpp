#pragma once

/**
 * @file error.hpp
 * @brief Error handling system for confix
 *
 * This header provides:
 * - Hierarchical error codes organized by category
 * - Rich error context with source location
 * - Error propagation without masking
 * - A Result type parameterized on its error type
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(CONFIX_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace confix::common {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Error categories for hierarchical classification
 *
 * Categories are grouped by functional area:
 * - 0x00xx: General/Common errors
 * - 0x04xx: Configuration errors
 * - 0x08xx: Serialization errors
 * - 0x09xx: Validation errors
 * - 0x0Axx: Platform-specific errors
 */
enum class ErrorCategory : uint8_t {
    GENERAL       = 0x00,
    CONFIG        = 0x04,
    SERIALIZATION = 0x08,
    VALIDATION    = 0x09,
    PLATFORM      = 0x0A,
};

/**
 * @brief Get category name as string
 */
constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:       return "General";
        case ErrorCategory::CONFIG:        return "Configuration";
        case ErrorCategory::SERIALIZATION: return "Serialization";
        case ErrorCategory::VALIDATION:    return "Validation";
        case ErrorCategory::PLATFORM:      return "Platform";
        default:                           return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Error codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== General (0x00xx) ==========
    SUCCESS             = 0x0000,

    // ========== Configuration (0x04xx) ==========
    CONFIG_INVALID      = 0x0400,
    CONFIG_PARSE_ERROR  = 0x0402,
    CONFIG_TYPE_MISMATCH = 0x0404,
    CONFIG_REQUIRED_MISSING = 0x0405,
    CONFIG_FILE_NOT_FOUND = 0x0406,
    CONFIG_INVALID_VALUE = 0x0408,
    CONFIG_KEY_CONFLICT = 0x0409,

    // ========== Serialization (0x08xx) ==========
    SERIALIZE_FAILED    = 0x0800,

    // ========== Validation (0x09xx) ==========
    VALUE_OUT_OF_RANGE  = 0x0901,

    // ========== Platform (0x0Axx) ==========
    OS_ERROR            = 0x0A09,
};

/**
 * @brief Extract category from error code
 */
constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

/**
 * @brief Check if error code is success
 */
constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Get human-readable error name
 */
constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        // General
        case ErrorCode::SUCCESS:              return "SUCCESS";

        // Configuration
        case ErrorCode::CONFIG_INVALID:       return "CONFIG_INVALID";
        case ErrorCode::CONFIG_PARSE_ERROR:   return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_TYPE_MISMATCH: return "CONFIG_TYPE_MISMATCH";
        case ErrorCode::CONFIG_REQUIRED_MISSING: return "CONFIG_REQUIRED_MISSING";
        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_KEY_CONFLICT:  return "CONFIG_KEY_CONFLICT";

        // Serialization
        case ErrorCode::SERIALIZE_FAILED:     return "SERIALIZE_FAILED";

        // Validation
        case ErrorCode::VALUE_OUT_OF_RANGE:   return "VALUE_OUT_OF_RANGE";

        // Platform
        case ErrorCode::OS_ERROR:             return "OS_ERROR";

        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for error tracking
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                             uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(CONFIX_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(CONFIX_HAS_SOURCE_LOCATION)
    #define CONFIX_CURRENT_LOCATION ::confix::common::SourceLocation::current()
#else
    #define CONFIX_CURRENT_LOCATION ::confix::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR CONTEXT
// ============================================================================

/**
 * @brief Rich error information with context
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept
        : code_(code) {}

    Error(ErrorCode code, std::string_view message) noexcept
        : code_(code), message_(message) {}

    Error(ErrorCode code, std::string_view message, SourceLocation loc) noexcept
        : code_(code), message_(message), location_(loc) {}

    Error(ErrorCode code, std::string message, SourceLocation loc) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    // Copy constructor (deep copy cause chain)
    Error(const Error& other)
        : code_(other.code_)
        , message_(other.message_)
        , location_(other.location_)
        , context_(other.context_) {
        if (other.cause_) {
            cause_ = std::make_unique<Error>(*other.cause_);
        }
    }

    Error(Error&& other) noexcept = default;

    // Copy assignment (deep copy cause chain)
    Error& operator=(const Error& other) {
        if (this != &other) {
            code_ = other.code_;
            message_ = other.message_;
            location_ = other.location_;
            context_ = other.context_;
            cause_ = other.cause_ ? std::make_unique<Error>(*other.cause_) : nullptr;
        }
        return *this;
    }

    Error& operator=(Error&& other) noexcept = default;

    // Accessors
    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }
    const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return context_;
    }

    // Status checks
    bool is_success() const noexcept { return confix::common::is_success(code_); }
    bool is_error() const noexcept { return !is_success(); }

    explicit operator bool() const noexcept { return is_success(); }

    // Get formatted error string
    std::string to_string() const;

    // Chain errors (for error wrapping)
    Error& with_cause(Error cause) {
        cause_ = std::make_unique<Error>(std::move(cause));
        return *this;
    }

    const Error* cause() const noexcept { return cause_.get(); }

    // Context addition
    Error& with_context(std::string_view key, std::string_view value);

    // Value of the first context entry with this key
    std::optional<std::string> context_value(std::string_view key) const;

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::unique_ptr<Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

/**
 * @brief Value-or-error result
 *
 * E defaults to Error. Other error types (the reader's structured ReadError)
 * must be default constructible and expose code() and message().
 */
template<typename T = void, typename E = Error>
class Result;

// Specialization for void
template<>
class Result<void, Error> {
public:
    // Success
    Result() noexcept = default;

    // Error from code
    Result(ErrorCode code) noexcept : error_(code) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = CONFIX_CURRENT_LOCATION) noexcept
        : error_(code, message, loc) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Error access
    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    // Chain errors
    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    Error error_;
};

// Specialization for non-void types
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    // Success with value
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (&storage_) T(std::move(value));
    }

    // Error from code
    Result(ErrorCode code) noexcept
        requires std::is_same_v<E, Error>
        : error_(code), has_value_(false) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = CONFIX_CURRENT_LOCATION) noexcept
        requires std::is_same_v<E, Error>
        : error_(code, message, loc), has_value_(false) {}

    // Error from error object
    Result(E error) noexcept : error_(std::move(error)), has_value_(false) {}

    Result(const Result& other) : error_(other.error_), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(other.value_ref());
        }
    }

    Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : error_(std::move(other.error_)), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(std::move(other.value_ref()));
        }
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy_value();
            error_ = other.error_;
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(other.value_ref());
            }
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            destroy_value();
            error_ = std::move(other.error_);
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(std::move(other.value_ref()));
            }
        }
        return *this;
    }

    ~Result() {
        destroy_value();
    }

    // Status
    bool is_success() const noexcept { return has_value_; }
    bool is_error() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return is_success(); }

    // Value access (only call if is_success())
    T& value() & noexcept { return value_ref(); }
    const T& value() const& noexcept { return value_ref(); }
    T&& value() && noexcept { return std::move(value_ref()); }

    // Value access with default
    T value_or(T default_value) const& noexcept(std::is_nothrow_copy_constructible_v<T>) {
        return has_value_ ? value_ref() : std::move(default_value);
    }

    T value_or(T default_value) && noexcept(std::is_nothrow_move_constructible_v<T>) {
        return has_value_ ? std::move(value_ref()) : std::move(default_value);
    }

    // Error access
    ErrorCode code() const noexcept { return has_value_ ? ErrorCode::SUCCESS : error_.code(); }
    const E& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    // Transform the value (if success)
    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>())), E> {
        using ReturnType = Result<decltype(func(std::declval<const T&>())), E>;
        if (has_value_) {
            return ReturnType(func(value_ref()));
        }
        return ReturnType(error_);
    }

    template<typename F>
    auto map(F&& func) && -> Result<decltype(func(std::declval<T&&>())), E> {
        using ReturnType = Result<decltype(func(std::declval<T&&>())), E>;
        if (has_value_) {
            return ReturnType(func(std::move(value_ref())));
        }
        return ReturnType(std::move(error_));
    }

private:
    alignas(T) unsigned char storage_[sizeof(T)];
    E error_;
    bool has_value_;

    T& value_ref() noexcept {
        return *std::launder(reinterpret_cast<T*>(&storage_));
    }

    const T& value_ref() const noexcept {
        return *std::launder(reinterpret_cast<const T*>(&storage_));
    }

    void destroy_value() noexcept {
        if (has_value_) {
            value_ref().~T();
            has_value_ = false;
        }
    }
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Result
 */
template<typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> ok() {
    return Result<void>();
}

/**
 * @brief Create an error Result
 */
template<typename T = void>
Result<T> err(ErrorCode code,
              std::string_view message = {},
              SourceLocation loc = CONFIX_CURRENT_LOCATION) {
    return Result<T>(code, message, loc);
}

/**
 * @brief Create an error Result from Error object
 */
template<typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return the error of a failed Result<void> (or same-typed Result)
 *
 * Usage: CONFIX_TRY(some_function_returning_result());
 */
#define CONFIX_TRY(expr)                                            \
    do {                                                            \
        auto _confix_result = (expr);                               \
        if (CONFIX_UNLIKELY(_confix_result.is_error())) {           \
            return _confix_result.error();                          \
        }                                                           \
    } while (0)

/**
 * @brief Assign value or return error
 *
 * Usage: CONFIX_TRY_ASSIGN(auto var, some_function_returning_result());
 * The error is returned as-is, so the enclosing function's Result must be
 * constructible from the same error type.
 */
#define CONFIX_TRY_CONCAT_IMPL(a, b) a##b
#define CONFIX_TRY_CONCAT(a, b) CONFIX_TRY_CONCAT_IMPL(a, b)
#define CONFIX_TRY_ASSIGN(decl, expr)                                                   \
    auto CONFIX_TRY_CONCAT(_confix_try_, __LINE__) = (expr);                            \
    if (CONFIX_UNLIKELY(CONFIX_TRY_CONCAT(_confix_try_, __LINE__).is_error())) {        \
        return CONFIX_TRY_CONCAT(_confix_try_, __LINE__).error();                       \
    }                                                                                   \
    decl = std::move(CONFIX_TRY_CONCAT(_confix_try_, __LINE__)).value()

} // namespace confix::common
