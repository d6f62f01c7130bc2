#pragma once

/**
 * @file read_error.hpp
 * @brief Structured errors produced while reading configuration
 *
 * A ReadError is a small tree: leaves describe one problem at one path,
 * AND nodes collect independent failures (every one must be fixed), OR
 * nodes collect failed alternatives (fixing any one suffices).
 */

#include <confix/common/error.hpp>
#include <confix/core/config/property_tree.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace confix::core::config {

class ReadError {
public:
    enum class Kind : uint8_t {
        MISSING_VALUE,
        FORMAT_ERROR,
        CONVERSION_ERROR,
        SOURCE_ERROR,
        AND_ERRORS,
        OR_ERRORS
    };

    ReadError() = default;

    static ReadError missing_value(StepPath path);
    static ReadError format_error(StepPath path, std::string message);
    static ReadError conversion_error(StepPath path, std::string raw_value, std::string message);
    static ReadError source_error(std::string message);

    /// Nested AND errors are flattened into one list
    static ReadError and_errors(std::vector<ReadError> errors);
    static ReadError or_errors(std::vector<ReadError> errors);

    Kind kind() const noexcept { return kind_; }
    const StepPath& path() const noexcept { return path_; }
    const std::string& raw_value() const noexcept { return raw_value_; }
    const std::vector<ReadError>& children() const noexcept { return children_; }

    /**
     * @brief One-line description
     */
    const std::string& message() const noexcept { return message_; }

    /**
     * @brief Closest common error code
     *
     * A composite maps to CONFIG_REQUIRED_MISSING when every leaf is a
     * missing value, otherwise to the code of its first other leaf.
     */
    common::ErrorCode code() const noexcept;

    bool is_missing_only() const noexcept;
    bool contains(Kind kind) const noexcept;
    std::size_t leaf_count() const noexcept;

    std::string path_string() const { return path_to_string(path_); }

    std::string to_string() const;

    /**
     * @brief Indented multi-line report of the whole error tree
     */
    std::string pretty_print() const;

    /**
     * @brief Convert to the common error type, keeping path and value as context
     */
    common::Error to_error() const;

    bool operator==(const ReadError& other) const = default;

private:
    ReadError(Kind kind, StepPath path, std::string message)
        : kind_(kind), path_(std::move(path)), message_(std::move(message)) {}

    void pretty_print(std::string& out, std::size_t depth) const;

    Kind kind_ = Kind::MISSING_VALUE;
    StepPath path_;
    std::string raw_value_;
    std::string message_;
    std::vector<ReadError> children_;
};

std::string_view kind_name(ReadError::Kind kind) noexcept;

inline std::ostream& operator<<(std::ostream& os, const ReadError& error) {
    return os << error.to_string();
}

/**
 * @brief Result of reading a configuration value
 */
template<typename T>
using ReadResult = common::Result<T, ReadError>;

}  // namespace confix::core::config
