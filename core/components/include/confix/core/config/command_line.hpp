#pragma once

/**
 * @file command_line.hpp
 * @brief Command-line arguments as a configuration source
 *
 * Accepted forms:
 * - --key=value / -key=value     one assignment
 * - --key value                  key followed by its value
 * - --outer --inner=value        nested keys
 * - value                        positional value
 *
 * Repeated keys accumulate into a sequence. With a key delimiter, "db.port"
 * addresses port inside db; with a value delimiter, "a,b" is a two-element
 * sequence.
 */

#include <confix/common/platform.hpp>
#include <confix/core/config/config_source.hpp>
#include <confix/core/config/property_tree.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace confix::core::config {

/**
 * @brief Classification of one argument token
 */
struct ArgToken {
    enum class Kind : uint8_t {
        BOTH,        // --key=value
        KEY_ONLY,    // --key
        VALUE_ONLY   // value
    };

    Kind kind = Kind::VALUE_ONLY;
    std::string key;
    std::string value;

    bool operator==(const ArgToken& other) const = default;
};

/**
 * @brief Classify a single token
 *
 * The text before the first '=' is a key when it starts with '-' and is not
 * made of dashes only; leading dashes are stripped. A key whose value half is
 * empty ("--key=") is a KEY_ONLY token.
 */
CONFIX_API ArgToken classify_arg(const std::string& token);

/**
 * @brief Trees produced by the argument list, merged and normalized
 */
CONFIX_API std::vector<PropertyTree> parse_args(const std::vector<std::string>& args,
                                                std::optional<char> key_delimiter   = std::nullopt,
                                                std::optional<char> value_delimiter = std::nullopt);

/**
 * @brief Source named "command line arguments" over parse_args()
 */
CONFIX_API ConfigSource from_args(const std::vector<std::string>& args,
                                  std::optional<char> key_delimiter   = std::nullopt,
                                  std::optional<char> value_delimiter = std::nullopt);

}  // namespace confix::core::config
