#pragma once

/**
 * @file reader.hpp
 * @brief Reads typed values out of configuration sources
 *
 * Failures are reported as a ReadError tree following the descriptor: both
 * sides of a zip report their errors together, so one run lists everything
 * that needs fixing.
 */

#include <confix/core/config/config_source.hpp>
#include <confix/core/config/descriptor.hpp>
#include <confix/core/config/read_error.hpp>

#include <any>

namespace confix::core::config {

/**
 * @brief Interpret an untyped descriptor node against @p source
 */
CONFIX_API ReadResult<std::any> read_node(const NodePtr& node, const ConfigSource& source);

/**
 * @brief Read @p descriptor from @p source
 *
 * Parts of the descriptor bound with from() use their own source.
 */
template<typename T>
ReadResult<T> read(const ConfigDescriptor<T>& descriptor, const ConfigSource& source) {
    auto result = read_node(descriptor.node(), source);
    if (result.is_error()) {
        return result.error();
    }
    return std::any_cast<T>(std::move(result).value());
}

/**
 * @brief Read a descriptor whose sources are all bound with from()
 */
template<typename T>
ReadResult<T> read(const ConfigDescriptor<T>& descriptor) {
    return read(descriptor, ConfigSource::empty());
}

}  // namespace confix::core::config
