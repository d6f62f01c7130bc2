#pragma once

/**
 * @file writer.hpp
 * @brief Writes typed values back into configuration trees
 *
 * The writer walks the same descriptor as the reader, so a written tree reads
 * back to the value it was written from.
 */

#include <confix/common/error.hpp>
#include <confix/core/config/descriptor.hpp>
#include <confix/core/config/property_tree.hpp>

#include <any>

namespace confix::core::config {

/**
 * @brief Interpret an untyped descriptor node against @p value
 *
 * Fails with the error of a failing backward transform, or with
 * CONFIG_KEY_CONFLICT when two zipped descriptors write the same key.
 */
CONFIX_API common::Result<PropertyTree> write_node(const NodePtr& node, const std::any& value);

template<typename T>
common::Result<PropertyTree> write(const ConfigDescriptor<T>& descriptor, const T& value) {
    return write_node(descriptor.node(), std::any(value));
}

/**
 * @brief Union of two written trees
 *
 * Empty is the identity and records combine key by key; any other overlap
 * is a CONFIG_KEY_CONFLICT.
 */
CONFIX_API common::Result<PropertyTree> union_trees(const PropertyTree& left, const PropertyTree& right);

}  // namespace confix::core::config
