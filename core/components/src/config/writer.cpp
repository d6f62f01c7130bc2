#include <confix/common/debug.hpp>
#include <confix/core/config/writer.hpp>

#include <type_traits>

namespace confix::core::config {

using namespace common::debug;
using common::ErrorCode;
using common::Result;

namespace {

Result<PropertyTree> union_at(const PropertyTree& left, const PropertyTree& right, StepPath& path) {
    if (left.kind() == PropertyTree::Kind::EMPTY) {
        return right;
    }
    if (right.kind() == PropertyTree::Kind::EMPTY) {
        return left;
    }

    if (left.is_record() && right.is_record()) {
        auto entries = left.record_entries();
        for (const auto& [key, child] : right.record_entries()) {
            auto it = entries.find(key);
            if (it == entries.end()) {
                entries.emplace(key, child);
                continue;
            }
            path.push_back(PathStep::for_key(key));
            auto merged = union_at(it->second, child, path);
            path.pop_back();
            if (merged.is_error()) {
                return merged;
            }
            it->second = std::move(merged).value();
        }
        return PropertyTree::record(std::move(entries));
    }

    auto where = path.empty() ? std::string("<root>") : path_to_string(path);
    CONFIX_LOG_ERROR(category::WRITER, "Zipped descriptors both write '" << where << "'");
    common::Error error(ErrorCode::CONFIG_KEY_CONFLICT, "conflicting values written at " + where);
    error.with_context("path", where);
    return error;
}

Result<PropertyTree> write_any(const NodePtr& node, const std::any& value);

Result<PropertyTree> write_op(const ValueNode& op, const std::any& value) {
    auto leaf = PropertyTree::leaf(op.type.render(value));
    return op.key ? PropertyTree::from_path({*op.key}, leaf) : leaf;
}

Result<PropertyTree> write_op(const NestedNode& op, const std::any& value) {
    CONFIX_TRY_ASSIGN(auto inner, write_any(op.inner, value));
    if (inner.kind() == PropertyTree::Kind::EMPTY) {
        return inner;
    }
    return PropertyTree::from_path({op.key}, std::move(inner));
}

Result<PropertyTree> write_op(const ZipNode& op, const std::any& value) {
    auto [first, second] = op.split(value);
    CONFIX_TRY_ASSIGN(auto left, write_any(op.left, first));
    CONFIX_TRY_ASSIGN(auto right, write_any(op.right, second));
    return union_trees(left, right);
}

Result<PropertyTree> write_op(const OrElseEitherNode& op, const std::any& value) {
    auto [is_left, side] = op.select(value);
    return write_any(is_left ? op.left : op.right, side);
}

Result<PropertyTree> write_op(const SequenceNode& op, const std::any& value) {
    PropertyTree::SequenceList elements;
    for (const auto& element : op.elements(value)) {
        CONFIX_TRY_ASSIGN(auto tree, write_any(op.inner, element));
        elements.push_back(std::move(tree));
    }
    return PropertyTree::sequence(std::move(elements));
}

Result<PropertyTree> write_op(const OptionalNode& op, const std::any& value) {
    auto present = op.unwrap(value);
    if (!present) {
        return PropertyTree::empty();
    }
    return write_any(op.inner, *present);
}

Result<PropertyTree> write_op(const TransformNode& op, const std::any& value) {
    auto original = op.backward(value);
    if (original.is_error()) {
        CONFIX_LOG_WARN(category::WRITER, "Value cannot be written back: " << original.message());
        return original.error();
    }
    return write_any(op.inner, original.value());
}

template<typename Op>
Result<PropertyTree> write_op(const Op& op, const std::any& value)
    requires std::is_same_v<Op, DefaultNode> || std::is_same_v<Op, DescribeNode> ||
             std::is_same_v<Op, SourcedFromNode>
{
    return write_any(op.inner, value);
}

Result<PropertyTree> write_any(const NodePtr& node, const std::any& value) {
    return std::visit([&](const auto& op) { return write_op(op, value); }, node->op);
}

}  // anonymous namespace

Result<PropertyTree> union_trees(const PropertyTree& left, const PropertyTree& right) {
    StepPath path;
    return union_at(left, right, path);
}

Result<PropertyTree> write_node(const NodePtr& node, const std::any& value) {
    return write_any(node, value);
}

}  // namespace confix::core::config
