#include <confix/common/debug.hpp>
#include <confix/core/config/reader.hpp>

#include <algorithm>
#include <type_traits>

namespace confix::core::config {

using namespace common::debug;

namespace {

/**
 * @brief Where a node is being read: the source, the lookup path within it
 * and the path reported in errors
 *
 * The two paths differ inside sequences, where each element is read as a
 * tree of its own while errors keep the element's full position.
 */
struct ReadContext {
    ConfigSource source;
    KeyPath keys;
    StepPath trail;

    ReadContext descend(const std::string& key) const {
        ReadContext next = *this;
        next.keys.push_back(key);
        next.trail.push_back(PathStep::for_key(key));
        return next;
    }

    PropertyTree tree() const { return source.get_config_value(keys); }
};

ReadResult<std::any> read_any(const NodePtr& node, const ReadContext& ctx);
bool is_absent(const NodePtr& node, const ReadContext& ctx);

// ============================================================================
// Scalars
// ============================================================================

ReadResult<std::any> parse_leaf(const ValueNode& op, const std::string& raw, const ReadContext& ctx) {
    auto parsed = op.type.parse(raw);
    if (parsed.is_error()) {
        return ReadError::conversion_error(ctx.trail, raw, parsed.message());
    }
    CONFIX_LOG_TRACE(category::READER,
                     "Read " << op.type.name << " '" << raw << "' at " << path_to_string(ctx.trail));
    return std::move(parsed).value();
}

ReadResult<std::any> read_op(const ValueNode& op, const ReadContext& parent) {
    ReadContext ctx = op.key ? parent.descend(*op.key) : parent;
    auto tree       = ctx.tree();

    if (tree.is_leaf()) {
        return parse_leaf(op, tree.leaf_value(), ctx);
    }
    if (tree.is_empty()) {
        return ReadError::missing_value(ctx.trail);
    }
    // A sequence of plain values reads as its first element
    if (tree.is_sequence() && !tree.sequence_elements().empty()) {
        const auto& elements = tree.sequence_elements();
        bool all_leaves      = std::all_of(elements.begin(), elements.end(),
                                           [](const PropertyTree& e) { return e.is_leaf(); });
        if (all_leaves) {
            return parse_leaf(op, elements.front().leaf_value(), ctx);
        }
    }

    return ReadError::format_error(ctx.trail, "expected a single " + op.type.name + " value, found " +
                                                  (tree.is_record() ? "a record" : "a sequence"));
}

// ============================================================================
// Structure
// ============================================================================

ReadResult<std::any> read_op(const NestedNode& op, const ReadContext& ctx) {
    return read_any(op.inner, ctx.descend(op.key));
}

ReadResult<std::any> read_op(const ZipNode& op, const ReadContext& ctx) {
    auto left  = read_any(op.left, ctx);
    auto right = read_any(op.right, ctx);

    if (left.is_success() && right.is_success()) {
        return op.combine(std::move(left).value(), std::move(right).value());
    }
    if (left.is_error() && right.is_error()) {
        return ReadError::and_errors({left.error(), right.error()});
    }
    return left.is_error() ? left.error() : right.error();
}

ReadResult<std::any> read_op(const OrElseEitherNode& op, const ReadContext& ctx) {
    auto left = read_any(op.left, ctx);
    if (left.is_success()) {
        return op.make_left(std::move(left).value());
    }
    if (left.error().contains(ReadError::Kind::SOURCE_ERROR)) {
        return left.error();
    }

    auto right = read_any(op.right, ctx);
    if (right.is_success()) {
        CONFIX_LOG_DEBUG(category::READER, "Alternative taken at '" << path_to_string(ctx.trail)
                                                                    << "': " << left.error());
        return op.make_right(std::move(right).value());
    }
    return ReadError::or_errors({left.error(), right.error()});
}

ReadResult<std::any> read_op(const SequenceNode& op, const ReadContext& ctx) {
    auto tree = ctx.tree();

    std::vector<PropertyTree> elements;
    if (tree.is_sequence()) {
        elements = tree.sequence_elements();
    } else if (tree.is_empty()) {
        return ReadError::missing_value(ctx.trail);
    } else if (ctx.source.leaf_for_sequence() == LeafForSequence::VALID) {
        elements.push_back(tree);
    } else {
        return ReadError::format_error(ctx.trail, "expected a sequence");
    }

    std::vector<std::any> values;
    values.reserve(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i) {
        ReadContext element{
            ConfigSource(ctx.source.names(),
                         [tree = elements[i]](const KeyPath& path) { return tree.get_path(path); },
                         ctx.source.leaf_for_sequence()),
            {},
            ctx.trail};
        element.trail.push_back(PathStep::for_index(i));

        auto result = read_any(op.inner, element);
        if (result.is_error()) {
            return result.error();
        }
        values.push_back(std::move(result).value());
    }
    return op.collect(std::move(values));
}

// ============================================================================
// Wrappers
// ============================================================================

ReadResult<std::any> read_op(const OptionalNode& op, const ReadContext& ctx) {
    if (is_absent(op.inner, ctx)) {
        return op.wrap(std::nullopt);
    }
    auto result = read_any(op.inner, ctx);
    if (result.is_error()) {
        return result.error();
    }
    return op.wrap(std::move(result).value());
}

ReadResult<std::any> read_op(const DefaultNode& op, const ReadContext& ctx) {
    auto result = read_any(op.inner, ctx);
    if (result.is_error() && result.error().is_missing_only()) {
        CONFIX_LOG_DEBUG(category::READER,
                         "Using default at '" << path_to_string(ctx.trail) << "'");
        return op.fallback;
    }
    return result;
}

/**
 * @brief Context of the value a node ultimately addresses
 *
 * Follows nested keys and a keyed scalar through wrapper nodes, so that a
 * failing transform reports the path and text of the value it converted.
 */
ReadContext focus(const NodePtr& node, const ReadContext& ctx) {
    return std::visit(
        [&](const auto& op) -> ReadContext {
            using T = std::decay_t<decltype(op)>;
            if constexpr (std::is_same_v<T, ValueNode>) {
                return op.key ? ctx.descend(*op.key) : ctx;
            } else if constexpr (std::is_same_v<T, NestedNode>) {
                return focus(op.inner, ctx.descend(op.key));
            } else if constexpr (std::is_same_v<T, DescribeNode> || std::is_same_v<T, DefaultNode> ||
                                 std::is_same_v<T, TransformNode> || std::is_same_v<T, OptionalNode>) {
                return focus(op.inner, ctx);
            } else {
                return ctx;
            }
        },
        node->op);
}

ReadResult<std::any> read_op(const TransformNode& op, const ReadContext& ctx) {
    auto result = read_any(op.inner, ctx);
    if (result.is_error()) {
        return result.error();
    }

    auto converted = op.forward(result.value());
    if (converted.is_error()) {
        auto at  = focus(op.inner, ctx);
        auto raw = at.tree();
        return ReadError::conversion_error(at.trail, raw.is_leaf() ? raw.leaf_value() : std::string(),
                                           converted.message());
    }
    return std::move(converted).value();
}

ReadResult<std::any> read_op(const DescribeNode& op, const ReadContext& ctx) {
    return read_any(op.inner, ctx);
}

ReadResult<std::any> read_op(const SourcedFromNode& op, const ReadContext& ctx) {
    return read_any(op.inner, ReadContext{op.source, ctx.keys, ctx.trail});
}

// ============================================================================
// Dispatch
// ============================================================================

ReadResult<std::any> read_any(const NodePtr& node, const ReadContext& ctx) {
    return std::visit([&](const auto& op) { return read_op(op, ctx); }, node->op);
}

/**
 * @brief True when nothing the node would read is configured
 */
bool is_absent(const NodePtr& node, const ReadContext& ctx) {
    return std::visit(
        [&](const auto& op) -> bool {
            using T = std::decay_t<decltype(op)>;
            if constexpr (std::is_same_v<T, ValueNode>) {
                return (op.key ? ctx.descend(*op.key) : ctx).tree().is_empty();
            } else if constexpr (std::is_same_v<T, NestedNode>) {
                return is_absent(op.inner, ctx.descend(op.key));
            } else if constexpr (std::is_same_v<T, ZipNode> || std::is_same_v<T, OrElseEitherNode>) {
                return is_absent(op.left, ctx) && is_absent(op.right, ctx);
            } else if constexpr (std::is_same_v<T, SequenceNode>) {
                auto tree = ctx.tree();
                return tree.is_empty() && !tree.is_sequence();
            } else if constexpr (std::is_same_v<T, SourcedFromNode>) {
                return is_absent(op.inner, ReadContext{op.source, ctx.keys, ctx.trail});
            } else {
                return is_absent(op.inner, ctx);
            }
        },
        node->op);
}

}  // anonymous namespace

ReadResult<std::any> read_node(const NodePtr& node, const ConfigSource& source) {
    CONFIX_LOG_TRACE(category::READER,
                     "Reading " << node_name(*node) << " descriptor from " << source.names().size()
                                << " source(s)");
    auto result = read_any(node, ReadContext{source, {}, {}});
    if (result.is_error()) {
        CONFIX_LOG_DEBUG(category::READER, "Configuration read failed: " << result.error());
    }
    return result;
}

}  // namespace confix::core::config
