#pragma once

/**
 * @file property_tree.hpp
 * @brief Immutable hierarchical tree of configuration values
 *
 * A PropertyTree is the common representation every source produces and every
 * writer emits. A node is one of:
 * - Empty:    absence of a value
 * - Leaf:     a single scalar
 * - Record:   string keys mapped to subtrees
 * - Sequence: an ordered list of subtrees
 *
 * Nodes are built bottom-up and never mutated afterwards; subtrees are shared
 * between trees, so copies are cheap and trees can be read from any thread.
 */

#include <confix/common/platform.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace confix::core::config {

using KeyPath = std::vector<std::string>;

/**
 * @brief Whether a single Leaf may stand in for a one-element Sequence
 *
 * Flat sources (environment variables, maps) cannot tell "one value" from
 * "a list with one value"; VALID lets the reader accept either.
 */
enum class LeafForSequence : uint8_t {
    VALID,
    INVALID
};

// ============================================================================
// PATH STEPS
// ============================================================================

/**
 * @brief One step of a path: a record key or a sequence index
 */
class PathStep {
public:
    static PathStep for_key(std::string name) {
        PathStep step;
        step.name_ = std::move(name);
        return step;
    }

    static PathStep for_index(std::size_t position) {
        PathStep step;
        step.position_ = position;
        return step;
    }

    bool is_key() const noexcept { return !position_.has_value(); }
    bool is_index() const noexcept { return position_.has_value(); }

    /// Key name (only meaningful if is_key())
    const std::string& name() const noexcept { return name_; }

    /// Sequence position (only meaningful if is_index())
    std::size_t position() const noexcept { return position_.value_or(0); }

    bool operator==(const PathStep& other) const = default;

private:
    PathStep() = default;

    std::string name_;
    std::optional<std::size_t> position_;
};

using StepPath = std::vector<PathStep>;

/**
 * @brief Render a path as "db.port" or "servers[1].host"
 */
CONFIX_API std::string path_to_string(const StepPath& path);

/**
 * @brief Key path as a step path
 */
CONFIX_API StepPath to_step_path(const KeyPath& keys);

// ============================================================================
// PROPERTY TREE
// ============================================================================

template<typename V>
class BasicPropertyTree {
public:
    using value_type   = V;
    using RecordMap    = std::map<std::string, BasicPropertyTree>;
    using SequenceList = std::vector<BasicPropertyTree>;
    using Flattened    = std::vector<std::pair<StepPath, std::vector<V>>>;

    enum class Kind : uint8_t {
        EMPTY,
        LEAF,
        RECORD,
        SEQUENCE
    };

    BasicPropertyTree() noexcept = default;

    // ========================================================================
    // CONSTRUCTION
    // ========================================================================

    static BasicPropertyTree empty() { return BasicPropertyTree(); }

    static BasicPropertyTree leaf(V value) {
        return BasicPropertyTree(std::make_shared<const Node>(
            Node{typename Node::Data(std::in_place_index<0>, std::move(value))}));
    }

    static BasicPropertyTree record(RecordMap entries) {
        return BasicPropertyTree(std::make_shared<const Node>(
            Node{typename Node::Data(std::in_place_index<1>, std::move(entries))}));
    }

    static BasicPropertyTree sequence(SequenceList elements) {
        return BasicPropertyTree(std::make_shared<const Node>(
            Node{typename Node::Data(std::in_place_index<2>, std::move(elements))}));
    }

    /**
     * @brief Sequence of Leafs, one per value
     */
    static BasicPropertyTree leaves(const std::vector<V>& values) {
        SequenceList elements;
        elements.reserve(values.size());
        for (const auto& v : values) {
            elements.push_back(leaf(v));
        }
        return sequence(std::move(elements));
    }

    /**
     * @brief Single-branch tree placing @p tree under nested records
     *
     * from_path({"a", "b"}, t) == Record{a: Record{b: t}}
     */
    static BasicPropertyTree from_path(const KeyPath& keys, BasicPropertyTree tree) {
        for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
            RecordMap entries;
            entries.emplace(*it, std::move(tree));
            tree = record(std::move(entries));
        }
        return tree;
    }

    static BasicPropertyTree unflatten(const KeyPath& keys, BasicPropertyTree tree) {
        return from_path(keys, std::move(tree));
    }

    static BasicPropertyTree unflatten(const KeyPath& keys, const std::vector<V>& values) {
        return from_path(keys, leaves(values));
    }

    /**
     * @brief Rebuild a tree from flatten() output
     *
     * Key steps sharing a prefix land in one Record, index steps in one
     * Sequence ordered by position (gaps are Empty). Each value list becomes a
     * Sequence of Leafs. When two pairs disagree on the shape at a path, the
     * later pair wins.
     */
    static BasicPropertyTree unflatten(const Flattened& pairs) {
        BasicPropertyTree result;
        for (const auto& [path, values] : pairs) {
            result = result.insert(path, 0, values);
        }
        return result;
    }

    // ========================================================================
    // INSPECTION
    // ========================================================================

    Kind kind() const noexcept {
        return node_ ? static_cast<Kind>(node_->data.index() + 1) : Kind::EMPTY;
    }

    bool is_leaf() const noexcept { return kind() == Kind::LEAF; }
    bool is_record() const noexcept { return kind() == Kind::RECORD; }
    bool is_sequence() const noexcept { return kind() == Kind::SEQUENCE; }

    /// Leaf value (only call if is_leaf())
    const V& leaf_value() const { return std::get<0>(node_->data); }

    /// Record entries; empty for any other kind
    const RecordMap& record_entries() const {
        static const RecordMap none;
        return is_record() ? std::get<1>(node_->data) : none;
    }

    /// Sequence elements; empty for any other kind
    const SequenceList& sequence_elements() const {
        static const SequenceList none;
        return is_sequence() ? std::get<2>(node_->data) : none;
    }

    /**
     * @brief Structural emptiness
     *
     * Empty is empty, a Leaf never is, a Record or Sequence is empty when all
     * of its children are (so a zero-length Sequence is empty too).
     */
    bool is_empty() const {
        switch (kind()) {
            case Kind::LEAF:
                return false;
            case Kind::RECORD:
                return std::all_of(record_entries().begin(), record_entries().end(),
                                   [](const auto& entry) { return entry.second.is_empty(); });
            case Kind::SEQUENCE:
                return std::all_of(sequence_elements().begin(), sequence_elements().end(),
                                   [](const auto& element) { return element.is_empty(); });
            default:
                return true;
        }
    }

    // ========================================================================
    // TRANSFORMATION
    // ========================================================================

    template<typename F>
    auto map(F&& f) const -> BasicPropertyTree<std::decay_t<std::invoke_result_t<F&, const V&>>> {
        using Out = BasicPropertyTree<std::decay_t<std::invoke_result_t<F&, const V&>>>;

        switch (kind()) {
            case Kind::LEAF:
                return Out::leaf(f(leaf_value()));
            case Kind::RECORD: {
                typename Out::RecordMap entries;
                for (const auto& [key, child] : record_entries()) {
                    entries.emplace(key, child.map(f));
                }
                return Out::record(std::move(entries));
            }
            case Kind::SEQUENCE: {
                typename Out::SequenceList elements;
                elements.reserve(sequence_elements().size());
                for (const auto& child : sequence_elements()) {
                    elements.push_back(child.map(f));
                }
                return Out::sequence(std::move(elements));
            }
            default:
                return Out::empty();
        }
    }

    /**
     * @brief Combine corresponding leaves of two trees
     *
     * Positions that exist on one side only, or whose shapes differ, become
     * Empty in the result.
     */
    template<typename W, typename F>
    auto zip_with(const BasicPropertyTree<W>& that, F&& f) const
        -> BasicPropertyTree<std::decay_t<std::invoke_result_t<F&, const V&, const W&>>> {
        using Out = BasicPropertyTree<std::decay_t<std::invoke_result_t<F&, const V&, const W&>>>;

        if (is_leaf() && that.is_leaf()) {
            return Out::leaf(f(leaf_value(), that.leaf_value()));
        }

        if (is_record() && that.is_record()) {
            const auto& other = that.record_entries();
            typename Out::RecordMap entries;
            for (const auto& [key, child] : record_entries()) {
                auto it = other.find(key);
                entries.emplace(key, it != other.end() ? child.zip_with(it->second, f) : Out::empty());
            }
            for (const auto& [key, child] : other) {
                if (!record_entries().count(key)) {
                    entries.emplace(key, Out::empty());
                }
            }
            return Out::record(std::move(entries));
        }

        if (is_sequence() && that.is_sequence()) {
            const auto& left  = sequence_elements();
            const auto& right = that.sequence_elements();
            typename Out::SequenceList elements;
            for (std::size_t i = 0; i < std::max(left.size(), right.size()); ++i) {
                if (i < left.size() && i < right.size()) {
                    elements.push_back(left[i].zip_with(right[i], f));
                } else {
                    elements.push_back(Out::empty());
                }
            }
            return Out::sequence(std::move(elements));
        }

        return Out::empty();
    }

    // ========================================================================
    // MERGE
    // ========================================================================

    /**
     * @brief Merge two trees
     *
     * Records merge key by key and Sequences concatenate. Any other pairing
     * has no single answer, so both trees are returned as alternatives.
     * A tree holding no leaves on either side yields the other tree.
     */
    std::vector<BasicPropertyTree> merge(const BasicPropertyTree& that) const {
        if (is_empty()) {
            return {that};
        }
        if (that.is_empty()) {
            return {*this};
        }

        if (is_sequence() && that.is_sequence()) {
            SequenceList elements = sequence_elements();
            elements.insert(elements.end(), that.sequence_elements().begin(),
                            that.sequence_elements().end());
            return {sequence(std::move(elements))};
        }

        if (is_record() && that.is_record()) {
            std::vector<RecordMap> alternatives{RecordMap{}};
            const auto& left  = record_entries();
            const auto& right = that.record_entries();

            auto put = [&alternatives](const std::string& key, const BasicPropertyTree& tree) {
                for (auto& entries : alternatives) {
                    entries.insert_or_assign(key, tree);
                }
            };

            for (const auto& [key, child] : left) {
                auto it = right.find(key);
                if (it == right.end()) {
                    put(key, child);
                    continue;
                }
                std::vector<RecordMap> next;
                for (const auto& merged : child.merge(it->second)) {
                    for (auto entries : alternatives) {
                        entries.insert_or_assign(key, merged);
                        next.push_back(std::move(entries));
                    }
                }
                alternatives = std::move(next);
            }
            for (const auto& [key, child] : right) {
                if (!left.count(key)) {
                    put(key, child);
                }
            }

            std::vector<BasicPropertyTree> result;
            result.reserve(alternatives.size());
            for (auto& entries : alternatives) {
                result.push_back(record(std::move(entries)));
            }
            return result;
        }

        return {*this, that};
    }

    /**
     * @brief Merge a list of trees, earlier trees first
     */
    static std::vector<BasicPropertyTree> merge_all(const std::vector<BasicPropertyTree>& trees) {
        if (trees.empty()) {
            return {};
        }

        std::vector<BasicPropertyTree> acc{trees.back()};
        for (auto it = std::next(trees.rbegin()); it != trees.rend(); ++it) {
            std::vector<BasicPropertyTree> next;
            for (const auto& tree : acc) {
                auto merged = it->merge(tree);
                next.insert(next.end(), merged.begin(), merged.end());
            }
            acc = std::move(next);
        }
        return acc;
    }

    // ========================================================================
    // FLATTEN
    // ========================================================================

    /**
     * @brief Paths to leaf values, in traversal order
     *
     * A Sequence made only of Leafs yields one path carrying all its values;
     * other Sequences contribute an index step per element.
     */
    Flattened flatten() const {
        Flattened out;
        StepPath path;
        flatten_into(path, out);
        return out;
    }

    // ========================================================================
    // LOOKUP
    // ========================================================================

    /**
     * @brief Subtree at @p keys
     *
     * Walking into a Sequence applies the remaining lookup to every element
     * and collects the results into a Sequence.
     */
    BasicPropertyTree get_path(const KeyPath& keys) const {
        return get_path(keys, 0);
    }

    BasicPropertyTree get_or_else(const BasicPropertyTree& that) const {
        return is_empty() ? that : *this;
    }

    // ========================================================================
    // NORMALIZATION
    // ========================================================================

    /**
     * @brief Remove empty children; a node left with none becomes Empty
     */
    BasicPropertyTree drop_empty() const {
        switch (kind()) {
            case Kind::RECORD: {
                RecordMap entries;
                for (const auto& [key, child] : record_entries()) {
                    auto pruned = child.drop_empty();
                    if (!pruned.is_empty()) {
                        entries.emplace(key, std::move(pruned));
                    }
                }
                return entries.empty() ? empty() : record(std::move(entries));
            }
            case Kind::SEQUENCE: {
                SequenceList elements;
                for (const auto& child : sequence_elements()) {
                    auto pruned = child.drop_empty();
                    if (!pruned.is_empty()) {
                        elements.push_back(std::move(pruned));
                    }
                }
                return elements.empty() ? empty() : sequence(std::move(elements));
            }
            default:
                return *this;
        }
    }

    static std::vector<BasicPropertyTree> drop_empty(const std::vector<BasicPropertyTree>& trees) {
        std::vector<BasicPropertyTree> result;
        for (const auto& tree : trees) {
            auto pruned = tree.drop_empty();
            if (!pruned.is_empty()) {
                result.push_back(std::move(pruned));
            }
        }
        return result;
    }

    /**
     * @brief Replace every one-element Sequence by its element
     */
    BasicPropertyTree unwrap_singleton_lists() const {
        switch (kind()) {
            case Kind::RECORD: {
                RecordMap entries;
                for (const auto& [key, child] : record_entries()) {
                    entries.emplace(key, child.unwrap_singleton_lists());
                }
                return record(std::move(entries));
            }
            case Kind::SEQUENCE: {
                const auto& elements = sequence_elements();
                if (elements.size() == 1) {
                    return elements.front().unwrap_singleton_lists();
                }
                SequenceList unwrapped;
                unwrapped.reserve(elements.size());
                for (const auto& child : elements) {
                    unwrapped.push_back(child.unwrap_singleton_lists());
                }
                return sequence(std::move(unwrapped));
            }
            default:
                return *this;
        }
    }

    static std::vector<BasicPropertyTree> unwrap_singleton_lists(
        const std::vector<BasicPropertyTree>& trees) {
        std::vector<BasicPropertyTree> result;
        result.reserve(trees.size());
        for (const auto& tree : trees) {
            result.push_back(tree.unwrap_singleton_lists());
        }
        return result;
    }

    // ========================================================================
    // COMPARISON / DISPLAY
    // ========================================================================

    bool operator==(const BasicPropertyTree& other) const {
        if (node_ == other.node_) {
            return true;
        }
        if (kind() != other.kind()) {
            return false;
        }
        switch (kind()) {
            case Kind::LEAF:
                return leaf_value() == other.leaf_value();
            case Kind::RECORD:
                return record_entries() == other.record_entries();
            case Kind::SEQUENCE:
                return sequence_elements() == other.sequence_elements();
            default:
                return true;
        }
    }

    /**
     * @brief Debug rendering, e.g. Record{a: Leaf(1), b: Sequence[Leaf(x)]}
     */
    void print(std::ostream& os) const {
        switch (kind()) {
            case Kind::LEAF:
                os << "Leaf(" << leaf_value() << ')';
                break;
            case Kind::RECORD: {
                os << "Record{";
                bool first = true;
                for (const auto& [key, child] : record_entries()) {
                    os << (first ? "" : ", ") << key << ": ";
                    child.print(os);
                    first = false;
                }
                os << '}';
                break;
            }
            case Kind::SEQUENCE: {
                os << "Sequence[";
                bool first = true;
                for (const auto& child : sequence_elements()) {
                    os << (first ? "" : ", ");
                    child.print(os);
                    first = false;
                }
                os << ']';
                break;
            }
            default:
                os << "Empty";
        }
    }

    std::string to_string() const {
        std::ostringstream oss;
        print(oss);
        return oss.str();
    }

private:
    struct Node;

    explicit BasicPropertyTree(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    BasicPropertyTree get_path(const KeyPath& keys, std::size_t pos) const {
        if (pos == keys.size()) {
            return *this;
        }
        switch (kind()) {
            case Kind::RECORD: {
                auto it = record_entries().find(keys[pos]);
                return it != record_entries().end() ? it->second.get_path(keys, pos + 1) : empty();
            }
            case Kind::SEQUENCE: {
                SequenceList elements;
                elements.reserve(sequence_elements().size());
                for (const auto& child : sequence_elements()) {
                    elements.push_back(child.get_path(keys, pos));
                }
                return sequence(std::move(elements));
            }
            default:
                return empty();
        }
    }

    void flatten_into(StepPath& path, Flattened& out) const {
        switch (kind()) {
            case Kind::LEAF:
                out.emplace_back(path, std::vector<V>{leaf_value()});
                break;
            case Kind::RECORD:
                for (const auto& [key, child] : record_entries()) {
                    path.push_back(PathStep::for_key(key));
                    child.flatten_into(path, out);
                    path.pop_back();
                }
                break;
            case Kind::SEQUENCE: {
                const auto& elements = sequence_elements();
                bool all_leaves = !elements.empty() &&
                                  std::all_of(elements.begin(), elements.end(),
                                              [](const auto& e) { return e.is_leaf(); });
                if (all_leaves) {
                    std::vector<V> values;
                    values.reserve(elements.size());
                    for (const auto& e : elements) {
                        values.push_back(e.leaf_value());
                    }
                    out.emplace_back(path, std::move(values));
                    break;
                }
                for (std::size_t i = 0; i < elements.size(); ++i) {
                    path.push_back(PathStep::for_index(i));
                    elements[i].flatten_into(path, out);
                    path.pop_back();
                }
                break;
            }
            default:
                break;
        }
    }

    BasicPropertyTree insert(const StepPath& path, std::size_t pos,
                             const std::vector<V>& values) const {
        if (pos == path.size()) {
            return leaves(values);
        }

        const auto& step = path[pos];
        if (step.is_key()) {
            RecordMap entries = record_entries();
            auto it = entries.find(step.name());
            BasicPropertyTree child = it != entries.end() ? it->second : empty();
            entries.insert_or_assign(step.name(), child.insert(path, pos + 1, values));
            return record(std::move(entries));
        }

        SequenceList elements = sequence_elements();
        if (elements.size() <= step.position()) {
            elements.resize(step.position() + 1);
        }
        elements[step.position()] = elements[step.position()].insert(path, pos + 1, values);
        return sequence(std::move(elements));
    }

    std::shared_ptr<const Node> node_;
};

template<typename V>
struct BasicPropertyTree<V>::Node {
    using Data = std::variant<V, RecordMap, SequenceList>;
    Data data;
};

template<typename V>
    requires requires(std::ostream& os, const V& v) { os << v; }
std::ostream& operator<<(std::ostream& os, const BasicPropertyTree<V>& tree) {
    tree.print(os);
    return os;
}

/// Trees of string values, the representation every source works with
using PropertyTree = BasicPropertyTree<std::string>;

extern template class BasicPropertyTree<std::string>;

}  // namespace confix::core::config
