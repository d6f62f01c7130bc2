#pragma once

/**
 * @file config_source.hpp
 * @brief Named, composable path -> PropertyTree resolvers
 *
 * A ConfigSource answers "what is the tree at this key path?" for every path;
 * absence is an Empty tree, never an error. Sources compose with or_else(),
 * which falls back per queried path, so one read can draw different branches
 * from different sources.
 */

#include <confix/common/platform.hpp>
#include <confix/core/config/property_tree.hpp>
#include <confix/core/config/read_error.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace confix::core::config {

/**
 * @brief Options shared by the flat-source constructors
 */
struct SourceOptions {
    /// Provenance name reported in diagnostics and docs
    std::string source_name = "constant";

    /// Splits keys into nested path segments ("db.port" -> db/port)
    std::optional<char> key_delimiter;

    /// Splits values into sequences ("a,b" -> [a, b])
    std::optional<char> value_delimiter;

    LeafForSequence leaf_for_sequence = LeafForSequence::VALID;

    /// Keys rejected by the filter are ignored (no filter keeps all keys)
    std::function<bool(const std::string&)> filter_keys;
};

class ConfigSource {
public:
    using Lookup = std::function<PropertyTree(const KeyPath&)>;
    using KeyMapper = std::function<std::string(const std::string&)>;

    /// Source that has nothing for any path
    ConfigSource();

    ConfigSource(std::set<std::string> names, Lookup lookup,
                 LeafForSequence leaf_for_sequence = LeafForSequence::VALID);

    // ========================================================================
    // CONSTRUCTION
    // ========================================================================

    static ConfigSource empty();

    static ConfigSource from_property_tree(PropertyTree tree, std::string name,
                                           LeafForSequence leaf_for_sequence = LeafForSequence::VALID);

    /**
     * @brief Source over alternative trees
     *
     * The trees are merged first; merge alternatives that could not be
     * reconciled are consulted in order through or_else().
     */
    static ConfigSource from_property_trees(const std::vector<PropertyTree>& trees, std::string name,
                                            LeafForSequence leaf_for_sequence = LeafForSequence::VALID);

    static ConfigSource from_map(const std::map<std::string, std::string>& entries,
                                 const SourceOptions& options = {});

    static ConfigSource from_multi_map(const std::map<std::string, std::vector<std::string>>& entries,
                                       const SourceOptions& options = {});

    /**
     * @brief Snapshot of the process environment
     *
     * The key delimiter, when given, must be a letter or '_' since other
     * characters cannot appear in variable names.
     */
    static ReadResult<ConfigSource> from_system_env(const SourceOptions& options = {});

    // ========================================================================
    // QUERY
    // ========================================================================

    const std::set<std::string>& names() const noexcept { return state_->names; }

    LeafForSequence leaf_for_sequence() const noexcept { return state_->leaf_for_sequence; }

    /**
     * @brief Tree at @p path (Empty when absent)
     */
    PropertyTree get_config_value(const KeyPath& path) const;

    // ========================================================================
    // COMPOSITION
    // ========================================================================

    /**
     * @brief This source, falling back to @p that per queried path
     *
     * @p that is only consulted for paths this source leaves empty. Names are
     * combined; the sequence policy is taken from @p that.
     */
    ConfigSource or_else(const ConfigSource& that) const;

    /**
     * @brief Remap every key of a queried path before lookup
     */
    ConfigSource convert_keys(KeyMapper f) const;

private:
    struct State {
        std::set<std::string> names;
        Lookup lookup;
        LeafForSequence leaf_for_sequence = LeafForSequence::VALID;
    };

    std::shared_ptr<const State> state_;
};

/**
 * @brief Left-to-right or_else() chain (empty source for an empty list)
 */
CONFIX_API ConfigSource merge_all(const std::vector<ConfigSource>& sources);

namespace detail {

/// Split on @p delimiter keeping empty pieces
std::vector<std::string> split(const std::string& text, char delimiter);

/// Strip surrounding whitespace
std::string trim(const std::string& text);

}  // namespace detail

}  // namespace confix::core::config
