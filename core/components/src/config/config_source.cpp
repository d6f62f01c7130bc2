#include <confix/common/debug.hpp>
#include <confix/common/platform.hpp>
#include <confix/core/config/config_source.hpp>

#include <cctype>

namespace confix::core::config {

using namespace common::debug;

namespace detail {

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

}  // namespace detail

namespace {

KeyPath split_key(const std::string& key, const std::optional<char>& delimiter) {
    if (!delimiter) {
        return {key};
    }
    KeyPath segments;
    for (auto& segment : detail::split(key, *delimiter)) {
        if (!detail::trim(segment).empty()) {
            segments.push_back(std::move(segment));
        }
    }
    return segments;
}

std::vector<std::string> split_values(const std::vector<std::string>& values,
                                      const std::optional<char>& delimiter) {
    if (!delimiter) {
        return values;
    }
    std::vector<std::string> out;
    for (const auto& value : values) {
        for (const auto& part : detail::split(value, *delimiter)) {
            out.push_back(detail::trim(part));
        }
    }
    return out;
}

}  // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

ConfigSource::ConfigSource()
    : ConfigSource({}, [](const KeyPath&) { return PropertyTree::empty(); }) {}

ConfigSource::ConfigSource(std::set<std::string> names, Lookup lookup,
                           LeafForSequence leaf_for_sequence)
    : state_(std::make_shared<const State>(
          State{std::move(names), std::move(lookup), leaf_for_sequence})) {}

ConfigSource ConfigSource::empty() {
    return ConfigSource();
}

ConfigSource ConfigSource::from_property_tree(PropertyTree tree, std::string name,
                                              LeafForSequence leaf_for_sequence) {
    return ConfigSource(
        {std::move(name)},
        [tree = std::move(tree)](const KeyPath& path) { return tree.get_path(path); },
        leaf_for_sequence);
}

ConfigSource ConfigSource::from_property_trees(const std::vector<PropertyTree>& trees,
                                               std::string name,
                                               LeafForSequence leaf_for_sequence) {
    auto merged = PropertyTree::merge_all(trees);
    if (merged.empty()) {
        return from_property_tree(PropertyTree::empty(), std::move(name), leaf_for_sequence);
    }

    if (merged.size() > 1) {
        CONFIX_LOG_DEBUG(category::SOURCE, "Source '" << name << "' keeps " << merged.size()
                                                      << " unmerged alternatives");
    }

    ConfigSource result = from_property_tree(merged.front(), name, leaf_for_sequence);
    for (std::size_t i = 1; i < merged.size(); ++i) {
        result = result.or_else(from_property_tree(merged[i], name, leaf_for_sequence));
    }
    return result;
}

ConfigSource ConfigSource::from_map(const std::map<std::string, std::string>& entries,
                                    const SourceOptions& options) {
    std::map<std::string, std::vector<std::string>> multi;
    for (const auto& [key, value] : entries) {
        multi.emplace(key, std::vector<std::string>{value});
    }
    return from_multi_map(multi, options);
}

ConfigSource ConfigSource::from_multi_map(
    const std::map<std::string, std::vector<std::string>>& entries, const SourceOptions& options) {
    std::vector<PropertyTree> trees;
    trees.reserve(entries.size());

    for (const auto& [key, values] : entries) {
        if (options.filter_keys && !options.filter_keys(key)) {
            continue;
        }
        auto path = split_key(key, options.key_delimiter);
        if (path.empty()) {
            CONFIX_LOG_DEBUG(category::SOURCE, "Ignoring blank key '" << key << "' in source '"
                                                                      << options.source_name << "'");
            continue;
        }
        trees.push_back(PropertyTree::unflatten(path, split_values(values, options.value_delimiter)));
    }

    CONFIX_LOG_TRACE(category::SOURCE,
                     "Source '" << options.source_name << "' built from " << trees.size() << " keys");

    auto normalized = PropertyTree::unwrap_singleton_lists(
        PropertyTree::drop_empty(PropertyTree::merge_all(trees)));
    return from_property_trees(normalized, options.source_name, options.leaf_for_sequence);
}

common::Result<ConfigSource, ReadError> ConfigSource::from_system_env(const SourceOptions& options) {
    if (options.key_delimiter) {
        char d = *options.key_delimiter;
        if (!std::isalpha(static_cast<unsigned char>(d)) && d != '_') {
            CONFIX_LOG_ERROR(category::SOURCE, "Invalid environment key delimiter '" << d << "'");
            return ReadError::source_error(
                std::string("environment key delimiter must be a letter or '_', got '") + d + "'");
        }
    }

    SourceOptions env_options = options;
    env_options.source_name   = "system environment";
    return from_map(common::platform::get_environment(), env_options);
}

// ============================================================================
// Query / composition
// ============================================================================

PropertyTree ConfigSource::get_config_value(const KeyPath& path) const {
    return state_->lookup(path);
}

ConfigSource ConfigSource::or_else(const ConfigSource& that) const {
    std::set<std::string> names = state_->names;
    names.insert(that.names().begin(), that.names().end());

    auto self = state_;
    auto other = that.state_;
    return ConfigSource(
        std::move(names),
        [self, other](const KeyPath& path) {
            auto tree = self->lookup(path);
            return tree.is_empty() ? other->lookup(path) : tree;
        },
        that.leaf_for_sequence());
}

ConfigSource ConfigSource::convert_keys(KeyMapper f) const {
    auto self = state_;
    return ConfigSource(
        state_->names,
        [self, f = std::move(f)](const KeyPath& path) {
            KeyPath converted;
            converted.reserve(path.size());
            for (const auto& key : path) {
                converted.push_back(f(key));
            }
            return self->lookup(converted);
        },
        state_->leaf_for_sequence);
}

ConfigSource merge_all(const std::vector<ConfigSource>& sources) {
    if (sources.empty()) {
        return ConfigSource::empty();
    }
    ConfigSource result = sources.front();
    for (std::size_t i = 1; i < sources.size(); ++i) {
        result = result.or_else(sources[i]);
    }
    return result;
}

}  // namespace confix::core::config
