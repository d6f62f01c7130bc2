#pragma once

/**
 * @file docs.hpp
 * @brief Reference documentation generated from a descriptor
 */

#include <confix/core/config/descriptor.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace confix::core::config {

/**
 * @brief One documented scalar of a schema
 */
struct DocEntry {
    std::string path;  // "database.url", "regions[]"
    std::string type_name;
    std::vector<std::string> descriptions;  // outermost first
    std::optional<std::string> default_value;
    bool optional = false;
    bool has_default = false;
    std::set<std::string> sources;

    bool required() const noexcept { return !optional && !has_default; }
};

class ConfigDocs {
public:
    ConfigDocs() = default;
    explicit ConfigDocs(std::vector<DocEntry> entries) : entries_(std::move(entries)) {}

    const std::vector<DocEntry>& entries() const noexcept { return entries_; }

    /// First entry documenting @p path, or nullptr
    const DocEntry* find(const std::string& path) const;

    /**
     * @brief Markdown table with one row per entry
     */
    std::string to_markdown() const;

private:
    std::vector<DocEntry> entries_;
};

CONFIX_API ConfigDocs generate_docs(const NodePtr& node);

template<typename T>
ConfigDocs generate_docs(const ConfigDescriptor<T>& descriptor) {
    return generate_docs(descriptor.node());
}

}  // namespace confix::core::config
