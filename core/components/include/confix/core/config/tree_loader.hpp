#pragma once

/**
 * @file tree_loader.hpp
 * @brief YAML, JSON and properties documents as property trees
 *
 * Mapping:
 * - maps / objects    -> Record
 * - sequences / arrays -> Sequence
 * - null              -> Empty
 * - any other scalar  -> Leaf holding its text
 *
 * Serialization maps the other way; every Leaf is written as a string.
 *
 * A properties document is flat: "db.port=5432" is the Record db holding the
 * Leaf port, and a key given on several lines is a Sequence of its values.
 */

#include <confix/common/error.hpp>
#include <confix/core/config/config_source.hpp>
#include <confix/core/config/property_tree.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace confix::core::config {

/**
 * @brief Document format
 */
enum class ConfigFormat : uint8_t {
    AUTO,  ///< Detect from file extension or content
    YAML,       ///< YAML format (default)
    JSON,       ///< JSON format
    PROPERTIES  ///< Flat key=value lines
};

/**
 * @brief Reads and writes property trees as YAML or JSON documents
 */
class TreeLoader {
public:
    /// Properties keys with their values in document order
    using PropertyEntries = std::map<std::string, std::vector<std::string>>;

    virtual ~TreeLoader() = default;

    // ========================================================================
    // FORMAT DETECTION
    // ========================================================================

    /**
     * @brief Detect format from file extension
     * @param path File path to check
     * @return JSON for .json, PROPERTIES for .properties, YAML otherwise
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief Detect format from content
     * @param content Document text
     * @return JSON when the document starts with '{' or '[', YAML otherwise
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    /**
     * @brief Split a properties document into its entries
     *
     * A line holds a key and a value separated by '=', ':' or whitespace.
     * Blank lines and lines starting with '#' or '!' are skipped. A backslash
     * escapes the next character (\n, \t, \r and \f name control
     * characters) and an unescaped trailing backslash joins the next line.
     * A key repeated on several lines keeps every value, in order.
     */
    static PropertyEntries parse_properties(std::string_view content);

    // ========================================================================
    // PARSING / SERIALIZATION
    // ========================================================================

    /**
     * @brief Parse a document
     * @param content Document text
     * @param format Format of content (AUTO to detect)
     * @return Tree or CONFIG_PARSE_ERROR
     */
    virtual common::Result<PropertyTree> parse(std::string_view content,
                                               ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Serialize a tree
     * @param tree Tree to serialize
     * @param format Output format (AUTO means YAML)
     * @return Document text or SERIALIZE_FAILED
     *
     * PROPERTIES fails for a Leaf at the root and for Sequences holding
     * anything other than Leafs, which have no flat key.
     */
    virtual common::Result<std::string> serialize(const PropertyTree& tree,
                                                  ConfigFormat format = ConfigFormat::YAML) = 0;

    // ========================================================================
    // FILES
    // ========================================================================

    /**
     * @brief Load a tree from file
     * @param path Path to document
     * @param format Format override (AUTO to detect from extension)
     * @return Tree, CONFIG_FILE_NOT_FOUND, OS_ERROR or CONFIG_PARSE_ERROR
     */
    virtual common::Result<PropertyTree> load_file(const std::filesystem::path& path,
                                                   ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Save a tree to file
     * @param tree Tree to save
     * @param path Output file path
     * @param format Format (AUTO to detect from extension)
     */
    virtual common::Result<void> save_file(const PropertyTree& tree, const std::filesystem::path& path,
                                           ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Source over a document file, named after the file path
     */
    virtual common::Result<ConfigSource> load_source(
        const std::filesystem::path& path, ConfigFormat format = ConfigFormat::AUTO,
        LeafForSequence leaf_for_sequence = LeafForSequence::VALID) = 0;

    /**
     * @brief Flat source over a properties file
     *
     * The entries go through ConfigSource::from_multi_map() with @p options,
     * so keys are only nested when a key delimiter is given. The source is
     * named after the file path whatever options.source_name says.
     */
    virtual common::Result<ConfigSource> load_properties_source(const std::filesystem::path& path,
                                                                const SourceOptions& options = {}) = 0;
};

/**
 * @brief TreeLoader implementation using yaml-cpp and jsoncpp
 */
class TreeLoaderImpl : public TreeLoader {
public:
    TreeLoaderImpl()           = default;
    ~TreeLoaderImpl() override = default;

    common::Result<PropertyTree> parse(std::string_view content,
                                       ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<std::string> serialize(const PropertyTree& tree,
                                          ConfigFormat format = ConfigFormat::YAML) override;

    common::Result<PropertyTree> load_file(const std::filesystem::path& path,
                                           ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<void> save_file(const PropertyTree& tree, const std::filesystem::path& path,
                                   ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<ConfigSource> load_source(
        const std::filesystem::path& path, ConfigFormat format = ConfigFormat::AUTO,
        LeafForSequence leaf_for_sequence = LeafForSequence::VALID) override;

    common::Result<ConfigSource> load_properties_source(const std::filesystem::path& path,
                                                        const SourceOptions& options = {}) override;

private:
    common::Result<std::string> read_file(const std::filesystem::path& path);
    common::Result<void> write_file(const std::filesystem::path& path, std::string_view content);
    ConfigFormat resolve_format(const std::filesystem::path& path, ConfigFormat format);
};

/**
 * @brief Create the default tree loader
 */
CONFIX_API std::unique_ptr<TreeLoader> create_tree_loader();

}  // namespace confix::core::config
