/**
 * @file tree_loader.cpp
 * @brief YAML / JSON / properties tree loader implementation
 */

#include <confix/common/debug.hpp>
#include <confix/core/config/tree_loader.hpp>

#include <yaml-cpp/yaml.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace confix::core::config {

using namespace common::debug;

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<TreeLoader> create_tree_loader() {
    return std::make_unique<TreeLoaderImpl>();
}

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat TreeLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    if (ext == ".properties") {
        return ConfigFormat::PROPERTIES;
    }

    return ConfigFormat::YAML;  // .yaml, .yml and anything else
}

ConfigFormat TreeLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos >= content.size()) {
        return ConfigFormat::YAML;
    }

    // JSON starts with { or [
    if (content[pos] == '{' || content[pos] == '[') {
        return ConfigFormat::JSON;
    }

    return ConfigFormat::YAML;
}

// ============================================================================
// YAML
// ============================================================================

namespace {

PropertyTree from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return PropertyTree::leaf(node.Scalar());

        case YAML::NodeType::Sequence: {
            PropertyTree::SequenceList elements;
            for (const auto& element : node) {
                elements.push_back(from_yaml(element));
            }
            return PropertyTree::sequence(std::move(elements));
        }

        case YAML::NodeType::Map: {
            PropertyTree::RecordMap entries;
            for (const auto& entry : node) {
                entries.insert_or_assign(entry.first.as<std::string>(), from_yaml(entry.second));
            }
            return PropertyTree::record(std::move(entries));
        }

        default:  // Null, Undefined
            return PropertyTree::empty();
    }
}

void emit_yaml(YAML::Emitter& out, const PropertyTree& tree) {
    switch (tree.kind()) {
        case PropertyTree::Kind::LEAF:
            out << tree.leaf_value();
            break;

        case PropertyTree::Kind::RECORD:
            if (tree.record_entries().empty()) {
                out << YAML::Flow;
            }
            out << YAML::BeginMap;
            for (const auto& [key, child] : tree.record_entries()) {
                out << YAML::Key << key << YAML::Value;
                emit_yaml(out, child);
            }
            out << YAML::EndMap;
            break;

        case PropertyTree::Kind::SEQUENCE:
            if (tree.sequence_elements().empty()) {
                out << YAML::Flow;
            }
            out << YAML::BeginSeq;
            for (const auto& child : tree.sequence_elements()) {
                emit_yaml(out, child);
            }
            out << YAML::EndSeq;
            break;

        default:
            out << YAML::Null;
            break;
    }
}

// ============================================================================
// JSON
// ============================================================================

PropertyTree from_json(const Json::Value& value) {
    if (value.isObject()) {
        PropertyTree::RecordMap entries;
        for (const auto& name : value.getMemberNames()) {
            entries.emplace(name, from_json(value[name]));
        }
        return PropertyTree::record(std::move(entries));
    }

    if (value.isArray()) {
        PropertyTree::SequenceList elements;
        for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
            elements.push_back(from_json(value[i]));
        }
        return PropertyTree::sequence(std::move(elements));
    }

    if (value.isNull()) {
        return PropertyTree::empty();
    }

    return PropertyTree::leaf(value.asString());
}

Json::Value to_json(const PropertyTree& tree) {
    switch (tree.kind()) {
        case PropertyTree::Kind::LEAF:
            return Json::Value(tree.leaf_value());

        case PropertyTree::Kind::RECORD: {
            Json::Value object(Json::objectValue);
            for (const auto& [key, child] : tree.record_entries()) {
                object[key] = to_json(child);
            }
            return object;
        }

        case PropertyTree::Kind::SEQUENCE: {
            Json::Value array(Json::arrayValue);
            for (const auto& child : tree.sequence_elements()) {
                array.append(to_json(child));
            }
            return array;
        }

        default:
            return Json::Value(Json::nullValue);
    }
}

// ============================================================================
// PROPERTIES
// ============================================================================

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\f';
}

// Logical lines: comments and blank lines dropped, continuations joined
std::vector<std::string> properties_lines(std::string_view content) {
    std::vector<std::string> lines;
    std::string current;
    bool continuing = false;

    std::istringstream stream{std::string{content}};
    std::string raw;
    while (std::getline(stream, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }

        std::string_view line = raw;
        auto first            = line.find_first_not_of(" \t\f");
        line                  = first == std::string_view::npos ? std::string_view() : line.substr(first);

        if (!continuing && (line.empty() || line.front() == '#' || line.front() == '!')) {
            continue;
        }

        std::size_t slashes = 0;
        while (slashes < line.size() && line[line.size() - 1 - slashes] == '\\') {
            ++slashes;
        }

        if (slashes % 2 == 1) {
            current.append(line.substr(0, line.size() - 1));
            continuing = true;
            continue;
        }

        current.append(line);
        lines.push_back(std::move(current));
        current.clear();
        continuing = false;
    }

    if (continuing) {
        lines.push_back(std::move(current));
    }
    return lines;
}

std::string unescape_property(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            out += text[i];
            continue;
        }
        switch (const char next = text[++i]) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'f': out += '\f'; break;
            default:  out += next;  break;
        }
    }
    return out;
}

std::pair<std::string, std::string> split_property(std::string_view line) {
    std::size_t end = 0;
    while (end < line.size()) {
        const char c = line[end];
        if (c == '\\') {
            end += 2;
            continue;
        }
        if (c == '=' || c == ':' || is_blank(c)) {
            break;
        }
        ++end;
    }
    end = std::min(end, line.size());

    // Whitespace, at most one separator, whitespace
    std::size_t value = end;
    while (value < line.size() && is_blank(line[value])) {
        ++value;
    }
    if (value < line.size() && (line[value] == '=' || line[value] == ':')) {
        ++value;
    }
    while (value < line.size() && is_blank(line[value])) {
        ++value;
    }

    return {unescape_property(line.substr(0, end)), unescape_property(line.substr(value))};
}

std::string escape_property(std::string_view text, bool key) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\f': out += "\\f"; break;
            default:
                if ((key && (c == '=' || c == ':' || c == ' ' || c == '#' || c == '!')) ||
                    (!key && i == 0 && c == ' ')) {
                    out += '\\';
                }
                out += c;
                break;
        }
    }
    return out;
}

PropertyTree from_properties(const TreeLoader::PropertyEntries& entries) {
    PropertyTree::Flattened pairs;
    for (const auto& [key, values] : entries) {
        KeyPath keys;
        for (auto& segment : detail::split(key, '.')) {
            if (!segment.empty()) {
                keys.push_back(std::move(segment));
            }
        }
        if (keys.empty()) {
            CONFIX_LOG_DEBUG(category::LOADER, "Ignoring blank property key '" << key << "'");
            continue;
        }
        pairs.emplace_back(to_step_path(keys), values);
    }
    return PropertyTree::unflatten(pairs).unwrap_singleton_lists();
}

common::Result<std::string> to_properties(const PropertyTree& tree) {
    std::string out;
    for (const auto& [path, values] : tree.flatten()) {
        if (path.empty()) {
            return common::Result<std::string>(common::ErrorCode::SERIALIZE_FAILED,
                                               "Properties need a key for every value");
        }
        for (const auto& step : path) {
            if (step.is_index()) {
                return common::Result<std::string>(
                    common::ErrorCode::SERIALIZE_FAILED,
                    "Properties cannot hold sequence elements: " + path_to_string(path));
            }
        }

        const auto key = escape_property(path_to_string(path), true);
        for (const auto& value : values) {
            out += key + "=" + escape_property(value, false) + "\n";
        }
    }
    return common::Result<std::string>(std::move(out));
}

}  // anonymous namespace

TreeLoader::PropertyEntries TreeLoader::parse_properties(std::string_view content) {
    PropertyEntries entries;
    for (const auto& line : properties_lines(content)) {
        auto [key, value] = split_property(line);
        entries[key].push_back(std::move(value));
    }
    return entries;
}

// ============================================================================
// IMPLEMENTATION
// ============================================================================

common::Result<std::string> TreeLoaderImpl::read_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return common::Result<std::string>(
            common::ErrorCode::CONFIG_FILE_NOT_FOUND,
            "Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return common::Result<std::string>(
            common::ErrorCode::OS_ERROR,
            "Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return common::Result<std::string>(buffer.str());
}

common::Result<void> TreeLoaderImpl::write_file(const std::filesystem::path& path,
                                                std::string_view content) {
    // Create parent directories if needed
    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return common::Result<void>(
                common::ErrorCode::OS_ERROR,
                "Failed to create directory: " + parent.string());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return common::Result<void>(
            common::ErrorCode::OS_ERROR,
            "Failed to open file for writing: " + path.string());
    }

    file << content;
    if (!file.good()) {
        return common::Result<void>(
            common::ErrorCode::OS_ERROR,
            "Failed to write to file: " + path.string());
    }

    return common::Result<void>();
}

ConfigFormat TreeLoaderImpl::resolve_format(const std::filesystem::path& path, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        return detect_format(path);
    }
    return format;
}

common::Result<PropertyTree> TreeLoaderImpl::parse(std::string_view content, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    try {
        if (format == ConfigFormat::PROPERTIES) {
            return common::Result<PropertyTree>(from_properties(parse_properties(content)));
        } else if (format == ConfigFormat::JSON) {
            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            std::istringstream stream{std::string{content}};

            if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                CONFIX_LOG_WARN(category::LOADER, "JSON parse error: " << errors);
                return common::Result<PropertyTree>(
                    common::ErrorCode::CONFIG_PARSE_ERROR,
                    "JSON parse error: " + errors);
            }

            return common::Result<PropertyTree>(from_json(root));
        } else {
            YAML::Node root = YAML::Load(std::string(content));
            return common::Result<PropertyTree>(from_yaml(root));
        }
    } catch (const std::exception& e) {
        CONFIX_LOG_WARN(category::LOADER, "Parse error: " << e.what());
        return common::Result<PropertyTree>(
            common::ErrorCode::CONFIG_PARSE_ERROR,
            std::string("Parse error: ") + e.what());
    }
}

common::Result<std::string> TreeLoaderImpl::serialize(const PropertyTree& tree, ConfigFormat format) {
    if (format == ConfigFormat::PROPERTIES) {
        return to_properties(tree);
    }

    if (format == ConfigFormat::JSON) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return common::Result<std::string>(Json::writeString(builder, to_json(tree)) + "\n");
    }

    YAML::Emitter out;
    emit_yaml(out, tree);
    if (!out.good()) {
        return common::Result<std::string>(
            common::ErrorCode::SERIALIZE_FAILED,
            "YAML emit error: " + out.GetLastError());
    }
    return common::Result<std::string>(std::string(out.c_str()) + "\n");
}

common::Result<PropertyTree> TreeLoaderImpl::load_file(const std::filesystem::path& path,
                                                       ConfigFormat format) {
    auto content_result = read_file(path);
    if (!content_result) {
        return common::Result<PropertyTree>(content_result.error());
    }

    CONFIX_LOG_DEBUG(category::LOADER, "Loaded configuration file " << path.string());
    return parse(content_result.value(), resolve_format(path, format));
}

common::Result<void> TreeLoaderImpl::save_file(const PropertyTree& tree,
                                               const std::filesystem::path& path,
                                               ConfigFormat format) {
    auto result = serialize(tree, resolve_format(path, format));
    if (!result) {
        return common::Result<void>(result.error());
    }

    return write_file(path, result.value());
}

common::Result<ConfigSource> TreeLoaderImpl::load_source(const std::filesystem::path& path,
                                                         ConfigFormat format,
                                                         LeafForSequence leaf_for_sequence) {
    auto tree = load_file(path, format);
    if (!tree) {
        return common::Result<ConfigSource>(tree.error());
    }

    return common::Result<ConfigSource>(
        ConfigSource::from_property_tree(tree.value(), path.string(), leaf_for_sequence));
}

common::Result<ConfigSource> TreeLoaderImpl::load_properties_source(const std::filesystem::path& path,
                                                                    const SourceOptions& options) {
    auto content = read_file(path);
    if (!content) {
        return common::Result<ConfigSource>(content.error());
    }

    auto entries = parse_properties(content.value());
    CONFIX_LOG_DEBUG(category::LOADER,
                     "Loaded " << entries.size() << " properties from " << path.string());

    SourceOptions named = options;
    named.source_name   = path.string();
    return common::Result<ConfigSource>(ConfigSource::from_multi_map(entries, named));
}

}  // namespace confix::core::config
