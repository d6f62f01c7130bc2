#include <confix/core/config/docs.hpp>

#include <sstream>
#include <type_traits>

namespace confix::core::config {

namespace {

/**
 * @brief What the enclosing nodes say about the scalars below them
 */
struct DocScope {
    std::string path;
    std::vector<std::string> descriptions;
    std::optional<std::string> default_value;
    bool optional    = false;
    bool has_default = false;
    std::set<std::string> sources;

    DocScope child(const std::string& key) const {
        DocScope next = *this;
        next.path     = path.empty() ? key : path + "." + key;
        return next;
    }
};

void collect(const NodePtr& node, const DocScope& scope, std::vector<DocEntry>& out) {
    std::visit(
        [&](const auto& op) {
            using T = std::decay_t<decltype(op)>;

            if constexpr (std::is_same_v<T, ValueNode>) {
                DocScope at = op.key ? scope.child(*op.key) : scope;
                DocEntry entry;
                entry.path          = at.path.empty() ? "<root>" : at.path;
                entry.type_name     = op.type.name;
                entry.descriptions  = at.descriptions;
                entry.default_value = at.default_value;
                entry.optional      = at.optional;
                entry.has_default   = at.has_default;
                entry.sources       = at.sources;
                out.push_back(std::move(entry));
            } else if constexpr (std::is_same_v<T, NestedNode>) {
                collect(op.inner, scope.child(op.key), out);
            } else if constexpr (std::is_same_v<T, ZipNode> || std::is_same_v<T, OrElseEitherNode>) {
                collect(op.left, scope, out);
                collect(op.right, scope, out);
            } else if constexpr (std::is_same_v<T, SequenceNode>) {
                DocScope element = scope;
                element.path += "[]";
                collect(op.inner, element, out);
            } else if constexpr (std::is_same_v<T, OptionalNode>) {
                DocScope inner = scope;
                inner.optional = true;
                collect(op.inner, inner, out);
            } else if constexpr (std::is_same_v<T, DefaultNode>) {
                DocScope inner      = scope;
                inner.has_default   = true;
                inner.default_value = op.rendered;
                collect(op.inner, inner, out);
            } else if constexpr (std::is_same_v<T, DescribeNode>) {
                DocScope inner = scope;
                inner.descriptions.push_back(op.text);
                collect(op.inner, inner, out);
            } else if constexpr (std::is_same_v<T, SourcedFromNode>) {
                DocScope inner = scope;
                inner.sources.insert(op.source.names().begin(), op.source.names().end());
                collect(op.inner, inner, out);
            } else {
                collect(op.inner, scope, out);
            }
        },
        node->op);
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += separator;
        }
        out += part;
    }
    return out;
}

}  // anonymous namespace

const DocEntry* ConfigDocs::find(const std::string& path) const {
    for (const auto& entry : entries_) {
        if (entry.path == path) {
            return &entry;
        }
    }
    return nullptr;
}

std::string ConfigDocs::to_markdown() const {
    std::ostringstream oss;
    oss << "| Path | Type | Required | Default | Description | Sources |\n";
    oss << "|------|------|----------|---------|-------------|---------|\n";

    for (const auto& entry : entries_) {
        oss << "| `" << entry.path << "` | " << entry.type_name << " | "
            << (entry.required() ? "yes" : "no") << " | ";
        if (entry.default_value) {
            oss << '`' << *entry.default_value << '`';
        }
        oss << " | " << join(entry.descriptions, "; ") << " | "
            << join(std::vector<std::string>(entry.sources.begin(), entry.sources.end()), ", ")
            << " |\n";
    }
    return oss.str();
}

ConfigDocs generate_docs(const NodePtr& node) {
    std::vector<DocEntry> entries;
    collect(node, DocScope{}, entries);
    return ConfigDocs(std::move(entries));
}

}  // namespace confix::core::config
