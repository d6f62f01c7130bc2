#include <confix/common/debug.hpp>
#include <confix/core/config/command_line.hpp>

namespace confix::core::config {

using namespace common::debug;

namespace {

constexpr const char* COMMAND_LINE_SOURCE = "command line arguments";

std::optional<std::string> as_key(const std::string& text) {
    if (text.empty() || text.front() != '-') {
        return std::nullopt;
    }
    auto start = text.find_first_not_of('-');
    if (start == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(start);
}

/**
 * @brief Turns classified tokens into trees, two tokens at a time
 */
class ArgsParser {
public:
    using Trees = std::vector<PropertyTree>;

    ArgsParser(std::vector<ArgToken> tokens, std::optional<char> key_delimiter,
               std::optional<char> value_delimiter)
        : tokens_(std::move(tokens))
        , key_delimiter_(key_delimiter)
        , value_delimiter_(value_delimiter) {}

    Trees parse() const { return loop(0, tokens_.size()); }

private:
    KeyPath key_path(const std::string& key) const {
        if (!key_delimiter_) {
            return {key};
        }
        KeyPath segments;
        for (auto& segment : detail::split(key, *key_delimiter_)) {
            if (!segment.empty()) {
                segments.push_back(std::move(segment));
            }
        }
        return segments;
    }

    PropertyTree nest(const std::string& key, PropertyTree tree) const {
        return PropertyTree::from_path(key_path(key), std::move(tree));
    }

    Trees nest_all(const std::string& key, const Trees& trees) const {
        Trees out;
        out.reserve(trees.size());
        for (const auto& tree : trees) {
            out.push_back(nest(key, tree));
        }
        return out;
    }

    // Trailing empty pieces are dropped: "a,b," has two values
    PropertyTree to_seq(const std::string& value) const {
        if (!value_delimiter_ || value.empty()) {
            return PropertyTree::leaves({value});
        }
        auto parts = detail::split(value, *value_delimiter_);
        while (!parts.empty() && parts.back().empty()) {
            parts.pop_back();
        }
        return PropertyTree::leaves(parts);
    }

    PropertyTree assign(const ArgToken& token) const {
        return nest(token.key, to_seq(token.value));
    }

    Trees single(const ArgToken& token) const {
        switch (token.kind) {
            case ArgToken::Kind::BOTH:
                return {assign(token)};
            case ArgToken::Kind::VALUE_ONLY:
                return {to_seq(token.value)};
            default:
                return {};
        }
    }

    static void append(Trees& out, Trees more) {
        out.insert(out.end(), std::make_move_iterator(more.begin()),
                   std::make_move_iterator(more.end()));
    }

    Trees loop(std::size_t begin, std::size_t end) const {
        if (begin >= end) {
            return {};
        }
        const auto& first = tokens_[begin];
        if (begin + 1 == end) {
            return single(first);
        }
        const auto& second = tokens_[begin + 1];
        const std::size_t rest = begin + 2;

        Trees out;
        switch (first.kind) {
            case ArgToken::Kind::BOTH:
                out.push_back(assign(first));
                switch (second.kind) {
                    case ArgToken::Kind::BOTH:
                        out.push_back(assign(second));
                        append(out, loop(rest, end));
                        break;
                    case ArgToken::Kind::KEY_ONLY:
                        // The key applies to the next token only
                        if (rest < end) {
                            append(out, nest_all(second.key, loop(rest, rest + 1)));
                            append(out, loop(rest + 1, end));
                        }
                        break;
                    case ArgToken::Kind::VALUE_ONLY:
                        out.push_back(to_seq(second.value));
                        append(out, loop(rest, end));
                        break;
                }
                break;

            case ArgToken::Kind::KEY_ONLY:
                switch (second.kind) {
                    case ArgToken::Kind::BOTH:
                        out.push_back(nest(first.key, assign(second)));
                        append(out, loop(rest, end));
                        break;
                    case ArgToken::Kind::KEY_ONLY:
                        return key_chain(first, second, rest, end);
                    case ArgToken::Kind::VALUE_ONLY:
                        out.push_back(nest(first.key, to_seq(second.value)));
                        append(out, loop(rest, end));
                        break;
                }
                break;

            case ArgToken::Kind::VALUE_ONLY:
                out.push_back(to_seq(first.value));
                switch (second.kind) {
                    case ArgToken::Kind::BOTH:
                        out.push_back(assign(second));
                        append(out, loop(rest, end));
                        break;
                    case ArgToken::Kind::KEY_ONLY:
                        append(out, nest_all(second.key, loop(rest, end)));
                        break;
                    case ArgToken::Kind::VALUE_ONLY:
                        out.push_back(to_seq(second.value));
                        append(out, loop(rest, end));
                        break;
                }
                break;
        }
        return out;
    }

    /**
     * @brief Two or more consecutive keys
     *
     * The first token after the chain that yields a tree on its own ends it;
     * the keys in between are further nesting levels. A chain that never
     * reaches a value is discarded together with the rest of the arguments.
     */
    Trees key_chain(const ArgToken& outer, const ArgToken& inner, std::size_t from,
                    std::size_t end) const {
        for (std::size_t i = from; i < end; ++i) {
            auto trees = loop(i, i + 1);
            if (trees.empty()) {
                continue;
            }

            KeyPath keys = key_path(inner.key);
            for (std::size_t j = from; j < i; ++j) {
                auto more = key_path(tokens_[j].key);
                keys.insert(keys.end(), more.begin(), more.end());
            }

            Trees out;
            for (const auto& tree : trees) {
                out.push_back(nest(outer.key, PropertyTree::from_path(keys, tree)));
            }
            append(out, loop(i + 1, end));
            return out;
        }

        CONFIX_LOG_DEBUG(category::CLI, "Discarding key chain '" << outer.key << "', '" << inner.key
                                                                 << "' that is never given a value");
        return {};
    }

    std::vector<ArgToken> tokens_;
    std::optional<char> key_delimiter_;
    std::optional<char> value_delimiter_;
};

std::string_view token_kind_name(ArgToken::Kind kind) {
    switch (kind) {
        case ArgToken::Kind::BOTH:     return "key=value";
        case ArgToken::Kind::KEY_ONLY: return "key";
        default:                       return "value";
    }
}

}  // anonymous namespace

ArgToken classify_arg(const std::string& token) {
    ArgToken result;

    auto eq = token.find('=');
    if (eq == std::string::npos) {
        if (auto key = as_key(token)) {
            result.kind = ArgToken::Kind::KEY_ONLY;
            result.key  = std::move(*key);
        } else {
            result.value = token;
        }
        return result;
    }

    std::string key_half   = token.substr(0, eq);
    std::string value_half = token.substr(eq + 1);

    auto key = as_key(key_half);
    if (!key) {
        result.value = std::move(value_half);
        return result;
    }

    result.key  = std::move(*key);
    result.kind = value_half.empty() ? ArgToken::Kind::KEY_ONLY : ArgToken::Kind::BOTH;
    result.value = std::move(value_half);
    return result;
}

std::vector<PropertyTree> parse_args(const std::vector<std::string>& args,
                                     std::optional<char> key_delimiter,
                                     std::optional<char> value_delimiter) {
    std::vector<ArgToken> tokens;
    tokens.reserve(args.size());
    for (const auto& arg : args) {
        if (arg.empty()) {
            continue;
        }
        tokens.push_back(classify_arg(arg));
        CONFIX_LOG_TRACE(category::CLI,
                         "Argument '" << arg << "' read as " << token_kind_name(tokens.back().kind));
    }

    ArgsParser parser(std::move(tokens), key_delimiter, value_delimiter);
    return PropertyTree::unwrap_singleton_lists(
        PropertyTree::drop_empty(PropertyTree::merge_all(parser.parse())));
}

ConfigSource from_args(const std::vector<std::string>& args, std::optional<char> key_delimiter,
                       std::optional<char> value_delimiter) {
    return ConfigSource::from_property_trees(parse_args(args, key_delimiter, value_delimiter),
                                             COMMAND_LINE_SOURCE, LeafForSequence::VALID);
}

}  // namespace confix::core::config
