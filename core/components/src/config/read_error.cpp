#include <confix/core/config/read_error.hpp>

#include <algorithm>
#include <sstream>

namespace confix::core::config {

using common::ErrorCode;

std::string_view kind_name(ReadError::Kind kind) noexcept {
    switch (kind) {
        case ReadError::Kind::MISSING_VALUE:    return "MissingValue";
        case ReadError::Kind::FORMAT_ERROR:     return "FormatError";
        case ReadError::Kind::CONVERSION_ERROR: return "ConversionError";
        case ReadError::Kind::SOURCE_ERROR:     return "SourceError";
        case ReadError::Kind::AND_ERRORS:       return "AndErrors";
        case ReadError::Kind::OR_ERRORS:        return "OrErrors";
        default:                                return "Unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

ReadError ReadError::missing_value(StepPath path) {
    return ReadError(Kind::MISSING_VALUE, std::move(path), "missing value");
}

ReadError ReadError::format_error(StepPath path, std::string message) {
    return ReadError(Kind::FORMAT_ERROR, std::move(path), std::move(message));
}

ReadError ReadError::conversion_error(StepPath path, std::string raw_value, std::string message) {
    ReadError error(Kind::CONVERSION_ERROR, std::move(path), std::move(message));
    error.raw_value_ = std::move(raw_value);
    return error;
}

ReadError ReadError::source_error(std::string message) {
    return ReadError(Kind::SOURCE_ERROR, {}, std::move(message));
}

ReadError ReadError::and_errors(std::vector<ReadError> errors) {
    std::vector<ReadError> flat;
    for (auto& e : errors) {
        if (e.kind_ == Kind::AND_ERRORS) {
            for (auto& child : e.children_) {
                flat.push_back(std::move(child));
            }
        } else {
            flat.push_back(std::move(e));
        }
    }

    ReadError error(Kind::AND_ERRORS, {}, std::to_string(flat.size()) + " errors");
    error.children_ = std::move(flat);
    return error;
}

ReadError ReadError::or_errors(std::vector<ReadError> errors) {
    ReadError error(Kind::OR_ERRORS, {},
                    "none of " + std::to_string(errors.size()) + " alternatives could be read");
    error.children_ = std::move(errors);
    return error;
}

// ============================================================================
// Classification
// ============================================================================

bool ReadError::is_missing_only() const noexcept {
    switch (kind_) {
        case Kind::MISSING_VALUE:
            return true;
        case Kind::AND_ERRORS:
        case Kind::OR_ERRORS:
            return !children_.empty() &&
                   std::all_of(children_.begin(), children_.end(),
                               [](const ReadError& e) { return e.is_missing_only(); });
        default:
            return false;
    }
}

bool ReadError::contains(Kind kind) const noexcept {
    if (kind_ == kind) {
        return true;
    }
    return std::any_of(children_.begin(), children_.end(),
                       [kind](const ReadError& e) { return e.contains(kind); });
}

std::size_t ReadError::leaf_count() const noexcept {
    if (kind_ != Kind::AND_ERRORS && kind_ != Kind::OR_ERRORS) {
        return 1;
    }
    std::size_t count = 0;
    for (const auto& child : children_) {
        count += child.leaf_count();
    }
    return count;
}

ErrorCode ReadError::code() const noexcept {
    switch (kind_) {
        case Kind::MISSING_VALUE:
            return ErrorCode::CONFIG_REQUIRED_MISSING;
        case Kind::CONVERSION_ERROR:
            return ErrorCode::CONFIG_TYPE_MISMATCH;
        case Kind::FORMAT_ERROR:
            return ErrorCode::CONFIG_INVALID_VALUE;
        case Kind::SOURCE_ERROR:
            return ErrorCode::CONFIG_INVALID;
        default:
            break;
    }

    for (const auto& child : children_) {
        if (!child.is_missing_only()) {
            return child.code();
        }
    }
    return ErrorCode::CONFIG_REQUIRED_MISSING;
}

// ============================================================================
// Display
// ============================================================================

std::string ReadError::to_string() const {
    std::ostringstream oss;

    if (kind_ == Kind::AND_ERRORS || kind_ == Kind::OR_ERRORS) {
        oss << (kind_ == Kind::AND_ERRORS ? "all of: [" : "one of: [");
        for (std::size_t i = 0; i < children_.size(); ++i) {
            oss << (i ? "; " : "") << children_[i].to_string();
        }
        oss << ']';
        return oss.str();
    }

    if (kind_ != Kind::SOURCE_ERROR) {
        oss << (path_.empty() ? "<root>" : path_string()) << ": ";
    }
    oss << message_;
    if (kind_ == Kind::CONVERSION_ERROR) {
        oss << " (value: '" << raw_value_ << "')";
    }
    return oss.str();
}

std::string ReadError::pretty_print() const {
    std::string out;
    pretty_print(out, 0);
    return out;
}

void ReadError::pretty_print(std::string& out, std::size_t depth) const {
    out.append(depth * 2, ' ');

    if (kind_ == Kind::AND_ERRORS || kind_ == Kind::OR_ERRORS) {
        out += kind_ == Kind::AND_ERRORS ? "all of:\n" : "one of:\n";
        for (const auto& child : children_) {
            child.pretty_print(out, depth + 1);
        }
        return;
    }

    out += to_string();
    out += '\n';
}

common::Error ReadError::to_error() const {
    common::Error error(code(), to_string());
    if (!path_.empty()) {
        error.with_context("path", path_string());
    }
    if (kind_ == Kind::CONVERSION_ERROR) {
        error.with_context("value", raw_value_);
    }
    return error;
}

}  // namespace confix::core::config
