#include <confix/core/config/property_type.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

namespace confix::core::config {

using common::ErrorCode;
using common::Result;

namespace {

std::string expected(std::string_view type_name) {
    return "expected " + std::string(type_name);
}

template<typename T>
Result<T> parse_number(const std::string& raw, std::string_view type_name) {
    T value{};
    const char* first = raw.data();
    const char* last  = raw.data() + raw.size();
    auto [ptr, ec]    = std::from_chars(first, last, value);

    if (ec == std::errc::result_out_of_range) {
        return Result<T>(ErrorCode::VALUE_OUT_OF_RANGE,
                         "value out of range for " + std::string(type_name));
    }
    if (ec != std::errc() || ptr != last || raw.empty()) {
        return Result<T>(ErrorCode::CONFIG_TYPE_MISMATCH, expected(type_name));
    }
    return value;
}

template<typename T>
std::string render_number(T value) {
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, ptr);
}

}  // anonymous namespace

// ============================================================================
// Text
// ============================================================================

Result<std::string> PropertyType<std::string>::parse(const std::string& raw) {
    return raw;
}

std::string PropertyType<std::string>::render(const std::string& value) {
    return value;
}

Result<bool> PropertyType<bool>::parse(const std::string& raw) {
    std::string lower = raw;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    return Result<bool>(ErrorCode::CONFIG_TYPE_MISMATCH, expected(name));
}

std::string PropertyType<bool>::render(bool value) {
    return value ? "true" : "false";
}

// ============================================================================
// Numbers
// ============================================================================

Result<int32_t> PropertyType<int32_t>::parse(const std::string& raw) {
    return parse_number<int32_t>(raw, name);
}

std::string PropertyType<int32_t>::render(int32_t value) {
    return render_number(value);
}

Result<int64_t> PropertyType<int64_t>::parse(const std::string& raw) {
    return parse_number<int64_t>(raw, name);
}

std::string PropertyType<int64_t>::render(int64_t value) {
    return render_number(value);
}

Result<uint32_t> PropertyType<uint32_t>::parse(const std::string& raw) {
    return parse_number<uint32_t>(raw, name);
}

std::string PropertyType<uint32_t>::render(uint32_t value) {
    return render_number(value);
}

Result<uint64_t> PropertyType<uint64_t>::parse(const std::string& raw) {
    return parse_number<uint64_t>(raw, name);
}

std::string PropertyType<uint64_t>::render(uint64_t value) {
    return render_number(value);
}

Result<float> PropertyType<float>::parse(const std::string& raw) {
    return parse_number<float>(raw, name);
}

std::string PropertyType<float>::render(float value) {
    return render_number(value);
}

Result<double> PropertyType<double>::parse(const std::string& raw) {
    return parse_number<double>(raw, name);
}

std::string PropertyType<double>::render(double value) {
    return render_number(value);
}

// ============================================================================
// Durations
// ============================================================================

Result<std::chrono::milliseconds> PropertyType<std::chrono::milliseconds>::parse(
    const std::string& raw) {
    using std::chrono::milliseconds;

    // Optional sign, digits, optional unit
    const std::size_t sign = (!raw.empty() && raw.front() == '-') ? 1 : 0;
    auto digits_end        = raw.find_first_not_of("0123456789", sign);
    std::string number     = raw.substr(0, digits_end);
    std::string unit       = digits_end == std::string::npos ? "" : raw.substr(digits_end);

    auto count = parse_number<int64_t>(number, name);
    if (count.is_error()) {
        return count.error();
    }

    int64_t factor = 0;
    if (unit.empty() || unit == "ms") {
        factor = 1;
    } else if (unit == "s") {
        factor = 1000;
    } else if (unit == "m") {
        factor = 60 * 1000;
    } else if (unit == "h") {
        factor = 60 * 60 * 1000;
    } else {
        return Result<milliseconds>(ErrorCode::CONFIG_TYPE_MISMATCH,
                                    expected(name) + " (unknown unit '" + unit + "')");
    }

    if (count.value() > std::numeric_limits<int64_t>::max() / factor ||
        count.value() < std::numeric_limits<int64_t>::min() / factor) {
        return Result<milliseconds>(ErrorCode::VALUE_OUT_OF_RANGE,
                                    "value out of range for " + std::string(name));
    }
    return milliseconds(count.value() * factor);
}

std::string PropertyType<std::chrono::milliseconds>::render(std::chrono::milliseconds value) {
    return render_number(static_cast<int64_t>(value.count())) + "ms";
}

}  // namespace confix::core::config
