#pragma once

/**
 * @file property_type.hpp
 * @brief String conversions for scalar configuration values
 *
 * Each supported scalar type has a PropertyType<T> specialization providing
 * a display name, parse() and render(). render() output always parses back
 * to the same value.
 */

#include <confix/common/error.hpp>
#include <confix/common/platform.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace confix::core::config {

/// Types without a specialization have no string conversion
template<typename T>
struct PropertyType {};

template<>
struct CONFIX_API PropertyType<std::string> {
    static constexpr std::string_view name = "string";
    static common::Result<std::string> parse(const std::string& raw);
    static std::string render(const std::string& value);
};

/// "true" / "false", case-insensitive
template<>
struct CONFIX_API PropertyType<bool> {
    static constexpr std::string_view name = "boolean";
    static common::Result<bool> parse(const std::string& raw);
    static std::string render(bool value);
};

template<>
struct CONFIX_API PropertyType<int32_t> {
    static constexpr std::string_view name = "int32";
    static common::Result<int32_t> parse(const std::string& raw);
    static std::string render(int32_t value);
};

template<>
struct CONFIX_API PropertyType<int64_t> {
    static constexpr std::string_view name = "int64";
    static common::Result<int64_t> parse(const std::string& raw);
    static std::string render(int64_t value);
};

template<>
struct CONFIX_API PropertyType<uint32_t> {
    static constexpr std::string_view name = "uint32";
    static common::Result<uint32_t> parse(const std::string& raw);
    static std::string render(uint32_t value);
};

template<>
struct CONFIX_API PropertyType<uint64_t> {
    static constexpr std::string_view name = "uint64";
    static common::Result<uint64_t> parse(const std::string& raw);
    static std::string render(uint64_t value);
};

template<>
struct CONFIX_API PropertyType<float> {
    static constexpr std::string_view name = "float";
    static common::Result<float> parse(const std::string& raw);
    static std::string render(float value);
};

template<>
struct CONFIX_API PropertyType<double> {
    static constexpr std::string_view name = "double";
    static common::Result<double> parse(const std::string& raw);
    static std::string render(double value);
};

/// Integer with an optional unit: ms (default), s, m or h
template<>
struct CONFIX_API PropertyType<std::chrono::milliseconds> {
    static constexpr std::string_view name = "duration";
    static common::Result<std::chrono::milliseconds> parse(const std::string& raw);
    static std::string render(std::chrono::milliseconds value);
};

// ============================================================================
// TYPE-ERASED VIEW
// ============================================================================

/**
 * @brief PropertyType<T> with the value type erased, as stored in descriptors
 */
struct PropertyTypeInfo {
    std::string name;
    std::function<common::Result<std::any>(const std::string&)> parse;
    std::function<std::string(const std::any&)> render;
};

template<typename T>
PropertyTypeInfo make_type_info() {
    PropertyTypeInfo info;
    info.name  = std::string(PropertyType<T>::name);
    info.parse = [](const std::string& raw) -> common::Result<std::any> {
        auto parsed = PropertyType<T>::parse(raw);
        if (parsed.is_error()) {
            return parsed.error();
        }
        return std::any(std::move(parsed).value());
    };
    info.render = [](const std::any& value) {
        return PropertyType<T>::render(std::any_cast<const T&>(value));
    };
    return info;
}

}  // namespace confix::core::config
