#pragma once

/**
 * @file platform.hpp
 * @brief Platform detection and OS environment access for confix
 *
 * This header provides:
 * - Compile-time compiler and OS detection
 * - Attribute and visibility macros
 * - Process environment queries used by the environment source
 */

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define CONFIX_COMPILER_CLANG 1
    #define CONFIX_COMPILER_NAME "Clang"
#elif defined(__GNUC__) || defined(__GNUG__)
    #define CONFIX_COMPILER_GCC 1
    #define CONFIX_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define CONFIX_COMPILER_MSVC 1
    #define CONFIX_COMPILER_NAME "MSVC"
#else
    #define CONFIX_COMPILER_UNKNOWN 1
    #define CONFIX_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// OPERATING SYSTEM DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define CONFIX_OS_WINDOWS 1
    #define CONFIX_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define CONFIX_OS_MACOS 1
    #define CONFIX_OS_NAME "macOS"
#elif defined(__linux__)
    #define CONFIX_OS_LINUX 1
    #define CONFIX_OS_NAME "Linux"
#elif defined(__FreeBSD__)
    #define CONFIX_OS_FREEBSD 1
    #define CONFIX_OS_NAME "FreeBSD"
#elif defined(__unix__)
    #define CONFIX_OS_UNIX 1
    #define CONFIX_OS_NAME "Unix"
#else
    #define CONFIX_OS_UNKNOWN 1
    #define CONFIX_OS_NAME "Unknown"
#endif

#if defined(CONFIX_OS_LINUX) || defined(CONFIX_OS_MACOS) || defined(CONFIX_OS_FREEBSD) || \
    defined(CONFIX_OS_UNIX)
    #define CONFIX_OS_POSIX 1
#endif

// ============================================================================
// FEATURE DETECTION
// ============================================================================

#if __cplusplus >= 202002L
    #define CONFIX_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define CONFIX_CPP_VERSION 17
#else
    #define CONFIX_CPP_VERSION 0
#endif

// Source location (C++20)
#if defined(__cpp_lib_source_location) || (CONFIX_CPP_VERSION >= 20 && !defined(CONFIX_COMPILER_MSVC))
    #define CONFIX_HAS_SOURCE_LOCATION 1
#endif

#if defined(NDEBUG) || defined(CONFIX_RELEASE)
    #define CONFIX_BUILD_RELEASE 1
#else
    #define CONFIX_BUILD_DEBUG 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES
// ============================================================================

// Branch prediction hints
#if defined(CONFIX_COMPILER_GCC) || defined(CONFIX_COMPILER_CLANG)
    #define CONFIX_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define CONFIX_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define CONFIX_LIKELY(x)   (x)
    #define CONFIX_UNLIKELY(x) (x)
#endif

// Export/Import for shared libraries
#if defined(CONFIX_OS_WINDOWS)
    #if defined(CONFIX_BUILDING_SHARED)
        #define CONFIX_API __declspec(dllexport)
    #elif defined(CONFIX_USING_SHARED)
        #define CONFIX_API __declspec(dllimport)
    #else
        #define CONFIX_API
    #endif
#elif defined(CONFIX_COMPILER_GCC) || defined(CONFIX_COMPILER_CLANG)
    #if defined(CONFIX_BUILDING_SHARED)
        #define CONFIX_API __attribute__((visibility("default")))
    #else
        #define CONFIX_API
    #endif
#else
    #define CONFIX_API
#endif

#define CONFIX_THREAD_LOCAL thread_local

namespace confix::common::platform {

// ============================================================================
// Runtime Environment Queries
// ============================================================================

/**
 * @brief Get current thread ID
 */
CONFIX_API uint64_t get_thread_id() noexcept;

/**
 * @brief Get environment variable value
 * @return Empty string if not found
 */
CONFIX_API std::string get_env(std::string_view name);

/**
 * @brief Set environment variable
 * @return true on success
 */
CONFIX_API bool set_env(std::string_view name, std::string_view value);

/**
 * @brief Remove environment variable
 * @return true on success (also when the variable was not set)
 */
CONFIX_API bool unset_env(std::string_view name);

/**
 * @brief Snapshot of the whole process environment
 *
 * Entries without a '=' separator are skipped.
 */
CONFIX_API std::map<std::string, std::string> get_environment();

} // namespace confix::common::platform
