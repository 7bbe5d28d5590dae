#pragma once

/**
 * @file platform.hpp
 * @brief Centralized platform detection and OS abstraction
 *
 * This header provides:
 * - Compile-time platform and compiler detection
 * - Feature detection for the language features linepipe relies on
 * - Branch hints and attribute helpers
 * - Runtime environment queries
 */

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define LINEPIPE_COMPILER_CLANG 1
    #define LINEPIPE_COMPILER_NAME "Clang"
#elif defined(__GNUC__) || defined(__GNUG__)
    #define LINEPIPE_COMPILER_GCC 1
    #define LINEPIPE_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define LINEPIPE_COMPILER_MSVC 1
    #define LINEPIPE_COMPILER_NAME "MSVC"
#else
    #define LINEPIPE_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// OPERATING SYSTEM DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define LINEPIPE_OS_WINDOWS 1
    #define LINEPIPE_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define LINEPIPE_OS_MACOS 1
    #define LINEPIPE_OS_NAME "macOS"
#elif defined(__linux__)
    #define LINEPIPE_OS_LINUX 1
    #define LINEPIPE_OS_NAME "Linux"
#elif defined(__FreeBSD__)
    #define LINEPIPE_OS_FREEBSD 1
    #define LINEPIPE_OS_NAME "FreeBSD"
#elif defined(__unix__)
    #define LINEPIPE_OS_UNIX 1
    #define LINEPIPE_OS_NAME "Unix"
#else
    #define LINEPIPE_OS_NAME "Unknown"
#endif

#if defined(LINEPIPE_OS_LINUX) || defined(LINEPIPE_OS_MACOS) || defined(LINEPIPE_OS_FREEBSD) || \
    defined(LINEPIPE_OS_UNIX)
    #define LINEPIPE_OS_POSIX 1
#endif

// ============================================================================
// BUILD TYPE DETECTION
// ============================================================================

#if defined(NDEBUG) || defined(LINEPIPE_RELEASE)
    #define LINEPIPE_BUILD_TYPE "Release"
#else
    #define LINEPIPE_BUILD_TYPE "Debug"
#endif

// ============================================================================
// FEATURE DETECTION
// ============================================================================

#if __cplusplus >= 202002L
    #define LINEPIPE_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define LINEPIPE_CPP_VERSION 17
#else
    #define LINEPIPE_CPP_VERSION 0
#endif

// Source location (C++20)
#if defined(__cpp_lib_source_location) || \
    (LINEPIPE_CPP_VERSION >= 20 && !defined(LINEPIPE_COMPILER_MSVC))
    #define LINEPIPE_HAS_SOURCE_LOCATION 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES
// ============================================================================

// Branch prediction hint
#if defined(LINEPIPE_COMPILER_GCC) || defined(LINEPIPE_COMPILER_CLANG)
    #define LINEPIPE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define LINEPIPE_UNLIKELY(x) (x)
#endif

// Export/Import for shared libraries
#if defined(LINEPIPE_OS_WINDOWS)
    #if defined(LINEPIPE_BUILDING_SHARED)
        #define LINEPIPE_API __declspec(dllexport)
    #elif defined(LINEPIPE_USING_SHARED)
        #define LINEPIPE_API __declspec(dllimport)
    #else
        #define LINEPIPE_API
    #endif
#elif defined(LINEPIPE_COMPILER_GCC) || defined(LINEPIPE_COMPILER_CLANG)
    #if defined(LINEPIPE_BUILDING_SHARED)
        #define LINEPIPE_API __attribute__((visibility("default")))
    #else
        #define LINEPIPE_API
    #endif
#else
    #define LINEPIPE_API
#endif

namespace linepipe::common::platform {

// ============================================================================
// Runtime Platform Information
// ============================================================================

/**
 * @brief Platform identification structure
 */
struct PlatformInfo {
    std::string_view os_name;
    std::string_view compiler_name;
    std::string_view build_type;
    uint32_t cpp_version;
};

/**
 * @brief Get compile-time platform information
 */
constexpr PlatformInfo get_platform_info() noexcept {
    return PlatformInfo{.os_name       = LINEPIPE_OS_NAME,
                        .compiler_name = LINEPIPE_COMPILER_NAME,
                        .build_type    = LINEPIPE_BUILD_TYPE,
                        .cpp_version   = LINEPIPE_CPP_VERSION};
}

/**
 * @brief Get current thread ID (OS-specific)
 */
LINEPIPE_API uint64_t get_thread_id() noexcept;

/**
 * @brief Read an environment variable, empty string if unset
 */
LINEPIPE_API std::string get_env(std::string_view name);

/**
 * @brief Check whether a C stream is attached to a terminal
 */
LINEPIPE_API bool is_terminal(std::FILE* stream) noexcept;

}  // namespace linepipe::common::platform
