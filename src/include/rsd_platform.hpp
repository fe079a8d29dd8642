#pragma once
/**
 * @file rsd_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (RESIDENCY_PLATFORM_LINUX, RESIDENCY_IS_POSIX, etc.) should
 * include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define RESIDENCY_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define RESIDENCY_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define RESIDENCY_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define RESIDENCY_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define RESIDENCY_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define RESIDENCY_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define RESIDENCY_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define RESIDENCY_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define RESIDENCY_PLATFORM_LINUX 1
#else
#define RESIDENCY_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(RESIDENCY_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(RESIDENCY_PLATFORM_WIN64)
#define RESIDENCY_IS_WINDOWS 1
#elif defined(RESIDENCY_PLATFORM_APPLE) || defined(RESIDENCY_PLATFORM_FREEBSD) ||                  \
    defined(RESIDENCY_PLATFORM_LINUX)
#define RESIDENCY_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// The code base uses std::source_location, concepts and std::atomic<std::shared_ptr>.
// For MSVC use _MSVC_LANG (MSVC sets __cplusplus only when /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "residency_utils_export.h"

namespace residency::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
RESIDENCY_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
RESIDENCY_UTILS_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The name of the executable, or "unknown" on failure.
 */
RESIDENCY_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
RESIDENCY_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns, or 0 if start_ns lies in the future.
 */
RESIDENCY_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

/**
 * @brief Resident set size of the current process in mebibytes.
 * @details Reads `/proc/self/statm` on Linux, `GetProcessMemoryInfo` on Windows.
 * @return The RSS in MiB, or a negative value if the platform cannot report it.
 */
RESIDENCY_UTILS_EXPORT double resident_set_mb() noexcept;

/**
 * @brief Asks the C runtime to hand freed heap pages back to the operating system.
 * @details Called after a component has been evicted. Uses `malloc_trim(0)` with glibc
 *          and `HeapCompact` on Windows; a no-op elsewhere.
 * @return `true` if the runtime reported that memory was released.
 */
RESIDENCY_UTILS_EXPORT bool release_free_memory() noexcept;

} // namespace residency::platform
