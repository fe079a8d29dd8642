/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * Functions live in the `residency::debug` namespace. They use `fmt` for compile-time
 * format string checks and `std::source_location` for automatic location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "residency_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", residency::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace residency::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX systems it uses `backtrace`/`dladdr` and demangles C++ symbols; on Windows it
 * prints raw frame addresses. Errors during capture are reported to `stderr`.
 */
RESIDENCY_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * Reserved for broken internal invariants. Formats and prints the message with the
 * source location, prints the stack and calls `std::abort()`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] %s:%u -- FORMAT ERROR DURING PANIC: %s\n", loc.file_name(),
                     static_cast<unsigned>(loc.line()), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with a compile-time checked format string.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace residency::debug

#ifndef RSD_LOC_HERE_STR
#define RSD_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `residency::debug::panic` with the current source location.
 */
#ifndef RSD_PANIC
#define RSD_PANIC(fmt, ...)                                                                        \
    ::residency::debug::panic(std::source_location::current(),                                     \
                              FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a `[DBG]` line when RESIDENCY_ENABLE_DEBUG_MESSAGES is defined; no-op otherwise.
 */
#ifndef RSD_DEBUG
#if defined(RESIDENCY_ENABLE_DEBUG_MESSAGES)
#define RSD_DEBUG(fmt, ...) ::residency::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define RSD_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
