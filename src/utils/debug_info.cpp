/**
 * @file debug_info.cpp
 * @brief Stack trace printing for residency::debug::print_stack_trace()
 *
 * POSIX builds capture frames with `backtrace`, resolve them with `dladdr` and demangle
 * C++ names with `abi::__cxa_demangle`. Other platforms print raw frame addresses.
 */
#include "rsd_base.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>

#if defined(RESIDENCY_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

namespace residency::debug
{

#if defined(RESIDENCY_IS_POSIX)
namespace
{

std::string demangle(const char *symbol)
{
    if (symbol == nullptr)
    {
        return "??";
    }
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled)
    {
        return demangled.get();
    }
    return symbol;
}

} // namespace

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 64;
    std::array<void *, kMaxFrames> frames{};
    const int count = ::backtrace(frames.data(), kMaxFrames);
    if (count <= 0)
    {
        std::fprintf(stderr, "  [stack trace unavailable]\n");
        return;
    }

    try
    {
        fmt::print(stderr, "Stack Trace (most recent call first):\n");
        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < count; ++i)
        {
            Dl_info info{};
            if (::dladdr(frames[static_cast<size_t>(i)], &info) != 0)
            {
                const auto *base = static_cast<const char *>(info.dli_fbase);
                const auto *addr = static_cast<const char *>(frames[static_cast<size_t>(i)]);
                fmt::print(stderr, "  #{:<2} {} + {:#x} [{}]\n", i - 1, demangle(info.dli_sname),
                           static_cast<std::uintptr_t>(addr - base),
                           format_tools::filename_only(info.dli_fname ? info.dli_fname : "?"));
            }
            else
            {
                fmt::print(stderr, "  #{:<2} {}\n", i - 1, frames[static_cast<size_t>(i)]);
            }
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "  [stack trace formatting failed: %s]\n", e.what());
    }
    std::fflush(stderr);
}

#else

void print_stack_trace() noexcept
{
    std::fprintf(stderr, "  [stack trace not supported on this platform]\n");
    std::fflush(stderr);
}

#endif

} // namespace residency::debug
