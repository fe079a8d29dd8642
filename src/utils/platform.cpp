/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the OS-specific utilities of residency.
 *
 * Process and thread identifiers, the current executable's path, monotonic time,
 * the resident-set size of the process and the heap reclamation hint issued after a
 * component eviction. Preprocessor directives select the Windows, macOS, Linux or
 * generic POSIX implementation.
 */
#include "rsd_base.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#if defined(RESIDENCY_IS_POSIX)
#include <climits> // PATH_MAX
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(RESIDENCY_PLATFORM_LINUX) && defined(__GLIBC__)
#include <malloc.h> // malloc_trim
#endif

#if defined(RESIDENCY_PLATFORM_WIN64)
#include <psapi.h>
#endif

#if defined(RESIDENCY_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <mach/mach.h>   // task_info
#endif

#include <fmt/format.h>

namespace residency::platform
{

uint64_t get_pid() noexcept
{
#if defined(RESIDENCY_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging; uses `GetCurrentThreadId`, `pthread_threadid_np` or
 *          `syscall(SYS_gettid)` depending on the platform.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(RESIDENCY_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(RESIDENCY_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(RESIDENCY_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(RESIDENCY_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path.assign(buf.data(), len);
#elif defined(RESIDENCY_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(RESIDENCY_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                full_path = buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem operations can throw on invalid paths.
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

double resident_set_mb() noexcept
{
    constexpr double kBytesPerMb = 1024.0 * 1024.0;
#if defined(RESIDENCY_PLATFORM_LINUX)
    // statm: size resident shared text lib data dt (in pages)
    std::ifstream statm("/proc/self/statm");
    unsigned long long total_pages = 0;
    unsigned long long resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages))
    {
        return -1.0;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0)
    {
        return -1.0;
    }
    return static_cast<double>(resident_pages) * static_cast<double>(page_size) / kBytesPerMb;
#elif defined(RESIDENCY_PLATFORM_WIN64)
    PROCESS_MEMORY_COUNTERS pmc{};
    if (!GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc)))
    {
        return -1.0;
    }
    return static_cast<double>(pmc.WorkingSetSize) / kBytesPerMb;
#elif defined(RESIDENCY_PLATFORM_APPLE)
    mach_task_basic_info info{};
    mach_msg_type_number_t count = MACH_TASK_BASIC_INFO_COUNT;
    if (task_info(mach_task_self(), MACH_TASK_BASIC_INFO, reinterpret_cast<task_info_t>(&info),
                  &count) != KERN_SUCCESS)
    {
        return -1.0;
    }
    return static_cast<double>(info.resident_size) / kBytesPerMb;
#else
    return -1.0;
#endif
}

bool release_free_memory() noexcept
{
#if defined(RESIDENCY_PLATFORM_LINUX) && defined(__GLIBC__)
    return ::malloc_trim(0) != 0;
#elif defined(RESIDENCY_PLATFORM_WIN64)
    return HeapCompact(GetProcessHeap(), 0) != 0;
#else
    return false;
#endif
}

} // namespace residency::platform
