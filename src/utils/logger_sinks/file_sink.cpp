#include "rsd_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#if defined(RESIDENCY_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace residency::utils
{

FileSink::FileSink(const std::filesystem::path &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
    std::error_code ec;
    if (m_path.has_parent_path())
    {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("Failed to create directory for log file '{}': {}",
                                                 m_path.string(), ec.message()));
        }
    }

#if defined(RESIDENCY_PLATFORM_WIN64)
    (void)m_use_flock;
    m_file_handle = CreateFileW(m_path.wstring().c_str(), FILE_APPEND_DATA,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (m_file_handle == INVALID_HANDLE_VALUE)
    {
        m_file_handle = nullptr;
        throw std::runtime_error(fmt::format("Failed to open log file '{}': error {}",
                                             m_path.string(), GetLastError()));
    }
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}': {}", m_path.string(),
                                             std::generic_category().message(errno)));
    }
#endif
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
#if defined(RESIDENCY_PLATFORM_WIN64)
    if (m_file_handle != nullptr)
    {
        CloseHandle(m_file_handle);
        m_file_handle = nullptr;
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const std::string line = format_logmsg(msg, mode);
#if defined(RESIDENCY_PLATFORM_WIN64)
    DWORD bytes_written = 0;
    if (!WriteFile(m_file_handle, line.data(), static_cast<DWORD>(line.size()), &bytes_written,
                   nullptr) ||
        bytes_written != line.size())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    if (m_use_flock)
    {
        // Advisory only; serializes writers that cooperate.
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, line.data(), line.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != line.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#if defined(RESIDENCY_PLATFORM_WIN64)
    FlushFileBuffers(m_file_handle);
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace residency::utils
