#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace residency::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a file.
 *
 * The file is opened in append mode (created if missing, parent directories included).
 * With `use_flock` an advisory lock serializes writes from several processes sharing
 * one log file (POSIX only).
 */
class RESIDENCY_UTILS_EXPORT FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock = false;
#if defined(_WIN32)
    void *m_file_handle = nullptr; // HANDLE; void* avoids including <windows.h>
#else
    int m_fd = -1;
#endif
};

} // namespace residency::utils
