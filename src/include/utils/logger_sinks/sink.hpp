#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "residency_utils_export.h"

namespace residency::utils
{

// A single log event as seen by a sink.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int keeps this header independent of logger.hpp's Level enum.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination. Sinks are only ever touched by the
// logger's worker thread, or by write_sync() under the logger's sink mutex.
class RESIDENCY_UTILS_EXPORT Sink
{
  public:
    enum WRITE_MODE
    {
        ASYNC_WRITE,
        SYNC_WRITE
    };

    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg, Sink::WRITE_MODE mode) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl) noexcept;
    static std::string format_logmsg(const LogMessage &msg, Sink::WRITE_MODE mode);
};

} // namespace residency::utils
