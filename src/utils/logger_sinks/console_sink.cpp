#include "rsd_base.hpp"
#include "utils/logger_sinks/console_sink.hpp"

#include <cstdio>

namespace residency::utils
{

void ConsoleSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    fmt::print(stderr, "{}", format_logmsg(msg, mode));
}

void ConsoleSink::flush()
{
    std::fflush(stderr);
}

} // namespace residency::utils
