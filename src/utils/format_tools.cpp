// format_tools.cpp
#include "rsd_base.hpp"

#include <fmt/chrono.h>

namespace residency::format_tools
{

// Local time with microsecond resolution. The fractional part is computed and appended
// manually so the output does not depend on which chrono subsecond styles fmt supports.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(tt));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string human_duration(std::chrono::nanoseconds elapsed)
{
    using namespace std::chrono;
    if (elapsed < nanoseconds::zero())
        elapsed = nanoseconds::zero();

    if (elapsed < seconds(1))
    {
        return fmt::format("{}ms", duration_cast<milliseconds>(elapsed).count());
    }
    if (elapsed < minutes(1))
    {
        return fmt::format("{:.1f}s", duration<double>(elapsed).count());
    }
    const auto mins = duration_cast<minutes>(elapsed);
    const auto secs = duration_cast<seconds>(elapsed - mins);
    if (mins < hours(1))
    {
        return fmt::format("{}m{:02d}s", mins.count(), secs.count());
    }
    const auto hrs = duration_cast<hours>(elapsed);
    return fmt::format("{}h{:02d}m", hrs.count(), (mins - hrs).count());
}

} // namespace residency::format_tools
