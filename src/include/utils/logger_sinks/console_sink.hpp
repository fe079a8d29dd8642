#pragma once

#include "utils/logger_sinks/sink.hpp"

namespace residency::utils
{

// Writes formatted log lines to stderr.
class RESIDENCY_UTILS_EXPORT ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override { return "Console"; }
};

} // namespace residency::utils
