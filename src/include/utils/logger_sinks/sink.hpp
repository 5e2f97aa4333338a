#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "sfhost_export.h"

namespace sfhost::utils
{

// Represents a single log message event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    int level; // Use int to avoid including all of logger.hpp for the enum.
    std::string body;
};

// Abstract interface for a log message destination.
class SFHOST_EXPORT Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace sfhost::utils
