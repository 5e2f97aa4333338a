/*******************************************************************************
 * @file logger.hpp
 * @brief Thread-safe, synchronous logging utility with pluggable sinks.
 *
 * The safeframe host runs on the page's single event thread, so log records are
 * formatted and written on the calling thread. A mutex still serializes sink
 * access so that the embedder may log from helper threads.
 *
 * **Sink Abstraction**: A `Sink` base class defines a simple interface for
 * writing and flushing. `ConsoleSink` (stderr, the default) and `FileSink`
 * encapsulate the details of each destination.
 *
 * **Robustness**: formatting errors are logged in place of the message, and I/O
 * errors are reported through a callback instead of propagating into message
 * handlers.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("slot {} connected on channel {}", slot_id, channel);
 *
 * Logger& logger = Logger::instance();
 * logger.set_logfile("/var/log/sfhost.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "sfhost_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

namespace sfhost::utils
{

class Sink;
struct LoggerImpl;

class SFHOST_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks / Configuration ---

    /** @brief Switch logging to the console (stderr). */
    void set_console();

    /**
     * @brief Switch logging to a file, appending to it.
     * @throws std::runtime_error if the file cannot be opened; the previous sink stays active.
     */
    void set_logfile(const std::string &utf8_path);

    /** @brief Install an arbitrary sink. A null sink discards all records. */
    void set_sink(std::unique_ptr<Sink> sink);

    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback to be invoked when a sink fails to write.
     * @param cb A function taking the error description.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// Parses "trace", "debug", "info", "warn"/"warning", "error" or "system".
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void write_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            write_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            write_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace sfhost::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::sfhost::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::sfhost::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::sfhost::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::sfhost::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::sfhost::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::sfhost::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
