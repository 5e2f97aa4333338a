/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous logger.
 ******************************************************************************/

#include "sfh_base.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>

#include <unistd.h>

namespace sfhost::utils
{

struct LoggerImpl
{
    std::mutex mutex;
    std::unique_ptr<Sink> sink{std::make_unique<ConsoleSink>()};
    std::atomic<int> level{static_cast<int>(Logger::Level::L_INFO)};
    std::function<void(const std::string &)> write_error_callback;
};

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Function-local static: constructed on first use, destroyed at exit.
    static Logger logger;
    return logger;
}

void Logger::set_console()
{
    set_sink(std::make_unique<ConsoleSink>());
}

void Logger::set_logfile(const std::string &utf8_path)
{
    // Open before taking the lock so a failure leaves the current sink untouched.
    auto sink = std::make_unique<FileSink>(utf8_path);
    set_sink(std::move(sink));
}

void Logger::set_sink(std::unique_ptr<Sink> sink)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->sink)
    {
        pImpl->sink->flush();
    }
    pImpl->sink = std::move(sink);
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->sink)
    {
        pImpl->sink->flush();
    }
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return static_cast<Level>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->write_error_callback = std::move(cb);
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= pImpl->level.load(std::memory_order_relaxed);
}

void Logger::write_log(Level lvl, std::string &&body) noexcept
{
    LogMessage msg{std::chrono::system_clock::now(), static_cast<uint64_t>(::getpid()),
                   static_cast<int>(lvl), std::move(body)};

    std::function<void(const std::string &)> on_error;
    std::string error_text;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->sink)
            return;
        try
        {
            pImpl->sink->write(msg);
        }
        catch (const std::exception &e)
        {
            on_error = pImpl->write_error_callback;
            error_text = fmt::format("Logger: write to '{}' failed: {}",
                                     pImpl->sink->description(), e.what());
        }
    }

    // Invoked outside the lock so the callback may log through another sink.
    if (on_error)
    {
        try
        {
            on_error(error_text);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "Logger: write-error callback threw: {}\n", e.what());
        }
    }
}

} // namespace sfhost::utils
