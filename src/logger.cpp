#include "logger.h"

#include <cstdarg>
#include <cstdio>
#include <new>
#include <string>

static constexpr size_t kTailLines = 50;

Logger &Logger::instance()
{
    static Logger s_instance;
    return s_instance;
}

void Logger::setVerbose(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_verbose = enabled;
}

void Logger::setDebug(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_debug = enabled;
}

void Logger::setQuiet(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_quiet = enabled;
}

void Logger::setProgressLineActive(bool active)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progressLineActive = active;
}

std::vector<std::string> Logger::recentLines() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_tail.begin(), m_tail.end());
}

bool Logger::verboseEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_verbose;
}

bool Logger::debugEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_debug;
}

bool Logger::shouldLog(LogLevel level) const
{
    // Quiet mode keeps errors only
    if (m_quiet)
        return level == LogLevel::Error;

    switch (level)
    {
    case LogLevel::Error:
    case LogLevel::Warn:
    case LogLevel::Info:
        return true;
    case LogLevel::Verbose:
        return m_verbose;
    case LogLevel::Debug:
        return m_debug;
    default:
        return false;
    }
}

const char *Logger::prefix(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
        return "[ERROR] ";
    case LogLevel::Warn:
        return "[WARN] ";
    case LogLevel::Info:
        return "[INFO] ";
    case LogLevel::Verbose:
        return "[VERBOSE] ";
    case LogLevel::Debug:
        return "[DEBUG] ";
    default:
        return "";
    }
}

void Logger::log(LogLevel level, const char *fmt, ...) noexcept
{
    va_list args;
    va_start(args, fmt);
    logv(level, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char *fmt, va_list args) noexcept
{
    if (!fmt)
        return;

    char line[1024];
    std::vsnprintf(line, sizeof(line), fmt, args);

    std::lock_guard<std::mutex> lock(m_mutex);
    try
    {
        if (m_tail.size() == kTailLines)
            m_tail.pop_front();
        m_tail.emplace_back(std::string(prefix(level)) + line);
    }
    catch (const std::bad_alloc &)
    {
        // Out of memory: drop the tail, the line still goes to stderr
        m_tail.clear();
    }

    if (!shouldLog(level))
        return;

    if (m_progressLineActive)
        std::fputs("\r\033[2K", stderr);

    std::fputs(prefix(level), stderr);
    std::fputs(line, stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}
