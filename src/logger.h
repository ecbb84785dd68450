#pragma once

#include <cstdarg>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel
{
    Error,
    Warn,
    Info,
    Verbose,
    Debug
};

class Logger
{
public:
    static Logger &instance();

    void setVerbose(bool enabled);
    void setDebug(bool enabled);
    void setQuiet(bool enabled);

    // While a progress bar owns the current terminal line, log lines clear it first
    void setProgressLineActive(bool active);

    // Last lines logged at any level, kept even when filtered from stderr
    std::vector<std::string> recentLines() const;

    bool verboseEnabled() const;
    bool debugEnabled() const;

    void log(LogLevel level, const char *fmt, ...) noexcept;
    void logv(LogLevel level, const char *fmt, va_list args) noexcept;

private:
    Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    bool shouldLog(LogLevel level) const;
    const char *prefix(LogLevel level) const;

    mutable std::mutex m_mutex;
    bool m_verbose = false;
    bool m_debug = false;
    bool m_quiet = false;
    bool m_progressLineActive = false;
    std::deque<std::string> m_tail;
};

#define LOG_ERROR(...) Logger::instance().log(LogLevel::Error, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log(LogLevel::Warn, __VA_ARGS__)
#define LOG_INFO(...) Logger::instance().log(LogLevel::Info, __VA_ARGS__)
#define LOG_VERBOSE(...) Logger::instance().log(LogLevel::Verbose, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log(LogLevel::Debug, __VA_ARGS__)
