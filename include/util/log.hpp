#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>
#include <string_view>

namespace blobshard
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always printed, used for command results on stderr
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Allow callers to pass string literals or other non-owning strings.
inline void set_log_level_by_name(const char *name)
{
    std::string level = std::string(name);
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // format the whole line first so lines from sharding workers don't interleave
    char line[1024];
    int  n = std::snprintf(line, sizeof(line), "%s %s %s: ", ts, level_name(lv),
                           func ? func : "?");
    if (n < 0)
        return;
    size_t used = static_cast<size_t>(n) < sizeof(line) ? static_cast<size_t>(n) : sizeof(line) - 1;

    va_list ap;
    va_start(ap, fmt);
    int m = std::vsnprintf(line + used, sizeof(line) - used, fmt, ap);
    va_end(ap);
    if (m > 0)
        used += static_cast<size_t>(m) < sizeof(line) - used ? static_cast<size_t>(m)
                                                              : sizeof(line) - used - 1;

    if (used == 0 || line[used - 1] != '\n')
    {
        if (used + 1 >= sizeof(line))
            used = sizeof(line) - 2;
        line[used++] = '\n';
        line[used]   = '\0';
    }
    std::fputs(line, stderr);
}

#define LOG_DEBUG(...) ::blobshard::logf(::blobshard::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::blobshard::logf(::blobshard::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::blobshard::logf(::blobshard::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::blobshard::logf(::blobshard::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::blobshard::logf(::blobshard::Level::System, __func__, __VA_ARGS__)

}  // namespace blobshard
