#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace voxmesh
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // daemon status lines, always printed
};

// read by the send worker, the transport rx thread and the sweep thread
inline std::atomic<Level> &global_level()
{
    static std::atomic<Level> lv{Level::Info};
    return lv;
}

// one line at a time on stderr
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void set_log_level(Level lv)
{
    global_level().store(lv);
}

// "debug", "INFO", "warn"/"warning", "err"/"error"; anything else means Info
inline void set_log_level_by_name(const char *name)
{
    std::string level = name ? std::string(name) : std::string();
    for (auto &c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (level == "debug")
        set_log_level(Level::Debug);
    else if (level == "warn" || level == "warning")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);
}

// VOXMESH_LOG_LEVEL, when set, overrides the default threshold
inline void init_log_from_env()
{
    if (const char *e = std::getenv("VOXMESH_LOG_LEVEL"); e && *e)
        set_log_level_by_name(e);
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
    if ((int)lv < (int)global_level().load())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // format first so the lock only covers the write
    char    line[1024];
    va_list ap;
    va_start(ap, fmt);
    int len = std::vsnprintf(line, sizeof(line), fmt, ap);
    va_end(ap);
    if (len < 0)
        len = 0;
    const bool cut = static_cast<size_t>(len) >= sizeof(line);
    size_t     m   = cut ? sizeof(line) - 1 : static_cast<size_t>(len);
    const bool nl  = m > 0 && line[m - 1] == '\n';

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: %s%s%s", ts, level_name(lv), func ? func : "?", line,
                 cut ? "..." : "", nl ? "" : "\n");
}

#define LOG_DEBUG(...) ::voxmesh::logf(::voxmesh::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::voxmesh::logf(::voxmesh::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::voxmesh::logf(::voxmesh::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::voxmesh::logf(::voxmesh::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::voxmesh::logf(::voxmesh::Level::System, __func__, __VA_ARGS__)

}  // namespace voxmesh
