// =============================================================================
// AdbFleet - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: FLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>
#include <atomic>
#include <cctype>

namespace fleet::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;
inline std::atomic<unsigned long> g_next_thread_no{1};

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "debug", "INFO", "warn" ... -> Level. Unknown names map to fallback.
inline Level parseLevel(const std::string& name, Level fallback = Level::Info) {
    std::string n;
    for (char c : name) n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "trace") return Level::Trace;
    if (n == "debug") return Level::Debug;
    if (n == "info")  return Level::Info;
    if (n == "warn" || n == "warning") return Level::Warn;
    if (n == "error") return Level::Error;
    if (n == "fatal") return Level::Fatal;
    return fallback;
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(std::memory_order_relaxed); }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite: one log per process run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

// Small per-process thread number, stable for the thread's lifetime
inline unsigned long threadNo() {
    thread_local unsigned long no = g_next_thread_no.fetch_add(1);
    return no;
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    unsigned long tid = threadNo();
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s [%s] [%s] (T%lu) %s\n", time_str, levelStr(level), tag, tid, msg);
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%lu) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace fleet::log

#define FLOG_TRACE(tag, fmt, ...) fleet::log::write(fleet::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define FLOG_DEBUG(tag, fmt, ...) fleet::log::write(fleet::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define FLOG_INFO(tag, fmt, ...)  fleet::log::write(fleet::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define FLOG_WARN(tag, fmt, ...)  fleet::log::write(fleet::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define FLOG_ERROR(tag, fmt, ...) fleet::log::write(fleet::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define FLOG_FATAL(tag, fmt, ...) fleet::log::write(fleet::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
