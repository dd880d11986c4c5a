#include "log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <mutex>
#include <thread>

static std::mutex              g_log_mutex;
static thread_local std::string t_thread_name;   // dies with its thread

static LogLevel level_from_env()
{
    LogLevel lvl = LogLevel::Info;
    const char* env = std::getenv("SWATCH_LOG_LEVEL");
    if (env) log_parse_level(env, lvl);
    return lvl;
}

static std::atomic<uint8_t> g_level{static_cast<uint8_t>(level_from_env())};

void log_set_level(LogLevel level)
{
    g_level.store(static_cast<uint8_t>(level));
}

LogLevel log_level()
{
    return static_cast<LogLevel>(g_level.load());
}

bool log_parse_level(const char* text, LogLevel& out)
{
    if (!text) return false;
    std::string s(text);
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s == "error")                   { out = LogLevel::Error; return true; }
    if (s == "warn" || s == "warning")  { out = LogLevel::Warn;  return true; }
    if (s == "info")                    { out = LogLevel::Info;  return true; }
    if (s == "debug")                   { out = LogLevel::Debug; return true; }
    if (s == "trace")                   { out = LogLevel::Trace; return true; }
    return false;
}

static const char* level_tag(LogLevel level)
{
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "?????";
}

void log_write(LogLevel level, const char* fmt, ...)
{
    if (static_cast<uint8_t>(level) > g_level.load()) return;

    char msg[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    const auto now = std::chrono::system_clock::now();
    const std::time_t tt = std::chrono::system_clock::to_time_t(now);
    const long ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000);
    std::tm tm_buf{};
    localtime_r(&tt, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!t_thread_name.empty()) {
        std::fprintf(stderr, "[%s.%03ld] [%s] [%s] %s\n",
                     stamp, ms, level_tag(level), t_thread_name.c_str(), msg);
    } else {
        std::fprintf(stderr, "[%s.%03ld] [%s] [T%zx] %s\n",
                     stamp, ms, level_tag(level),
                     std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFF,
                     msg);
    }
}

void set_thread_name(const std::string& name)
{
    t_thread_name = name;
}

const std::string& thread_name()
{
    return t_thread_name;
}
