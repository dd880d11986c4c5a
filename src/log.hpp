#pragma once

#include <cstdint>
#include <string>

enum class LogLevel : uint8_t {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Trace = 4,
};

// Threshold starts from SWATCH_LOG_LEVEL (default: info).
void     log_set_level(LogLevel level);
LogLevel log_level();

// Accepts error|warn|warning|info|debug|trace, case-insensitive.
bool log_parse_level(const char* text, LogLevel& out);

// One line on stderr: [time] [LEVEL] [thread] message. Never throws.
void log_write(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

// Names the calling thread in subsequent log lines.
void set_thread_name(const std::string& name);

// Name set by set_thread_name() on this thread; empty if none.
const std::string& thread_name();

#define LOG_ERROR(...) log_write(LogLevel::Error, __VA_ARGS__)
#define LOG_WARN(...)  log_write(LogLevel::Warn,  __VA_ARGS__)
#define LOG_INFO(...)  log_write(LogLevel::Info,  __VA_ARGS__)
#define LOG_DEBUG(...) log_write(LogLevel::Debug, __VA_ARGS__)
#define LOG_TRACE(...) log_write(LogLevel::Trace, __VA_ARGS__)
