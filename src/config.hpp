#pragma once

#include "log.hpp"

#include <cstdint>
#include <string>

struct PipelineConfig {
    int  worker_count        = 0;     // 0 = SWATCH_THREADS or hardware concurrency
    int  completion_capacity = 8;     // results buffered between workers and ordering
    bool auto_quit_on_last   = true;  // Next on the last image ends the viewer
    int  shutdown_grace_ms   = 2000;
};

struct AppConfig {
    PipelineConfig pipeline;
    uint32_t       count  = 0;   // 0 = prompt
    int            width  = 0;   // 0 = prompt
    int            height = 0;   // 0 = prompt
    bool           has_log_level = false;
    LogLevel       log_level     = LogLevel::Info;
    bool           help          = false;
};

// Resolves worker_count == 0 to SWATCH_THREADS, then hardware concurrency,
// then 4.
int resolve_worker_count(int requested);

// Returns empty string on success, or an error message.
std::string parse_args(int argc, const char* const* argv, AppConfig& cfg);

const char* usage_text();
