#include "config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <thread>

int resolve_worker_count(int requested)
{
    if (requested > 0) return requested;

    int n = 0;
    if (const char* env = std::getenv("SWATCH_THREADS"))
        n = std::atoi(env);
    if (n <= 0)
        n = static_cast<int>(std::thread::hardware_concurrency());
    if (n <= 0)
        n = 4;
    return n;
}

const char* usage_text()
{
    return
        "usage: swatch_viewer [count [width [height]]] [options]\n"
        "\n"
        "  count, width, height   positive integers; prompted for when missing\n"
        "\n"
        "options:\n"
        "  --workers N            render threads (default: SWATCH_THREADS or CPU count)\n"
        "  --capacity N           completion channel capacity (default: 8)\n"
        "  --no-auto-quit         keep the last image open until 'q'\n"
        "  --grace-ms N           shutdown grace period (default: 2000)\n"
        "  --log-level L          error|warn|info|debug|trace\n"
        "  --help                 show this text\n";
}

static bool parse_int(const char* text, long min_v, long max_v, long& out)
{
    if (!text || !*text) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (v < min_v || v > max_v) return false;
    out = v;
    return true;
}

std::string parse_args(int argc, const char* const* argv, AppConfig& cfg)
{
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        auto value = [&]() -> const char* {
            return (i + 1 < argc) ? argv[++i] : nullptr;
        };

        long v = 0;
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            cfg.help = true;
        } else if (std::strcmp(arg, "--no-auto-quit") == 0) {
            cfg.pipeline.auto_quit_on_last = false;
        } else if (std::strcmp(arg, "--workers") == 0) {
            const char* s = value();
            if (!s) return "--workers needs a value";
            if (!parse_int(s, 1, 1024, v))
                return std::string("--workers: expected 1..1024, got '") + s + "'";
            cfg.pipeline.worker_count = static_cast<int>(v);
        } else if (std::strcmp(arg, "--capacity") == 0) {
            const char* s = value();
            if (!s) return "--capacity needs a value";
            if (!parse_int(s, 1, 1 << 20, v))
                return std::string("--capacity: expected 1..1048576, got '") + s + "'";
            cfg.pipeline.completion_capacity = static_cast<int>(v);
        } else if (std::strcmp(arg, "--grace-ms") == 0) {
            const char* s = value();
            if (!s) return "--grace-ms needs a value";
            if (!parse_int(s, 0, 600000, v))
                return std::string("--grace-ms: expected 0..600000, got '") + s + "'";
            cfg.pipeline.shutdown_grace_ms = static_cast<int>(v);
        } else if (std::strcmp(arg, "--log-level") == 0) {
            const char* s = value();
            if (!s) return "--log-level needs a value";
            if (!log_parse_level(s, cfg.log_level))
                return std::string("--log-level: unknown level '") + s + "'";
            cfg.has_log_level = true;
        } else if (arg[0] == '-' && arg[1] == '-') {
            return std::string("unknown option '") + arg + "'";
        } else {
            static const char* const names[] = {"count", "width", "height"};
            if (positional >= 3)
                return std::string("unexpected argument '") + arg + "'";
            if (!parse_int(arg, 1, INT_MAX, v))
                return std::string(names[positional]) + " must be a positive integer, got '"
                     + arg + "'";
            if (positional == 0)      cfg.count  = static_cast<uint32_t>(v);
            else if (positional == 1) cfg.width  = static_cast<int>(v);
            else                      cfg.height = static_cast<int>(v);
            ++positional;
        }
    }
    return {};  // success
}
