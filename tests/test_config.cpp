#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "log.hpp"

int test_count = 0;
int pass_count = 0;

void check(const char* name, bool passed) {
    test_count++;
    if (passed) {
        std::cout << "✓ " << name << " PASSED\n";
        pass_count++;
    } else {
        std::cout << "✗ " << name << " FAILED\n";
    }
}

static std::string parse(std::vector<const char*> args, AppConfig& cfg) {
    args.insert(args.begin(), "swatch_viewer");
    return parse_args(static_cast<int>(args.size()), args.data(), cfg);
}

void test_defaults() {
    AppConfig cfg;
    check("no arguments parse", parse({}, cfg).empty());
    check("defaults", cfg.count == 0 && cfg.width == 0 && cfg.height == 0
                      && cfg.pipeline.worker_count == 0
                      && cfg.pipeline.completion_capacity == 8
                      && cfg.pipeline.auto_quit_on_last
                      && cfg.pipeline.shutdown_grace_ms == 2000
                      && !cfg.help);
}

void test_positional_and_options() {
    AppConfig cfg;
    const std::string err = parse({"12", "640", "480", "--workers", "3", "--capacity", "5",
                                   "--no-auto-quit", "--grace-ms", "150",
                                   "--log-level", "DEBUG"}, cfg);
    check("full command line parses", err.empty());
    check("positional values", cfg.count == 12 && cfg.width == 640 && cfg.height == 480);
    check("pipeline options", cfg.pipeline.worker_count == 3
                              && cfg.pipeline.completion_capacity == 5
                              && !cfg.pipeline.auto_quit_on_last
                              && cfg.pipeline.shutdown_grace_ms == 150);
    check("log level", cfg.has_log_level && cfg.log_level == LogLevel::Debug);

    AppConfig partial;
    check("count only", parse({"7"}, partial).empty() && partial.count == 7
                        && partial.width == 0);
}

void test_errors() {
    AppConfig cfg;
    check("unknown option", !parse({"--fast"}, cfg).empty());
    check("missing value", !parse({"--workers"}, cfg).empty());
    check("zero workers", !parse({"--workers", "0"}, cfg).empty());
    check("non-numeric capacity", !parse({"--capacity", "lots"}, cfg).empty());
    check("zero count", !parse({"0"}, cfg).empty());
    check("negative width", !parse({"3", "-4"}, cfg).empty());
    check("trailing junk", !parse({"3x"}, cfg).empty());
    check("too many positionals", !parse({"1", "2", "3", "4"}, cfg).empty());
    check("bad log level", !parse({"--log-level", "loud"}, cfg).empty());

    AppConfig help;
    check("help flag", parse({"--help"}, help).empty() && help.help);
    check("usage mentions options",
          std::string(usage_text()).find("--no-auto-quit") != std::string::npos);
}

void test_worker_resolution() {
    check("explicit count wins", resolve_worker_count(6) == 6);

    setenv("SWATCH_THREADS", "5", 1);
    check("SWATCH_THREADS used when unset", resolve_worker_count(0) == 5);
    setenv("SWATCH_THREADS", "junk", 1);
    check("bad SWATCH_THREADS falls back", resolve_worker_count(0) >= 1);
    unsetenv("SWATCH_THREADS");
    check("hardware fallback", resolve_worker_count(0) >= 1);
}

void test_log_levels() {
    LogLevel lvl = LogLevel::Info;
    check("warning alias", log_parse_level("Warning", lvl) && lvl == LogLevel::Warn);
    check("trace", log_parse_level("trace", lvl) && lvl == LogLevel::Trace);
    check("unknown level", !log_parse_level("verbose", lvl));
}

// Names belong to the thread that set them; later threads start unnamed
void test_thread_names() {
    std::string inside;
    std::thread a([&] {
        set_thread_name("worker-0");
        inside = thread_name();
    });
    a.join();

    std::string later = "unset";
    for (int i = 0; i < 8; ++i) {
        std::thread b([&] { later = thread_name(); });
        b.join();
        if (!later.empty()) break;
    }
    check("name visible on its thread", inside == "worker-0");
    check("exited thread's name not inherited", later.empty());
    check("main thread unnamed", thread_name().empty());
}

int main() {
    std::cout << "=== Config tests ===\n\n";

    test_defaults();
    test_positional_and_options();
    test_errors();
    test_worker_resolution();
    test_log_levels();
    test_thread_names();

    std::cout << "\n" << pass_count << "/" << test_count << " tests passed.\n";
    return (pass_count == test_count) ? 0 : 1;
}
