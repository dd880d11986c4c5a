#include "config.hpp"
#include "display_loop.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "sdl_viewer.hpp"
#include "swatch_renderer.hpp"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

// ---------------------------------------------------------------------------
// Interactive prompt: re-asks until a whole number >= 1 is entered.
// False on end of input.
// ---------------------------------------------------------------------------
static bool prompt_positive(const char* prompt, long max_v, long& out)
{
    std::string line;
    while (true) {
        std::printf("%s", prompt);
        std::fflush(stdout);
        if (!std::getline(std::cin, line)) return false;

        errno = 0;
        char* end = nullptr;
        const long v = std::strtol(line.c_str(), &end, 10);
        if (line.empty() || errno != 0 || *end != '\0') {
            std::printf("Invalid input! Input must be a whole number\n\n");
            continue;
        }
        if (v < 1) {
            std::printf("Input must be greater than or equal to 1\n\n");
            continue;
        }
        if (v > max_v) {
            std::printf("Input must be at most %ld\n\n", max_v);
            continue;
        }
        out = v;
        return true;
    }
}

static bool fill_missing(AppConfig& cfg)
{
    long v = 0;
    if (cfg.count == 0) {
        if (!prompt_positive("Enter number of images to generate: ", UINT32_MAX, v))
            return false;
        cfg.count = static_cast<uint32_t>(v);
    }
    if (cfg.width == 0) {
        if (!prompt_positive("Enter number of pixels for image width: ", INT_MAX, v))
            return false;
        cfg.width = static_cast<int>(v);
    }
    if (cfg.height == 0) {
        if (!prompt_positive("Enter number of pixels for image height: ", INT_MAX, v))
            return false;
        cfg.height = static_cast<int>(v);
    }
    return true;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    set_thread_name("main");

    AppConfig cfg;
    const std::string arg_err = parse_args(argc, argv, cfg);
    if (!arg_err.empty()) {
        fprintf(stderr, "swatch_viewer: %s\n\n%s", arg_err.c_str(), usage_text());
        return 2;
    }
    if (cfg.help) {
        std::printf("%s", usage_text());
        return 0;
    }
    if (cfg.has_log_level)
        log_set_level(cfg.log_level);

    std::printf("~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~\n");
    std::printf("<     Random Image Creator & Viewer     >\n");
    std::printf("~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~\n\n");

    if (!fill_missing(cfg)) {
        fprintf(stderr, "swatch_viewer: no input, giving up\n");
        return 2;
    }

    SwatchRenderer renderer;
    SdlViewer      viewer;
    const std::string open_err = viewer.open(cfg.width, cfg.height);
    if (!open_err.empty()) {
        LOG_ERROR("%s", open_err.c_str());
        return 1;
    }

    Pipeline pipeline(renderer, cfg.pipeline);
    const std::string run_err = pipeline.run(cfg.count, cfg.width, cfg.height);
    if (!run_err.empty()) {
        LOG_ERROR("%s", run_err.c_str());
        return 1;
    }

    const DisplayOutcome outcome =
        run_display_loop(pipeline, viewer, cfg.pipeline.auto_quit_on_last);
    viewer.close();

    std::printf("----------------------------------------------------------\n");
    std::printf("Cleaning up, this will take just a sec...\n");
    const bool clean = pipeline.shutdown(
        std::chrono::milliseconds(cfg.pipeline.shutdown_grace_ms));
    const PipelineState st = pipeline.state();

    // The pipeline holds the final word; a fault can land after the loop ends
    int exit_code = 0;
    if (st.status == RunStatus::Failed) {
        fprintf(stderr, "swatch_viewer: %s\n", pipeline.error().c_str());
        exit_code = 1;
    }

    std::printf("----------------------------------------------------------\n");
    if (clean)
        std::printf("Successful shutdown after showing %u images and flushing %llu items from memory!\n",
                    outcome.shown, static_cast<unsigned long long>(st.discarded));
    else
        std::printf("Shutdown timed out with %d worker(s) still rendering; exiting anyway.\n",
                    pipeline.live_workers());
    std::printf("__________________________________________________________\n");
    std::fflush(stdout);

    // Last resort: do not block on joining renders that overran the grace period
    if (!clean) {
        std::fflush(stderr);
        std::_Exit(exit_code);
    }
    return exit_code;
}
