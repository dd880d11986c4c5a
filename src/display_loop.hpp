#pragma once

#include "pipeline.hpp"
#include "renderer.hpp"

#include <cstdint>
#include <string>

enum class UserAction {
    Next,
    Quit,
};

// What the viewer shows next to the pixels.
struct ViewInfo {
    uint32_t    index  = 0;
    uint32_t    count  = 0;
    std::string caption;
    bool        failed = false;
};

class IViewer {
public:
    virtual ~IViewer() = default;

    // Shows one image and blocks until the user picks an action.
    // Never called concurrently.
    virtual UserAction show(const PixelBuffer& buf, const ViewInfo& info) = 0;
};

enum class DisplayState {
    Running,
    Cancelling,
    Finished,
};

struct DisplayOutcome {
    uint32_t    shown        = 0;      // distinct images presented
    bool        quit_by_user = false;
    RunStatus   status       = RunStatus::Idle;
    std::string error;                 // set when status is Failed
};

// Pulls results from `pipeline` in order and presents each one.
//   Running --Next, more results--> Running
//   Running --Next, no more results--> Finished   (auto_quit_on_last)
//   Running --Quit--> Cancelling --> Finished
// Without auto_quit_on_last the last image stays up until Quit.
// Failed renders are shown as a gray placeholder. The pipeline is cancelled
// exactly once on the way to Finished.
DisplayOutcome run_display_loop(Pipeline& pipeline, IViewer& viewer,
                                bool auto_quit_on_last);

// Gray image with a dark border, same size as the failed job (64x64 when
// that size is unusable).
PixelBuffer make_placeholder(int width, int height);
