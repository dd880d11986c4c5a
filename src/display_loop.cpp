#include "display_loop.hpp"
#include "log.hpp"

#include <utility>

static constexpr long long MAX_PLACEHOLDER_PIXELS = 16LL * 1024 * 1024;

PixelBuffer make_placeholder(int width, int height)
{
    PixelBuffer buf;
    if (width <= 0 || height <= 0
            || static_cast<long long>(width) * height > MAX_PLACEHOLDER_PIXELS) {
        width  = 64;
        height = 64;
    }
    buf.resize(width, height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const bool edge = x == 0 || y == 0 || x == width - 1 || y == height - 1;
            uint8_t* p = buf.pixel(x, y);
            p[0] = p[1] = p[2] = edge ? 64 : 128;
        }
    }
    return buf;
}

DisplayOutcome run_display_loop(Pipeline& pipeline, IViewer& viewer,
                                bool auto_quit_on_last)
{
    DisplayOutcome out;
    DisplayState   state    = DisplayState::Running;
    const uint32_t count    = pipeline.state().total;

    PixelBuffer last_buf;
    ViewInfo    last_info;
    bool        have_last = false;

    while (state == DisplayState::Running) {
        Result res;
        if (!pipeline.next(res)) {
            if (auto_quit_on_last || !have_last
                    || pipeline.status() != RunStatus::Completed) {
                state = DisplayState::Finished;
                break;
            }
            // Hold the last image until the user quits
            while (viewer.show(last_buf, last_info) != UserAction::Quit) {}
            out.quit_by_user = true;
            state = DisplayState::Cancelling;
            break;
        }

        ViewInfo info;
        info.index  = res.index;
        info.count  = count;
        info.failed = !res.ok();
        if (res.ok()) {
            info.caption = std::move(res.caption);
        } else {
            info.caption = "render failed: " + res.error;
            res.pixels   = make_placeholder(res.pixels.width, res.pixels.height);
        }

        LOG_DEBUG("showing image %u of %u: %s", info.index + 1, count,
                  info.caption.c_str());
        const UserAction action = viewer.show(res.pixels, info);
        ++out.shown;

        last_buf  = std::move(res.pixels);
        last_info = std::move(info);
        have_last = true;

        if (action == UserAction::Quit) {
            out.quit_by_user = true;
            state = DisplayState::Cancelling;
        }
    }

    // Cancelling and exhaustion both land here
    pipeline.cancel();
    state = DisplayState::Finished;

    out.status = pipeline.status();
    if (out.status == RunStatus::Failed)
        out.error = pipeline.error();
    return out;
}
