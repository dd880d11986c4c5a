#include "swatch_renderer.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

// -----------------------------------------------------------------------
// Constructors: unseeded renders draw from a per-thread engine
// -----------------------------------------------------------------------
SwatchRenderer::SwatchRenderer() = default;

SwatchRenderer::SwatchRenderer(uint32_t s)
    : seeded(true), seed(s)
{
}

int SwatchRenderer::pick_swatch(uint32_t index)
{
    std::uniform_int_distribution<int> dist(0, SWATCH_COUNT - 1);
    if (seeded) {
        std::mt19937 rng(seed ^ (index * 2654435761u));
        return dist(rng);
    }
    thread_local std::mt19937 rng(std::random_device{}());
    return dist(rng);
}

// -----------------------------------------------------------------------
// Drawing helpers: everything clips to the buffer
// -----------------------------------------------------------------------
static void fill(PixelBuffer& buf, Rgb c)
{
    uint8_t* p   = buf.bytes.data();
    uint8_t* end = p + buf.bytes.size();
    for (; p < end; p += 3) {
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
    }
}

static void fill_rect(PixelBuffer& buf, int x, int y, int w, int h, Rgb c)
{
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(buf.width,  x + w);
    const int y1 = std::min(buf.height, y + h);
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            uint8_t* p = buf.pixel(px, py);
            p[0] = c.r;
            p[1] = c.g;
            p[2] = c.b;
        }
    }
}

static void fill_disc(PixelBuffer& buf, int cx, int cy, int r, Rgb c)
{
    if (r <= 0) return;
    const long long r2 = static_cast<long long>(r) * r;
    const int y0 = std::max(0, cy - r);
    const int y1 = std::min(buf.height - 1, cy + r);
    for (int py = y0; py <= y1; ++py) {
        const long long dy = py - cy;
        const int x0 = std::max(0, cx - r);
        const int x1 = std::min(buf.width - 1, cx + r);
        for (int px = x0; px <= x1; ++px) {
            const long long dx = px - cx;
            if (dx * dx + dy * dy > r2) continue;
            uint8_t* p = buf.pixel(px, py);
            p[0] = c.r;
            p[1] = c.g;
            p[2] = c.b;
        }
    }
}

Watermark watermark_for(int width, int height)
{
    Watermark wm;
    wm.cx     = width / 2;
    wm.cy     = height / 2;
    wm.radius = std::min(width, height) / 4;

    // Label bar sits above the disc, the way a caption would
    if (wm.radius >= 4) {
        wm.bar_w = wm.radius;
        wm.bar_h = std::max(1, wm.radius / 6);
        const int gap = std::max(1, wm.radius / 8);
        wm.bar_x = wm.cx - wm.bar_w / 2;
        wm.bar_y = wm.cy - wm.radius - gap - wm.bar_h;
    }
    return wm;
}

// -----------------------------------------------------------------------
// render: one complete image per job
// -----------------------------------------------------------------------
std::string SwatchRenderer::render(const Job& job, PixelBuffer& buf,
                                   std::string& caption)
{
    if (job.width <= 0 || job.height <= 0) {
        char msg[96];
        std::snprintf(msg, sizeof(msg), "invalid image size %dx%d",
                      job.width, job.height);
        return msg;
    }
    if (static_cast<size_t>(job.width) >
        MAX_IMAGE_BYTES / 3 / static_cast<size_t>(job.height)) {
        char msg[96];
        std::snprintf(msg, sizeof(msg), "image %dx%d exceeds %zu bytes",
                      job.width, job.height, MAX_IMAGE_BYTES);
        return msg;
    }

    const int swatch = pick_swatch(job.index);
    const Rgb base   = g_swatch_colors[swatch];
    const Rgb mark   = complement(base);

    buf.resize(job.width, job.height);
    fill(buf, base);

    const Watermark wm = watermark_for(job.width, job.height);
    fill_disc(buf, wm.cx, wm.cy, wm.radius, mark);
    if (wm.bar_w > 0)
        fill_rect(buf, wm.bar_x, wm.bar_y, wm.bar_w, wm.bar_h, mark);

    caption = g_swatch_names[swatch];
    return {};  // success
}
