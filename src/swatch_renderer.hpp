#pragma once

#include "renderer.hpp"
#include "swatch.hpp"

#include <cstdint>

// Fills each image with a random named color and stamps a watermark in the
// complementary color: a centered disc of radius min(w, h) / 4 and a label
// bar above it, both scaled with the image. The bar stands in for the color
// name text; the name itself travels in the caption.
class SwatchRenderer : public IImageRenderer {
public:
    SwatchRenderer();
    // Same seed and job index always give the same color.
    explicit SwatchRenderer(uint32_t seed);

    std::string render(const Job& job, PixelBuffer& buf,
                       std::string& caption) override;

    // Largest accepted image, in bytes.
    static constexpr size_t MAX_IMAGE_BYTES = size_t(1) << 30;

private:
    int pick_swatch(uint32_t index);

    bool     seeded = false;
    uint32_t seed   = 0;
};

// Geometry of the watermark, shared with the tests.
struct Watermark {
    int cx     = 0;
    int cy     = 0;
    int radius = 0;
    int bar_x  = 0;
    int bar_y  = 0;
    int bar_w  = 0;
    int bar_h  = 0;
};

Watermark watermark_for(int width, int height);
