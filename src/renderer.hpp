#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Pixel buffer: RGB, 3 bytes per pixel, row-major
struct PixelBuffer {
    std::vector<uint8_t> bytes;
    int width  = 0;
    int height = 0;

    static size_t bytes_for(int w, int h)
    {
        return static_cast<size_t>(w) * static_cast<size_t>(h) * 3;
    }

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        bytes.assign(bytes_for(w, h), 0);
    }

    uint8_t* pixel(int x, int y)
    {
        return bytes.data() + (static_cast<size_t>(y) * width + x) * 3;
    }

    const uint8_t* pixel(int x, int y) const
    {
        return bytes.data() + (static_cast<size_t>(y) * width + x) * 3;
    }
};

// One requested image. Immutable once handed out.
struct Job {
    uint32_t index  = 0;
    int      width  = 0;
    int      height = 0;
};

// Rendered output tagged with its job index. A non-empty error marks a
// failed render; pixels then keep the job's size but hold no bytes.
struct Result {
    uint32_t    index = 0;
    PixelBuffer pixels;
    std::string caption;
    std::string error;

    bool ok() const { return error.empty(); }
};

class IImageRenderer {
public:
    virtual ~IImageRenderer() = default;

    // Called concurrently from every worker. Returns empty string on success,
    // or an error message. An exception means the calling worker cannot go on.
    virtual std::string render(const Job& job, PixelBuffer& buf,
                               std::string& caption) = 0;
};
