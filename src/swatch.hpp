#pragma once

#include <cstdint>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(Rgb a, Rgb b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(Rgb a, Rgb b) { return !(a == b); }

static constexpr int SWATCH_COUNT = 8;

extern const char* const g_swatch_names[SWATCH_COUNT];
extern const Rgb         g_swatch_colors[SWATCH_COUNT];

// Name <-> color lookups. Return -1 when nothing matches.
int swatch_by_name(const char* name);
int swatch_by_color(Rgb c);

// 255 minus each channel.
inline Rgb complement(Rgb c)
{
    return Rgb{static_cast<uint8_t>(255 - c.r),
               static_cast<uint8_t>(255 - c.g),
               static_cast<uint8_t>(255 - c.b)};
}
