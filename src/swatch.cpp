#include "swatch.hpp"

#include <cstring>

const char* const g_swatch_names[SWATCH_COUNT] = {
    "black",
    "white",
    "red",
    "yellow",
    "lime",
    "aqua",
    "blue",
    "fuchsia",
};

const Rgb g_swatch_colors[SWATCH_COUNT] = {
    {  0,   0,   0},
    {255, 255, 255},
    {255,   0,   0},
    {255, 255,   0},
    {  0, 255,   0},
    {  0, 255, 255},
    {  0,   0, 255},
    {255,   0, 255},
};

int swatch_by_name(const char* name)
{
    if (!name) return -1;
    for (int i = 0; i < SWATCH_COUNT; ++i)
        if (std::strcmp(g_swatch_names[i], name) == 0) return i;
    return -1;
}

int swatch_by_color(Rgb c)
{
    for (int i = 0; i < SWATCH_COUNT; ++i)
        if (g_swatch_colors[i] == c) return i;
    return -1;
}
