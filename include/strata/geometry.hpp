#pragma once

#include <cstdint>
#include <vector>

namespace strata
{

// Rectangle in figure-fraction coordinates: (0,0) is the lower left corner
// of the figure, (1,1) the upper right one.
struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float x1() const { return x + w; }
    float y1() const { return y + h; }

    static Rect from_extents(float x0, float y0, float x1, float y1)
    {
        return {x0, y0, x1 - x0, y1 - y0};
    }
};

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;
};

struct AxisLimits
{
    float min = 0.0f;
    float max = 1.0f;

    float range() const { return max - min; }
};

// Pixel size of the drawing surface the figure fractions refer to.
struct FigureCanvas
{
    uint32_t width  = 640;
    uint32_t height = 480;
};

// Default envelope of a diagram (matplotlib's figure.subplot.* defaults).
inline constexpr float kDefaultLeft   = 0.125f;
inline constexpr float kDefaultBottom = 0.11f;
inline constexpr float kDefaultRight  = 0.9f;
inline constexpr float kDefaultTop    = 0.88f;

Rect default_envelope();

// Figure fraction <-> pixel conversions. Pixels grow to the right and upwards,
// so both spaces share the same orientation.
Vec2 figure_to_pixel(Vec2 p, const FigureCanvas& canvas);
Vec2 pixel_to_figure(Vec2 p, const FigureCanvas& canvas);

// Converts a vertical distance given as fraction of `panel` height into a
// pixel distance on `canvas`.
float panel_fraction_to_pixels(float fraction, const Rect& panel, const FigureCanvas& canvas);

float deg_to_rad(float degrees);

// Length of a bracket arm leaving its anchor at `angle_deg` (measured from the
// horizontal) that rises by `rise_px`.
float arm_length(float rise_px, float angle_deg);

// Horizontal run of the same arm. Zero for a vertical arm.
float arm_run(float rise_px, float angle_deg);

// Smallest rectangle containing every rect. Returns an empty rect for no input.
Rect bounding_rect(const std::vector<Rect>& rects);

bool nearly_equal(float a, float b, float eps = 1e-6f);

}   // namespace strata
