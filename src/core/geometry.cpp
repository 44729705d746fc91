#include <algorithm>
#include <cmath>
#include <numbers>
#include <strata/geometry.hpp>

namespace strata
{

Rect default_envelope()
{
    return Rect::from_extents(kDefaultLeft, kDefaultBottom, kDefaultRight, kDefaultTop);
}

Vec2 figure_to_pixel(Vec2 p, const FigureCanvas& canvas)
{
    return {p.x * static_cast<float>(canvas.width), p.y * static_cast<float>(canvas.height)};
}

Vec2 pixel_to_figure(Vec2 p, const FigureCanvas& canvas)
{
    float w = static_cast<float>(canvas.width);
    float h = static_cast<float>(canvas.height);

    // Avoid division by zero on a collapsed canvas
    if (w == 0.0f)
        w = 1.0f;
    if (h == 0.0f)
        h = 1.0f;

    return {p.x / w, p.y / h};
}

float panel_fraction_to_pixels(float fraction, const Rect& panel, const FigureCanvas& canvas)
{
    // panel-local fraction -> figure fraction -> pixels
    float dy_figure = fraction * panel.h;
    Vec2  base      = figure_to_pixel({panel.x, panel.y1()}, canvas);
    Vec2  shifted   = figure_to_pixel({panel.x, panel.y1() + dy_figure}, canvas);
    return shifted.y - base.y;
}

float deg_to_rad(float degrees)
{
    return degrees * std::numbers::pi_v<float> / 180.0f;
}

float arm_length(float rise_px, float angle_deg)
{
    float s = std::sin(deg_to_rad(angle_deg));
    if (std::fabs(s) < 1e-6f)
        return 0.0f;
    return rise_px / s;
}

float arm_run(float rise_px, float angle_deg)
{
    if (nearly_equal(std::fmod(angle_deg, 180.0f), 90.0f, 1e-4f))
        return 0.0f;
    float t = std::tan(deg_to_rad(angle_deg));
    if (std::fabs(t) < 1e-6f)
        return 0.0f;
    return rise_px / t;
}

Rect bounding_rect(const std::vector<Rect>& rects)
{
    if (rects.empty())
        return {};

    float x0 = rects.front().x;
    float y0 = rects.front().y;
    float x1 = rects.front().x1();
    float y1 = rects.front().y1();
    for (const auto& r : rects)
    {
        x0 = std::min(x0, r.x);
        y0 = std::min(y0, r.y);
        x1 = std::max(x1, r.x1());
        y1 = std::max(y1, r.y1());
    }
    return Rect::from_extents(x0, y0, x1, y1);
}

bool nearly_equal(float a, float b, float eps)
{
    return std::fabs(a - b) <= eps;
}

}   // namespace strata
