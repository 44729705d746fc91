#pragma once

#include <cstdint>
#include <optional>
#include <strata/geometry.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace strata
{

// Layout variant of a group.
enum class GrouperKind : uint8_t
{
    Default,
    Percentage,
    AllInOne,
    Stacked,
};

// Rendering directive for one series.
enum class PlotKind : uint8_t
{
    Line,      // vertical line over the index
    Area,      // filled area against zero
    Bar,       // horizontal bars
    Stacked,   // cumulative stack of all series in the panel
};

enum class SpineStyle : uint8_t
{
    Solid,
    Dotted,
};

const char* to_string(GrouperKind kind);
const char* to_string(PlotKind kind);
std::optional<GrouperKind> grouper_kind_from_string(std::string_view s);
std::optional<PlotKind>    plot_kind_from_string(std::string_view s);

// Resolved style of a panel. Built fresh for every grouper from the variant
// defaults and the caller overrides.
struct PanelFormat
{
    PlotKind           plot            = PlotKind::Line;
    bool               y_ticks_visible = false;
    bool               categorical     = true;    // bar plots only
    bool               rounded_xlim    = false;   // x range [0, rounded max]
    std::vector<float> x_ticks;                   // empty = renderer decides
    std::string        title           = "%(name)s";
    int                title_wrap      = 0;       // 0 = no wrapping
    bool               legend          = false;
    float              group_bar_angle = 45.0f;
};

// Caller supplied per-group overrides. Unset fields keep the variant default.
struct FormatOverrides
{
    std::optional<PlotKind>           plot;
    std::optional<bool>               y_ticks_visible;
    std::optional<std::vector<float>> x_ticks;
    std::optional<std::string>        title;
    std::optional<int>                title_wrap;
    std::optional<bool>               legend;
    std::optional<float>              group_bar_angle;
    std::optional<AxisLimits>         x_limits;

    bool empty() const;
};

PanelFormat default_format(GrouperKind kind, bool use_bars);
PanelFormat merge_format(PanelFormat base, const FormatOverrides& overrides);

// Replaces %(name)s, %(group)s and %(long_name)s in `pattern`.
std::string expand_label(std::string_view   pattern,
                         const std::string& name,
                         const std::string& group,
                         const std::string& long_name = {});

// Greedy word wrap to lines of at most `width` characters (0 = no wrap).
std::string wrap_text(const std::string& text, int width);

}   // namespace strata
