#include <sstream>
#include <strata/format.hpp>

namespace strata
{

const char* to_string(GrouperKind kind)
{
    switch (kind)
    {
        case GrouperKind::Default:
            return "default";
        case GrouperKind::Percentage:
            return "percentages";
        case GrouperKind::AllInOne:
            return "all_in_one";
        case GrouperKind::Stacked:
            return "stacked";
    }
    return "default";
}

const char* to_string(PlotKind kind)
{
    switch (kind)
    {
        case PlotKind::Line:
            return "line";
        case PlotKind::Area:
            return "area";
        case PlotKind::Bar:
            return "bar";
        case PlotKind::Stacked:
            return "stacked";
    }
    return "line";
}

std::optional<GrouperKind> grouper_kind_from_string(std::string_view s)
{
    if (s == "default")
        return GrouperKind::Default;
    if (s == "percentages")
        return GrouperKind::Percentage;
    if (s == "all_in_one")
        return GrouperKind::AllInOne;
    if (s == "stacked")
        return GrouperKind::Stacked;
    return std::nullopt;
}

std::optional<PlotKind> plot_kind_from_string(std::string_view s)
{
    if (s == "line")
        return PlotKind::Line;
    if (s == "area")
        return PlotKind::Area;
    if (s == "bar")
        return PlotKind::Bar;
    if (s == "stacked")
        return PlotKind::Stacked;
    return std::nullopt;
}

bool FormatOverrides::empty() const
{
    return !plot && !y_ticks_visible && !x_ticks && !title && !title_wrap && !legend
           && !group_bar_angle && !x_limits;
}

PanelFormat default_format(GrouperKind kind, bool use_bars)
{
    PanelFormat fmt;
    if (use_bars)
    {
        fmt.plot        = PlotKind::Bar;
        fmt.categorical = false;
    }

    switch (kind)
    {
        case GrouperKind::Default:
            break;
        case GrouperKind::Percentage:
            fmt.rounded_xlim = true;
            fmt.x_ticks      = {10.0f, 30.0f, 50.0f, 70.0f, 90.0f};
            if (!use_bars)
                fmt.plot = PlotKind::Area;
            break;
        case GrouperKind::AllInOne:
            fmt.title  = "%(group)s";
            fmt.legend = true;
            break;
        case GrouperKind::Stacked:
            fmt.title  = "%(group)s";
            fmt.legend = true;
            fmt.plot   = PlotKind::Stacked;
            break;
    }
    return fmt;
}

PanelFormat merge_format(PanelFormat base, const FormatOverrides& overrides)
{
    if (overrides.plot)
        base.plot = *overrides.plot;
    if (overrides.y_ticks_visible)
        base.y_ticks_visible = *overrides.y_ticks_visible;
    if (overrides.x_ticks)
        base.x_ticks = *overrides.x_ticks;
    if (overrides.title)
        base.title = *overrides.title;
    if (overrides.title_wrap)
        base.title_wrap = *overrides.title_wrap;
    if (overrides.legend)
        base.legend = *overrides.legend;
    if (overrides.group_bar_angle)
        base.group_bar_angle = *overrides.group_bar_angle;
    // Explicit limits replace the data driven rounding
    if (overrides.x_limits)
        base.rounded_xlim = false;
    return base;
}

std::string expand_label(std::string_view   pattern,
                         const std::string& name,
                         const std::string& group,
                         const std::string& long_name)
{
    struct Key
    {
        std::string_view   token;
        const std::string* value;
    };
    const Key keys[] = {
        {"%(name)s", &name},
        {"%(group)s", &group},
        {"%(long_name)s", long_name.empty() ? &name : &long_name},
    };

    std::string result;
    std::size_t i = 0;
    while (i < pattern.size())
    {
        bool replaced = false;
        for (const auto& key : keys)
        {
            if (pattern.substr(i, key.token.size()) == key.token)
            {
                result += *key.value;
                i += key.token.size();
                replaced = true;
                break;
            }
        }
        if (!replaced)
            result += pattern[i++];
    }
    return result;
}

std::string wrap_text(const std::string& text, int width)
{
    if (width <= 0)
        return text;

    std::istringstream words(text);
    std::string        word;
    std::string        result;
    std::size_t        line_len = 0;
    while (words >> word)
    {
        if (line_len > 0 && line_len + 1 + word.size() > static_cast<std::size_t>(width))
        {
            result += '\n';
            line_len = 0;
        }
        else if (line_len > 0)
        {
            result += ' ';
            ++line_len;
        }
        result += word;
        line_len += word.size();
    }
    return result;
}

}   // namespace strata
