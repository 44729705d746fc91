#include <algorithm>
#include <cmath>
#include <strata/grouper.hpp>
#include <strata/logger.hpp>

namespace strata
{

float rounded_upper_limit(float value)
{
    if (!(value > 0.0f))
        return 0.0f;
    float magnitude = std::pow(10.0f, std::floor(std::log10(value)));
    return std::ceil(value / magnitude) * magnitude;
}

PercentageGrouper::PercentageGrouper(std::shared_ptr<DiagramContext> ctx,
                                     std::string                     group,
                                     const Rect&                     bbox,
                                     const std::vector<std::string>& variables,
                                     PanelFormat                     format,
                                     std::optional<AxisLimits>       xlim_override)
    : DefaultGrouper(
          std::move(ctx), std::move(group), bbox, variables, std::move(format), xlim_override)
{
    // The base constructor laid the panels out with equal widths
    reflow();
}

std::vector<float> PercentageGrouper::allocate(const std::vector<Panel*>& visible) const
{
    std::vector<float> ranges;
    ranges.reserve(visible.size());
    float total = 0.0f;
    for (const Panel* p : visible)
    {
        float r = std::max(p->x_limits().range(), 0.0f);
        ranges.push_back(r);
        total += r;
    }

    if (total <= 0.0f)
        return DefaultGrouper::allocate(visible);

    for (float& r : ranges)
        r = bbox_.w * r / total;
    return ranges;
}

bool PercentageGrouper::apply_floor(float floor)
{
    bool changed = false;
    for (Panel* p : panels())
    {
        if (p->x_limits().max < floor)
        {
            p->xlim(0.0f, floor);
            changed = true;
        }
    }
    if (changed)
    {
        STRATA_LOG_DEBUG("grouper", "raised percentage ranges of '{}' to {}", group_, floor);
        reflow();
        notify();
    }
    return changed;
}

}   // namespace strata
