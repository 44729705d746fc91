#include <strata/group_bar.hpp>
#include <strata/logger.hpp>

namespace strata
{

std::optional<GroupBar> GroupBarAnnotator::compute(const Rect&              anchor,
                                                   const std::vector<Rect>& spanned,
                                                   const std::string&       label,
                                                   const FigureCanvas&      canvas) const
{
    if (spanned.empty())
        return std::nullopt;

    const Rect extent = bounding_rect(spanned);
    GroupBar   bar;
    bar.x0  = extent.x;
    bar.x1  = extent.x1();
    bar.top = extent.y1();

    bar.angle_deg  = style_.angle_deg;
    bar.offset     = style_.offset_fraction * anchor.h;
    bar.offset_px  = panel_fraction_to_pixels(style_.offset_fraction, anchor, canvas);
    bar.arm_px     = arm_length(bar.offset_px, bar.angle_deg);
    bar.shift      = pixel_to_figure({arm_run(bar.offset_px, bar.angle_deg), 0.0f}, canvas).x;
    bar.label      = label;
    bar.background = style_.background;

    const float y_bar = bar.top + bar.offset;
    bar.label_pos     = {0.5f * (bar.x0 + bar.x1) + bar.shift, y_bar};
    bar.bracket       = {
        {bar.x0, bar.top},
        {bar.x0 + bar.shift, y_bar},
        {bar.x1 + bar.shift, y_bar},
        {bar.x1, bar.top},
    };
    return bar;
}

bool GroupBarAnnotator::annotate(PanelRegistry&              panels,
                                 const ScaleLinkManager&     links,
                                 ShareGroupId                id,
                                 const std::vector<PanelId>& clear,
                                 const std::string&          label,
                                 const FigureCanvas&         canvas) const
{
    remove(panels, clear);

    const ShareGroup* group = links.group(id);
    if (!group)
        return false;
    const Panel* anchor = panels.get(group->anchor);
    if (!anchor || !anchor->visible())
        return false;

    std::vector<Rect> spanned;
    for (PanelId member : group->members)
    {
        const Panel* p = panels.get(member);
        if (p && p->visible())
            spanned.push_back(p->position());
    }

    auto bar = compute(anchor->position(), spanned, label, canvas);
    if (!bar)
        return false;

    STRATA_LOG_TRACE("groupbar",
                     "bar '{}' spans [{}, {}] at {}",
                     label,
                     bar->x0,
                     bar->x1,
                     bar->top + bar->offset);
    panels.get(group->anchor)->set_group_bar(std::move(*bar));
    return true;
}

void GroupBarAnnotator::remove(PanelRegistry& panels, const std::vector<PanelId>& ids)
{
    for (PanelId id : ids)
    {
        if (Panel* p = panels.get(id))
            p->clear_group_bar();
    }
}

}   // namespace strata
