#include <algorithm>
#include <cmath>
#include <strata/grouper.hpp>
#include <strata/logger.hpp>

namespace strata
{

AllInOneGrouper::AllInOneGrouper(std::shared_ptr<DiagramContext> ctx,
                                 std::string                     group,
                                 const Rect&                     bbox,
                                 const std::vector<std::string>& variables,
                                 PanelFormat                     format,
                                 std::optional<AxisLimits>       xlim_override)
    : Grouper(std::move(ctx), std::move(group), bbox, std::move(format), xlim_override),
      variables_(variables)
{
    Panel& p = create_panel();
    for (const auto& var : variables_)
        p.series_mut().push_back({var, format_.plot});
    p.title(wrap_text(expand_label(format_.title, group_, group_), format_.title_wrap));

    AxisLimits xlim{0.0f, 1.0f};
    if (xlim_override_)
    {
        xlim = *xlim_override_;
    }
    else if (format_.plot == PlotKind::Stacked)
    {
        float top = 0.0f;
        for (float v : ctx_->data.row_sum(variables_))
            top = std::max(top, v);
        xlim = {0.0f, top > 0.0f ? top : 1.0f};
    }
    else if (!variables_.empty())
    {
        xlim = initial_xlim(variables_.front());
        for (const auto& var : variables_)
        {
            AxisLimits l = initial_xlim(var);
            xlim.min     = std::min(xlim.min, l.min);
            xlim.max     = std::max(xlim.max, l.max);
        }
    }
    p.xlim(xlim.min, xlim.max);

    reflow();
}

Panel* AllInOneGrouper::panel() const
{
    return panel_ids_.empty() ? nullptr : ctx_->panels.get(panel_ids_.front());
}

SeriesEntry* AllInOneGrouper::entry(const std::string& name) const
{
    Panel* p = panel();
    if (!p)
        return nullptr;
    for (auto& s : p->series_mut())
    {
        if (s.variable == name)
            return &s;
    }
    return nullptr;
}

bool AllInOneGrouper::is_visible(const std::string& name) const
{
    const SeriesEntry* e = entry(name);
    return e && e->draw.has_value();
}

void AllInOneGrouper::hide(const std::string& name)
{
    SeriesEntry* e = entry(name);
    if (!e || !e->draw)
        return;
    e->draw.reset();
    notify();
}

void AllInOneGrouper::show(const std::string& name)
{
    SeriesEntry* e = entry(name);
    if (!e || e->draw)
        return;
    e->draw = format_.plot;
    notify();
}

void AllInOneGrouper::reorder(const std::vector<std::string>& names)
{
    std::vector<std::string> ordered;
    ordered.reserve(variables_.size());
    auto known = [&](const std::string& n)
    { return std::find(variables_.begin(), variables_.end(), n) != variables_.end(); };
    auto taken = [&](const std::string& n)
    { return std::find(ordered.begin(), ordered.end(), n) != ordered.end(); };

    for (const auto& name : names)
    {
        if (!known(name))
        {
            STRATA_LOG_WARN("grouper", "reorder: '{}' is not a member of '{}'", name, group_);
            continue;
        }
        if (!taken(name))
            ordered.push_back(name);
    }
    for (const auto& name : variables_)
    {
        if (!taken(name))
            ordered.push_back(name);
    }

    // Series keep their own visibility when they move
    if (Panel* p = panel())
    {
        std::vector<SeriesEntry> series;
        series.reserve(ordered.size());
        for (const auto& name : ordered)
        {
            const SeriesEntry* e = entry(name);
            series.push_back(e ? *e : SeriesEntry{name, format_.plot});
        }
        p->series_mut() = std::move(series);
    }
    variables_ = std::move(ordered);

    reflow();
    notify();
}

void AllInOneGrouper::reflow()
{
    if (Panel* p = panel())
        p->set_position(bbox_);
}

}   // namespace strata
