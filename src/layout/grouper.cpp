#include <algorithm>
#include <strata/grouper.hpp>
#include <strata/logger.hpp>

namespace strata
{

// ─── Grouper ─────────────────────────────────────────────────────────────────

Grouper::Grouper(std::shared_ptr<DiagramContext> ctx,
                 std::string                     group,
                 const Rect&                     bbox,
                 PanelFormat                     format,
                 std::optional<AxisLimits>       xlim_override)
    : ctx_(std::move(ctx)),
      group_(std::move(group)),
      bbox_(bbox),
      format_(std::move(format)),
      xlim_override_(xlim_override)
{
}

bool Grouper::has(const std::string& name) const
{
    auto all = names();
    return std::find(all.begin(), all.end(), name) != all.end();
}

void Grouper::resize(const Rect& envelope)
{
    bbox_ = envelope;
    reflow();
    notify();
}

std::string Grouper::subgroup_of(const std::string& name) const
{
    if (!ctx_->data.has_column(name))
        return {};
    return ctx_->data.info(name).subgroup;
}

ColumnStats Grouper::stats(const std::string& name) const
{
    if (!ctx_->data.has_column(name))
        return {};
    return ctx_->data.stats(name);
}

std::vector<Panel*> Grouper::panels() const
{
    std::vector<Panel*> result;
    for (PanelId id : panel_ids_)
    {
        if (Panel* p = ctx_->panels.get(id))
            result.push_back(p);
    }
    return result;
}

std::vector<Panel*> Grouper::visible_panels() const
{
    std::vector<Panel*> result;
    for (Panel* p : panels())
    {
        if (p->visible())
            result.push_back(p);
    }
    return result;
}

Panel& Grouper::create_panel()
{
    Panel& p = ctx_->panels.create(group_);
    p.format() = format_;
    p.set_position(bbox_);
    panel_ids_.push_back(p.id());
    ctx_->links.add_to_group(ctx_->index_group, p.id());
    return p;
}

AxisLimits Grouper::initial_xlim(const std::string& variable) const
{
    if (xlim_override_)
        return *xlim_override_;

    ColumnStats st = stats(variable);
    if (st.count == 0)
        return {0.0f, 1.0f};
    if (format_.rounded_xlim)
        return {0.0f, rounded_upper_limit(st.max)};
    if (st.min == st.max)
        return {st.min - 0.5f, st.max + 0.5f};
    return {st.min, st.max};
}

void Grouper::notify()
{
    if (on_change_)
        on_change_(*this);
}

// ─── DefaultGrouper ──────────────────────────────────────────────────────────

DefaultGrouper::DefaultGrouper(std::shared_ptr<DiagramContext> ctx,
                               std::string                     group,
                               const Rect&                     bbox,
                               const std::vector<std::string>& variables,
                               PanelFormat                     format,
                               std::optional<AxisLimits>       xlim_override)
    : Grouper(std::move(ctx), std::move(group), bbox, std::move(format), xlim_override)
{
    annotator_.style().angle_deg = format_.group_bar_angle;

    // Panels of one subgroup are kept adjacent, subgroups in first-occurrence order
    std::vector<std::pair<std::string, std::vector<std::string>>> buckets;
    for (const auto& var : variables)
    {
        std::string key = subgroup_of(var);
        auto it = std::find_if(
            buckets.begin(), buckets.end(), [&](const auto& b) { return b.first == key; });
        if (it == buckets.end())
            buckets.push_back({key, {var}});
        else
            it->second.push_back(var);
    }

    for (const auto& [subgroup, vars] : buckets)
    {
        for (const auto& var : vars)
        {
            Panel& p = create_panel();
            p.series_mut().push_back({var, format_.plot});

            std::string long_name = ctx_->data.has_column(var) ? ctx_->data.info(var).long_name : "";
            p.title(wrap_text(expand_label(format_.title, var, group_, long_name), format_.title_wrap));
            AxisLimits xlim = initial_xlim(var);
            p.xlim(xlim.min, xlim.max);

            Member m;
            m.name      = var;
            m.share_key = subgroup.empty() ? group_ : subgroup;
            m.panel     = p.id();
            if (share_group(m.share_key) == 0)
                share_groups_.emplace_back(m.share_key, ctx_->links.create_group(m.share_key));
            members_.push_back(std::move(m));
        }
    }

    reflow();
}

DefaultGrouper::~DefaultGrouper()
{
    for (const auto& [key, id] : share_groups_)
        ctx_->links.remove_group(id);
}

std::vector<std::string> DefaultGrouper::names() const
{
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& m : members_)
        result.push_back(m.name);
    return result;
}

bool DefaultGrouper::is_visible(const std::string& name) const
{
    Panel* p = panel_for(name);
    return p && p->visible();
}

Panel* DefaultGrouper::panel_for(const std::string& name) const
{
    const Member* m = find(name);
    return m ? ctx_->panels.get(m->panel) : nullptr;
}

ShareGroupId DefaultGrouper::share_group(const std::string& key) const
{
    for (const auto& [k, id] : share_groups_)
    {
        if (k == key)
            return id;
    }
    return 0;
}

const DefaultGrouper::Member* DefaultGrouper::find(const std::string& name) const
{
    for (const auto& m : members_)
    {
        if (m.name == name)
            return &m;
    }
    return nullptr;
}

void DefaultGrouper::hide(const std::string& name)
{
    Panel* p = panel_for(name);
    if (!p || !p->visible())
        return;
    STRATA_LOG_DEBUG("grouper", "hiding '{}' in group '{}'", name, group_);
    p->visible(false);
    reflow();
    notify();
}

void DefaultGrouper::show(const std::string& name)
{
    Panel* p = panel_for(name);
    if (!p || p->visible())
        return;
    STRATA_LOG_DEBUG("grouper", "showing '{}' in group '{}'", name, group_);
    p->visible(true);
    reflow();
    notify();
}

void DefaultGrouper::reorder(const std::vector<std::string>& names)
{
    std::vector<Member> ordered;
    ordered.reserve(members_.size());
    auto taken = [&](const std::string& n)
    {
        return std::any_of(
            ordered.begin(), ordered.end(), [&](const Member& m) { return m.name == n; });
    };

    for (const auto& name : names)
    {
        const Member* m = find(name);
        if (!m)
        {
            STRATA_LOG_WARN("grouper", "reorder: '{}' is not a member of '{}'", name, group_);
            continue;
        }
        if (!taken(name))
            ordered.push_back(*m);
    }
    for (const auto& m : members_)
    {
        if (!taken(m.name))
            ordered.push_back(m);
    }

    members_ = std::move(ordered);
    panel_ids_.clear();
    for (const auto& m : members_)
        panel_ids_.push_back(m.panel);

    reflow();
    notify();
}

std::vector<float> DefaultGrouper::allocate(const std::vector<Panel*>& visible) const
{
    float w = bbox_.w / static_cast<float>(visible.size());
    return std::vector<float>(visible.size(), w);
}

void DefaultGrouper::reflow()
{
    auto visible = visible_panels();
    if (!visible.empty())
    {
        auto  widths = allocate(visible);
        float x      = bbox_.x;
        for (size_t i = 0; i < visible.size(); ++i)
        {
            // The last panel absorbs rounding so the envelope is filled exactly
            float w = (i + 1 == visible.size()) ? bbox_.x1() - x : widths[i];
            visible[i]->set_position({x, bbox_.y, w, bbox_.h});
            x += w;
        }
    }
    relink();
    refresh_group_bars();
}

void DefaultGrouper::relink()
{
    for (const auto& [key, id] : share_groups_)
    {
        std::vector<PanelId> shared;
        for (const auto& m : members_)
        {
            const Panel* p = ctx_->panels.get(m.panel);
            if (m.share_key == key && p && p->visible())
                shared.push_back(m.panel);
        }
        ctx_->links.set_members(id, std::move(shared));
    }
}

void DefaultGrouper::refresh_group_bars()
{
    if (!bar_offset_)
    {
        GroupBarAnnotator::remove(ctx_->panels, panel_ids_);
        return;
    }

    annotator_.style().offset_fraction = *bar_offset_;
    for (const auto& [key, id] : share_groups_)
    {
        std::vector<PanelId> clear;
        for (const auto& m : members_)
        {
            if (m.share_key == key)
                clear.push_back(m.panel);
        }
        annotator_.annotate(ctx_->panels, ctx_->links, id, clear, key, ctx_->canvas);
    }
}

void DefaultGrouper::group_plots(float offset_fraction)
{
    bar_offset_ = offset_fraction;
    refresh_group_bars();
}

// ─── factory ─────────────────────────────────────────────────────────────────

std::unique_ptr<Grouper> make_grouper(GrouperKind                     kind,
                                      std::shared_ptr<DiagramContext> ctx,
                                      const std::string&              group,
                                      const Rect&                     bbox,
                                      const std::vector<std::string>& variables,
                                      bool                            use_bars,
                                      const FormatOverrides&          overrides)
{
    PanelFormat fmt = merge_format(default_format(kind, use_bars), overrides);
    switch (kind)
    {
        case GrouperKind::Percentage:
            return std::make_unique<PercentageGrouper>(
                std::move(ctx), group, bbox, variables, fmt, overrides.x_limits);
        case GrouperKind::AllInOne:
            return std::make_unique<AllInOneGrouper>(
                std::move(ctx), group, bbox, variables, fmt, overrides.x_limits);
        case GrouperKind::Stacked:
            return std::make_unique<StackedGrouper>(
                std::move(ctx), group, bbox, variables, fmt, overrides.x_limits);
        case GrouperKind::Default:
            break;
    }
    return std::make_unique<DefaultGrouper>(
        std::move(ctx), group, bbox, variables, fmt, overrides.x_limits);
}

}   // namespace strata
