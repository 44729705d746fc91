#include <algorithm>
#include <stdexcept>
#include <strata/logger.hpp>
#include <strata/stratplot.hpp>

namespace strata
{

namespace
{

bool contains(const std::vector<std::string>& list, const std::string& value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}

}   // anonymous namespace

ClassifierOptions StratOptions::classifier_options() const
{
    ClassifierOptions opts;
    opts.percentages           = percentages;
    opts.exclude               = exclude;
    opts.percentage_basis      = percentage_basis;
    opts.calculate_percentages = calculate_percentages;
    opts.threshold             = threshold;
    opts.summed                = summed;
    opts.sum_all_groups        = sum_all_groups;
    opts.subgroups             = subgroups;
    return opts;
}

GrouperKind resolve_kind(const std::string& group, const StratOptions& options)
{
    if (contains(options.all_in_one, group))
        return GrouperKind::AllInOne;
    if (contains(options.stacked, group) || group == SUMMED_GROUP)
        return GrouperKind::Stacked;
    if (contains(options.percentages, group))
        return GrouperKind::Percentage;
    return GrouperKind::Default;
}

float resolve_width(const std::string&              group,
                    const std::vector<std::string>& groups,
                    const StratOptions&             options)
{
    auto it = options.widths.find(group);
    if (it != options.widths.end())
        return it->second;

    size_t n = 0;
    for (const auto& g : groups)
    {
        if (!contains(options.percentages, g))
            ++n;
    }
    return 1.0f / static_cast<float>(std::max<size_t>(n, 1));
}

// ─── StratDiagram ────────────────────────────────────────────────────────────

StratDiagram::StratDiagram(ConstructKey, std::shared_ptr<DiagramContext> ctx, const Rect& envelope)
    : ctx_(std::move(ctx)), envelope_(envelope)
{
}

StratDiagram::~StratDiagram()
{
    for (auto& g : groupers_)
        g->set_on_change(nullptr);
}

Grouper* StratDiagram::grouper(const std::string& group) const
{
    for (const auto& g : groupers_)
    {
        if (g->group() == group)
            return g.get();
    }
    return nullptr;
}

std::vector<Panel*> StratDiagram::panels() const
{
    std::vector<Panel*> result;
    for (const auto& g : groupers_)
    {
        auto ps = g->panels();
        result.insert(result.end(), ps.begin(), ps.end());
    }
    return result;
}

void StratDiagram::begin_batch()
{
    ++batch_depth_;
}

void StratDiagram::end_batch()
{
    if (batch_depth_ == 0)
    {
        STRATA_LOG_WARN("stratplot", "end_batch() without matching begin_batch()");
        return;
    }
    if (--batch_depth_ > 0 || !pending_)
        return;

    pending_ = false;
    if (on_change_)
        on_change_(*this);
}

void StratDiagram::notify_resize(uint32_t width_px, uint32_t height_px)
{
    if (ctx_->canvas.width == width_px && ctx_->canvas.height == height_px)
        return;

    ctx_->canvas.width  = width_px;
    ctx_->canvas.height = height_px;
    STRATA_LOG_DEBUG("stratplot", "Canvas resized to {}x{}", width_px, height_px);

    for (auto& g : groupers_)
        g->refresh_group_bars();
    handle_change();
}

void StratDiagram::close()
{
    if (closed_)
        return;
    closed_ = true;
    ctx_->panels.clear();
    STRATA_LOG_DEBUG("stratplot", "Diagram closed");
    handle_change();
}

void StratDiagram::draw(PanelRenderer& renderer) const
{
    renderer.begin_frame(ctx_->canvas);
    for (Panel* p : panels())
    {
        if (!p->visible())
            continue;

        PanelView view;
        view.panel          = p;
        view.index          = ctx_->data.index();
        view.share_partners = ctx_->links.peers(p->id());
        for (const auto& entry : p->series())
        {
            SeriesView sv;
            sv.entry = &entry;
            if (ctx_->data.has_column(entry.variable))
                sv.values = ctx_->data.column(entry.variable);
            view.series.push_back(sv);
        }
        renderer.draw_panel(view);
    }
    renderer.end_frame();
}

void StratDiagram::handle_change()
{
    update_dividers();
    if (batch_depth_ > 0)
    {
        pending_ = true;
        return;
    }
    if (on_change_)
        on_change_(*this);
}

void StratDiagram::update_dividers()
{
    for (Panel* p : panels())
    {
        const Rect& r    = p->position();
        p->spines().left = nearly_equal(r.x, envelope_.x) ? SpineStyle::Solid : SpineStyle::Dotted;
        p->spines().right =
            nearly_equal(r.x1(), envelope_.x1()) ? SpineStyle::Solid : SpineStyle::Dotted;
    }
}

// ─── stratplot ───────────────────────────────────────────────────────────────

std::unique_ptr<StratDiagram> stratplot(const DataTable&    table,
                                        const ClassifyFn&   classify,
                                        const StratOptions& options,
                                        const FigureCanvas& canvas)
{
    if (options.trunc_height < 0.0f || options.trunc_height >= 1.0f)
        throw std::invalid_argument("trunc_height must be in [0, 1)");

    Classification cls = classify_columns(table, classify, options.classifier_options());
    for (const auto& [group, fraction] : options.widths)
    {
        if (!contains(cls.group_order, group))
            STRATA_LOG_DEBUG("stratplot", "ignoring width {} of unknown group '{}'", fraction, group);
    }

    auto ctx         = std::make_shared<DiagramContext>();
    ctx->data        = std::move(cls.data);
    ctx->canvas      = canvas;
    ctx->index_group = ctx->links.create_group("index");

    DiagramContext* raw = ctx.get();
    ctx->panels.set_removed_callback([raw](PanelId id) { raw->links.remove_from_all(id); });

    const Rect envelope = options.bbox.value_or(default_envelope());
    const float height  = envelope.h * (1.0f - options.trunc_height);
    // Group bars sit halfway into the band reserved above the panels.
    const float bar_offset = options.trunc_height > 0.0f
                                 ? 0.5f * options.trunc_height / (1.0f - options.trunc_height)
                                 : 0.0f;

    auto diagram = std::make_unique<StratDiagram>(StratDiagram::ConstructKey{}, ctx, envelope);
    StratDiagram::BatchGuard batch(*diagram);

    float x = envelope.x;
    for (const auto& group : cls.group_order)
    {
        std::vector<std::string> vars = cls.plotted_members(group);
        if (vars.empty())
        {
            STRATA_LOG_DEBUG("stratplot", "Group '{}' has nothing to plot", group);
            continue;
        }

        GrouperKind kind = resolve_kind(group, options);
        float       w    = resolve_width(group, cls.group_order, options) * envelope.w;
        bool use_bars    = options.bars_for_all || contains(options.use_bars, group);

        FormatOverrides overrides;
        auto            fo = options.formatoptions.find(group);
        if (fo != options.formatoptions.end())
            overrides = fo->second;
        if (!overrides.group_bar_angle)
            overrides.group_bar_angle = options.group_bar_angle;

        Rect bbox{x, envelope.y, w, height};
        auto g = make_grouper(kind, ctx, group, bbox, vars, use_bars, overrides);

        if (kind == GrouperKind::Percentage)
            static_cast<PercentageGrouper&>(*g).apply_floor(options.min_percentage);
        if (group != NOGROUP)
            g->group_plots(bar_offset);

        STRATA_LOG_INFO("stratplot", "Group '{}': {} ({} columns, width {})", group,
                        to_string(kind), vars.size(), w);

        StratDiagram* d = diagram.get();
        g->set_on_change([d](Grouper&) { d->handle_change(); });
        diagram->groupers_.push_back(std::move(g));
        x += w;
    }

    auto all = diagram->panels();
    if (!all.empty())
    {
        Panel* first = all.front();
        auto   idx   = ctx->data.index();
        if (!idx.empty())
        {
            auto [lo, hi] = std::minmax_element(idx.begin(), idx.end());
            first->ylim(*lo, *hi);
        }
        first->invert_y(true);
        first->format().y_ticks_visible = true;
        first->ylabel(ctx->data.index_name());
        ctx->links.propagate_limits(ctx->panels, first->id());
    }
    else
    {
        STRATA_LOG_WARN("stratplot", "No columns left to plot");
    }

    diagram->handle_change();
    return diagram;
}

}   // namespace strata
