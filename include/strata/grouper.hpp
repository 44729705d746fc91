#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <strata/format.hpp>
#include <strata/geometry.hpp>
#include <strata/group_bar.hpp>
#include <strata/panel.hpp>
#include <strata/scale_link.hpp>
#include <strata/table.hpp>
#include <string>
#include <vector>

namespace strata
{

// State shared by all groupers of one diagram. The diagram and its groupers
// co-own it; panels inside are owned by `panels` alone.
struct DiagramContext
{
    DataTable        data;
    PanelRegistry    panels;
    ScaleLinkManager links;
    FigureCanvas     canvas;
    ShareGroupId     index_group = 0;   // every panel shares the index axis
};

// Layout owner of one group of columns.
//
// Subclasses decide how many panels exist and how the group envelope is
// divided among the visible ones. All mutations leave geometry, scale
// sharing and group bars consistent before they return.
class Grouper
{
   public:
    using ChangeCallback = std::function<void(Grouper&)>;

    virtual ~Grouper() = default;

    Grouper(const Grouper&)            = delete;
    Grouper& operator=(const Grouper&) = delete;

    virtual GrouperKind kind() const = 0;

    const std::string& group() const { return group_; }
    const Rect&        bbox() const { return bbox_; }
    const PanelFormat& format() const { return format_; }

    // Member variables in display order.
    virtual std::vector<std::string> names() const                       = 0;
    virtual bool                     is_visible(const std::string& name) const = 0;
    bool                             has(const std::string& name) const;

    // No-ops for unknown names and for names already in the requested state.
    virtual void show(const std::string& name) = 0;
    virtual void hide(const std::string& name) = 0;

    // Known names are moved to the front in the given order, unknown ones are
    // ignored and unmentioned members follow in their previous order.
    virtual void reorder(const std::vector<std::string>& names) = 0;

    // Moves the group into a new envelope and reflows it.
    void resize(const Rect& envelope);

    // Recomputes panel geometry, scale sharing and group bars.
    virtual void reflow() = 0;

    // Recomputes the group bars only (e.g. after a canvas resize).
    virtual void refresh_group_bars() {}

    // Enables group bars at `offset_fraction` anchor heights above the panels.
    virtual void group_plots(float offset_fraction) { (void)offset_fraction; }

    // Read-only accessors for a visibility tree.
    std::string subgroup_of(const std::string& name) const;
    ColumnStats stats(const std::string& name) const;

    const std::vector<PanelId>& panel_ids() const { return panel_ids_; }
    std::vector<Panel*>         panels() const;
    std::vector<Panel*>         visible_panels() const;
    size_t                      panel_count() const { return panel_ids_.size(); }

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   protected:
    Grouper(std::shared_ptr<DiagramContext> ctx,
            std::string                     group,
            const Rect&                     bbox,
            PanelFormat                     format,
            std::optional<AxisLimits>       xlim_override);

    Panel&     create_panel();
    AxisLimits initial_xlim(const std::string& variable) const;
    void       notify();

    std::shared_ptr<DiagramContext> ctx_;
    std::string                     group_;
    Rect                            bbox_;
    PanelFormat                     format_;
    std::optional<AxisLimits>       xlim_override_;
    std::vector<PanelId>            panel_ids_;

   private:
    ChangeCallback on_change_;
};

// One panel per column, laid out left to right with equal widths.
class DefaultGrouper : public Grouper
{
   public:
    DefaultGrouper(std::shared_ptr<DiagramContext> ctx,
                   std::string                     group,
                   const Rect&                     bbox,
                   const std::vector<std::string>& variables,
                   PanelFormat                     format,
                   std::optional<AxisLimits>       xlim_override = std::nullopt);
    ~DefaultGrouper() override;

    GrouperKind kind() const override { return GrouperKind::Default; }

    std::vector<std::string> names() const override;
    bool                     is_visible(const std::string& name) const override;

    void show(const std::string& name) override;
    void hide(const std::string& name) override;
    void reorder(const std::vector<std::string>& names) override;
    void reflow() override;
    void refresh_group_bars() override;
    void group_plots(float offset_fraction) override;

    // Panel of a member, nullptr if unknown or closed.
    Panel* panel_for(const std::string& name) const;

    // Share group of the given subgroup key (the group name without subgroups).
    ShareGroupId share_group(const std::string& key) const;

    std::optional<float> group_bar_offset() const { return bar_offset_; }

   protected:
    // Widths of the visible panels; they must add up to bbox().w.
    virtual std::vector<float> allocate(const std::vector<Panel*>& visible) const;

   private:
    struct Member
    {
        std::string name;
        std::string share_key;
        PanelId     panel = INVALID_PANEL_ID;
    };

    const Member* find(const std::string& name) const;
    void          relink();

    std::vector<Member>                               members_;
    std::vector<std::pair<std::string, ShareGroupId>> share_groups_;
    std::optional<float>                              bar_offset_;
    GroupBarAnnotator                                 annotator_;
};

// One panel per column; widths proportional to each panel's x range.
class PercentageGrouper : public DefaultGrouper
{
   public:
    PercentageGrouper(std::shared_ptr<DiagramContext> ctx,
                      std::string                     group,
                      const Rect&                     bbox,
                      const std::vector<std::string>& variables,
                      PanelFormat                     format,
                      std::optional<AxisLimits>       xlim_override = std::nullopt);

    GrouperKind kind() const override { return GrouperKind::Percentage; }

    // Raises every x range below `floor` to [0, floor] and reflows when
    // anything changed. Returns whether a range was raised.
    bool apply_floor(float floor);

   protected:
    std::vector<float> allocate(const std::vector<Panel*>& visible) const override;
};

// All columns overlaid in a single panel; visibility is a per-series
// directive and never changes the geometry.
class AllInOneGrouper : public Grouper
{
   public:
    AllInOneGrouper(std::shared_ptr<DiagramContext> ctx,
                    std::string                     group,
                    const Rect&                     bbox,
                    const std::vector<std::string>& variables,
                    PanelFormat                     format,
                    std::optional<AxisLimits>       xlim_override = std::nullopt);

    GrouperKind kind() const override { return GrouperKind::AllInOne; }

    std::vector<std::string> names() const override { return variables_; }
    bool                     is_visible(const std::string& name) const override;

    void show(const std::string& name) override;
    void hide(const std::string& name) override;
    void reorder(const std::vector<std::string>& names) override;
    void reflow() override;

    Panel* panel() const;

   private:
    SeriesEntry* entry(const std::string& name) const;

    std::vector<std::string> variables_;
};

// Same as AllInOneGrouper, drawn as a cumulative stack.
class StackedGrouper : public AllInOneGrouper
{
   public:
    using AllInOneGrouper::AllInOneGrouper;

    GrouperKind kind() const override { return GrouperKind::Stacked; }
};

// Upper x limit for percentage panels: `value` rounded up to the next
// multiple of its decade (34.2 -> 40, 3.7 -> 4). Zero for non-positive input.
float rounded_upper_limit(float value);

// Builds the grouper variant for `kind`.
std::unique_ptr<Grouper> make_grouper(GrouperKind                     kind,
                                      std::shared_ptr<DiagramContext> ctx,
                                      const std::string&              group,
                                      const Rect&                     bbox,
                                      const std::vector<std::string>& variables,
                                      bool                            use_bars,
                                      const FormatOverrides&          overrides = {});

}   // namespace strata
