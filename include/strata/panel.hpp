#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <strata/format.hpp>
#include <strata/geometry.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata
{

// Stable panel identifier, unique within one PanelRegistry.
using PanelId = uint32_t;

// Sentinel value for "no panel".
inline constexpr PanelId INVALID_PANEL_ID = 0;

// Bracket-and-label decoration spanning the panels of one (sub)group.
// All coordinates are figure fractions.
struct GroupBar
{
    float             x0         = 0.0f;   // left anchor
    float             x1         = 0.0f;   // right anchor
    float             top        = 0.0f;   // top edge of the spanned panels
    float             offset     = 0.0f;   // height of the bar above `top`
    float             offset_px  = 0.0f;
    float             angle_deg  = 45.0f;
    float             arm_px     = 0.0f;   // bracket arm length in pixels
    float             shift      = 0.0f;   // horizontal run of the arms
    std::string       label;
    Vec2              label_pos;
    bool              background = true;   // label occludes what is below it
    std::vector<Vec2> bracket;             // polyline from (x0, top) to (x1, top)
};

// One series drawn inside a panel. An empty `draw` directive hides it.
struct SeriesEntry
{
    std::string             variable;
    std::optional<PlotKind> draw;
};

struct Spines
{
    SpineStyle left  = SpineStyle::Solid;
    SpineStyle right = SpineStyle::Solid;
};

// A rectangular plotting region bound to one column (or to several for the
// combined variants). Geometry only; drawing is left to a PanelRenderer.
class Panel
{
   public:
    Panel(PanelId id, std::string group);

    PanelId            id() const { return id_; }
    const std::string& group() const { return group_; }

    const Rect& position() const { return position_; }
    void        set_position(const Rect& r) { position_ = r; }

    bool visible() const { return visible_; }
    void visible(bool v) { visible_ = v; }

    const std::string& title() const { return title_; }
    void               title(const std::string& t) { title_ = t; }

    const std::string& ylabel() const { return ylabel_; }
    void               ylabel(const std::string& lbl) { ylabel_ = lbl; }

    const std::vector<SeriesEntry>& series() const { return series_; }
    std::vector<SeriesEntry>&       series_mut() { return series_; }
    std::vector<std::string>        variables() const;

    PanelFormat&       format() { return format_; }
    const PanelFormat& format() const { return format_; }

    AxisLimits x_limits() const { return xlim_; }
    void       xlim(float min, float max) { xlim_ = {min, max}; }
    AxisLimits y_limits() const { return ylim_; }
    void       ylim(float min, float max) { ylim_ = {min, max}; }
    bool       y_inverted() const { return y_inverted_; }
    void       invert_y(bool inverted) { y_inverted_ = inverted; }

    Spines&       spines() { return spines_; }
    const Spines& spines() const { return spines_; }

    const std::optional<GroupBar>& group_bar() const { return group_bar_; }
    void                           set_group_bar(GroupBar bar) { group_bar_ = std::move(bar); }
    void                           clear_group_bar() { group_bar_.reset(); }

   private:
    PanelId                  id_;
    std::string              group_;
    Rect                     position_;
    bool                     visible_ = true;
    std::string              title_;
    std::string              ylabel_;
    std::vector<SeriesEntry> series_;
    PanelFormat              format_;
    AxisLimits               xlim_;
    AxisLimits               ylim_;
    bool                     y_inverted_ = false;
    Spines                   spines_;
    std::optional<GroupBar>  group_bar_;
};

// Owns the panels of one diagram. Everybody else refers to panels by id and
// must expect get() to return nullptr once a panel has been removed.
class PanelRegistry
{
   public:
    using RemovedCallback = std::function<void(PanelId)>;

    Panel& create(const std::string& group);

    Panel*       get(PanelId id);
    const Panel* get(PanelId id) const;
    bool         contains(PanelId id) const;

    // Returns false if the id is unknown.
    bool remove(PanelId id);
    void clear();

    const std::vector<PanelId>& ids() const { return insertion_order_; }
    size_t                      count() const { return panels_.size(); }

    void set_removed_callback(RemovedCallback cb) { on_removed_ = std::move(cb); }

   private:
    std::unordered_map<PanelId, std::unique_ptr<Panel>> panels_;
    std::vector<PanelId>                                insertion_order_;
    PanelId                                             next_id_ = 1;
    RemovedCallback                                     on_removed_;
};

}   // namespace strata
