#pragma once

#include <optional>
#include <strata/geometry.hpp>
#include <strata/panel.hpp>
#include <strata/scale_link.hpp>
#include <string>
#include <vector>

namespace strata
{

struct GroupBarStyle
{
    float angle_deg       = 45.0f;   // 90 draws vertical connectors
    float offset_fraction = 0.2f;    // bar height above the panels, in anchor heights
    bool  background      = true;
};

// Places the bracket-and-label decoration over the panels of a share group.
//
// The vertical offset is specified relative to the anchor panel but the bar
// lives in figure space, so the offset goes through pixels
// (panel fraction -> pixel delta -> figure fraction). Bars are never cached:
// callers re-run annotate() after every reflow or canvas resize.
class GroupBarAnnotator
{
   public:
    GroupBarAnnotator() = default;
    explicit GroupBarAnnotator(GroupBarStyle style) : style_(style) {}

    const GroupBarStyle& style() const { return style_; }
    GroupBarStyle&       style() { return style_; }

    // Geometry of a bar spanning `spanned`. std::nullopt for an empty span.
    std::optional<GroupBar> compute(const Rect&              anchor,
                                    const std::vector<Rect>& spanned,
                                    const std::string&       label,
                                    const FigureCanvas&      canvas) const;

    // Removes bars from `clear`, then attaches a fresh bar to the anchor of
    // share group `id`, spanning its visible members. Returns false when
    // nothing could be attached (empty group, closed panels).
    bool annotate(PanelRegistry&              panels,
                  const ScaleLinkManager&     links,
                  ShareGroupId                id,
                  const std::vector<PanelId>& clear,
                  const std::string&          label,
                  const FigureCanvas&         canvas) const;

    // Removes label and bracket together from every listed panel.
    static void remove(PanelRegistry& panels, const std::vector<PanelId>& ids);

   private:
    GroupBarStyle style_;
};

}   // namespace strata
