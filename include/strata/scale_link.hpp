#pragma once

#include <cstdint>
#include <strata/panel.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata
{

// A unique identifier for a share group
using ShareGroupId = uint32_t;

// A set of panels forced onto the same vertical scale. The anchor is the
// panel the others attach to (the leftmost visible one for group bars).
struct ShareGroup
{
    ShareGroupId         id = 0;
    std::string          name;
    PanelId              anchor = INVALID_PANEL_ID;
    std::vector<PanelId> members;

    bool contains(PanelId panel) const;
    void remove(PanelId panel);
};

// Manages vertical scale sharing between panels.
//
// Usage:
//   auto id = links.create_group("Pollen");
//   links.set_members(id, {p1, p2, p3});   // p1 becomes the anchor
//   links.propagate_limits(registry, p2);   // p1 and p3 follow p2's ylim
//
// Membership is always replaced as a whole through set_members() when a
// grouper reflows, so no two panels disagree about who is co-scaled.
class ScaleLinkManager
{
   public:
    ScaleLinkManager();
    ~ScaleLinkManager();

    // ── Group lifecycle ──────────────────────────────────────────────

    ShareGroupId create_group(const std::string& name);
    void         remove_group(ShareGroupId id);

    // ── Membership ───────────────────────────────────────────────────

    // Appends a member. The first member becomes the anchor.
    void add_to_group(ShareGroupId id, PanelId panel);

    // Replaces the member list; the anchor becomes the first entry.
    void set_members(ShareGroupId id, std::vector<PanelId> members);

    // Remove a panel from ALL groups (e.g. when the panel is destroyed).
    void remove_from_all(PanelId panel);

    // ── Queries ──────────────────────────────────────────────────────

    PanelId                   anchor(ShareGroupId id) const;
    std::vector<ShareGroupId> groups_for(PanelId panel) const;
    // All panels sharing a group with `panel`, excluding itself.
    std::vector<PanelId> peers(PanelId panel) const;
    const ShareGroup*    group(ShareGroupId id) const;
    size_t               group_count() const { return groups_.size(); }

    // ── Propagation ──────────────────────────────────────────────────

    // Copies the vertical limits and orientation of `source` to every
    // peer that still exists in `panels`.
    void propagate_limits(PanelRegistry& panels, PanelId source);

   private:
    std::unordered_map<ShareGroupId, ShareGroup> groups_;
    ShareGroupId                                 next_id_ = 1;

    // Guard against re-entrant propagation
    bool propagating_ = false;
};

}   // namespace strata
