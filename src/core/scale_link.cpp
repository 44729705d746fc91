#include <algorithm>
#include <strata/logger.hpp>
#include <strata/scale_link.hpp>

namespace strata
{

// ─── ShareGroup ──────────────────────────────────────────────────────────────

bool ShareGroup::contains(PanelId panel) const
{
    return std::find(members.begin(), members.end(), panel) != members.end();
}

void ShareGroup::remove(PanelId panel)
{
    members.erase(std::remove(members.begin(), members.end(), panel), members.end());
    if (anchor == panel)
        anchor = members.empty() ? INVALID_PANEL_ID : members.front();
}

// ─── ScaleLinkManager ────────────────────────────────────────────────────────

ScaleLinkManager::ScaleLinkManager()  = default;
ScaleLinkManager::~ScaleLinkManager() = default;

ShareGroupId ScaleLinkManager::create_group(const std::string& name)
{
    ShareGroupId id = next_id_++;
    ShareGroup   group;
    group.id    = id;
    group.name  = name;
    groups_[id] = std::move(group);
    return id;
}

void ScaleLinkManager::remove_group(ShareGroupId id)
{
    groups_.erase(id);
}

void ScaleLinkManager::add_to_group(ShareGroupId id, PanelId panel)
{
    if (panel == INVALID_PANEL_ID)
        return;
    auto it = groups_.find(id);
    if (it == groups_.end())
        return;
    auto& group = it->second;
    if (!group.contains(panel))
    {
        group.members.push_back(panel);
        if (group.anchor == INVALID_PANEL_ID)
            group.anchor = panel;
    }
}

void ScaleLinkManager::set_members(ShareGroupId id, std::vector<PanelId> members)
{
    auto it = groups_.find(id);
    if (it == groups_.end())
        return;
    auto& group = it->second;
    members.erase(std::remove(members.begin(), members.end(), INVALID_PANEL_ID), members.end());
    if (group.members == members)
        return;
    group.members = std::move(members);
    group.anchor  = group.members.empty() ? INVALID_PANEL_ID : group.members.front();
    STRATA_LOG_TRACE("links",
                     "share group '{}' now has {} members",
                     group.name,
                     group.members.size());
}

void ScaleLinkManager::remove_from_all(PanelId panel)
{
    for (auto& [id, group] : groups_)
        group.remove(panel);
}

PanelId ScaleLinkManager::anchor(ShareGroupId id) const
{
    auto it = groups_.find(id);
    return it != groups_.end() ? it->second.anchor : INVALID_PANEL_ID;
}

std::vector<ShareGroupId> ScaleLinkManager::groups_for(PanelId panel) const
{
    std::vector<ShareGroupId> result;
    for (const auto& [id, group] : groups_)
    {
        if (group.contains(panel))
            result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<PanelId> ScaleLinkManager::peers(PanelId panel) const
{
    std::vector<PanelId> result;
    for (ShareGroupId id : groups_for(panel))
    {
        for (PanelId member : groups_.at(id).members)
        {
            if (member != panel
                && std::find(result.begin(), result.end(), member) == result.end())
                result.push_back(member);
        }
    }
    return result;
}

const ShareGroup* ScaleLinkManager::group(ShareGroupId id) const
{
    auto it = groups_.find(id);
    return it != groups_.end() ? &it->second : nullptr;
}

void ScaleLinkManager::propagate_limits(PanelRegistry& panels, PanelId source)
{
    if (propagating_)
        return;
    const Panel* src = panels.get(source);
    if (!src)
        return;
    propagating_ = true;

    AxisLimits ylim     = src->y_limits();
    bool       inverted = src->y_inverted();
    for (PanelId peer_id : peers(source))
    {
        // Closed panels are skipped silently
        if (Panel* peer = panels.get(peer_id))
        {
            peer->ylim(ylim.min, ylim.max);
            peer->invert_y(inverted);
        }
    }

    propagating_ = false;
}

}   // namespace strata
