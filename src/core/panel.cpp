#include <algorithm>
#include <strata/panel.hpp>

namespace strata
{

// --- Panel ---

Panel::Panel(PanelId id, std::string group) : id_(id), group_(std::move(group)) {}

std::vector<std::string> Panel::variables() const
{
    std::vector<std::string> names;
    names.reserve(series_.size());
    for (const auto& s : series_)
        names.push_back(s.variable);
    return names;
}

// --- PanelRegistry ---

Panel& PanelRegistry::create(const std::string& group)
{
    PanelId id  = next_id_++;
    auto    ptr = std::make_unique<Panel>(id, group);
    Panel&  ref = *ptr;
    panels_[id] = std::move(ptr);
    insertion_order_.push_back(id);
    return ref;
}

Panel* PanelRegistry::get(PanelId id)
{
    auto it = panels_.find(id);
    return (it != panels_.end()) ? it->second.get() : nullptr;
}

const Panel* PanelRegistry::get(PanelId id) const
{
    auto it = panels_.find(id);
    return (it != panels_.end()) ? it->second.get() : nullptr;
}

bool PanelRegistry::contains(PanelId id) const
{
    return panels_.count(id) > 0;
}

bool PanelRegistry::remove(PanelId id)
{
    auto it = panels_.find(id);
    if (it == panels_.end())
        return false;
    panels_.erase(it);
    insertion_order_.erase(std::remove(insertion_order_.begin(), insertion_order_.end(), id),
                           insertion_order_.end());
    if (on_removed_)
        on_removed_(id);
    return true;
}

void PanelRegistry::clear()
{
    auto ids = insertion_order_;
    for (PanelId id : ids)
        remove(id);
}

}   // namespace strata
