#include "focus_history.hpp"

#include <algorithm>

namespace paneldock
{

FocusHistory::FocusHistory(size_t limit) : limit_(std::max<size_t>(1, limit)) {}

bool FocusHistory::record(const PanelId& panel_id)
{
    if (panel_id.empty())
        return false;
    if (!entries_.empty() && entries_.front() == panel_id)
        return false;

    std::erase(entries_, panel_id);
    entries_.insert(entries_.begin(), panel_id);
    if (entries_.size() > limit_)
        entries_.resize(limit_);
    return true;
}

bool FocusHistory::remove(const PanelId& panel_id)
{
    return std::erase(entries_, panel_id) > 0;
}

bool FocusHistory::prune(const std::function<bool(const PanelId&)>& keep)
{
    return std::erase_if(entries_, [&](const PanelId& id) { return !keep(id); }) > 0;
}

void FocusHistory::assign(const std::vector<PanelId>& entries)
{
    entries_.clear();
    std::set<PanelId> seen;
    for (const auto& id : entries)
    {
        if (id.empty() || !seen.insert(id).second)
            continue;
        entries_.push_back(id);
        if (entries_.size() >= limit_)
            break;
    }
}

}   // namespace paneldock
