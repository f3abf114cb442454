#pragma once

#include <paneldock/fwd.hpp>

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace paneldock
{

// Most-recently-focused-first list of panel ids, deduplicated and capped.
class FocusHistory
{
   public:
    static constexpr size_t DEFAULT_LIMIT = 50;

    explicit FocusHistory(size_t limit = DEFAULT_LIMIT);

    // Moves the id to the front. Returns true when the list changed.
    bool record(const PanelId& panel_id);
    bool remove(const PanelId& panel_id);
    // Drops every id for which `keep` returns false.
    bool prune(const std::function<bool(const PanelId&)>& keep);
    void clear() { entries_.clear(); }

    // Replaces the contents; input is deduplicated and capped.
    void assign(const std::vector<PanelId>& entries);

    const std::vector<PanelId>& entries() const { return entries_; }
    size_t                      size() const { return entries_.size(); }
    size_t                      limit() const { return limit_; }
    bool                        empty() const { return entries_.empty(); }

   private:
    size_t               limit_;
    std::vector<PanelId> entries_;
};

}   // namespace paneldock
