#include <algorithm>
#include <cmath>
#include <paneldock/layout_presets.hpp>
#include <paneldock/layout_tree.hpp>
#include <set>
#include <stdexcept>

namespace paneldock
{

namespace
{

void collect_groups_into(const LayoutNode& node, std::vector<LayoutNode>& out)
{
    if (node.is_panel() || node.is_tabs())
    {
        out.push_back(node);
        return;
    }
    for (const auto& child : node.children)
        collect_groups_into(child, out);
}

size_t resolve_column_count(size_t count, const LayoutPreset& preset)
{
    if (count <= 1)
        return 1;
    if (preset.kind == LayoutPreset::Kind::Auto)
    {
        auto cols = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(count))));
        return std::max<size_t>(1, cols);
    }
    return std::max<size_t>(1, std::min(preset.columns, count));
}

class SplitIdAllocator
{
   public:
    explicit SplitIdAllocator(const LayoutNode& root)
    {
        auto ids = collect_split_ids(root);
        used_.insert(ids.begin(), ids.end());
    }

    SplitId next()
    {
        size_t  n  = used_.size() + 1;
        SplitId id = "split-" + std::to_string(n);
        while (used_.count(id))
            id = "split-" + std::to_string(++n);
        used_.insert(id);
        return id;
    }

   private:
    std::set<SplitId> used_;
};

LayoutNode make_even_split(SplitIdAllocator&       ids,
                           SplitDirection          direction,
                           std::vector<LayoutNode> children)
{
    size_t n = children.size();
    return LayoutNode::split(ids.next(),
                             direction,
                             std::move(children),
                             normalize_split_sizes(std::vector<double>(n, 1.0), n));
}

}   // namespace

// ─── Grid presets ────────────────────────────────────────────────────────────

std::vector<LayoutNode> collect_layout_groups(const LayoutNode& root)
{
    std::vector<LayoutNode> out;
    collect_groups_into(root, out);
    return out;
}

LayoutNode build_layout_preset(const LayoutNode& root, const LayoutPreset& preset)
{
    auto groups = collect_layout_groups(root);
    if (groups.empty())
        return root;
    if (groups.size() == 1)
        return groups.front();

    size_t           columns = resolve_column_count(groups.size(), preset);
    SplitIdAllocator ids(root);

    std::vector<LayoutNode> rows;
    for (size_t start = 0; start < groups.size(); start += columns)
    {
        size_t end = std::min(start + columns, groups.size());
        if (end - start == 1)
        {
            rows.push_back(groups[start]);
            continue;
        }
        std::vector<LayoutNode> row(groups.begin() + static_cast<std::ptrdiff_t>(start),
                                    groups.begin() + static_cast<std::ptrdiff_t>(end));
        rows.push_back(make_even_split(ids, SplitDirection::Horizontal, std::move(row)));
    }

    if (rows.size() == 1)
        return rows.front();
    return make_even_split(ids, SplitDirection::Vertical, std::move(rows));
}

// ─── Default layout ──────────────────────────────────────────────────────────

namespace
{

int region_order(PanelRegion region)
{
    switch (region)
    {
        case PanelRegion::Center:
            return 0;
        case PanelRegion::Left:
            return 1;
        case PanelRegion::Right:
            return 2;
        case PanelRegion::Top:
            return 3;
        case PanelRegion::Bottom:
            return 4;
    }
    return 0;
}

PanelId resolve_default_panel_id(const std::string& panel_type, std::set<PanelId>& used)
{
    PanelId preferred;
    if (panel_type == "sessions")
        preferred = "sessions-1";
    else if (panel_type == "chat")
        preferred = "chat-1";

    if (!preferred.empty() && !used.count(preferred))
    {
        used.insert(preferred);
        return preferred;
    }

    size_t  n  = 1;
    PanelId id = panel_type + "-" + std::to_string(n);
    while (used.count(id))
        id = panel_type + "-" + std::to_string(++n);
    used.insert(id);
    return id;
}

}   // namespace

LayoutPersistence create_default_panel_layout(const std::vector<PanelTypeManifest>& manifests)
{
    std::vector<const PanelTypeManifest*> selected;
    for (const auto& m : manifests)
    {
        if (m.default_placement)
            selected.push_back(&m);
    }
    if (selected.empty())
    {
        for (const auto& m : manifests)
            selected.push_back(&m);
    }
    if (selected.empty())
        throw std::runtime_error("No panels registered.");

    struct Entry
    {
        const PanelTypeManifest* manifest;
        PanelId                  panel_id;
    };

    LayoutPersistence  result;
    std::set<PanelId>  used;
    std::vector<Entry> entries;
    for (const auto* m : selected)
    {
        PanelId id = resolve_default_panel_id(m->type, used);
        result.panels[id] = PanelInstance{.panel_id = id, .panel_type = m->type};
        entries.push_back({m, id});
    }

    std::stable_sort(entries.begin(),
                     entries.end(),
                     [](const Entry& a, const Entry& b)
                     {
                         auto ra = a.manifest->default_placement
                                       ? a.manifest->default_placement->region
                                       : PanelRegion::Center;
                         auto rb = b.manifest->default_placement
                                       ? b.manifest->default_placement->region
                                       : PanelRegion::Center;
                         return region_order(ra) < region_order(rb);
                     });

    std::optional<LayoutNode> layout;
    for (const auto& entry : entries)
    {
        if (!layout)
        {
            layout = LayoutNode::panel(entry.panel_id);
            continue;
        }
        PanelPlacement placement = entry.manifest->default_placement.value_or(PanelPlacement{});
        layout = insert_panel(*layout, entry.panel_id, placement);
    }

    result.layout = std::move(*layout);
    return result;
}

}   // namespace paneldock
