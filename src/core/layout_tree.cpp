#include <algorithm>
#include <cmath>
#include <paneldock/layout_tree.hpp>
#include <set>

namespace paneldock
{

namespace
{

void collect_panel_ids_into(const LayoutNode& node, std::vector<PanelId>& out)
{
    if (node.is_panel())
    {
        out.push_back(node.panel_id);
        return;
    }
    for (const auto& child : node.children)
        collect_panel_ids_into(child, out);
}

void collect_split_ids_into(const LayoutNode& node, std::vector<SplitId>& out)
{
    if (node.is_panel())
        return;
    out.push_back(node.split_id);
    for (const auto& child : node.children)
        collect_split_ids_into(child, out);
}

void collect_visible_into(const LayoutNode& node, std::vector<PanelId>& out)
{
    if (node.is_panel())
    {
        out.push_back(node.panel_id);
        return;
    }
    if (node.children.empty())
        return;
    if (node.is_tabs())
    {
        collect_visible_into(node.children[active_child_index(node)], out);
        return;
    }
    for (const auto& child : node.children)
        collect_visible_into(child, out);
}

bool find_panel_path_into(const LayoutNode& node, const PanelId& panel_id, LayoutPath& path)
{
    if (node.is_panel())
        return node.panel_id == panel_id;
    for (size_t i = 0; i < node.children.size(); ++i)
    {
        path.push_back(i);
        if (find_panel_path_into(node.children[i], panel_id, path))
            return true;
        path.pop_back();
    }
    return false;
}

bool find_split_path_into(const LayoutNode& node, const SplitId& split_id, LayoutPath& path)
{
    if (node.is_panel())
        return false;
    if (node.split_id == split_id)
        return true;
    for (size_t i = 0; i < node.children.size(); ++i)
    {
        path.push_back(i);
        if (find_split_path_into(node.children[i], split_id, path))
            return true;
        path.pop_back();
    }
    return false;
}

bool is_valid_size(double v)
{
    return std::isfinite(v) && v > 0.0;
}

// Rebuilds the spine from the root to `path`, replacing the node at the end
// with the result of `fn`. Returns nullopt if `fn` does.
std::optional<LayoutNode> replace_at_path(
    const LayoutNode&                                                  node,
    const LayoutPath&                                                  path,
    size_t                                                             depth,
    const std::function<std::optional<LayoutNode>(const LayoutNode&)>& fn)
{
    if (depth == path.size())
        return fn(node);

    size_t index = path[depth];
    if (node.is_panel() || index >= node.children.size())
        return std::nullopt;

    auto replaced = replace_at_path(node.children[index], path, depth + 1, fn);
    if (!replaced)
        return std::nullopt;

    LayoutNode copy      = node;
    copy.children[index] = std::move(*replaced);
    return copy;
}

bool is_edge_first(PanelRegion region)
{
    return region == PanelRegion::Left || region == PanelRegion::Top;
}

SplitDirection direction_for(PanelRegion region)
{
    return (region == PanelRegion::Top || region == PanelRegion::Bottom)
               ? SplitDirection::Vertical
               : SplitDirection::Horizontal;
}

// Adds a leaf to a tabs node after `after_index`, giving it an equal share.
LayoutNode join_tabs(const LayoutNode& tabs, const PanelId& panel_id, size_t after_index)
{
    LayoutNode          copy = tabs;
    size_t              n    = copy.children.size();
    std::vector<double> base = normalize_split_sizes(copy.sizes, n);

    double scale = static_cast<double>(n) / static_cast<double>(n + 1);
    for (auto& s : base)
        s *= scale;

    size_t insert_at = std::min(after_index + 1, n);
    copy.children.insert(copy.children.begin() + static_cast<std::ptrdiff_t>(insert_at),
                         LayoutNode::panel(panel_id));
    base.insert(base.begin() + static_cast<std::ptrdiff_t>(insert_at),
                1.0 / static_cast<double>(n + 1));

    copy.sizes     = normalize_split_sizes(base, n + 1);
    copy.active_id = panel_id;
    return copy;
}

// Places the new panel relative to `node` as a whole.
LayoutNode create_placement_node(const LayoutNode&                   node,
                                 const PanelId&                      panel_id,
                                 const PanelPlacement&               placement,
                                 const std::optional<ContainerSize>& container_size,
                                 const SplitId&                      new_split_id)
{
    if (placement.region == PanelRegion::Center)
    {
        if (node.is_tabs())
            return join_tabs(node, panel_id, node.children.size() - 1);

        return LayoutNode::split(new_split_id,
                                 SplitDirection::Horizontal,
                                 {node, LayoutNode::panel(panel_id)},
                                 {0.5, 0.5},
                                 ViewMode::Tabs,
                                 panel_id);
    }

    double ratio      = resolve_split_ratio(placement, container_size);
    bool   new_first  = is_edge_first(placement.region);
    auto   new_leaf   = LayoutNode::panel(panel_id);
    auto   children   = new_first ? std::vector<LayoutNode>{new_leaf, node}
                                  : std::vector<LayoutNode>{node, new_leaf};
    return LayoutNode::split(new_split_id,
                             direction_for(placement.region),
                             std::move(children),
                             {ratio, 1.0 - ratio});
}

LayoutNode insert_relative(const LayoutNode&                   node,
                           const PanelId&                      panel_id,
                           const PanelPlacement&               placement,
                           const PanelId&                      target,
                           const std::optional<ContainerSize>& container_size,
                           const SplitId&                      new_split_id)
{
    if (node.is_panel())
    {
        if (node.panel_id != target)
            return node;
        return create_placement_node(node, panel_id, placement, container_size, new_split_id);
    }

    if (placement.region == PanelRegion::Center && node.is_tabs())
    {
        for (size_t i = 0; i < node.children.size(); ++i)
        {
            const auto& child = node.children[i];
            if (child.is_panel() && child.panel_id == target)
                return join_tabs(node, panel_id, i);
        }
    }

    LayoutNode copy = node;
    for (auto& child : copy.children)
    {
        if (contains_panel_id(child, target))
        {
            child = insert_relative(child, panel_id, placement, target, container_size, new_split_id);
            break;
        }
    }
    return copy;
}

std::optional<LayoutNode> remove_node(const LayoutNode& node, const PanelId& panel_id)
{
    if (node.is_panel())
    {
        if (node.panel_id == panel_id)
            return std::nullopt;
        return node;
    }

    std::vector<LayoutNode> children;
    std::vector<double>     sizes;
    std::vector<double>     current = normalize_split_sizes(node.sizes, node.children.size());
    children.reserve(node.children.size());

    for (size_t i = 0; i < node.children.size(); ++i)
    {
        const auto& child = node.children[i];
        if (!contains_panel_id(child, panel_id))
        {
            children.push_back(child);
            sizes.push_back(current[i]);
            continue;
        }
        auto next = remove_node(child, panel_id);
        if (next)
        {
            children.push_back(std::move(*next));
            sizes.push_back(current[i]);
        }
    }

    if (children.empty())
        return std::nullopt;
    if (children.size() == 1)
        return std::move(children.front());

    LayoutNode copy = node;
    copy.children   = std::move(children);
    copy.sizes      = normalize_split_sizes(sizes, copy.children.size());

    if (copy.is_tabs())
    {
        bool still_present = copy.active_id
                             && std::any_of(copy.children.begin(),
                                            copy.children.end(),
                                            [&](const LayoutNode& c)
                                            { return contains_panel_id(c, *copy.active_id); });
        if (!still_present)
            copy.active_id = find_first_panel_id(copy.children.front());
    }
    return copy;
}

LayoutNode activate_tabs_in(const LayoutNode& node, const PanelId& panel_id)
{
    if (node.is_panel())
        return node;

    LayoutNode copy = node;
    for (auto& child : copy.children)
    {
        if (contains_panel_id(child, panel_id))
        {
            child = activate_tabs_in(child, panel_id);
            if (copy.is_tabs())
                copy.active_id = panel_id;
            break;
        }
    }
    return copy;
}

}   // namespace

// ─── Queries ─────────────────────────────────────────────────────────────────

std::vector<PanelId> collect_panel_ids(const LayoutNode& node)
{
    std::vector<PanelId> out;
    collect_panel_ids_into(node, out);
    return out;
}

std::vector<SplitId> collect_split_ids(const LayoutNode& node)
{
    std::vector<SplitId> out;
    collect_split_ids_into(node, out);
    return out;
}

std::vector<PanelId> collect_visible_panel_ids(const LayoutNode& node)
{
    std::vector<PanelId> out;
    collect_visible_into(node, out);
    return out;
}

bool contains_panel_id(const LayoutNode& node, const PanelId& panel_id)
{
    if (node.is_panel())
        return node.panel_id == panel_id;
    return std::any_of(node.children.begin(),
                       node.children.end(),
                       [&](const LayoutNode& child) { return contains_panel_id(child, panel_id); });
}

std::optional<PanelId> find_first_panel_id(const LayoutNode& node)
{
    if (node.is_panel())
        return node.panel_id;
    for (const auto& child : node.children)
    {
        if (auto id = find_first_panel_id(child))
            return id;
    }
    return std::nullopt;
}

std::optional<LayoutPath> find_panel_path(const LayoutNode& root, const PanelId& panel_id)
{
    LayoutPath path;
    if (find_panel_path_into(root, panel_id, path))
        return path;
    return std::nullopt;
}

std::optional<LayoutPath> find_split_path(const LayoutNode& root, const SplitId& split_id)
{
    LayoutPath path;
    if (find_split_path_into(root, split_id, path))
        return path;
    return std::nullopt;
}

const LayoutNode* node_at_path(const LayoutNode& root, const LayoutPath& path)
{
    const LayoutNode* node = &root;
    for (size_t index : path)
    {
        if (node->is_panel() || index >= node->children.size())
            return nullptr;
        node = &node->children[index];
    }
    return node;
}

const LayoutNode* find_split(const LayoutNode& root, const SplitId& split_id)
{
    auto path = find_split_path(root, split_id);
    return path ? node_at_path(root, *path) : nullptr;
}

size_t active_child_index(const LayoutNode& split)
{
    if (split.active_id)
    {
        for (size_t i = 0; i < split.children.size(); ++i)
        {
            if (contains_panel_id(split.children[i], *split.active_id))
                return i;
        }
    }
    return 0;
}

const LayoutNode* find_nearest_split_for_panel(const LayoutNode& root,
                                               const PanelId&    panel_id,
                                               size_t*           child_index)
{
    if (root.is_panel())
        return nullptr;
    for (size_t i = 0; i < root.children.size(); ++i)
    {
        const auto& child = root.children[i];
        if (child.is_panel())
        {
            if (child.panel_id == panel_id)
            {
                if (child_index)
                    *child_index = i;
                return &root;
            }
            continue;
        }
        if (contains_panel_id(child, panel_id))
            return find_nearest_split_for_panel(child, panel_id, child_index);
    }
    return nullptr;
}

// ─── Sizes ───────────────────────────────────────────────────────────────────

std::vector<double> normalize_split_sizes(const std::vector<double>& sizes, size_t count)
{
    if (count == 0)
        return {};

    std::vector<double> out(count, 0.0);
    std::vector<bool>   valid(count, false);
    double              valid_sum   = 0.0;
    size_t              valid_count = 0;

    for (size_t i = 0; i < count && i < sizes.size(); ++i)
    {
        if (is_valid_size(sizes[i]))
        {
            out[i]   = sizes[i];
            valid[i] = true;
            valid_sum += sizes[i];
            ++valid_count;
        }
    }

    if (valid_count == 0 || !std::isfinite(valid_sum))
        return std::vector<double>(count, 1.0 / static_cast<double>(count));

    size_t invalid_count = count - valid_count;
    if (invalid_count > 0)
    {
        double remainder = 1.0 - valid_sum;
        double fill      = remainder > 1e-9 ? remainder / static_cast<double>(invalid_count)
                                            : valid_sum / static_cast<double>(valid_count);
        for (size_t i = 0; i < count; ++i)
        {
            if (!valid[i])
                out[i] = fill;
        }
    }

    double total = 0.0;
    for (double v : out)
        total += v;
    for (auto& v : out)
        v /= total;
    return out;
}

// ─── Edits ───────────────────────────────────────────────────────────────────

double resolve_split_ratio(const PanelPlacement&               placement,
                           const std::optional<ContainerSize>& container_size)
{
    if (placement.region == PanelRegion::Center || !placement.size || !container_size)
        return 0.5;

    bool horizontal = direction_for(placement.region) == SplitDirection::Horizontal;
    auto desired    = horizontal ? placement.size->width : placement.size->height;
    double available = horizontal ? container_size->width : container_size->height;
    if (!desired || !is_valid_size(*desired) || !is_valid_size(available))
        return 0.5;

    double ratio = std::clamp(*desired / available, MIN_PLACEMENT_RATIO, MAX_PLACEMENT_RATIO);
    return is_edge_first(placement.region) ? ratio : 1.0 - ratio;
}

SplitId create_split_id(const LayoutNode& root)
{
    auto                  existing = collect_split_ids(root);
    std::set<std::string> used(existing.begin(), existing.end());
    size_t                n = existing.size() + 1;
    while (used.count("split-" + std::to_string(n)))
        ++n;
    return "split-" + std::to_string(n);
}

LayoutNode insert_panel(const LayoutNode&             root,
                        const PanelId&                panel_id,
                        const PanelPlacement&         placement,
                        const std::optional<PanelId>& target_panel_id,
                        std::optional<ContainerSize>  container_size)
{
    SplitId new_split_id = create_split_id(root);
    if (target_panel_id && contains_panel_id(root, *target_panel_id))
    {
        return insert_relative(
            root, panel_id, placement, *target_panel_id, container_size, new_split_id);
    }
    return create_placement_node(root, panel_id, placement, container_size, new_split_id);
}

std::optional<LayoutNode> remove_panel(const LayoutNode& root, const PanelId& panel_id)
{
    if (!contains_panel_id(root, panel_id))
        return root;
    return remove_node(root, panel_id);
}

LayoutNode move_panel(const LayoutNode&             root,
                      const PanelId&                panel_id,
                      const PanelPlacement&         placement,
                      const std::optional<PanelId>& target_panel_id,
                      std::optional<ContainerSize>  container_size)
{
    std::optional<PanelId> target = target_panel_id;
    if (target && *target == panel_id)
        target.reset();

    auto removed = remove_panel(root, panel_id);
    if (!removed)
        return LayoutNode::panel(panel_id);
    return insert_panel(*removed, panel_id, placement, target, container_size);
}

std::optional<LayoutNode> update_split(const LayoutNode&  root,
                                       const SplitId&     split_id,
                                       const SplitUpdate& update)
{
    auto path = find_split_path(root, split_id);
    if (!path)
        return std::nullopt;
    return replace_at_path(root, *path, 0, update);
}

std::optional<LayoutNode> update_nearest_split_for_panel(const LayoutNode&         root,
                                                         const PanelId&            panel_id,
                                                         const NearestSplitUpdate& update)
{
    auto path = find_panel_path(root, panel_id);
    if (!path || path->empty())
        return std::nullopt;

    size_t child_index = path->back();
    path->pop_back();
    return replace_at_path(root,
                           *path,
                           0,
                           [&](const LayoutNode& split) { return update(split, child_index); });
}

std::optional<LayoutNode> set_split_sizes(const LayoutNode&          root,
                                          const SplitId&             split_id,
                                          const std::vector<double>& sizes)
{
    return update_split(root,
                        split_id,
                        [&](const LayoutNode& split) -> std::optional<LayoutNode>
                        {
                            LayoutNode copy = split;
                            copy.sizes      = normalize_split_sizes(sizes, split.children.size());
                            return copy;
                        });
}

std::optional<LayoutNode> set_split_view_mode(const LayoutNode& root,
                                              const SplitId&    split_id,
                                              ViewMode          view_mode)
{
    return update_split(root,
                        split_id,
                        [&](const LayoutNode& split) -> std::optional<LayoutNode>
                        {
                            if (split.view_mode == view_mode)
                                return std::nullopt;
                            LayoutNode copy = split;
                            copy.view_mode  = view_mode;
                            if (view_mode == ViewMode::Split)
                            {
                                copy.active_id.reset();
                            }
                            else if (!copy.active_id || !contains_panel_id(copy, *copy.active_id))
                            {
                                copy.active_id = find_first_panel_id(copy);
                            }
                            return copy;
                        });
}

std::optional<LayoutNode> set_tabs_active(const LayoutNode& root,
                                          const SplitId&    split_id,
                                          const PanelId&    panel_id)
{
    return update_split(root,
                        split_id,
                        [&](const LayoutNode& split) -> std::optional<LayoutNode>
                        {
                            if (!split.is_tabs() || !contains_panel_id(split, panel_id))
                                return std::nullopt;
                            if (split.active_id == panel_id)
                                return std::nullopt;
                            LayoutNode copy = split;
                            copy.active_id  = panel_id;
                            return copy;
                        });
}

LayoutNode activate_tabs_for_panel(const LayoutNode& root, const PanelId& panel_id)
{
    return activate_tabs_in(root, panel_id);
}

std::optional<LayoutNode> reorder_split_child(const LayoutNode& root,
                                              const SplitId&    split_id,
                                              size_t            from,
                                              size_t            to)
{
    return update_split(
        root,
        split_id,
        [&](const LayoutNode& split) -> std::optional<LayoutNode>
        {
            size_t n = split.children.size();
            if (from >= n || n < 2)
                return std::nullopt;
            size_t target = std::min(to, n - 1);
            if (target == from)
                return std::nullopt;

            LayoutNode          copy  = split;
            std::vector<double> sizes = normalize_split_sizes(split.sizes, n);

            LayoutNode moved      = std::move(copy.children[from]);
            double     moved_size = sizes[from];
            copy.children.erase(copy.children.begin() + static_cast<std::ptrdiff_t>(from));
            sizes.erase(sizes.begin() + static_cast<std::ptrdiff_t>(from));
            copy.children.insert(copy.children.begin() + static_cast<std::ptrdiff_t>(target),
                                 std::move(moved));
            sizes.insert(sizes.begin() + static_cast<std::ptrdiff_t>(target), moved_size);
            copy.sizes = std::move(sizes);
            return copy;
        });
}

}   // namespace paneldock
