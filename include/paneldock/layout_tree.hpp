#pragma once

#include <paneldock/layout.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Pure functions over LayoutNode. Every edit returns a new root; inputs are
// never modified and nothing here has side effects.

namespace paneldock
{

// Child indices from the root down to a node.
using LayoutPath = std::vector<size_t>;

// Lower bound for a split child produced by a sized edge placement.
inline constexpr double MIN_PLACEMENT_RATIO = 0.05;
inline constexpr double MAX_PLACEMENT_RATIO = 0.95;

// ── Queries ──────────────────────────────────────────────────────────────────

std::vector<PanelId> collect_panel_ids(const LayoutNode& node);
std::vector<SplitId> collect_split_ids(const LayoutNode& node);

// Leaves reachable without crossing an inactive tabs branch, in document
// order. A tabs node shows the child that contains its active_id, or its
// first child when active_id is unset or stale.
std::vector<PanelId> collect_visible_panel_ids(const LayoutNode& node);

bool                   contains_panel_id(const LayoutNode& node, const PanelId& panel_id);
std::optional<PanelId> find_first_panel_id(const LayoutNode& node);

std::optional<LayoutPath> find_panel_path(const LayoutNode& root, const PanelId& panel_id);
std::optional<LayoutPath> find_split_path(const LayoutNode& root, const SplitId& split_id);
const LayoutNode*         node_at_path(const LayoutNode& root, const LayoutPath& path);
const LayoutNode*         find_split(const LayoutNode& root, const SplitId& split_id);

// Index of the child of a tabs node that is shown.
size_t active_child_index(const LayoutNode& split);

// The split that directly contains the panel leaf, found top-down. Returns
// nullptr when the panel is the root or absent. child_index receives the
// position of the leaf inside that split.
const LayoutNode* find_nearest_split_for_panel(const LayoutNode& root,
                                               const PanelId&    panel_id,
                                               size_t*           child_index = nullptr);

// ── Sizes ────────────────────────────────────────────────────────────────────

// Repairs any input into exactly `count` positive values summing to 1.
// Valid entries (finite, > 0) keep their proportions. Missing or invalid
// entries share the unallocated remainder equally; when nothing remains
// they take the mean of the valid entries before the final rescale.
std::vector<double> normalize_split_sizes(const std::vector<double>& sizes, size_t count);

// ── Edits ────────────────────────────────────────────────────────────────────

// Inserts a new panel leaf relative to target_panel_id (the whole tree when
// absent or not found). Center joins the tabs node directly holding the
// target, or wraps the target in a new two-child tabs node; either way the
// new panel becomes active. Edge regions wrap the target in a new
// horizontal (left/right) or vertical (top/bottom) split.
LayoutNode insert_panel(const LayoutNode&             root,
                        const PanelId&                panel_id,
                        const PanelPlacement&         placement,
                        const std::optional<PanelId>& target_panel_id = std::nullopt,
                        std::optional<ContainerSize>  container_size  = std::nullopt);

// Removes a leaf and collapses any split left with a single child. Returns
// the tree unchanged when the id is absent and nullopt when the leaf was the
// only one.
std::optional<LayoutNode> remove_panel(const LayoutNode& root, const PanelId& panel_id);

// remove_panel followed by insert_panel for the same leaf. A target equal to
// the moved panel is treated as no target.
LayoutNode move_panel(const LayoutNode&             root,
                      const PanelId&                panel_id,
                      const PanelPlacement&         placement,
                      const std::optional<PanelId>& target_panel_id = std::nullopt,
                      std::optional<ContainerSize>  container_size  = std::nullopt);

// Ratio of the first child for a new edge split.
double resolve_split_ratio(const PanelPlacement&               placement,
                           const std::optional<ContainerSize>& container_size);

// "split-N" with N starting after the existing split count.
SplitId create_split_id(const LayoutNode& root);

// Applies `update` to the split with the given id. The callback returns
// nullopt to leave the tree untouched; the returned tree is otherwise a
// copy with that node replaced.
using SplitUpdate = std::function<std::optional<LayoutNode>(const LayoutNode& split)>;
std::optional<LayoutNode> update_split(const LayoutNode& root,
                                       const SplitId&    split_id,
                                       const SplitUpdate& update);

// Same, for the split found by find_nearest_split_for_panel. The callback
// also receives the index of the child holding the panel.
using NearestSplitUpdate =
    std::function<std::optional<LayoutNode>(const LayoutNode& split, size_t child_index)>;
std::optional<LayoutNode> update_nearest_split_for_panel(const LayoutNode&         root,
                                                         const PanelId&            panel_id,
                                                         const NearestSplitUpdate& update);

std::optional<LayoutNode> set_split_sizes(const LayoutNode&          root,
                                          const SplitId&             split_id,
                                          const std::vector<double>& sizes);

// Switching to tabs keeps a valid active_id or picks the first panel of
// the first child; switching to split clears active_id.
std::optional<LayoutNode> set_split_view_mode(const LayoutNode& root,
                                              const SplitId&    split_id,
                                              ViewMode          view_mode);

// Sets active_id of a tabs node. Fails for a split-mode node or a panel
// that is not inside it.
std::optional<LayoutNode> set_tabs_active(const LayoutNode& root,
                                          const SplitId&    split_id,
                                          const PanelId&    panel_id);

// Switches every tabs ancestor of the panel so that it becomes visible.
LayoutNode activate_tabs_for_panel(const LayoutNode& root, const PanelId& panel_id);

// Moves child `from` of the split to index `to`, carrying its size.
std::optional<LayoutNode> reorder_split_child(const LayoutNode& root,
                                              const SplitId&    split_id,
                                              size_t            from,
                                              size_t            to);

}   // namespace paneldock
