#include "panel_workspace.hpp"

#include <algorithm>
#include <cmath>
#include <paneldock/layout_tree.hpp>
#include <paneldock/logger.hpp>
#include <stdexcept>

#include "io/json.hpp"
#include "io/layout_store.hpp"

namespace paneldock
{

namespace
{

template <typename T>
T& require(T* ptr, const char* what)
{
    if (!ptr)
        throw std::invalid_argument(std::string("PanelWorkspace requires a ") + what);
    return *ptr;
}

InteractionTuning tuning_from(const WorkspaceConfig& config)
{
    InteractionTuning tuning;
    tuning.split_min_fraction      = config.split_min_fraction;
    tuning.dock_edge_fraction      = config.dock_edge_fraction;
    tuning.center_inset            = config.tabs_highlight_inset;
    tuning.popover.min_width       = config.popover_min_width;
    tuning.popover.min_height      = config.popover_min_height;
    tuning.popover.viewport_margin = config.popover_viewport_margin;
    tuning.popover.gap             = config.popover_gap;
    tuning.popover.edge_padding    = config.popover_edge_padding;
    return tuning;
}

bool is_valid_header_size(const HeaderPanelSize& size)
{
    return std::isfinite(size.width) && std::isfinite(size.height) && size.width > 0.0
           && size.height > 0.0;
}

// Drops leaves rejected by `keep` and duplicate leaves, collapses splits
// left with one child and repairs sizes and tabs active ids.
std::optional<LayoutNode> sanitize_node(const LayoutNode&                            node,
                                        const std::function<bool(const PanelId&)>& keep,
                                        std::set<PanelId>&                           seen)
{
    if (node.is_panel())
    {
        if (node.panel_id.empty() || !keep(node.panel_id) || !seen.insert(node.panel_id).second)
            return std::nullopt;
        return node;
    }

    LayoutNode          copy = node;
    std::vector<double> sizes;
    copy.children.clear();
    for (size_t i = 0; i < node.children.size(); ++i)
    {
        auto child = sanitize_node(node.children[i], keep, seen);
        if (!child)
            continue;
        copy.children.push_back(std::move(*child));
        sizes.push_back(i < node.sizes.size() ? node.sizes[i] : 0.0);
    }

    if (copy.children.empty())
        return std::nullopt;
    if (copy.children.size() == 1)
        return std::move(copy.children.front());

    copy.sizes = normalize_split_sizes(sizes, copy.children.size());
    if (copy.view_mode == ViewMode::Tabs)
    {
        if (!copy.active_id || !contains_panel_id(copy, *copy.active_id))
            copy.active_id = find_first_panel_id(copy);
    }
    else
    {
        copy.active_id.reset();
    }
    return copy;
}

}   // anonymous namespace

// ─── Construction ────────────────────────────────────────────────────────────

PanelWorkspace::PanelWorkspace(WorkspaceOptions options)
    : options_(std::move(options)),
      registry_(require(options_.registry, "panel registry")),
      host_(require(options_.host, "panel host")),
      config_(options_.config),
      history_(options_.config.focus_history_limit)
{
    // Converted here: make_unique has no access to the private base.
    interaction_ = std::make_unique<InteractionController>(static_cast<InteractionDelegate&>(*this),
                                                           tuning_from(config_));
    layout_      = load_initial_layout();

    if (options_.storage)
    {
        history_.assign(
            load_focus_history(*options_.storage, config_.focus_history_limit, config_.window_id));
    }
    prune_focus_history();
    recompute_geometry();
}

PanelWorkspace::~PanelWorkspace()
{
    for (auto& [id, unsubscribe] : context_subscriptions_)
    {
        if (unsubscribe)
            unsubscribe();
    }
    context_subscriptions_.clear();
}

void PanelWorkspace::attach()
{
    if (attached_)
        return;
    attached_ = true;
    render();
    apply_default_pinned_panels();
}

void PanelWorkspace::render()
{
    if (!attached_)
    {
        recompute_geometry();
        return;
    }

    // Geometry changes under any drag or menu session, so they end here.
    // A live resize keeps going; it re-reads its split on every move.
    switch (interaction_->state())
    {
        case InteractionState::Docking:
        case InteractionState::Reordering:
        case InteractionState::MenuOpen:
            interaction_->cancel();
            break;
        case InteractionState::Idle:
        case InteractionState::Resizing:
        case InteractionState::PopoverResizing:
            break;
    }

    if (open_header_panel_id_ && !is_panel_pinned(*open_header_panel_id_))
        open_header_panel_id_.reset();
    if (active_chat_panel_id_ && !has_panel(*active_chat_panel_id_))
        active_chat_panel_id_.reset();
    if (active_non_chat_panel_id_ && !has_panel(*active_non_chat_panel_id_))
        active_non_chat_panel_id_.reset();

    prune_focus_history();
    unmount_removed_panels();
    recompute_geometry();
    mount_panels();
    update_visibility();
    sync_panel_sizes();
    ensure_active_panel();
    sync_context_subscriptions();
    update_panel_context_summary();
    notify_layout_change();
}

// ─── Viewport ────────────────────────────────────────────────────────────────

void PanelWorkspace::set_viewport(const Rect&         viewport,
                                  const Rect&         workspace,
                                  std::optional<Rect> header_dock)
{
    viewport_         = viewport;
    workspace_rect_   = workspace;
    header_dock_rect_ = header_dock;
    recompute_geometry();
    if (attached_)
        sync_panel_sizes();
}

void PanelWorkspace::set_geometry_provider(const GeometryProvider* provider)
{
    custom_geometry_ = provider;
}

// ─── Layout lifecycle ────────────────────────────────────────────────────────

LayoutPersistence PanelWorkspace::load_initial_layout()
{
    std::optional<LayoutPersistence> stored;
    if (options_.load_layout)
        stored = options_.load_layout();
    else if (options_.storage)
        stored = load_panel_layout(*options_.storage, config_.window_id);

    if (stored)
    {
        if (auto normalized = normalize_layout(std::move(*stored)))
        {
            uses_default_layout_ = false;
            return std::move(*normalized);
        }
        PANELDOCK_LOG_WARN("workspace", "Stored layout has no usable panels, using the default");
    }
    return create_default_layout();
}

LayoutPersistence PanelWorkspace::create_default_layout()
{
    uses_default_layout_ = true;

    if (options_.default_layout)
    {
        if (auto normalized = normalize_layout(options_.default_layout()))
            return std::move(*normalized);
    }
    else
    {
        std::vector<PanelTypeManifest> manifests;
        for (auto& manifest : registry_.list_manifests())
        {
            if (is_available(manifest.type, &manifest))
                manifests.push_back(std::move(manifest));
        }
        if (!manifests.empty())
        {
            if (auto normalized = normalize_layout(create_default_panel_layout(manifests)))
                return std::move(*normalized);
        }
    }
    return create_fallback_layout();
}

LayoutPersistence PanelWorkspace::create_fallback_layout() const
{
    auto manifests = registry_.list_manifests();
    if (manifests.empty())
        throw std::runtime_error("No panels registered.");

    const PanelTypeManifest* chosen = &manifests.front();
    for (const auto& manifest : manifests)
    {
        if (is_available(manifest.type, &manifest))
        {
            chosen = &manifest;
            break;
        }
    }

    PanelId id = chosen->type + "-1";
    PANELDOCK_LOG_INFO("workspace", "Using fallback layout with panel '{}'", id);

    LayoutPersistence layout;
    layout.layout     = LayoutNode::panel(id);
    layout.panels[id] = registry_.create_instance(chosen->type, id);
    return layout;
}

std::optional<LayoutPersistence> PanelWorkspace::normalize_layout(LayoutPersistence layout) const
{
    // Instances without a manifest are dropped; the map key wins over a
    // mismatching panel_id.
    for (auto it = layout.panels.begin(); it != layout.panels.end();)
    {
        if (it->first.empty() || !registry_.has(it->second.panel_type))
        {
            PANELDOCK_LOG_DEBUG("workspace",
                                "Dropping panel '{}' of unknown type '{}'",
                                it->first,
                                it->second.panel_type);
            it = layout.panels.erase(it);
            continue;
        }
        it->second.panel_id = it->first;
        ++it;
    }

    std::set<PanelId> seen;
    auto              root = sanitize_node(
        layout.layout, [&](const PanelId& id) { return layout.panels.count(id) > 0; }, seen);
    if (!root)
        return std::nullopt;
    layout.layout = std::move(*root);

    std::vector<PanelId> header;
    for (const auto& id : layout.header_panels)
    {
        if (!layout.panels.count(id) || seen.count(id))
            continue;
        seen.insert(id);
        header.push_back(id);
    }
    layout.header_panels = std::move(header);

    for (auto it = layout.panels.begin(); it != layout.panels.end();)
    {
        bool modal = modal_panel_id_ && *modal_panel_id_ == it->first;
        if (!seen.count(it->first) && !modal)
            it = layout.panels.erase(it);
        else
            ++it;
    }

    std::erase_if(layout.header_panel_sizes,
                  [&](const auto& entry)
                  { return !layout.panels.count(entry.first) || !is_valid_header_size(entry.second); });

    for (auto& [id, instance] : layout.panels)
    {
        if (instance.binding && !is_session_bound(instance.panel_type))
            instance.binding.reset();
    }
    return layout;
}

void PanelWorkspace::persist_layout()
{
    LayoutPersistence out = layout_;
    if (modal_panel_id_)
    {
        out.panels.erase(*modal_panel_id_);
        out.header_panel_sizes.erase(*modal_panel_id_);
    }

    if (options_.save_layout)
    {
        options_.save_layout(out);
        return;
    }
    if (options_.storage && !save_panel_layout(*options_.storage, out, config_.window_id))
        PANELDOCK_LOG_WARN("workspace", "Failed to persist panel layout");
}

void PanelWorkspace::notify_layout_change()
{
    if (options_.on_layout_change)
        options_.on_layout_change(layout_);
}

void PanelWorkspace::reset_layout()
{
    interaction_->cancel();
    if (modal_panel_id_)
        close_modal_panel(*modal_panel_id_);
    if (options_.storage && !options_.save_layout)
        clear_panel_layout(*options_.storage, config_.window_id);

    open_header_panel_id_.reset();
    default_pins_applied_ = false;
    layout_               = create_default_layout();
    PANELDOCK_LOG_INFO("workspace", "Layout reset to default");

    persist_layout();
    render();
    apply_default_pinned_panels();
}

void PanelWorkspace::reset_panel_states()
{
    bool changed = false;
    for (auto& [id, instance] : layout_.panels)
    {
        if (instance.state)
        {
            instance.state.reset();
            changed = true;
        }
    }
    if (!changed)
        return;

    persist_layout();
    for (const auto& id : std::vector<PanelId>(mounted_.begin(), mounted_.end()))
        remount_panel(id);
    render();
}

void PanelWorkspace::apply_layout_preset(const LayoutPreset& preset)
{
    LayoutPersistence candidate = layout_;
    candidate.layout            = build_layout_preset(layout_.layout, preset);

    auto normalized = normalize_layout(std::move(candidate));
    if (!normalized)
    {
        PANELDOCK_LOG_WARN("workspace", "Layout preset produced an unusable layout");
        return;
    }
    if (normalized->layout == layout_.layout)
        return;

    layout_ = std::move(*normalized);
    persist_layout();
    render();
}

void PanelWorkspace::refresh_availability()
{
    apply_default_pinned_panels();
    render();
}

// ─── Panels ──────────────────────────────────────────────────────────────────

std::optional<PanelId> PanelWorkspace::open_panel(const std::string&      panel_type,
                                                  const PanelOpenOptions& options)
{
    const PanelTypeManifest* manifest = registry_.get_manifest(panel_type);
    if (!manifest)
    {
        PANELDOCK_LOG_DEBUG("workspace", "Cannot open unregistered panel type '{}'", panel_type);
        return std::nullopt;
    }
    if (!is_available(panel_type, manifest))
    {
        PANELDOCK_LOG_DEBUG("workspace", "Panel type '{}' is not available", panel_type);
        return std::nullopt;
    }

    auto existing = panel_ids_by_type(panel_type);
    std::optional<PanelBinding> requested =
        is_session_bound(panel_type) ? options.binding : std::nullopt;

    // A chat bound to a session is reused for that session.
    if (panel_type == "chat" && requested && requested->is_fixed())
    {
        for (const auto& id : existing)
        {
            auto binding = current_binding(id);
            if (!binding || !binding->is_fixed() || binding->session_id != requested->session_id)
                continue;

            update_panel_binding(id, requested);
            if (options.state)
                update_panel_state(id, options.state);
            if (options.placement)
                move_panel(id, *options.placement, options.target_panel_id);
            else
                reuse_existing_panel(id);
            return id;
        }
    }

    if (manifest->multi_instance == false && !existing.empty())
    {
        const PanelId id = existing.front();
        if (requested)
            update_panel_binding(id, requested);
        if (options.state)
            update_panel_state(id, options.state);
        reuse_existing_panel(id);
        return id;
    }

    PanelId          id = create_panel_id(panel_type);
    PanelInitOptions init;
    init.binding = requested;
    init.state   = options.state;
    init.focus   = options.focus;

    PanelPlacement placement =
        options.placement.value_or(manifest->default_placement.value_or(PanelPlacement{}));
    auto container = placement_container_size(options.target_panel_id);

    layout_.layout =
        insert_panel(layout_.layout, id, placement, options.target_panel_id, container);
    layout_.panels[id] = registry_.create_instance(panel_type, id, init);
    record_focus(id);
    PANELDOCK_LOG_DEBUG("workspace",
                        "Opened panel '{}' at {}",
                        id,
                        region_to_string(placement.region));

    persist_layout();
    render();

    if (options.focus)
        focus_panel(id);
    return id;
}

void PanelWorkspace::reuse_existing_panel(const PanelId& panel_id)
{
    if (is_panel_pinned(panel_id))
    {
        open_header_panel(panel_id);
        focus_panel(panel_id);
        return;
    }
    activate_panel(panel_id);
}

bool PanelWorkspace::replace_panel(const PanelId&          panel_id,
                                   const std::string&      panel_type,
                                   const PanelInitOptions& options)
{
    if (!has_panel(panel_id) || is_modal(panel_id))
        return false;
    const PanelTypeManifest* manifest = registry_.get_manifest(panel_type);
    if (!manifest || !is_available(panel_type, manifest))
        return false;

    if (manifest->multi_instance == false)
    {
        auto existing = panel_ids_by_type(panel_type);
        if (!existing.empty())
        {
            reuse_existing_panel(existing.front());
            return false;
        }
    }

    PanelInitOptions init = options;
    if (!is_session_bound(panel_type))
        init.binding.reset();
    layout_.panels[panel_id] = registry_.create_instance(panel_type, panel_id, init);
    persist_layout();

    bool chat = panel_type == "chat";
    if (active_chat_panel_id_ == panel_id && !chat)
        active_chat_panel_id_.reset();
    if (active_non_chat_panel_id_ == panel_id && chat)
        active_non_chat_panel_id_.reset();
    if (active_panel_id_ == panel_id)
        track_active_kind(panel_id);

    PANELDOCK_LOG_DEBUG("workspace", "Replaced panel '{}' with type '{}'", panel_id, panel_type);
    remount_panel(panel_id);
    render();
    return true;
}

bool PanelWorkspace::close_panel(const PanelId& panel_id)
{
    if (is_modal(panel_id))
        return close_modal_panel(panel_id);
    if (!has_panel(panel_id))
        return false;
    if (!detach_from_tree(panel_id))
        return false;

    drop_instance(panel_id);
    if (active_panel_id_ == panel_id)
        active_panel_id_.reset();
    PANELDOCK_LOG_DEBUG("workspace", "Closed panel '{}'", panel_id);

    persist_layout();
    // The next visible panel in document order takes focus.
    render();
    return true;
}

bool PanelWorkspace::close_panel_to_placeholder(const PanelId& panel_id)
{
    if (!has_panel(panel_id) || is_modal(panel_id))
        return false;

    if (is_panel_pinned(panel_id))
    {
        if (open_header_panel_id_ == panel_id)
            close_header_panel();
        return true;
    }

    if (panel_type(panel_id) == "empty")
        return close_panel(panel_id);

    PanelInitOptions init;
    init.focus = false;
    if (replace_panel(panel_id, "empty", init))
        return true;
    return close_panel(panel_id);
}

bool PanelWorkspace::move_panel(const PanelId&                panel_id,
                                const PanelPlacement&         placement,
                                const std::optional<PanelId>& target_panel_id)
{
    if (!has_panel(panel_id) || is_modal(panel_id))
        return false;

    std::optional<PanelId> target = target_panel_id;
    if (target && *target == panel_id)
        target.reset();
    auto container = placement_container_size(target);

    if (is_panel_pinned(panel_id))
    {
        remove_header_entry(panel_id);
        layout_.layout = insert_panel(layout_.layout, panel_id, placement, target, container);
    }
    else
    {
        layout_.layout =
            paneldock::move_panel(layout_.layout, panel_id, placement, target, container);
    }
    PANELDOCK_LOG_DEBUG("workspace",
                        "Moved panel '{}' to {} of '{}'",
                        panel_id,
                        region_to_string(placement.region),
                        target.value_or("workspace"));

    persist_layout();
    render();
    focus_panel(panel_id);
    return true;
}

void PanelWorkspace::toggle_panel(const std::string& panel_type)
{
    auto existing = panel_ids_by_type(panel_type);
    for (const auto& id : existing)
    {
        if (is_panel_pinned(id))
        {
            toggle_header_panel(id);
            return;
        }
    }
    if (!existing.empty())
    {
        close_panel(existing.front());
        return;
    }
    open_panel(panel_type);
}

void PanelWorkspace::set_panel_open(const std::string& panel_type, bool open)
{
    auto existing = panel_ids_by_type(panel_type);
    if (open)
    {
        if (existing.empty())
        {
            open_panel(panel_type);
            return;
        }
        reuse_existing_panel(existing.front());
        return;
    }

    for (const auto& id : existing)
    {
        if (is_panel_pinned(id))
        {
            if (open_header_panel_id_ == id)
                close_header_panel();
            return;
        }
    }
    if (!existing.empty())
        close_panel(existing.front());
}

std::optional<PanelId> PanelWorkspace::open_modal_panel(const std::string&      panel_type,
                                                        const PanelOpenOptions& options)
{
    const PanelTypeManifest* manifest = registry_.get_manifest(panel_type);
    if (!manifest || !is_available(panel_type, manifest))
    {
        PANELDOCK_LOG_DEBUG("workspace", "Cannot open modal panel of type '{}'", panel_type);
        return std::nullopt;
    }

    if (modal_panel_id_)
        close_modal_panel(*modal_panel_id_);

    PanelId          id = create_panel_id(panel_type);
    PanelInitOptions init;
    init.binding = options.binding;
    init.state   = options.state;

    layout_.panels[id] = registry_.create_instance(panel_type, id, init);
    modal_panel_id_    = id;
    PANELDOCK_LOG_DEBUG("workspace", "Opened modal panel '{}'", id);

    render();
    focus_panel(id);
    return id;
}

bool PanelWorkspace::close_modal_panel(const PanelId& panel_id)
{
    if (!is_modal(panel_id))
        return false;

    modal_panel_id_.reset();
    layout_.panels.erase(panel_id);
    layout_.header_panel_sizes.erase(panel_id);
    if (history_.remove(panel_id))
        save_focus_history();
    if (active_panel_id_ == panel_id)
    {
        active_panel_id_.reset();
        host_.set_context(ACTIVE_PANEL_CONTEXT_KEY, std::nullopt);
    }
    PANELDOCK_LOG_DEBUG("workspace", "Closed modal panel '{}'", panel_id);

    render();
    return true;
}

// ─── Splits and tabs ─────────────────────────────────────────────────────────

bool PanelWorkspace::toggle_split_view_mode(const SplitId& split_id)
{
    const LayoutNode* split = find_split(layout_.layout, split_id);
    if (!split)
        return false;

    ViewMode next         = split->is_tabs() ? ViewMode::Split : ViewMode::Tabs;
    bool     holds_active = active_panel_id_ && contains_panel_id(*split, *active_panel_id_);

    auto updated = set_split_view_mode(layout_.layout, split_id, next);
    if (!updated)
        return false;
    if (next == ViewMode::Tabs && holds_active)
    {
        if (auto active = set_tabs_active(*updated, split_id, *active_panel_id_))
            updated = std::move(active);
    }

    layout_.layout = std::move(*updated);
    persist_layout();
    render();
    return true;
}

bool PanelWorkspace::toggle_split_view_mode_for_panel(const PanelId& panel_id)
{
    const LayoutNode* split = find_nearest_split_for_panel(layout_.layout, panel_id);
    if (!split)
        return false;
    return toggle_split_view_mode(SplitId(split->split_id));
}

bool PanelWorkspace::close_split(const SplitId& split_id)
{
    const LayoutNode* target = find_split(layout_.layout, split_id);
    if (!target || target->children.empty())
        return false;

    const LayoutNode& keep =
        target->is_tabs() ? target->children[active_child_index(*target)] : target->children.front();
    auto              keep_list = collect_panel_ids(keep);
    std::set<PanelId> keep_ids(keep_list.begin(), keep_list.end());

    std::vector<PanelId> remove_ids;
    for (const auto& id : collect_panel_ids(*target))
    {
        if (!keep_ids.count(id))
            remove_ids.push_back(id);
    }
    if (remove_ids.empty())
        return false;

    std::optional<LayoutNode> next = layout_.layout;
    for (const auto& id : remove_ids)
    {
        next = remove_panel(*next, id);
        if (!next)
            return false;
    }

    layout_.layout = std::move(*next);
    for (const auto& id : remove_ids)
    {
        drop_instance(id);
        if (active_panel_id_ == id)
            active_panel_id_.reset();
    }
    PANELDOCK_LOG_DEBUG("workspace", "Closed split '{}' ({} panels)", split_id, remove_ids.size());

    persist_layout();
    render();
    return true;
}

std::optional<PanelId> PanelWorkspace::cycle_tab_for_panel(const PanelId& panel_id, bool reverse)
{
    std::optional<PanelId> next_id;
    auto                   updated = update_nearest_split_for_panel(
        layout_.layout,
        panel_id,
        [&](const LayoutNode& split, size_t) -> std::optional<LayoutNode>
        {
            size_t n = split.children.size();
            if (!split.is_tabs() || n < 2)
                return std::nullopt;

            size_t active = active_child_index(split);
            size_t next   = reverse ? (active + n - 1) % n : (active + 1) % n;
            auto   id     = find_first_panel_id(split.children[next]);
            if (!id || split.active_id == id)
                return std::nullopt;

            LayoutNode copy = split;
            copy.active_id  = id;
            next_id         = id;
            return copy;
        });

    if (!updated || !next_id)
        return std::nullopt;

    layout_.layout = std::move(*updated);
    persist_layout();
    render();
    focus_panel(*next_id);
    return next_id;
}

// ─── Header dock ─────────────────────────────────────────────────────────────

bool PanelWorkspace::pin_panel(const PanelId& panel_id)
{
    if (!has_panel(panel_id) || is_modal(panel_id))
        return false;
    if (is_panel_pinned(panel_id))
        return open_header_panel(panel_id);
    if (!detach_from_tree(panel_id))
        return false;

    layout_.header_panels.push_back(panel_id);
    open_header_panel_id_ = panel_id;
    PANELDOCK_LOG_DEBUG("workspace", "Pinned panel '{}'", panel_id);

    persist_layout();
    render();
    return true;
}

bool PanelWorkspace::unpin_panel(const PanelId& panel_id)
{
    if (!is_panel_pinned(panel_id))
        return false;

    std::optional<PanelId> target;
    if (active_panel_id_ && contains_panel_id(layout_.layout, *active_panel_id_))
        target = active_panel_id_;
    else
        target = find_first_panel_id(layout_.layout);

    remove_header_entry(panel_id);
    layout_.layout = insert_panel(layout_.layout,
                                  panel_id,
                                  PanelPlacement{PanelRegion::Center, std::nullopt},
                                  target,
                                  placement_container_size(target));
    PANELDOCK_LOG_DEBUG("workspace", "Unpinned panel '{}'", panel_id);

    persist_layout();
    render();
    focus_panel(panel_id);
    return true;
}

bool PanelWorkspace::open_header_panel(const PanelId& panel_id)
{
    if (!is_panel_pinned(panel_id))
        return false;
    if (open_header_panel_id_ == panel_id)
        return true;

    if (interaction_->state() == InteractionState::PopoverResizing)
        interaction_->cancel();
    open_header_panel_id_ = panel_id;
    render();
    return true;
}

void PanelWorkspace::close_header_panel()
{
    if (!open_header_panel_id_)
        return;
    if (interaction_->state() == InteractionState::PopoverResizing)
        interaction_->cancel();
    open_header_panel_id_.reset();
    render();
}

void PanelWorkspace::toggle_header_panel(const PanelId& panel_id)
{
    if (open_header_panel_id_ == panel_id)
        close_header_panel();
    else
        open_header_panel(panel_id);
}

bool PanelWorkspace::apply_default_pinned_panels()
{
    if (!uses_default_layout_ || default_pins_applied_)
        return false;
    // Wait until the server reported which panel types exist.
    if (options_.available_panel_types && !options_.available_panel_types())
        return false;
    default_pins_applied_ = true;

    bool changed = false;
    for (const auto& manifest : registry_.list_manifests())
    {
        if (!manifest.default_pinned || !is_available(manifest.type, &manifest))
            continue;

        auto    existing = panel_ids_by_type(manifest.type);
        PanelId id;
        if (existing.empty())
        {
            id                 = create_panel_id(manifest.type);
            layout_.panels[id] = registry_.create_instance(manifest.type, id);
        }
        else
        {
            id = existing.front();
        }
        if (is_panel_pinned(id))
            continue;

        if (contains_panel_id(layout_.layout, id))
        {
            auto next = remove_panel(layout_.layout, id);
            if (!next)
                continue;
            layout_.layout = std::move(*next);
        }
        layout_.header_panels.push_back(id);
        changed = true;
    }

    if (!changed)
        return false;
    persist_layout();
    render();
    return true;
}

std::optional<Rect> PanelWorkspace::header_popover_rect() const
{
    if (!open_header_panel_id_)
        return std::nullopt;

    std::optional<Rect> anchor = geometry_.header_button_rect(*open_header_panel_id_);
    if (!anchor)
        anchor = header_dock_rect_.value_or(Rect{viewport_.x, viewport_.y, 0.0f, 0.0f});
    return position_popover(
        *anchor, header_panel_size(*open_header_panel_id_), viewport_, interaction_->tuning().popover);
}

HeaderPanelSize PanelWorkspace::header_panel_size(const PanelId& panel_id) const
{
    HeaderPanelSize size{config_.popover_default_width, config_.popover_default_height};
    if (auto it = layout_.header_panel_sizes.find(panel_id); it != layout_.header_panel_sizes.end())
        size = it->second;
    if (!viewport_.empty())
        size = clamp_popover_size(size.width, size.height, viewport_, interaction_->tuning().popover);
    return size;
}

// ─── Instance data ───────────────────────────────────────────────────────────

bool PanelWorkspace::update_panel_binding(const PanelId&                     panel_id,
                                          const std::optional<PanelBinding>& binding)
{
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return false;

    std::optional<PanelBinding> next =
        is_session_bound(it->second.panel_type) ? binding : std::nullopt;
    if (it->second.binding == next)
        return false;

    it->second.binding = next;
    persist_layout();
    host_.set_panel_binding(panel_id, next);
    publish_panel_inventory();
    return true;
}

bool PanelWorkspace::update_panel_metadata(const PanelId&                      panel_id,
                                           const std::optional<PanelMetadata>& meta)
{
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return false;
    if (it->second.meta == meta)
        return false;

    it->second.meta = meta;
    persist_layout();
    update_panel_context_summary();
    return true;
}

bool PanelWorkspace::update_panel_state(const PanelId&                    panel_id,
                                        const std::optional<std::string>& state)
{
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return false;
    if (state && !json::is_valid(*state))
    {
        PANELDOCK_LOG_WARN("workspace", "Ignoring malformed state for panel '{}'", panel_id);
        return false;
    }

    it->second.state = state;
    persist_layout();
    return true;
}

std::optional<std::string> PanelWorkspace::panel_state(const PanelId& panel_id) const
{
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return std::nullopt;
    return it->second.state;
}

// ─── Focus ───────────────────────────────────────────────────────────────────

bool PanelWorkspace::focus_panel(const PanelId& panel_id)
{
    if (!has_panel(panel_id))
        return false;
    set_focus(panel_id);
    update_panel_context_summary();
    return true;
}

void PanelWorkspace::set_focus(const PanelId& panel_id)
{
    if (active_panel_id_ && *active_panel_id_ != panel_id)
        host_.set_panel_focus(*active_panel_id_, false);

    active_panel_id_ = panel_id;
    record_focus(panel_id);
    host_.set_panel_focus(panel_id, true);
    track_active_kind(panel_id);

    json::Value summary = json::Value::object();
    summary.set("panelId", panel_id);
    summary.set("panelType", panel_type(panel_id).value_or(""));
    summary.set("panelTitle", panel_title(panel_id));
    host_.set_context(ACTIVE_PANEL_CONTEXT_KEY, summary.dump());
}

bool PanelWorkspace::activate_panel(const PanelId& panel_id)
{
    if (!has_panel(panel_id))
        return false;
    reveal_tabs(panel_id);
    focus_panel(panel_id);
    return true;
}

bool PanelWorkspace::reveal_panel(const PanelId& panel_id)
{
    if (!has_panel(panel_id))
        return false;
    if (is_panel_pinned(panel_id))
        return open_header_panel(panel_id);
    reveal_tabs(panel_id);
    return true;
}

void PanelWorkspace::reveal_tabs(const PanelId& panel_id)
{
    LayoutNode updated = activate_tabs_for_panel(layout_.layout, panel_id);
    if (updated == layout_.layout)
        return;
    layout_.layout = std::move(updated);
    persist_layout();
    render();
}

void PanelWorkspace::focus_next_panel(bool reverse)
{
    auto visible = visible_panel_ids();
    if (visible.empty())
        return;

    size_t n    = visible.size();
    auto   it   = active_panel_id_ ? std::find(visible.begin(), visible.end(), *active_panel_id_)
                                   : visible.end();
    size_t next = 0;
    if (it == visible.end())
    {
        next = reverse ? n - 1 : 0;
    }
    else
    {
        size_t index = static_cast<size_t>(it - visible.begin());
        next         = reverse ? (index + n - 1) % n : (index + 1) % n;
    }
    focus_panel(visible[next]);
}

bool PanelWorkspace::focus_last_panel_of_type(const std::string& panel_type)
{
    for (const auto& id : history_.entries())
    {
        if (is_modal(id) || this->panel_type(id) != panel_type)
            continue;
        reuse_existing_panel(id);
        return true;
    }

    auto ids = panel_ids_by_type(panel_type);
    if (ids.empty())
        return false;

    auto visible = visible_panel_ids();
    for (const auto& id : ids)
    {
        if (std::find(visible.begin(), visible.end(), id) != visible.end())
        {
            activate_panel(id);
            return true;
        }
    }
    reuse_existing_panel(ids.front());
    return true;
}

bool PanelWorkspace::set_active_chat_panel_id(const std::optional<PanelId>& panel_id)
{
    if (panel_id && panel_type(*panel_id) != "chat")
        return false;
    if (active_chat_panel_id_ == panel_id)
        return true;
    active_chat_panel_id_ = panel_id;
    publish_panel_inventory();
    return true;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::vector<PanelId> PanelWorkspace::all_panel_ids() const
{
    std::vector<PanelId> ids;
    ids.reserve(layout_.panels.size());
    for (const auto& [id, instance] : layout_.panels)
        ids.push_back(id);
    return ids;
}

std::vector<PanelId> PanelWorkspace::visible_panel_ids() const
{
    return collect_visible_panel_ids(layout_.layout);
}

std::vector<PanelId> PanelWorkspace::panel_ids_by_type(const std::string& panel_type) const
{
    std::vector<PanelId> ids;
    auto                 add = [&](const PanelId& id)
    {
        auto it = layout_.panels.find(id);
        if (it != layout_.panels.end() && it->second.panel_type == panel_type)
            ids.push_back(id);
    };
    for (const auto& id : collect_panel_ids(layout_.layout))
        add(id);
    for (const auto& id : layout_.header_panels)
        add(id);
    return ids;
}

std::optional<std::string> PanelWorkspace::panel_type(const PanelId& panel_id) const
{
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return std::nullopt;
    return it->second.panel_type;
}

std::string PanelWorkspace::panel_title(const PanelId& panel_id) const
{
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return panel_id;

    const auto& instance = it->second;
    if (instance.meta && instance.meta->title && !instance.meta->title->empty())
        return *instance.meta->title;
    if (const auto* manifest = registry_.get_manifest(instance.panel_type);
        manifest && !manifest->title.empty())
        return manifest->title;
    return instance.panel_type;
}

bool PanelWorkspace::has_panel(const PanelId& panel_id) const
{
    return layout_.panels.count(panel_id) > 0;
}

bool PanelWorkspace::is_panel_pinned(const PanelId& panel_id) const
{
    return std::find(layout_.header_panels.begin(), layout_.header_panels.end(), panel_id)
           != layout_.header_panels.end();
}

bool PanelWorkspace::is_panel_mounted(const PanelId& panel_id) const
{
    return mounted_.count(panel_id) > 0;
}

bool PanelWorkspace::is_panel_visible(const PanelId& panel_id) const
{
    auto it = visibility_.find(panel_id);
    return it != visibility_.end() && it->second;
}

bool PanelWorkspace::is_panel_type_open(const std::string& panel_type) const
{
    return !panel_ids_by_type(panel_type).empty();
}

bool PanelWorkspace::is_panel_type_visible(const std::string& panel_type) const
{
    for (const auto& id : panel_ids_by_type(panel_type))
    {
        if (is_panel_visible(id))
            return true;
    }
    return false;
}

PanelAvailability PanelWorkspace::panel_availability(const std::string& panel_type) const
{
    return resolve_panel_availability(panel_type, registry_.get_manifest(panel_type), availability_context());
}

PanelInventoryPayload PanelWorkspace::build_panel_inventory() const
{
    PanelInventoryPayload payload;
    for (const auto& [id, instance] : layout_.panels)
    {
        PanelInventoryItem item;
        item.panel_id    = id;
        item.panel_type  = instance.panel_type;
        item.panel_title = panel_title(id);
        item.visible     = is_panel_visible(id);
        item.binding     = instance.binding;
        item.context     = host_.get_context(panel_context_key(id));
        payload.panels.push_back(std::move(item));
    }
    payload.selected_panel_id      = active_non_chat_panel_id_;
    payload.selected_chat_panel_id = active_chat_panel_id_;
    payload.layout                 = layout_.layout;
    payload.header_panels          = layout_.header_panels;
    if (!config_.window_id.empty())
        payload.window_id = config_.window_id;
    return payload;
}

void PanelWorkspace::publish_panel_inventory()
{
    host_.send_panel_event(PanelEvent{"workspace", "workspace", build_panel_inventory().to_json()});
}

// ─── Pointer and keyboard ────────────────────────────────────────────────────

bool PanelWorkspace::begin_split_resize(const SplitId&      split_id,
                                        size_t              handle_index,
                                        const PointerEvent& event)
{
    return interaction_->begin_resize(split_id, handle_index, event);
}

bool PanelWorkspace::begin_panel_drag(const PanelId& panel_id, const PointerEvent& event)
{
    if (!has_panel(panel_id) || is_modal(panel_id))
        return false;
    return interaction_->begin_dock_drag(panel_id, event);
}

bool PanelWorkspace::begin_panel_reorder(const PanelId& panel_id, const PointerEvent& event)
{
    auto anchor = reorder_anchor(panel_id);
    if (!anchor)
        return false;
    return interaction_->begin_reorder(
        panel_id, anchor->split_id, anchor->child_index, anchor->direction, event);
}

bool PanelWorkspace::begin_header_popover_resize(const PointerEvent& event)
{
    if (!open_header_panel_id_)
        return false;
    PanelId id = *open_header_panel_id_;
    return interaction_->begin_popover_resize(id, header_panel_size(id), event);
}

void PanelWorkspace::open_panel_menu(const PanelId& panel_id)
{
    if (!has_panel(panel_id))
        return;
    interaction_->open_menu(panel_id);
}

void PanelWorkspace::close_panel_menu()
{
    if (interaction_->state() == InteractionState::MenuOpen)
        interaction_->cancel();
}

void PanelWorkspace::pointer_move(const PointerEvent& event)
{
    interaction_->pointer_move(event);
}

void PanelWorkspace::pointer_up(const PointerEvent& event)
{
    interaction_->pointer_up(event);
}

void PanelWorkspace::pointer_cancel(const PointerEvent& event)
{
    interaction_->pointer_cancel(event);
}

void PanelWorkspace::lost_pointer_capture(const PointerEvent& event)
{
    interaction_->lost_pointer_capture(event);
}

void PanelWorkspace::pointer_down(const PointerEvent& event)
{
    if (!open_header_panel_id_ || interaction_->listening())
        return;
    if (auto popover = header_popover_rect(); popover && popover->contains(event.x, event.y))
        return;
    if (auto dock = geometry().header_dock_rect(); dock && dock->contains(event.x, event.y))
        return;
    close_header_panel();
}

bool PanelWorkspace::handle_escape()
{
    if (interaction_->escape())
        return true;
    if (open_header_panel_id_)
    {
        close_header_panel();
        return true;
    }
    if (modal_panel_id_ && !modal_input_blocked())
        return close_modal_panel(*modal_panel_id_);
    return false;
}

bool PanelWorkspace::handle_modal_backdrop_click()
{
    if (!modal_panel_id_ || modal_input_blocked())
        return false;
    return close_modal_panel(*modal_panel_id_);
}

const std::vector<std::string>& PanelWorkspace::modal_blocking_surfaces()
{
    static const std::vector<std::string> surfaces = {
        "confirm-dialog",
        "workspace-switcher",
        "share-target",
        "command-palette",
        "panel-launcher",
        "session-picker",
        "context-menu",
        "panel-dock-popover",
    };
    return surfaces;
}

bool PanelWorkspace::modal_input_blocked() const
{
    if (open_header_panel_id_ || interaction_->state() == InteractionState::MenuOpen)
        return true;
    for (const auto& surface : modal_blocking_surfaces())
    {
        if (host_.is_surface_open(surface))
            return true;
    }
    return false;
}

// ─── InteractionDelegate ─────────────────────────────────────────────────────

const GeometryProvider& PanelWorkspace::geometry() const
{
    if (custom_geometry_)
        return *custom_geometry_;
    return geometry_;
}

std::optional<InteractionDelegate::SplitInfo> PanelWorkspace::split_info(const SplitId& split_id) const
{
    const LayoutNode* split = find_split(layout_.layout, split_id);
    if (!split)
        return std::nullopt;
    return SplitInfo{split->direction, normalize_split_sizes(split->sizes, split->children.size())};
}

void PanelWorkspace::apply_live_split_sizes(const SplitId& split_id, const std::vector<double>& sizes)
{
    auto updated = set_split_sizes(layout_.layout, split_id, sizes);
    if (!updated)
        return;
    layout_.layout = std::move(*updated);
    recompute_geometry();
    if (attached_)
        sync_panel_sizes();
}

void PanelWorkspace::commit_split_resize(const SplitId& split_id)
{
    PANELDOCK_LOG_DEBUG("interaction", "Resized split '{}'", split_id);
    persist_layout();
    render();
}

void PanelWorkspace::commit_pin(const PanelId& panel_id)
{
    pin_panel(panel_id);
}

void PanelWorkspace::commit_move(const PanelId&                panel_id,
                                 const PanelPlacement&         placement,
                                 const std::optional<PanelId>& target_panel_id)
{
    move_panel(panel_id, placement, target_panel_id);
}

void PanelWorkspace::commit_reorder(const PanelId& panel_id, size_t target_index)
{
    auto anchor = reorder_anchor(panel_id);
    if (!anchor)
        return;
    auto updated =
        reorder_split_child(layout_.layout, anchor->split_id, anchor->child_index, target_index);
    if (!updated)
        return;

    PANELDOCK_LOG_DEBUG("interaction",
                        "Reordered '{}' in split '{}' to index {}",
                        panel_id,
                        anchor->split_id,
                        target_index);
    layout_.layout = std::move(*updated);
    persist_layout();
    render();
}

void PanelWorkspace::apply_live_popover_size(const PanelId& panel_id, const HeaderPanelSize& size)
{
    layout_.header_panel_sizes[panel_id] = size;
    if (attached_)
        sync_panel_sizes();
}

void PanelWorkspace::commit_popover_size(const PanelId& panel_id, const HeaderPanelSize& size)
{
    if (!is_panel_pinned(panel_id))
        return;
    layout_.header_panel_sizes[panel_id] = size;
    persist_layout();
    if (attached_)
        sync_panel_sizes();
}

void PanelWorkspace::on_interaction_changed(InteractionState state)
{
    PANELDOCK_LOG_TRACE("interaction", "Interaction state: {}", interaction_state_name(state));
}

// ─── Render steps ────────────────────────────────────────────────────────────

void PanelWorkspace::recompute_geometry()
{
    GeometryStyle style;
    style.splitter_thickness  = config_.splitter_thickness;
    style.tab_strip_height    = config_.tab_strip_height;
    style.header_button_width = config_.header_button_width;
    geometry_ = LayoutGeometry::compute(
        layout_.layout, workspace_rect_, header_dock_rect_, layout_.header_panels, style);
}

void PanelWorkspace::unmount_removed_panels()
{
    for (const auto& id : std::vector<PanelId>(mounted_.begin(), mounted_.end()))
    {
        if (has_panel(id))
            continue;
        if (is_panel_visible(id))
            host_.set_panel_visibility(id, false);
        host_.unmount_panel(id);
        forget_panel(id);
    }
}

void PanelWorkspace::remount_panel(const PanelId& panel_id)
{
    if (!mounted_.count(panel_id))
        return;
    host_.unmount_panel(panel_id);
    forget_panel(panel_id);
}

void PanelWorkspace::forget_panel(const PanelId& panel_id)
{
    mounted_.erase(panel_id);
    visibility_.erase(panel_id);
    last_sizes_.erase(panel_id);
}

void PanelWorkspace::mount_panels()
{
    for (const auto& id : all_panel_ids())
    {
        if (mounted_.count(id))
            continue;
        auto it = layout_.panels.find(id);
        if (it == layout_.panels.end())
            continue;

        PanelMountRequest request;
        request.panel_id   = id;
        request.panel_type = it->second.panel_type;
        request.container  = container_for(id);
        request.binding    = it->second.binding;
        request.state      = it->second.state;
        try
        {
            host_.mount_panel(request);
            mounted_.insert(id);
        }
        catch (const std::exception& e)
        {
            PANELDOCK_LOG_ERROR("workspace",
                                "Failed to mount panel '{}' ({}): {}",
                                id,
                                request.panel_type,
                                e.what());
        }
    }
}

void PanelWorkspace::update_visibility()
{
    auto              tree = visible_panel_ids();
    std::set<PanelId> visible(tree.begin(), tree.end());
    if (open_header_panel_id_)
        visible.insert(*open_header_panel_id_);
    if (modal_panel_id_)
        visible.insert(*modal_panel_id_);

    for (const auto& id : mounted_)
    {
        bool shown = visible.count(id) > 0;
        auto it    = visibility_.find(id);
        if (it != visibility_.end() && it->second == shown)
            continue;
        visibility_[id] = shown;
        host_.set_panel_visibility(id, shown);
    }
}

void PanelWorkspace::sync_panel_sizes()
{
    for (const auto& id : mounted_)
    {
        if (!is_panel_visible(id))
            continue;
        Rect bounds = container_for(id).bounds;
        if (bounds.empty())
            continue;

        ContainerSize size{bounds.w, bounds.h};
        auto          it = last_sizes_.find(id);
        if (it != last_sizes_.end() && it->second == size)
            continue;
        last_sizes_[id] = size;
        host_.set_panel_size(id, size);
    }
}

void PanelWorkspace::ensure_active_panel()
{
    auto              tree = visible_panel_ids();
    std::set<PanelId> visible(tree.begin(), tree.end());
    if (modal_panel_id_)
        visible.insert(*modal_panel_id_);
    if (open_header_panel_id_)
        visible.insert(*open_header_panel_id_);
    if (visible.empty())
        return;
    if (active_panel_id_ && visible.count(*active_panel_id_))
        return;

    if (!tree.empty())
        set_focus(tree.front());
    else
        set_focus(*visible.begin());
}

void PanelWorkspace::sync_context_subscriptions()
{
    for (auto it = context_subscriptions_.begin(); it != context_subscriptions_.end();)
    {
        if (has_panel(it->first))
        {
            ++it;
            continue;
        }
        if (it->second)
            it->second();
        it = context_subscriptions_.erase(it);
    }

    for (const auto& [id, instance] : layout_.panels)
    {
        if (context_subscriptions_.count(id))
            continue;
        context_subscriptions_[id] =
            host_.subscribe_context(panel_context_key(id),
                                    [this](const std::optional<std::string>&)
                                    { publish_panel_inventory(); });
    }
}

void PanelWorkspace::update_panel_context_summary()
{
    auto summary = [this](const PanelId& id)
    {
        json::Value entry = json::Value::object();
        entry.set("panelId", id);
        entry.set("panelType", panel_type(id).value_or(""));
        entry.set("panelTitle", panel_title(id));
        return entry;
    };

    json::Value panels = json::Value::array();
    for (const auto& [id, instance] : layout_.panels)
        panels.push_back(summary(id));

    json::Value doc = json::Value::object();
    doc.set("active",
            active_non_chat_panel_id_ && has_panel(*active_non_chat_panel_id_)
                ? summary(*active_non_chat_panel_id_)
                : json::Value());
    doc.set("panels", std::move(panels));
    host_.set_context(PANEL_SUMMARY_CONTEXT_KEY, doc.dump());

    publish_panel_inventory();
}

void PanelWorkspace::prune_focus_history()
{
    if (history_.prune([this](const PanelId& id) { return has_panel(id); }))
        save_focus_history();
}

void PanelWorkspace::save_focus_history()
{
    if (!options_.storage)
        return;
    if (!paneldock::save_focus_history(*options_.storage, history_.entries(), config_.window_id))
        PANELDOCK_LOG_WARN("workspace", "Failed to persist focus history");
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

AvailabilityContext PanelWorkspace::availability_context() const
{
    AvailabilityContext context;
    if (options_.available_panel_types)
        context.allowed_panel_types = options_.available_panel_types();
    if (options_.available_capabilities)
        context.available_capabilities = options_.available_capabilities();
    return context;
}

bool PanelWorkspace::is_available(const std::string&       panel_type,
                                  const PanelTypeManifest* manifest) const
{
    return resolve_panel_availability(panel_type, manifest, availability_context()).allows_open();
}

bool PanelWorkspace::is_session_bound(const std::string& panel_type) const
{
    if (panel_type == "chat" || panel_type == "session-info" || panel_type == "terminal")
        return true;
    const PanelTypeManifest* manifest = registry_.get_manifest(panel_type);
    return manifest && manifest->session_scope && *manifest->session_scope != SessionScope::Global;
}

PanelId PanelWorkspace::create_panel_id(const std::string& panel_type) const
{
    size_t n = 1;
    while (has_panel(panel_type + "-" + std::to_string(n)))
        ++n;
    return panel_type + "-" + std::to_string(n);
}

std::optional<ContainerSize>
PanelWorkspace::placement_container_size(const std::optional<PanelId>& target) const
{
    const GeometryProvider& provider = geometry();
    if (target)
    {
        if (auto rect = provider.panel_rect(*target); rect && !rect->empty())
            return ContainerSize{rect->w, rect->h};
    }
    Rect workspace = provider.workspace_rect();
    if (workspace.empty())
        return std::nullopt;
    return ContainerSize{workspace.w, workspace.h};
}

std::optional<PanelBinding> PanelWorkspace::current_binding(const PanelId& panel_id) const
{
    if (auto binding = host_.get_panel_binding(panel_id))
        return binding;
    auto it = layout_.panels.find(panel_id);
    if (it == layout_.panels.end())
        return std::nullopt;
    return it->second.binding;
}

bool PanelWorkspace::is_modal(const PanelId& panel_id) const
{
    return modal_panel_id_ && *modal_panel_id_ == panel_id;
}

void PanelWorkspace::record_focus(const PanelId& panel_id)
{
    if (is_modal(panel_id))
        return;
    if (history_.record(panel_id))
        save_focus_history();
}

void PanelWorkspace::track_active_kind(const PanelId& panel_id)
{
    auto type = panel_type(panel_id);
    if (!type)
        return;
    if (*type == "chat")
        active_chat_panel_id_ = panel_id;
    else
        active_non_chat_panel_id_ = panel_id;
}

bool PanelWorkspace::detach_from_tree(const PanelId& panel_id)
{
    if (!contains_panel_id(layout_.layout, panel_id))
        return true;

    auto next = remove_panel(layout_.layout, panel_id);
    if (!next)
    {
        // Last leaf: seed a placeholder so the tree never goes empty.
        PanelOpenOptions placeholder;
        placeholder.focus = false;
        if (!open_panel("empty", placeholder))
        {
            PANELDOCK_LOG_DEBUG("workspace", "No placeholder available to replace '{}'", panel_id);
            return false;
        }
        next = remove_panel(layout_.layout, panel_id);
        if (!next)
            return false;
    }
    layout_.layout = std::move(*next);
    return true;
}

void PanelWorkspace::remove_header_entry(const PanelId& panel_id)
{
    std::erase(layout_.header_panels, panel_id);
    if (open_header_panel_id_ == panel_id)
    {
        if (interaction_->state() == InteractionState::PopoverResizing)
            interaction_->cancel();
        open_header_panel_id_.reset();
    }
}

void PanelWorkspace::drop_instance(const PanelId& panel_id)
{
    remove_header_entry(panel_id);
    layout_.panels.erase(panel_id);
    layout_.header_panel_sizes.erase(panel_id);
    if (history_.remove(panel_id))
        save_focus_history();
}

PanelContainer PanelWorkspace::container_for(const PanelId& panel_id) const
{
    PanelContainer container;
    if (is_modal(panel_id))
    {
        container.surface = PanelContainer::Surface::Modal;
        container.bounds  = viewport_;
        return container;
    }
    if (is_panel_pinned(panel_id))
    {
        container.surface = PanelContainer::Surface::Header;
        if (open_header_panel_id_ == panel_id)
            container.bounds = header_popover_rect().value_or(Rect{});
        return container;
    }
    container.surface = PanelContainer::Surface::Tree;
    container.bounds  = geometry().panel_rect(panel_id).value_or(Rect{});
    return container;
}

std::optional<PanelWorkspace::ReorderAnchor> PanelWorkspace::reorder_anchor(const PanelId& panel_id) const
{
    auto path = find_panel_path(layout_.layout, panel_id);
    if (!path)
        return std::nullopt;

    // Innermost split-mode ancestor; tabs reorder through their strip.
    for (size_t depth = path->size(); depth > 0; --depth)
    {
        LayoutPath        prefix(path->begin(), path->begin() + static_cast<std::ptrdiff_t>(depth - 1));
        const LayoutNode* parent = node_at_path(layout_.layout, prefix);
        if (!parent || !parent->is_split() || parent->is_tabs())
            continue;
        return ReorderAnchor{parent->split_id, (*path)[depth - 1], parent->direction};
    }
    return std::nullopt;
}

}   // namespace paneldock
