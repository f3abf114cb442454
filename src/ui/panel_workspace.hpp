#pragma once

#include <paneldock/geometry_provider.hpp>
#include <paneldock/layout.hpp>
#include <paneldock/layout_presets.hpp>
#include <paneldock/panel_host.hpp>
#include <paneldock/panel_registry.hpp>
#include <paneldock/storage.hpp>
#include <paneldock/workspace_config.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "focus_history.hpp"
#include "interaction.hpp"
#include "layout_geometry.hpp"

namespace paneldock
{

using PanelTypeSet = std::set<std::string>;

struct WorkspaceOptions
{
    PanelRegistry*   registry = nullptr;   // required
    PanelHost*       host     = nullptr;   // required
    KeyValueStorage* storage  = nullptr;   // layout + focus history, optional
    WorkspaceConfig  config;

    // Hooks replacing the storage-backed defaults.
    std::function<std::optional<LayoutPersistence>()> load_layout;
    std::function<void(const LayoutPersistence&)>     save_layout;
    std::function<LayoutPersistence()>                default_layout;
    std::function<void(const LayoutPersistence&)>     on_layout_change;

    // Server-reported availability; nullopt while unknown.
    std::function<std::optional<PanelTypeSet>()> available_panel_types;
    std::function<std::optional<PanelTypeSet>()> available_capabilities;
};

// Owns the live LayoutPersistence and every interactive behaviour around
// it: opening, closing, pinning, modal overlay, focus and history, pointer
// gestures, persistence and host notification.
//
// The layout value is replaced wholesale by each mutating call; references
// obtained from layout() are stale after any non-const call.
class PanelWorkspace : private InteractionDelegate
{
   public:
    // Throws std::invalid_argument without a registry or host, and
    // std::runtime_error when no manifest is registered.
    explicit PanelWorkspace(WorkspaceOptions options);
    ~PanelWorkspace() override;

    PanelWorkspace(const PanelWorkspace&)            = delete;
    PanelWorkspace& operator=(const PanelWorkspace&) = delete;

    // First render: mounts every panel and publishes the inventory.
    void attach();
    bool attached() const { return attached_; }
    void render();

    // ── Viewport ────────────────────────────────────────────────────────

    // `viewport` is the whole window, `workspace` the tiling area and
    // `header_dock` the strip holding pinned panel buttons.
    void set_viewport(const Rect& viewport, const Rect& workspace, std::optional<Rect> header_dock);
    // Replaces the computed geometry for hit-testing. Pass nullptr to
    // restore it. The provider must outlive the workspace or be reset.
    void set_geometry_provider(const GeometryProvider* provider);

    const LayoutGeometry& computed_geometry() const { return geometry_; }
    Rect                  viewport() const { return viewport_; }

    // ── State ───────────────────────────────────────────────────────────

    const LayoutPersistence& layout() const { return layout_; }
    const LayoutNode&        layout_root() const { return layout_.layout; }
    bool                     uses_default_layout() const { return uses_default_layout_; }

    void reset_layout();
    void reset_panel_states();
    void apply_layout_preset(const LayoutPreset& preset);
    // Re-renders after the server availability sets changed.
    void refresh_availability();

    // ── Panels ──────────────────────────────────────────────────────────

    std::optional<PanelId> open_panel(const std::string& panel_type, const PanelOpenOptions& options = {});
    bool replace_panel(const PanelId& panel_id, const std::string& panel_type, const PanelInitOptions& options = {});
    bool close_panel(const PanelId& panel_id);
    // Swaps a tree panel for an empty placeholder in the same slot.
    bool close_panel_to_placeholder(const PanelId& panel_id);
    bool move_panel(const PanelId&                panel_id,
                    const PanelPlacement&         placement,
                    const std::optional<PanelId>& target_panel_id = std::nullopt);

    void toggle_panel(const std::string& panel_type);
    void set_panel_open(const std::string& panel_type, bool open);

    std::optional<PanelId> open_modal_panel(const std::string& panel_type, const PanelOpenOptions& options = {});
    bool                   close_modal_panel(const PanelId& panel_id);

    // ── Splits and tabs ─────────────────────────────────────────────────

    bool                   toggle_split_view_mode(const SplitId& split_id);
    bool                   toggle_split_view_mode_for_panel(const PanelId& panel_id);
    bool                   close_split(const SplitId& split_id);
    std::optional<PanelId> cycle_tab_for_panel(const PanelId& panel_id, bool reverse = false);

    // ── Header dock ─────────────────────────────────────────────────────

    bool pin_panel(const PanelId& panel_id);
    bool unpin_panel(const PanelId& panel_id);
    bool open_header_panel(const PanelId& panel_id);
    void close_header_panel();
    void toggle_header_panel(const PanelId& panel_id);
    bool apply_default_pinned_panels();

    std::optional<Rect> header_popover_rect() const;
    HeaderPanelSize     header_panel_size(const PanelId& panel_id) const;

    // ── Instance data ───────────────────────────────────────────────────

    bool update_panel_binding(const PanelId& panel_id, const std::optional<PanelBinding>& binding);
    bool update_panel_metadata(const PanelId& panel_id, const std::optional<PanelMetadata>& meta);
    // `state` must be JSON text (or nullopt to clear).
    bool                       update_panel_state(const PanelId& panel_id, const std::optional<std::string>& state);
    std::optional<std::string> panel_state(const PanelId& panel_id) const;

    // ── Focus ───────────────────────────────────────────────────────────

    bool focus_panel(const PanelId& panel_id);
    // Switches tabs ancestors so the panel shows, then focuses it.
    bool activate_panel(const PanelId& panel_id);
    // Makes the panel visible without moving focus.
    bool reveal_panel(const PanelId& panel_id);
    void focus_next_panel(bool reverse = false);
    bool focus_last_panel_of_type(const std::string& panel_type);
    bool set_active_chat_panel_id(const std::optional<PanelId>& panel_id);

    // ── Queries ─────────────────────────────────────────────────────────

    const std::optional<PanelId>& active_panel_id() const { return active_panel_id_; }
    const std::optional<PanelId>& active_chat_panel_id() const { return active_chat_panel_id_; }
    const std::optional<PanelId>& modal_panel_id() const { return modal_panel_id_; }
    const std::optional<PanelId>& open_header_panel_id() const { return open_header_panel_id_; }
    const std::vector<PanelId>&   focus_history() const { return history_.entries(); }
    const std::vector<PanelId>&   header_panel_ids() const { return layout_.header_panels; }

    std::vector<PanelId>       all_panel_ids() const;
    std::vector<PanelId>       visible_panel_ids() const;
    std::vector<PanelId>       panel_ids_by_type(const std::string& panel_type) const;
    std::optional<std::string> panel_type(const PanelId& panel_id) const;
    std::string                panel_title(const PanelId& panel_id) const;

    bool has_panel(const PanelId& panel_id) const;
    bool is_panel_pinned(const PanelId& panel_id) const;
    bool is_panel_mounted(const PanelId& panel_id) const;
    bool is_panel_visible(const PanelId& panel_id) const;
    bool is_panel_type_open(const std::string& panel_type) const;
    bool is_panel_type_visible(const std::string& panel_type) const;

    PanelAvailability panel_availability(const std::string& panel_type) const;

    PanelInventoryPayload build_panel_inventory() const;
    void                  publish_panel_inventory();

    // ── Pointer and keyboard ────────────────────────────────────────────

    bool begin_split_resize(const SplitId& split_id, size_t handle_index, const PointerEvent& event);
    bool begin_panel_drag(const PanelId& panel_id, const PointerEvent& event);
    bool begin_panel_reorder(const PanelId& panel_id, const PointerEvent& event);
    bool begin_header_popover_resize(const PointerEvent& event);
    void open_panel_menu(const PanelId& panel_id);
    void close_panel_menu();

    void pointer_move(const PointerEvent& event);
    void pointer_up(const PointerEvent& event);
    void pointer_cancel(const PointerEvent& event);
    void lost_pointer_capture(const PointerEvent& event);
    // Primary-button press anywhere; closes the header popover when the
    // press lands outside both the popover and the header dock.
    void pointer_down(const PointerEvent& event);

    // Escape closes, in order: the live gesture or menu, the header popover,
    // the modal (unless a higher-priority surface is open). Returns whether
    // anything was closed.
    bool handle_escape();
    bool handle_modal_backdrop_click();

    const InteractionController& interaction() const { return *interaction_; }

    // Surfaces that take Escape and backdrop clicks ahead of the modal.
    static const std::vector<std::string>& modal_blocking_surfaces();

   private:
    // ── InteractionDelegate ─────────────────────────────────────────────
    const GeometryProvider&  geometry() const override;
    std::optional<SplitInfo> split_info(const SplitId& split_id) const override;
    void apply_live_split_sizes(const SplitId& split_id, const std::vector<double>& sizes) override;
    void commit_split_resize(const SplitId& split_id) override;
    void commit_pin(const PanelId& panel_id) override;
    void commit_move(const PanelId&                panel_id,
                     const PanelPlacement&         placement,
                     const std::optional<PanelId>& target_panel_id) override;
    void commit_reorder(const PanelId& panel_id, size_t target_index) override;
    Rect viewport_rect() const override { return viewport_; }
    void apply_live_popover_size(const PanelId& panel_id, const HeaderPanelSize& size) override;
    void commit_popover_size(const PanelId& panel_id, const HeaderPanelSize& size) override;
    void on_interaction_changed(InteractionState state) override;

    // ── Layout lifecycle ────────────────────────────────────────────────
    LayoutPersistence                load_initial_layout();
    LayoutPersistence                create_default_layout();
    LayoutPersistence                create_fallback_layout() const;
    std::optional<LayoutPersistence> normalize_layout(LayoutPersistence layout) const;
    void                             persist_layout();
    void                             notify_layout_change();

    // ── Render steps ────────────────────────────────────────────────────
    void recompute_geometry();
    void unmount_removed_panels();
    void remount_panel(const PanelId& panel_id);
    void forget_panel(const PanelId& panel_id);
    void mount_panels();
    void update_visibility();
    void sync_panel_sizes();
    void ensure_active_panel();
    void sync_context_subscriptions();
    void update_panel_context_summary();
    void prune_focus_history();
    void save_focus_history();

    // ── Helpers ─────────────────────────────────────────────────────────
    struct ReorderAnchor
    {
        SplitId        split_id;
        size_t         child_index = 0;
        SplitDirection direction   = SplitDirection::Horizontal;
    };

    AvailabilityContext          availability_context() const;
    bool                         is_available(const std::string& panel_type, const PanelTypeManifest* manifest) const;
    bool                         is_session_bound(const std::string& panel_type) const;
    PanelId                      create_panel_id(const std::string& panel_type) const;
    std::optional<ContainerSize> placement_container_size(const std::optional<PanelId>& target) const;
    std::optional<PanelBinding>  current_binding(const PanelId& panel_id) const;
    bool                         is_modal(const PanelId& panel_id) const;
    bool                         modal_input_blocked() const;
    void                         set_focus(const PanelId& panel_id);
    void                         record_focus(const PanelId& panel_id);
    void                         track_active_kind(const PanelId& panel_id);
    void                         reveal_tabs(const PanelId& panel_id);
    // Pinned: opens its popover and focuses it. Otherwise activates it.
    void                         reuse_existing_panel(const PanelId& panel_id);
    // Removes the leaf from the tree, seeding an empty placeholder when it
    // is the only one. Returns false when no placeholder could be opened.
    bool                         detach_from_tree(const PanelId& panel_id);
    void                         remove_header_entry(const PanelId& panel_id);
    void                         drop_instance(const PanelId& panel_id);
    PanelContainer               container_for(const PanelId& panel_id) const;
    // Innermost split-mode ancestor of the panel and the child holding it.
    std::optional<ReorderAnchor> reorder_anchor(const PanelId& panel_id) const;

    WorkspaceOptions options_;
    PanelRegistry&   registry_;
    PanelHost&       host_;
    WorkspaceConfig  config_;

    LayoutPersistence layout_;
    bool              uses_default_layout_ = false;
    bool              default_pins_applied_ = false;
    bool              attached_             = false;

    std::optional<PanelId> active_panel_id_;
    std::optional<PanelId> active_chat_panel_id_;
    std::optional<PanelId> active_non_chat_panel_id_;
    std::optional<PanelId> modal_panel_id_;
    std::optional<PanelId> open_header_panel_id_;
    FocusHistory           history_;

    std::set<PanelId>                       mounted_;
    std::map<PanelId, bool>                 visibility_;
    std::map<PanelId, ContainerSize>        last_sizes_;
    std::map<PanelId, PanelHost::Unsubscribe> context_subscriptions_;

    Rect                    viewport_;
    Rect                    workspace_rect_;
    std::optional<Rect>     header_dock_rect_;
    LayoutGeometry          geometry_;
    const GeometryProvider* custom_geometry_ = nullptr;

    std::unique_ptr<InteractionController> interaction_;
};

}   // namespace paneldock
