#pragma once

#include <paneldock/layout.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace paneldock
{

// Where a panel's content goes.
struct PanelContainer
{
    enum class Surface
    {
        Tree,     // a frame in the tiling layout
        Header,   // a pinned panel's popover
        Modal     // the modal overlay
    };

    Surface surface = Surface::Tree;
    Rect    bounds;   // empty while the panel is hidden
};

struct PanelMountRequest
{
    PanelId                     panel_id;
    std::string                 panel_type;
    PanelContainer              container;
    std::optional<PanelBinding> binding;
    std::optional<std::string>  state;   // JSON text
};

struct PanelInventoryItem
{
    PanelId                     panel_id;
    std::string                 panel_type;
    std::string                 panel_title;
    bool                        visible = false;
    std::optional<PanelBinding> binding;
    std::optional<std::string>  context;   // JSON object text
};

struct PanelInventoryPayload
{
    std::vector<PanelInventoryItem> panels;
    std::optional<PanelId>          selected_panel_id;
    std::optional<PanelId>          selected_chat_panel_id;
    LayoutNode                      layout;
    std::vector<PanelId>            header_panels;
    std::optional<std::string>      window_id;

    // {"type":"panel_inventory", ...}
    std::string to_json() const;
};

// Envelope for events addressed to the host. The workspace sends the
// inventory from the pseudo-panel "workspace".
struct PanelEvent
{
    PanelId     panel_id;
    std::string panel_type;
    std::string payload;   // JSON text

    std::string to_json() const;
};

// Panel content lifecycle, implemented by the application shell. mount_panel
// may throw std::exception; the workspace logs it and retries on the next
// render.
class PanelHost
{
   public:
    virtual ~PanelHost() = default;

    using ContextListener = std::function<void(const std::optional<std::string>& value)>;
    using Unsubscribe     = std::function<void()>;

    virtual void mount_panel(const PanelMountRequest& request)               = 0;
    virtual void unmount_panel(const PanelId& panel_id)                      = 0;
    virtual void set_panel_visibility(const PanelId& panel_id, bool visible) = 0;
    virtual void set_panel_focus(const PanelId& panel_id, bool focused)      = 0;
    virtual void set_panel_size(const PanelId& panel_id, const ContainerSize& size) = 0;

    virtual std::optional<PanelBinding> get_panel_binding(const PanelId& panel_id) const = 0;
    virtual void set_panel_binding(const PanelId&                    panel_id,
                                   const std::optional<PanelBinding>& binding)       = 0;

    // Context values are JSON text.
    virtual std::optional<std::string> get_context(const std::string& key) const = 0;
    virtual void        set_context(const std::string& key, const std::optional<std::string>& value) = 0;
    virtual Unsubscribe subscribe_context(const std::string& key, ContextListener listener) = 0;

    virtual void send_panel_event(const PanelEvent& event) = 0;

    // Open state of surfaces drawn outside the workspace (dialogs, menus,
    // palettes). Used to decide whether Escape belongs to the modal.
    virtual bool is_surface_open(const std::string& surface) const
    {
        (void)surface;
        return false;
    }
};

// Host context key carrying a panel's own context object.
std::string panel_context_key(const PanelId& panel_id);

inline constexpr const char* ACTIVE_PANEL_CONTEXT_KEY  = "panel.active";
inline constexpr const char* PANEL_SUMMARY_CONTEXT_KEY = "panel.context";

}   // namespace paneldock
