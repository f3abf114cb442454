#pragma once

// PanelHost for the demos: keeps contexts and bindings in memory and logs
// every request it receives.

#include <map>
#include <paneldock/logger.hpp>
#include <paneldock/panel_host.hpp>
#include <paneldock/panel_registry.hpp>
#include <set>
#include <string>
#include <vector>

namespace paneldock::demo
{

class ConsoleHost : public PanelHost
{
   public:
    void mount_panel(const PanelMountRequest& request) override
    {
        PANELDOCK_LOG_INFO("host", "mount {} ({})", request.panel_id, request.panel_type);
        mounted_.insert(request.panel_id);
    }

    void unmount_panel(const PanelId& panel_id) override
    {
        PANELDOCK_LOG_INFO("host", "unmount {}", panel_id);
        mounted_.erase(panel_id);
    }

    void set_panel_visibility(const PanelId& panel_id, bool visible) override
    {
        PANELDOCK_LOG_DEBUG("host", "{} {}", panel_id, visible ? "shown" : "hidden");
    }

    void set_panel_focus(const PanelId& panel_id, bool focused) override
    {
        if (focused)
            PANELDOCK_LOG_INFO("host", "focus {}", panel_id);
    }

    void set_panel_size(const PanelId& panel_id, const ContainerSize& size) override
    {
        PANELDOCK_LOG_DEBUG("host", "{} resized to {}x{}", panel_id, size.width, size.height);
    }

    std::optional<PanelBinding> get_panel_binding(const PanelId& panel_id) const override
    {
        auto it = bindings_.find(panel_id);
        if (it == bindings_.end())
            return std::nullopt;
        return it->second;
    }

    void set_panel_binding(const PanelId& panel_id, const std::optional<PanelBinding>& binding) override
    {
        if (binding)
            bindings_[panel_id] = *binding;
        else
            bindings_.erase(panel_id);
    }

    std::optional<std::string> get_context(const std::string& key) const override
    {
        auto it = context_.find(key);
        if (it == context_.end())
            return std::nullopt;
        return it->second;
    }

    void set_context(const std::string& key, const std::optional<std::string>& value) override
    {
        if (value)
            context_[key] = *value;
        else
            context_.erase(key);

        for (size_t i = 0; i < listeners_.size(); ++i)
        {
            if (listeners_[i].active && listeners_[i].key == key)
                listeners_[i].listener(value);
        }
    }

    Unsubscribe subscribe_context(const std::string& key, ContextListener listener) override
    {
        listeners_.push_back({key, std::move(listener), true});
        size_t index = listeners_.size() - 1;
        return [this, index]() { listeners_[index].active = false; };
    }

    void send_panel_event(const PanelEvent& event) override
    {
        PANELDOCK_LOG_DEBUG("host", "event from {}: {}", event.panel_id, event.payload);
        ++events_sent_;
    }

    bool   is_mounted(const PanelId& panel_id) const { return mounted_.count(panel_id) > 0; }
    size_t events_sent() const { return events_sent_; }

   private:
    struct Listener
    {
        std::string     key;
        ContextListener listener;
        bool            active = true;
    };

    std::set<PanelId>                   mounted_;
    std::map<PanelId, PanelBinding>     bindings_;
    std::map<std::string, std::string>  context_;
    std::vector<Listener>               listeners_;
    size_t                              events_sent_ = 0;
};

// chat (center), sessions (left), notes (right) and a modal-friendly
// settings panel.
inline void register_demo_panels(PanelRegistry& registry)
{
    PanelTypeManifest sessions;
    sessions.type              = "sessions";
    sessions.title             = "Sessions";
    sessions.multi_instance    = false;
    sessions.default_placement = PanelPlacement{PanelRegion::Left, PanelSize{240.0, std::nullopt}};
    registry.register_panel(sessions);

    PanelTypeManifest chat;
    chat.type              = "chat";
    chat.title             = "Chat";
    chat.session_scope     = SessionScope::Required;
    chat.default_placement = PanelPlacement{PanelRegion::Center, std::nullopt};
    registry.register_panel(chat);

    PanelTypeManifest notes;
    notes.type              = "notes";
    notes.title             = "Notes";
    notes.default_placement = PanelPlacement{PanelRegion::Right, std::nullopt};
    registry.register_panel(notes);

    PanelTypeManifest files;
    files.type           = "files";
    files.title          = "Files";
    files.default_pinned = true;
    registry.register_panel(files);

    PanelTypeManifest settings;
    settings.type           = "settings";
    settings.title          = "Settings";
    settings.multi_instance = false;
    registry.register_panel(settings);
}

}   // namespace paneldock::demo
