#pragma once

// Recording PanelHost and registry helpers shared by the workspace tests.

#include <map>
#include <paneldock/panel_host.hpp>
#include <paneldock/panel_registry.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace paneldock::test
{

class FakeHost : public PanelHost
{
   public:
    struct Subscription
    {
        std::string     key;
        ContextListener listener;
        bool            active = true;
    };

    void mount_panel(const PanelMountRequest& request) override
    {
        ++mount_attempts[request.panel_id];
        if (failing_mounts.count(request.panel_id) || failing_types.count(request.panel_type))
            throw std::runtime_error("mount failed");
        mounts.push_back(request);
        mounted.insert(request.panel_id);
    }

    void unmount_panel(const PanelId& panel_id) override
    {
        unmounts.push_back(panel_id);
        mounted.erase(panel_id);
    }

    void set_panel_visibility(const PanelId& panel_id, bool visible) override
    {
        visibility[panel_id] = visible;
        visibility_calls.emplace_back(panel_id, visible);
    }

    void set_panel_focus(const PanelId& panel_id, bool focused) override
    {
        focus[panel_id] = focused;
        focus_calls.emplace_back(panel_id, focused);
    }

    void set_panel_size(const PanelId& panel_id, const ContainerSize& size) override
    {
        sizes[panel_id] = size;
        ++size_calls;
    }

    std::optional<PanelBinding> get_panel_binding(const PanelId& panel_id) const override
    {
        auto it = bindings.find(panel_id);
        if (it == bindings.end())
            return std::nullopt;
        return it->second;
    }

    void set_panel_binding(const PanelId& panel_id, const std::optional<PanelBinding>& binding) override
    {
        bindings[panel_id] = binding;
    }

    std::optional<std::string> get_context(const std::string& key) const override
    {
        auto it = context.find(key);
        if (it == context.end())
            return std::nullopt;
        return it->second;
    }

    void set_context(const std::string& key, const std::optional<std::string>& value) override
    {
        if (value)
            context[key] = *value;
        else
            context.erase(key);
        for (auto& sub : subscriptions)
        {
            if (sub.active && sub.key == key)
                sub.listener(value);
        }
    }

    Unsubscribe subscribe_context(const std::string& key, ContextListener listener) override
    {
        subscriptions.push_back({key, std::move(listener), true});
        size_t index = subscriptions.size() - 1;
        return [this, index]() { subscriptions[index].active = false; };
    }

    void send_panel_event(const PanelEvent& event) override { events.push_back(event); }

    bool is_surface_open(const std::string& surface) const override
    {
        return open_surfaces.count(surface) > 0;
    }

    size_t active_subscriptions(const std::string& key) const
    {
        size_t n = 0;
        for (const auto& sub : subscriptions)
        {
            if (sub.active && sub.key == key)
                ++n;
        }
        return n;
    }

    bool is_focused(const PanelId& panel_id) const
    {
        auto it = focus.find(panel_id);
        return it != focus.end() && it->second;
    }

    bool is_visible(const PanelId& panel_id) const
    {
        auto it = visibility.find(panel_id);
        return it != visibility.end() && it->second;
    }

    // Panel requests
    std::vector<PanelMountRequest>                    mounts;
    std::vector<PanelId>                              unmounts;
    std::set<PanelId>                                 mounted;
    std::map<PanelId, int>                            mount_attempts;
    std::set<PanelId>                                 failing_mounts;
    std::set<std::string>                             failing_types;
    std::map<PanelId, bool>                           visibility;
    std::vector<std::pair<PanelId, bool>>             visibility_calls;
    std::map<PanelId, bool>                           focus;
    std::vector<std::pair<PanelId, bool>>             focus_calls;
    std::map<PanelId, ContainerSize>                  sizes;
    int                                               size_calls = 0;
    std::map<PanelId, std::optional<PanelBinding>>    bindings;

    // Context and events
    std::map<std::string, std::string> context;
    std::vector<Subscription>          subscriptions;
    std::vector<PanelEvent>            events;
    std::set<std::string>              open_surfaces;
};

inline PanelTypeManifest make_manifest(const std::string& type,
                                       std::optional<PanelRegion> region = PanelRegion::Center)
{
    PanelTypeManifest manifest;
    manifest.type  = type;
    manifest.title = type;
    if (region)
        manifest.default_placement = PanelPlacement{*region, std::nullopt};
    return manifest;
}

// sessions (left), chat (center), notes (right) and a non-multi-instance
// settings panel, plus the empty placeholder type.
inline void register_standard_panels(PanelRegistry& registry)
{
    auto sessions           = make_manifest("sessions", PanelRegion::Left);
    sessions.multi_instance = false;
    registry.register_panel(sessions);

    auto chat          = make_manifest("chat", PanelRegion::Center);
    chat.title         = "Chat";
    chat.session_scope = SessionScope::Required;
    registry.register_panel(chat);

    registry.register_panel(make_manifest("notes", PanelRegion::Right));

    auto settings           = make_manifest("settings", std::nullopt);
    settings.multi_instance = false;
    registry.register_panel(settings);

    registry.register_panel(make_manifest("empty", std::nullopt));
}

}   // namespace paneldock::test
