#include <algorithm>
#include <paneldock/panel_registry.hpp>
#include <stdexcept>

namespace paneldock
{

// ─── Registry ────────────────────────────────────────────────────────────────

void PanelRegistry::register_panel(PanelTypeManifest manifest)
{
    if (manifests_.count(manifest.type))
        throw std::invalid_argument("Panel type already registered: " + manifest.type);
    register_or_replace(std::move(manifest));
}

void PanelRegistry::register_or_replace(PanelTypeManifest manifest)
{
    if (!manifests_.count(manifest.type))
        order_.push_back(manifest.type);
    std::string type  = manifest.type;
    manifests_[type] = std::move(manifest);
}

void PanelRegistry::update_manifest(const std::string& panel_type, PanelTypeManifest manifest)
{
    auto it = manifests_.find(panel_type);
    if (it == manifests_.end())
        throw std::invalid_argument("Panel type not registered: " + panel_type);
    if (manifest.type != panel_type)
    {
        throw std::invalid_argument("Panel manifest type mismatch: " + manifest.type + " vs "
                                    + panel_type);
    }
    it->second = std::move(manifest);
}

bool PanelRegistry::has(const std::string& panel_type) const
{
    return manifests_.count(panel_type) > 0;
}

const PanelTypeManifest* PanelRegistry::get_manifest(const std::string& panel_type) const
{
    auto it = manifests_.find(panel_type);
    return it != manifests_.end() ? &it->second : nullptr;
}

std::vector<PanelTypeManifest> PanelRegistry::list_manifests() const
{
    std::vector<PanelTypeManifest> out;
    out.reserve(order_.size());
    for (const auto& type : order_)
        out.push_back(manifests_.at(type));
    return out;
}

PanelInstance PanelRegistry::create_instance(const std::string&      panel_type,
                                             const PanelId&          panel_id,
                                             const PanelInitOptions& options) const
{
    if (!has(panel_type))
        throw std::invalid_argument("Unknown panel type: " + panel_type);

    PanelInstance instance;
    instance.panel_id   = panel_id;
    instance.panel_type = panel_type;
    instance.binding    = options.binding;
    instance.state      = options.state;
    return instance;
}

// ─── Availability ────────────────────────────────────────────────────────────

PanelAvailability resolve_panel_availability(const std::string&         panel_type,
                                             const PanelTypeManifest*   manifest,
                                             const AvailabilityContext& context)
{
    PanelAvailability result;
    if (!context.allowed_panel_types || !context.available_capabilities)
    {
        result.state = PanelAvailability::State::Loading;
        return result;
    }

    if (!context.allowed_panel_types->count(panel_type))
    {
        result.state  = PanelAvailability::State::Unavailable;
        result.reason = "Panel type is not enabled on the server.";
        return result;
    }

    if (!manifest)
    {
        result.state  = PanelAvailability::State::Unavailable;
        result.reason = "Panel manifest is not registered in the client.";
        return result;
    }

    for (const auto& capability : manifest->capabilities)
    {
        if (!context.available_capabilities->count(capability))
            result.missing_capabilities.push_back(capability);
    }
    if (!result.missing_capabilities.empty())
    {
        result.state  = PanelAvailability::State::Unavailable;
        result.reason = "Required capabilities are not available.";
    }
    return result;
}

}   // namespace paneldock
