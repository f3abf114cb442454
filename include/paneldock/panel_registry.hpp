#pragma once

#include <paneldock/layout.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace paneldock
{

// ─── Manifest ────────────────────────────────────────────────────────────────

enum class SessionScope
{
    Required,
    Optional,
    Global
};

struct PanelTypeManifest
{
    std::string                   type;
    std::string                   title;
    std::optional<std::string>    icon;
    std::optional<std::string>    description;
    std::optional<std::string>    version;
    std::optional<bool>           multi_instance;   // unset means multi-instance
    std::optional<std::string>    default_session_binding;
    std::optional<SessionScope>   session_scope;
    std::optional<PanelPlacement> default_placement;
    bool                          default_pinned = false;
    std::optional<ContainerSize>  min_size;
    std::optional<ContainerSize>  max_size;
    std::vector<std::string>      capabilities;
};

struct PanelInitOptions
{
    std::optional<PanelBinding> binding;
    std::optional<std::string>  state;   // JSON text
    bool                        focus = true;
};

struct PanelOpenOptions : PanelInitOptions
{
    std::optional<PanelPlacement> placement;
    std::optional<PanelId>        target_panel_id;
};

// ─── Registry ────────────────────────────────────────────────────────────────

// Catalogue of panel types. Panel content (factories, widgets) belongs to
// the host; the registry only knows manifests and mints instances.
class PanelRegistry
{
   public:
    PanelRegistry()  = default;
    ~PanelRegistry() = default;

    PanelRegistry(const PanelRegistry&)            = delete;
    PanelRegistry& operator=(const PanelRegistry&) = delete;

    // Throws std::invalid_argument if the type is already registered.
    void register_panel(PanelTypeManifest manifest);
    void register_or_replace(PanelTypeManifest manifest);
    // Throws std::invalid_argument for an unknown type or a type mismatch.
    void update_manifest(const std::string& panel_type, PanelTypeManifest manifest);

    bool has(const std::string& panel_type) const;

    const PanelTypeManifest*       get_manifest(const std::string& panel_type) const;
    std::vector<PanelTypeManifest> list_manifests() const;
    size_t                         size() const { return manifests_.size(); }

    // Throws std::invalid_argument for an unknown type.
    PanelInstance create_instance(const std::string&      panel_type,
                                  const PanelId&          panel_id,
                                  const PanelInitOptions& options = {}) const;

   private:
    // Registration order is kept for list_manifests().
    std::vector<std::string>                 order_;
    std::map<std::string, PanelTypeManifest> manifests_;
};

// ─── Availability ────────────────────────────────────────────────────────────

struct AvailabilityContext
{
    // nullopt while the server has not reported yet.
    std::optional<std::set<std::string>> allowed_panel_types;
    std::optional<std::set<std::string>> available_capabilities;
};

struct PanelAvailability
{
    enum class State
    {
        Available,
        Loading,
        Unavailable
    };

    State                    state = State::Available;
    std::string              reason;
    std::vector<std::string> missing_capabilities;

    // Only Unavailable blocks opening.
    bool allows_open() const { return state != State::Unavailable; }
};

PanelAvailability resolve_panel_availability(const std::string&         panel_type,
                                             const PanelTypeManifest*   manifest,
                                             const AvailabilityContext& context);

}   // namespace paneldock
