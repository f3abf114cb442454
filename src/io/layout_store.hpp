#pragma once

#include <paneldock/layout.hpp>
#include <paneldock/storage.hpp>

#include <optional>
#include <string>
#include <vector>

#include "json.hpp"

namespace paneldock
{

// ─── JSON codec ──────────────────────────────────────────────────────────────
// Field names follow the persisted layout document:
//   { layout, panels: {id: {panelId, panelType, binding?, meta?, state?}},
//     headerPanels, headerPanelSizes }

json::Value layout_node_to_json(const LayoutNode& node);
json::Value panel_binding_to_json(const PanelBinding& binding);
json::Value panel_instance_to_json(const PanelInstance& instance);
json::Value persistence_to_json(const LayoutPersistence& layout);

// Schema-checking decoders. A split needs at least two children and one
// positive size per child. `error` receives a short reason on failure.
std::optional<LayoutNode>        layout_node_from_json(const json::Value& value,
                                                       std::string*       error = nullptr);
std::optional<PanelBinding>      panel_binding_from_json(const json::Value& value);
std::optional<PanelInstance>     panel_instance_from_json(const json::Value& value,
                                                          std::string*       error = nullptr);
std::optional<LayoutPersistence> persistence_from_json(const json::Value& value,
                                                       std::string*       error = nullptr);

// ─── Layout store ────────────────────────────────────────────────────────────

// Stored layouts from another version are discarded, never migrated.
inline constexpr int CURRENT_LAYOUT_VERSION = 3;

inline constexpr const char* LAYOUT_STORAGE_KEY         = "paneldock.layout";
inline constexpr const char* LAYOUT_VERSION_STORAGE_KEY = "paneldock.layout.version";
inline constexpr const char* FOCUS_HISTORY_STORAGE_KEY  = "paneldock.focus_history";

// Appends ":<window_id>" when a window id is given.
std::string storage_key(const char* base, const std::string& window_id);

// Returns nullopt (and logs why) on a missing entry, a version mismatch,
// unparsable text or a schema failure.
std::optional<LayoutPersistence> load_panel_layout(const KeyValueStorage& storage,
                                                   const std::string&     window_id = {});
bool save_panel_layout(KeyValueStorage&         storage,
                       const LayoutPersistence& layout,
                       const std::string&       window_id = {});
void clear_panel_layout(KeyValueStorage& storage, const std::string& window_id = {});

std::optional<int> stored_layout_version(const KeyValueStorage& storage,
                                         const std::string&     window_id = {});

// Focus history: a JSON array of ids, most recent first. Also accepts the
// wrapped form {"history": [...]}. Entries are trimmed and deduplicated;
// anything that is not a non-empty string is skipped.
std::vector<PanelId> parse_focus_history(const std::string& text, size_t limit);
std::vector<PanelId> load_focus_history(const KeyValueStorage& storage,
                                        size_t                 limit,
                                        const std::string&     window_id = {});
bool                 save_focus_history(KeyValueStorage&            storage,
                                        const std::vector<PanelId>& history,
                                        const std::string&          window_id = {});

}   // namespace paneldock
