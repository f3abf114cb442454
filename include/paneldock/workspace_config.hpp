#pragma once

#include <paneldock/logger.hpp>

#include <optional>
#include <string>

namespace paneldock
{

// Tunables for one workspace. Stored as a small JSON file:
//   { "version": 1, "focus_history_limit": 50, "log_level": "info", ... }
// Unknown keys are ignored; missing keys keep their defaults.
struct WorkspaceConfig
{
    static constexpr int FORMAT_VERSION = 1;

    // Persistence
    std::string storage_dir;   // empty: <config dir>/state
    std::string window_id;     // suffix for storage keys, empty for none

    // Focus
    size_t focus_history_limit = 50;

    // Interaction
    double split_min_fraction   = 0.05;   // floor for a resized split child
    double dock_edge_fraction   = 0.25;   // edge band of a drop target
    double tabs_highlight_inset = 0.15;   // inset of the center drop highlight

    // Geometry
    float splitter_thickness   = 6.0f;
    float tab_strip_height     = 28.0f;
    float header_button_width  = 32.0f;
    float popover_gap          = 8.0f;    // between the dock button and the popover
    float popover_edge_padding = 8.0f;
    float popover_viewport_margin = 32.0f;
    float popover_min_width    = 320.0f;
    float popover_min_height   = 240.0f;
    float popover_default_width  = 480.0f;
    float popover_default_height = 360.0f;

    // Logging
    LogLevel    log_level = LogLevel::Info;
    std::string log_file;

    // $PANELDOCK_CONFIG, else ~/.config/paneldock/workspace.json.
    static std::string default_path();
    static std::string default_storage_dir();

    // Returns false (and keeps the current values) when the file is missing
    // or malformed.
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    bool        load_from_string(const std::string& text);
    std::string serialize() const;

    // Storage directory with the default applied.
    std::string resolved_storage_dir() const;
};

}   // namespace paneldock
