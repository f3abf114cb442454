// Scripts a short session against a console host: opens, splits, tabs,
// pins, drags and resizes panels, then prints the resulting layout.
//
//   paneldock_demo [--persist] [config.json]

#include <iostream>
#include <memory>
#include <paneldock/layout_presets.hpp>
#include <paneldock/layout_tree.hpp>
#include <paneldock/logger.hpp>
#include <paneldock/storage.hpp>
#include <paneldock/workspace_config.hpp>
#include <string>
#include <vector>

#include "console_host.hpp"
#include "ui/panel_workspace.hpp"

using namespace paneldock;

namespace
{

const char* direction_name(SplitDirection direction)
{
    return direction == SplitDirection::Horizontal ? "horizontal" : "vertical";
}

void print_tree(const PanelWorkspace& workspace, const LayoutNode& node, int depth = 0)
{
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    if (node.is_panel())
    {
        auto rect = workspace.computed_geometry().panel_rect(node.panel_id);
        std::cout << indent << "- " << node.panel_id << " \"" << workspace.panel_title(node.panel_id) << "\"";
        if (rect)
            std::cout << "  [" << rect->x << ", " << rect->y << ", " << rect->w << " x " << rect->h << "]";
        else
            std::cout << "  (hidden)";
        if (workspace.active_panel_id() == node.panel_id)
            std::cout << "  *";
        std::cout << "\n";
        return;
    }

    std::cout << indent << "+ " << node.split_id << " " << (node.is_tabs() ? "tabs" : direction_name(node.direction))
              << " (";
    for (size_t i = 0; i < node.sizes.size(); ++i)
        std::cout << (i ? ", " : "") << node.sizes[i];
    std::cout << ")\n";
    for (const auto& child : node.children)
        print_tree(workspace, child, depth + 1);
}

void print_state(const PanelWorkspace& workspace, const char* title)
{
    std::cout << "\n=== " << title << " ===\n";
    print_tree(workspace, workspace.layout_root());
    if (!workspace.header_panel_ids().empty())
    {
        std::cout << "header:";
        for (const auto& id : workspace.header_panel_ids())
            std::cout << " " << id << (workspace.open_header_panel_id() == id ? " (open)" : "");
        std::cout << "\n";
    }
    if (auto modal = workspace.modal_panel_id())
        std::cout << "modal: " << *modal << "\n";
}

PointerEvent center_of(const Rect& r)
{
    return PointerEvent{1, r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

}   // namespace

int main(int argc, char** argv)
{
    bool        persist = false;
    std::string config_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--persist")
            persist = true;
        else
            config_path = arg;
    }

    WorkspaceConfig config;
    bool            loaded = config.load(config_path.empty() ? WorkspaceConfig::default_path() : config_path);

    Logger::instance().set_level(config.log_level);
    Logger::instance().add_sink(sinks::console_sink());
    if (!config.log_file.empty())
        Logger::instance().add_sink(sinks::file_sink(config.log_file));
    if (!loaded)
        PANELDOCK_LOG_INFO("demo", "No workspace config found, using defaults");

    std::unique_ptr<KeyValueStorage> storage;
    if (persist)
    {
        storage = std::make_unique<FileStorage>(config.resolved_storage_dir());
        PANELDOCK_LOG_INFO("demo", "Persisting to {}", config.resolved_storage_dir());
    }
    else
    {
        storage = std::make_unique<MemoryStorage>();
    }

    PanelRegistry registry;
    demo::register_demo_panels(registry);
    demo::ConsoleHost host;

    WorkspaceOptions options;
    options.registry = &registry;
    options.host     = &host;
    options.storage  = storage.get();
    options.config   = config;

    PanelWorkspace workspace(options);
    workspace.set_viewport(Rect{0, 0, 1280, 800}, Rect{0, 40, 1280, 760}, Rect{960, 0, 320, 40});
    workspace.attach();
    print_state(workspace, "initial");

    // Open a second notes panel below the first, and a second chat as a tab.
    auto notes_ids = workspace.panel_ids_by_type("notes");
    PanelOpenOptions below;
    below.placement = PanelPlacement{PanelRegion::Bottom, std::nullopt};
    if (!notes_ids.empty())
        below.target_panel_id = notes_ids.front();
    auto notes = workspace.open_panel("notes", below);

    PanelOpenOptions as_tab;
    as_tab.placement = PanelPlacement{PanelRegion::Center, std::nullopt};
    as_tab.binding   = PanelBinding::fixed("session-2");
    auto chat        = workspace.open_panel("chat", as_tab);
    print_state(workspace, "after opening");

    if (chat)
        workspace.cycle_tab_for_panel(*chat);

    // Pin sessions to the header and open its popover.
    if (auto sessions = workspace.panel_ids_by_type("sessions"); !sessions.empty())
    {
        workspace.pin_panel(sessions.front());
        workspace.open_header_panel(sessions.front());
        if (auto popover = workspace.header_popover_rect())
            PANELDOCK_LOG_INFO("demo", "Popover at {},{} size {}x{}", popover->x, popover->y, popover->w, popover->h);
    }
    print_state(workspace, "after pinning");

    // Escape closes the popover first.
    workspace.handle_escape();

    // Drag the new notes panel onto the left edge of the workspace.
    if (notes)
    {
        if (auto rect = workspace.computed_geometry().panel_rect(*notes))
        {
            workspace.begin_panel_drag(*notes, center_of(*rect));
            PointerEvent drop{1, 20.0f, 400.0f};
            workspace.pointer_move(drop);
            workspace.pointer_up(drop);
        }
    }

    // Widen the first column by dragging the root splitter.
    // Copied: every pointer move recomputes the geometry.
    std::vector<SplitHandle> handles = workspace.computed_geometry().handles();
    for (const auto& handle : handles)
    {
        if (handle.split_id != workspace.layout_root().split_id)
            continue;
        PointerEvent grab = center_of(handle.rect);
        workspace.begin_split_resize(handle.split_id, handle.index, grab);
        PointerEvent moved{1, grab.x + 120.0f, grab.y};
        workspace.pointer_move(moved);
        workspace.pointer_up(moved);
        break;
    }
    print_state(workspace, "after drag and resize");

    // Settings in the modal overlay, then dismissed with Escape.
    workspace.open_modal_panel("settings");
    print_state(workspace, "modal");
    workspace.handle_escape();

    workspace.apply_layout_preset(LayoutPreset::automatic());
    print_state(workspace, "auto grid");

    std::cout << "\ninventory: " << workspace.build_panel_inventory().to_json() << "\n";
    std::cout << "events sent to host: " << host.events_sent() << "\n";
    return 0;
}
