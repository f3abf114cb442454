#pragma once

#include <paneldock/fwd.hpp>
#include <paneldock/geometry_provider.hpp>
#include <paneldock/layout.hpp>
#include <paneldock/layout_presets.hpp>
#include <paneldock/layout_tree.hpp>
#include <paneldock/logger.hpp>
#include <paneldock/panel_host.hpp>
#include <paneldock/panel_registry.hpp>
#include <paneldock/storage.hpp>
#include <paneldock/workspace_config.hpp>

// ─── Overview ────────────────────────────────────────────────────────────────
// The tree engine (layout_tree, layout_presets) is a set of pure functions
// over LayoutNode values. PanelWorkspace owns a LayoutPersistence and drives
// a PanelHost:
//
//   paneldock::PanelRegistry registry;
//   registry.register_panel(manifest);
//   paneldock::PanelWorkspace workspace({.registry = &registry, .host = &host});
//   workspace.set_viewport(viewport, workspace_rect, header_dock_rect);
//   workspace.attach();
//   workspace.open_panel("notes");
