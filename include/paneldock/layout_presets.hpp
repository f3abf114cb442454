#pragma once

#include <paneldock/layout.hpp>
#include <paneldock/panel_registry.hpp>

#include <vector>

namespace paneldock
{

// ─── Grid presets ────────────────────────────────────────────────────────────

struct LayoutPreset
{
    enum class Kind
    {
        Auto,      // ceil(sqrt(n)) columns
        Columns    // fixed column count, capped at the group count
    };

    Kind   kind    = Kind::Auto;
    size_t columns = 1;

    static LayoutPreset automatic() { return {Kind::Auto, 1}; }
    static LayoutPreset with_columns(size_t n) { return {Kind::Columns, n}; }
};

// Leaves and whole tabs nodes, in document order. Plain splits are
// flattened away.
std::vector<LayoutNode> collect_layout_groups(const LayoutNode& root);

// Rearranges the groups of `root` into rows of equal-width columns.
LayoutNode build_layout_preset(const LayoutNode& root, const LayoutPreset& preset);

// ─── Default layout ──────────────────────────────────────────────────────────

// Builds the first-run workspace from the registered manifests. Throws
// std::runtime_error("No panels registered.") when `manifests` is empty.
LayoutPersistence create_default_panel_layout(const std::vector<PanelTypeManifest>& manifests);

}   // namespace paneldock
