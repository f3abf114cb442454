#pragma once

#include <paneldock/fwd.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace paneldock
{

// ─── Geometry ────────────────────────────────────────────────────────────────

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    bool contains(float px, float py) const
    {
        return px >= x && px <= x + w && py >= y && py <= y + h;
    }

    bool empty() const { return w <= 0.0f || h <= 0.0f; }

    bool operator==(const Rect&) const = default;
};

struct ContainerSize
{
    double width  = 0.0;
    double height = 0.0;

    bool operator==(const ContainerSize&) const = default;
};

// ─── Layout tree ─────────────────────────────────────────────────────────────

enum class SplitDirection
{
    Horizontal,   // children side by side, vertical divider
    Vertical      // children stacked, horizontal divider
};

enum class ViewMode
{
    Split,   // every child visible and resizable
    Tabs     // one active child visible
};

// Tagged tree node. A panel leaf carries only panel_id; a split carries
// split_id, direction, view_mode, children and sizes (same length, each
// > 0, summing to 1). active_id is only meaningful in Tabs mode and names
// a panel reachable through one of the children.
struct LayoutNode
{
    enum class Kind
    {
        Panel,
        Split
    };

    Kind                    kind = Kind::Panel;
    PanelId                 panel_id;
    SplitId                 split_id;
    SplitDirection          direction = SplitDirection::Horizontal;
    ViewMode                view_mode = ViewMode::Split;
    std::vector<LayoutNode> children;
    std::vector<double>     sizes;
    std::optional<PanelId>  active_id;

    static LayoutNode panel(PanelId id);
    static LayoutNode split(SplitId                 id,
                            SplitDirection          direction,
                            std::vector<LayoutNode> children,
                            std::vector<double>     sizes,
                            ViewMode                view_mode = ViewMode::Split,
                            std::optional<PanelId>  active_id = std::nullopt);

    bool is_panel() const { return kind == Kind::Panel; }
    bool is_split() const { return kind == Kind::Split; }
    bool is_tabs() const { return kind == Kind::Split && view_mode == ViewMode::Tabs; }

    bool operator==(const LayoutNode&) const = default;
};

// ─── Placement ───────────────────────────────────────────────────────────────

enum class PanelRegion
{
    Center,
    Left,
    Right,
    Top,
    Bottom
};

const char*                region_to_string(PanelRegion region);
std::optional<PanelRegion> region_from_string(const std::string& text);

struct PanelSize
{
    std::optional<double> width;
    std::optional<double> height;

    bool operator==(const PanelSize&) const = default;
};

struct PanelPlacement
{
    PanelRegion              region = PanelRegion::Center;
    std::optional<PanelSize> size;

    bool operator==(const PanelPlacement&) const = default;
};

// ─── Panel instances ─────────────────────────────────────────────────────────

struct PanelBinding
{
    enum class Mode
    {
        Fixed,
        Global
    };

    Mode        mode = Mode::Global;
    std::string session_id;   // only for Fixed

    static PanelBinding fixed(std::string session) { return {Mode::Fixed, std::move(session)}; }
    static PanelBinding global() { return {Mode::Global, {}}; }

    bool is_fixed() const { return mode == Mode::Fixed; }

    bool operator==(const PanelBinding&) const = default;
};

enum class PanelStatus
{
    Idle,
    Busy,
    Error
};

struct PanelMetadata
{
    std::optional<std::string> title;
    std::optional<std::string> icon;
    std::optional<std::string> badge;
    std::optional<PanelStatus> status;

    bool operator==(const PanelMetadata&) const = default;
};

struct PanelInstance
{
    PanelId                      panel_id;
    std::string                  panel_type;
    std::optional<PanelBinding>  binding;
    std::optional<PanelMetadata> meta;
    // Opaque panel state as a JSON document. Persisted, never interpreted.
    std::optional<std::string> state;

    bool operator==(const PanelInstance&) const = default;
};

struct HeaderPanelSize
{
    double width  = 0.0;
    double height = 0.0;

    bool operator==(const HeaderPanelSize&) const = default;
};

// The complete persisted workspace. Every id referenced by layout or
// header_panels has an entry in panels; an id is either in the tree or
// pinned, never both.
struct LayoutPersistence
{
    LayoutNode                             layout;
    std::map<PanelId, PanelInstance>       panels;
    std::vector<PanelId>                   header_panels;
    std::map<PanelId, HeaderPanelSize>     header_panel_sizes;

    bool operator==(const LayoutPersistence&) const = default;
};

}   // namespace paneldock
