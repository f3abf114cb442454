#pragma once

#include <paneldock/geometry_provider.hpp>
#include <paneldock/layout.hpp>

#include <optional>
#include <string>
#include <vector>

namespace paneldock
{

struct GeometryStyle
{
    float splitter_thickness  = 6.0f;
    float tab_strip_height    = 28.0f;
    float header_button_width = 32.0f;
};

// ─── Layout pieces ───────────────────────────────────────────────────────────

struct PanelFrame
{
    PanelId panel_id;
    Rect    rect;
};

// Drag handle between child `index` and `index + 1` of a split.
struct SplitHandle
{
    SplitId        split_id;
    size_t         index = 0;
    SplitDirection direction = SplitDirection::Horizontal;
    Rect           rect;
};

struct TabButton
{
    size_t  child_index = 0;
    PanelId panel_id;   // first panel of the child
    Rect    rect;
    bool    active = false;
};

struct TabStrip
{
    SplitId                split_id;
    Rect                   rect;
    std::vector<TabButton> tabs;
};

// A laid-out split. For split mode child_rects are the child areas; for
// tabs mode they are the tab buttons.
struct SplitBox
{
    SplitId           split_id;
    SplitDirection    direction = SplitDirection::Horizontal;
    ViewMode          view_mode = ViewMode::Split;
    Rect              rect;
    std::vector<Rect> child_rects;
};

struct HeaderButton
{
    PanelId panel_id;
    Rect    rect;
};

// ─── LayoutGeometry ──────────────────────────────────────────────────────────

class LayoutGeometry : public GeometryProvider
{
   public:
    LayoutGeometry() = default;

    static LayoutGeometry compute(const LayoutNode&           root,
                                  const Rect&                 workspace,
                                  const std::optional<Rect>&  header_dock,
                                  const std::vector<PanelId>& header_panels,
                                  const GeometryStyle&        style = {});

    // GeometryProvider
    Rect                   workspace_rect() const override { return workspace_; }
    std::optional<Rect>    header_dock_rect() const override { return header_dock_; }
    std::optional<Rect>    panel_rect(const PanelId& panel_id) const override;
    std::optional<PanelId> panel_at(float x, float y) const override;
    std::optional<Rect>    split_rect(const SplitId& split_id) const override;
    std::vector<Rect>      split_child_rects(const SplitId& split_id) const override;

    const std::vector<PanelFrame>&   frames() const { return frames_; }
    const std::vector<SplitHandle>&  handles() const { return handles_; }
    const std::vector<TabStrip>&     tab_strips() const { return tab_strips_; }
    const std::vector<SplitBox>&     splits() const { return splits_; }
    const std::vector<HeaderButton>& header_buttons() const { return header_buttons_; }

    std::optional<Rect>        header_button_rect(const PanelId& panel_id) const;
    const SplitHandle*         handle_at(float x, float y) const;
    const TabButton*           tab_at(float x, float y, const TabStrip** strip = nullptr) const;
    std::optional<PanelId>     header_button_at(float x, float y) const;

   private:
    void layout_node(const LayoutNode& node, const Rect& rect, const GeometryStyle& style);

    Rect                      workspace_;
    std::optional<Rect>       header_dock_;
    std::vector<PanelFrame>   frames_;
    std::vector<SplitHandle>  handles_;
    std::vector<TabStrip>     tab_strips_;
    std::vector<SplitBox>     splits_;
    std::vector<HeaderButton> header_buttons_;
};

}   // namespace paneldock
