#pragma once

#include <paneldock/layout.hpp>

#include <optional>
#include <vector>

namespace paneldock
{

// Geometry queries used by the pointer interactions. The workspace answers
// them from its own computed layout; a frontend that lays panels out itself
// can inject an implementation instead.
class GeometryProvider
{
   public:
    virtual ~GeometryProvider() = default;

    virtual Rect                workspace_rect() const   = 0;
    virtual std::optional<Rect> header_dock_rect() const = 0;

    // Frame of a visible tree panel.
    virtual std::optional<Rect> panel_rect(const PanelId& panel_id) const = 0;
    // Visible tree panel whose frame contains the point.
    virtual std::optional<PanelId> panel_at(float x, float y) const = 0;

    // Bounds of a laid-out split and of each of its children, in child order.
    virtual std::optional<Rect> split_rect(const SplitId& split_id) const              = 0;
    virtual std::vector<Rect>   split_child_rects(const SplitId& split_id) const       = 0;
};

}   // namespace paneldock
