#include "layout_geometry.hpp"

#include <algorithm>
#include <paneldock/layout_tree.hpp>

namespace paneldock
{

LayoutGeometry LayoutGeometry::compute(const LayoutNode&           root,
                                       const Rect&                 workspace,
                                       const std::optional<Rect>&  header_dock,
                                       const std::vector<PanelId>& header_panels,
                                       const GeometryStyle&        style)
{
    LayoutGeometry geometry;
    geometry.workspace_   = workspace;
    geometry.header_dock_ = header_dock;
    geometry.layout_node(root, workspace, style);

    if (header_dock)
    {
        float x = header_dock->x;
        for (const auto& id : header_panels)
        {
            geometry.header_buttons_.push_back(
                {id, Rect{x, header_dock->y, style.header_button_width, header_dock->h}});
            x += style.header_button_width;
        }
    }
    return geometry;
}

void LayoutGeometry::layout_node(const LayoutNode& node, const Rect& rect, const GeometryStyle& style)
{
    if (node.is_panel())
    {
        frames_.push_back({node.panel_id, rect});
        return;
    }

    size_t n = node.children.size();
    if (n == 0)
        return;

    SplitBox box;
    box.split_id  = node.split_id;
    box.direction = node.direction;
    box.view_mode = node.view_mode;
    box.rect      = rect;

    if (node.is_tabs())
    {
        float strip_h = std::min(style.tab_strip_height, rect.h);
        Rect  strip_rect{rect.x, rect.y, rect.w, strip_h};
        Rect  content{rect.x, rect.y + strip_h, rect.w, std::max(0.0f, rect.h - strip_h)};

        TabStrip strip;
        strip.split_id = node.split_id;
        strip.rect     = strip_rect;

        size_t active = active_child_index(node);
        float  tab_w  = rect.w / static_cast<float>(n);
        for (size_t i = 0; i < n; ++i)
        {
            Rect tab_rect{rect.x + tab_w * static_cast<float>(i), rect.y, tab_w, strip_h};
            strip.tabs.push_back({i,
                                  find_first_panel_id(node.children[i]).value_or(PanelId{}),
                                  tab_rect,
                                  i == active});
            box.child_rects.push_back(tab_rect);
        }
        tab_strips_.push_back(std::move(strip));
        splits_.push_back(std::move(box));

        layout_node(node.children[active], content, style);
        return;
    }

    std::vector<double> sizes      = normalize_split_sizes(node.sizes, n);
    bool                horizontal = node.direction == SplitDirection::Horizontal;
    float               extent     = horizontal ? rect.w : rect.h;
    float               gaps       = style.splitter_thickness * static_cast<float>(n - 1);
    float               available  = std::max(0.0f, extent - gaps);
    float               cursor     = horizontal ? rect.x : rect.y;

    std::vector<Rect> child_rects;
    for (size_t i = 0; i < n; ++i)
    {
        float length = available * static_cast<float>(sizes[i]);
        Rect  child  = horizontal ? Rect{cursor, rect.y, length, rect.h}
                                  : Rect{rect.x, cursor, rect.w, length};
        child_rects.push_back(child);
        cursor += length;

        if (i + 1 < n)
        {
            Rect handle = horizontal ? Rect{cursor, rect.y, style.splitter_thickness, rect.h}
                                     : Rect{rect.x, cursor, rect.w, style.splitter_thickness};
            handles_.push_back({node.split_id, i, node.direction, handle});
            cursor += style.splitter_thickness;
        }
    }

    box.child_rects = child_rects;
    splits_.push_back(std::move(box));

    for (size_t i = 0; i < n; ++i)
        layout_node(node.children[i], child_rects[i], style);
}

std::optional<Rect> LayoutGeometry::panel_rect(const PanelId& panel_id) const
{
    for (const auto& frame : frames_)
    {
        if (frame.panel_id == panel_id)
            return frame.rect;
    }
    return std::nullopt;
}

std::optional<PanelId> LayoutGeometry::panel_at(float x, float y) const
{
    for (const auto& frame : frames_)
    {
        if (frame.rect.contains(x, y))
            return frame.panel_id;
    }
    return std::nullopt;
}

std::optional<Rect> LayoutGeometry::split_rect(const SplitId& split_id) const
{
    for (const auto& box : splits_)
    {
        if (box.split_id == split_id)
            return box.rect;
    }
    return std::nullopt;
}

std::vector<Rect> LayoutGeometry::split_child_rects(const SplitId& split_id) const
{
    for (const auto& box : splits_)
    {
        if (box.split_id == split_id)
            return box.child_rects;
    }
    return {};
}

std::optional<Rect> LayoutGeometry::header_button_rect(const PanelId& panel_id) const
{
    for (const auto& button : header_buttons_)
    {
        if (button.panel_id == panel_id)
            return button.rect;
    }
    return std::nullopt;
}

const SplitHandle* LayoutGeometry::handle_at(float x, float y) const
{
    for (const auto& handle : handles_)
    {
        if (handle.rect.contains(x, y))
            return &handle;
    }
    return nullptr;
}

const TabButton* LayoutGeometry::tab_at(float x, float y, const TabStrip** strip) const
{
    for (const auto& s : tab_strips_)
    {
        if (!s.rect.contains(x, y))
            continue;
        for (const auto& tab : s.tabs)
        {
            if (tab.rect.contains(x, y))
            {
                if (strip)
                    *strip = &s;
                return &tab;
            }
        }
    }
    return nullptr;
}

std::optional<PanelId> LayoutGeometry::header_button_at(float x, float y) const
{
    for (const auto& button : header_buttons_)
    {
        if (button.rect.contains(x, y))
            return button.panel_id;
    }
    return std::nullopt;
}

}   // namespace paneldock
