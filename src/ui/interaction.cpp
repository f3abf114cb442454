#include "interaction.hpp"

#include <algorithm>
#include <cmath>
#include <paneldock/logger.hpp>

namespace paneldock
{

// ─── Geometry helpers ────────────────────────────────────────────────────────

Rect merge_rects(const Rect& a, const Rect& b)
{
    float left   = std::min(a.x, b.x);
    float top    = std::min(a.y, b.y);
    float right  = std::max(a.x + a.w, b.x + b.w);
    float bottom = std::max(a.y + a.h, b.y + b.h);
    return Rect{left, top, right - left, bottom - top};
}

std::optional<std::pair<double, double>> compute_resize_pair(float  pointer,
                                                             float  merged_start,
                                                             float  merged_extent,
                                                             double size_a,
                                                             double size_b,
                                                             double min_fraction)
{
    if (!(merged_extent > 0.0f))
        return std::nullopt;

    double total = size_a + size_b;
    if (!std::isfinite(total) || total <= 0.0)
        return std::nullopt;

    double ratio     = (static_cast<double>(pointer) - merged_start) / merged_extent;
    double min_ratio = total < min_fraction * 2.0 ? 0.5 : min_fraction / total;
    ratio            = std::clamp(ratio, min_ratio, 1.0 - min_ratio);

    double first = total * ratio;
    return std::make_pair(first, total - first);
}

PanelRegion resolve_drop_region(float x, float y, const Rect& rect, double edge_fraction)
{
    auto  edge        = static_cast<float>(edge_fraction);
    float left_edge   = rect.x + rect.w * edge;
    float right_edge  = rect.x + rect.w - rect.w * edge;
    float top_edge    = rect.y + rect.h * edge;
    float bottom_edge = rect.y + rect.h - rect.h * edge;

    if (x <= left_edge)
        return PanelRegion::Left;
    if (x >= right_edge)
        return PanelRegion::Right;
    if (y <= top_edge)
        return PanelRegion::Top;
    if (y >= bottom_edge)
        return PanelRegion::Bottom;
    return PanelRegion::Center;
}

Rect compute_drop_highlight(PanelRegion region, const Rect& rect, double center_inset)
{
    float half_w = rect.w * 0.5f;
    float half_h = rect.h * 0.5f;
    switch (region)
    {
        case PanelRegion::Left:
            return Rect{rect.x, rect.y, half_w, rect.h};
        case PanelRegion::Right:
            return Rect{rect.x + rect.w - half_w, rect.y, half_w, rect.h};
        case PanelRegion::Top:
            return Rect{rect.x, rect.y, rect.w, half_h};
        case PanelRegion::Bottom:
            return Rect{rect.x, rect.y + rect.h - half_h, rect.w, half_h};
        case PanelRegion::Center:
            break;
    }
    auto  inset = static_cast<float>(center_inset);
    float dx    = rect.w * inset;
    float dy    = rect.h * inset;
    return Rect{rect.x + dx, rect.y + dy, rect.w - 2.0f * dx, rect.h - 2.0f * dy};
}

size_t resolve_split_child_index(const std::vector<Rect>& children,
                                 const Rect&              container,
                                 float                    x,
                                 float                    y,
                                 SplitDirection           direction)
{
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (children[i].contains(x, y))
            return i;
    }
    if (children.empty())
        return 0;

    bool before = direction == SplitDirection::Horizontal
                      ? x < container.x + container.w * 0.5f
                      : y < container.y + container.h * 0.5f;
    return before ? 0 : children.size() - 1;
}

HeaderPanelSize clamp_popover_size(double               width,
                                   double               height,
                                   const Rect&          viewport,
                                   const PopoverLimits& limits)
{
    double max_w = std::max<double>(limits.min_width, viewport.w - limits.viewport_margin);
    double max_h = std::max<double>(limits.min_height, viewport.h - limits.viewport_margin);
    return HeaderPanelSize{std::clamp<double>(width, limits.min_width, max_w),
                           std::clamp<double>(height, limits.min_height, max_h)};
}

Rect position_popover(const Rect&            anchor,
                      const HeaderPanelSize& size,
                      const Rect&            viewport,
                      const PopoverLimits&   limits)
{
    auto  w   = static_cast<float>(size.width);
    auto  h   = static_cast<float>(size.height);
    float pad = limits.edge_padding;

    float left = anchor.x;
    float top  = anchor.y + anchor.h + limits.gap;

    if (left + w > viewport.x + viewport.w - pad)
        left = viewport.x + viewport.w - w - pad;
    if (left < viewport.x + pad)
        left = viewport.x + pad;
    if (top + h > viewport.y + viewport.h - pad)
        top = anchor.y - h - limits.gap;
    if (top < viewport.y + pad)
        top = viewport.y + pad;
    return Rect{left, top, w, h};
}

// ─── InteractionController ───────────────────────────────────────────────────

const char* interaction_state_name(InteractionState state)
{
    switch (state)
    {
        case InteractionState::Idle:
            return "idle";
        case InteractionState::Resizing:
            return "resizing";
        case InteractionState::Docking:
            return "docking";
        case InteractionState::Reordering:
            return "reordering";
        case InteractionState::PopoverResizing:
            return "popover-resizing";
        case InteractionState::MenuOpen:
            return "menu-open";
    }
    return "idle";
}

InteractionController::InteractionController(InteractionDelegate& delegate,
                                             InteractionTuning    tuning)
    : delegate_(delegate), tuning_(tuning)
{
}

void InteractionController::set_state(InteractionState state)
{
    if (state_ == state)
        return;
    PANELDOCK_LOG_TRACE("interaction",
                        "{} -> {}",
                        interaction_state_name(state_),
                        interaction_state_name(state));
    state_ = state;
    delegate_.on_interaction_changed(state);
}

bool InteractionController::begin_resize(const SplitId&      split_id,
                                         size_t              handle_index,
                                         const PointerEvent& event)
{
    cancel();

    auto info = delegate_.split_info(split_id);
    if (!info || handle_index + 1 >= info->sizes.size())
        return false;

    resize_              = ResizeSession{};
    resize_.split_id     = split_id;
    resize_.handle_index = handle_index;
    resize_.pointer_id   = event.pointer_id;
    resize_.start_sizes  = info->sizes;
    listening_           = true;
    set_state(InteractionState::Resizing);
    return true;
}

bool InteractionController::begin_dock_drag(const PanelId& panel_id, const PointerEvent& event)
{
    cancel();

    dock_          = DockSession{};
    dock_.panel_id = panel_id;
    listening_     = true;
    set_state(InteractionState::Docking);
    update_dock(event);
    return true;
}

bool InteractionController::begin_reorder(const PanelId&      panel_id,
                                          const SplitId&      split_id,
                                          size_t              source_index,
                                          SplitDirection      direction,
                                          const PointerEvent& event)
{
    cancel();

    if (delegate_.geometry().split_child_rects(split_id).size() < 2)
        return false;

    reorder_              = ReorderSession{};
    reorder_.panel_id     = panel_id;
    reorder_.split_id     = split_id;
    reorder_.source_index = source_index;
    reorder_.direction    = direction;
    listening_            = true;
    set_state(InteractionState::Reordering);
    update_reorder(event);
    return true;
}

bool InteractionController::begin_popover_resize(const PanelId&         panel_id,
                                                 const HeaderPanelSize& start_size,
                                                 const PointerEvent&    event)
{
    cancel();

    popover_              = PopoverSession{};
    popover_.panel_id     = panel_id;
    popover_.pointer_id   = event.pointer_id;
    popover_.start_x      = event.x;
    popover_.start_y      = event.y;
    popover_.start_size   = start_size;
    popover_.current_size = start_size;
    listening_            = true;
    set_state(InteractionState::PopoverResizing);
    return true;
}

void InteractionController::open_menu(const PanelId& panel_id)
{
    cancel();
    menu_panel_id_ = panel_id;
    set_state(InteractionState::MenuOpen);
}

void InteractionController::pointer_move(const PointerEvent& event)
{
    if (!listening_)
        return;
    switch (state_)
    {
        case InteractionState::Resizing:
            update_resize(event);
            break;
        case InteractionState::Docking:
            update_dock(event);
            break;
        case InteractionState::Reordering:
            update_reorder(event);
            break;
        case InteractionState::PopoverResizing:
            update_popover(event);
            break;
        case InteractionState::Idle:
        case InteractionState::MenuOpen:
            break;
    }
}

void InteractionController::pointer_up(const PointerEvent& event)
{
    if (!listening_)
        return;
    if (state_ == InteractionState::Resizing && event.pointer_id != resize_.pointer_id)
        return;
    end_session(EndReason::Commit, &event);
}

void InteractionController::pointer_cancel(const PointerEvent& event)
{
    pointer_up(event);
}

void InteractionController::lost_pointer_capture(const PointerEvent& event)
{
    pointer_up(event);
}

bool InteractionController::escape()
{
    if (state_ == InteractionState::Idle)
        return false;
    cancel();
    return true;
}

void InteractionController::cancel()
{
    if (state_ == InteractionState::Idle)
        return;
    end_session(EndReason::Cancel, nullptr);
}

void InteractionController::end_session(EndReason reason, const PointerEvent* event)
{
    InteractionState ended = state_;
    listening_             = false;
    set_state(InteractionState::Idle);

    switch (ended)
    {
        case InteractionState::Resizing:
        {
            ResizeSession session = std::move(resize_);
            resize_               = ResizeSession{};
            if (reason == EndReason::Cancel)
            {
                delegate_.apply_live_split_sizes(session.split_id, session.start_sizes);
                return;
            }
            delegate_.commit_split_resize(session.split_id);
            return;
        }
        case InteractionState::Docking:
        {
            if (reason == EndReason::Commit && event)
                update_dock(*event);
            DockSession session = std::move(dock_);
            dock_               = DockSession{};
            if (reason == EndReason::Cancel)
                return;
            if (session.target.kind == DockTarget::Kind::Header)
                delegate_.commit_pin(session.panel_id);
            else if (session.target.kind == DockTarget::Kind::Layout)
                delegate_.commit_move(session.panel_id,
                                      session.target.placement,
                                      session.target.target_panel_id);
            return;
        }
        case InteractionState::Reordering:
        {
            ReorderSession session = std::move(reorder_);
            reorder_               = ReorderSession{};
            if (reason == EndReason::Cancel || !session.target_index
                || *session.target_index == session.source_index)
                return;
            delegate_.commit_reorder(session.panel_id, *session.target_index);
            return;
        }
        case InteractionState::PopoverResizing:
        {
            PopoverSession session = std::move(popover_);
            popover_               = PopoverSession{};
            if (reason == EndReason::Cancel)
            {
                delegate_.apply_live_popover_size(session.panel_id, session.start_size);
                return;
            }
            delegate_.commit_popover_size(session.panel_id, session.current_size);
            return;
        }
        case InteractionState::MenuOpen:
            menu_panel_id_.clear();
            return;
        case InteractionState::Idle:
            return;
    }
}

void InteractionController::update_resize(const PointerEvent& event)
{
    if (event.pointer_id != resize_.pointer_id)
        return;

    auto info  = delegate_.split_info(resize_.split_id);
    auto rects = delegate_.geometry().split_child_rects(resize_.split_id);
    size_t i   = resize_.handle_index;
    if (!info || i + 1 >= info->sizes.size() || i + 1 >= rects.size())
        return;

    Rect   merged     = merge_rects(rects[i], rects[i + 1]);
    bool   horizontal = info->direction == SplitDirection::Horizontal;
    auto   pair       = compute_resize_pair(horizontal ? event.x : event.y,
                                    horizontal ? merged.x : merged.y,
                                    horizontal ? merged.w : merged.h,
                                    info->sizes[i],
                                    info->sizes[i + 1],
                                    tuning_.split_min_fraction);
    if (!pair)
        return;

    std::vector<double> sizes = info->sizes;
    sizes[i]                  = pair->first;
    sizes[i + 1]              = pair->second;
    delegate_.apply_live_split_sizes(resize_.split_id, sizes);
}

void InteractionController::update_dock(const PointerEvent& event)
{
    const GeometryProvider& geometry = delegate_.geometry();
    DockTarget              target;

    if (auto dock = geometry.header_dock_rect(); dock && dock->contains(event.x, event.y))
    {
        target.kind      = DockTarget::Kind::Header;
        target.highlight = *dock;
        dock_.target     = target;
        return;
    }

    Rect workspace = geometry.workspace_rect();
    if (!workspace.contains(event.x, event.y))
    {
        dock_.target = target;
        return;
    }

    Rect target_rect = workspace;
    auto hovered     = geometry.panel_at(event.x, event.y);
    if (hovered && *hovered != dock_.panel_id)
    {
        if (auto rect = geometry.panel_rect(*hovered))
        {
            target.target_panel_id = hovered;
            target_rect            = *rect;
        }
    }

    PanelRegion region      = resolve_drop_region(event.x, event.y, target_rect, tuning_.dock_edge_fraction);
    target.kind             = DockTarget::Kind::Layout;
    target.placement.region = region;
    target.highlight        = compute_drop_highlight(region, target_rect, tuning_.center_inset);
    dock_.target            = target;
}

void InteractionController::update_reorder(const PointerEvent& event)
{
    const GeometryProvider& geometry  = delegate_.geometry();
    auto                    container = geometry.split_rect(reorder_.split_id);
    auto                    children  = geometry.split_child_rects(reorder_.split_id);

    reorder_.target_index.reset();
    reorder_.highlight.reset();
    if (!container || !container->contains(event.x, event.y) || children.size() < 2)
        return;

    size_t index = resolve_split_child_index(children, *container, event.x, event.y, reorder_.direction);
    reorder_.target_index = index;
    if (index != reorder_.source_index)
        reorder_.highlight = children[index];
}

void InteractionController::update_popover(const PointerEvent& event)
{
    if (event.pointer_id != popover_.pointer_id)
        return;

    double width  = popover_.start_size.width + (event.x - popover_.start_x);
    double height = popover_.start_size.height + (event.y - popover_.start_y);
    popover_.current_size =
        clamp_popover_size(width, height, delegate_.viewport_rect(), tuning_.popover);
    delegate_.apply_live_popover_size(popover_.panel_id, popover_.current_size);
}

std::optional<Rect> InteractionController::highlight_rect() const
{
    if (state_ == InteractionState::Docking)
        return dock_.target.highlight;
    if (state_ == InteractionState::Reordering)
        return reorder_.highlight;
    return std::nullopt;
}

std::optional<PanelId> InteractionController::session_panel_id() const
{
    switch (state_)
    {
        case InteractionState::Docking:
            return dock_.panel_id;
        case InteractionState::Reordering:
            return reorder_.panel_id;
        case InteractionState::PopoverResizing:
            return popover_.panel_id;
        case InteractionState::MenuOpen:
            return menu_panel_id_;
        case InteractionState::Idle:
        case InteractionState::Resizing:
            break;
    }
    return std::nullopt;
}

std::optional<SplitId> InteractionController::resizing_split_id() const
{
    if (state_ != InteractionState::Resizing)
        return std::nullopt;
    return resize_.split_id;
}

std::optional<size_t> InteractionController::reorder_target_index() const
{
    if (state_ != InteractionState::Reordering)
        return std::nullopt;
    return reorder_.target_index;
}

std::optional<PanelId> InteractionController::menu_panel_id() const
{
    if (state_ != InteractionState::MenuOpen)
        return std::nullopt;
    return menu_panel_id_;
}

}   // namespace paneldock
