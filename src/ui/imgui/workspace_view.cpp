#ifdef PANELDOCK_USE_IMGUI

    #include "workspace_view.hpp"

    #include <algorithm>
    #include <cctype>
    #include <imgui.h>
    #include <paneldock/logger.hpp>

    #include "../panel_workspace.hpp"

namespace paneldock
{

namespace
{

namespace colors
{
constexpr ImU32 HEADER_BG     = IM_COL32(30, 32, 38, 255);
constexpr ImU32 FRAME_BG      = IM_COL32(22, 24, 28, 255);
constexpr ImU32 GRIP          = IM_COL32(40, 43, 50, 255);
constexpr ImU32 GRIP_ACTIVE   = IM_COL32(52, 60, 78, 255);
constexpr ImU32 BORDER        = IM_COL32(58, 62, 70, 255);
constexpr ImU32 BORDER_ACTIVE = IM_COL32(88, 140, 230, 255);
constexpr ImU32 TEXT          = IM_COL32(220, 224, 230, 255);
constexpr ImU32 TEXT_DIM      = IM_COL32(140, 146, 156, 255);
constexpr ImU32 TAB           = IM_COL32(36, 39, 46, 255);
constexpr ImU32 TAB_ACTIVE    = IM_COL32(56, 62, 76, 255);
constexpr ImU32 HANDLE        = IM_COL32(34, 36, 42, 255);
constexpr ImU32 HANDLE_HOVER  = IM_COL32(70, 110, 180, 255);
constexpr ImU32 BUTTON        = IM_COL32(44, 48, 56, 255);
constexpr ImU32 BUTTON_OPEN   = IM_COL32(88, 140, 230, 255);
constexpr ImU32 DROP_FILL     = IM_COL32(88, 140, 230, 60);
constexpr ImU32 DROP_BORDER   = IM_COL32(88, 140, 230, 200);
constexpr ImU32 POPOVER_BG    = IM_COL32(28, 30, 36, 250);
constexpr ImU32 SHADOW        = IM_COL32(0, 0, 0, 90);
constexpr ImU32 BACKDROP      = IM_COL32(0, 0, 0, 140);
}   // namespace colors

constexpr const char* PANEL_MENU_POPUP = "##paneldock_panel_menu";

ImVec2 top_left(const Rect& r)
{
    return ImVec2(r.x, r.y);
}

ImVec2 bottom_right(const Rect& r)
{
    return ImVec2(r.x + r.w, r.y + r.h);
}

void draw_clipped_text(ImDrawList* dl, const Rect& r, float pad, ImU32 color, const std::string& text)
{
    dl->PushClipRect(top_left(r), bottom_right(r), true);
    float text_h = ImGui::GetTextLineHeight();
    dl->AddText(ImVec2(r.x + pad, r.y + (r.h - text_h) * 0.5f), color, text.c_str());
    dl->PopClipRect();
}

Rect below(const Rect& r, float offset)
{
    float h = std::min(offset, r.h);
    return Rect{r.x, r.y + h, r.w, r.h - h};
}

}   // namespace

WorkspaceView::WorkspaceView(PanelWorkspace& workspace, WorkspaceViewStyle style)
    : workspace_(workspace), style_(style)
{
}

void WorkspaceView::draw()
{
    sync_viewport();
    handle_input();

    ImDrawList* dl = ImGui::GetBackgroundDrawList();
    draw_header(dl);
    draw_frames(dl);
    draw_tab_strips(dl);
    draw_handles(dl);
    draw_highlight(dl);
    draw_popover(dl);
    draw_modal(dl);
    draw_panel_menu();
}

// ─── Viewport ────────────────────────────────────────────────────────────────

void WorkspaceView::sync_viewport()
{
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    Rect viewport{vp->Pos.x, vp->Pos.y, vp->Size.x, vp->Size.y};
    if (viewport == last_viewport_)
        return;
    last_viewport_ = viewport;

    float header_h = std::min(style_.header_height, viewport.h);
    float dock_w   = std::min(style_.dock_width, viewport.w);
    Rect  workspace{viewport.x, viewport.y + header_h, viewport.w, viewport.h - header_h};
    Rect  dock{viewport.x + viewport.w - dock_w, viewport.y, dock_w, header_h};

    PANELDOCK_LOG_DEBUG("imgui", "Viewport {}x{}", viewport.w, viewport.h);
    workspace_.set_viewport(viewport, workspace, dock);
}

// ─── Input ───────────────────────────────────────────────────────────────────

void WorkspaceView::handle_input()
{
    ImGuiIO& io = ImGui::GetIO();
    bool     listening = workspace_.interaction().listening();

    // ImGui windows (panel content, the panel menu) take their own input.
    if (!listening && ImGui::IsWindowHovered(ImGuiHoveredFlags_AnyWindow))
        return;

    float        mx = io.MousePos.x;
    float        my = io.MousePos.y;
    PointerEvent event{0, mx, my};

    if (ImGui::IsKeyPressed(ImGuiKey_Escape, false))
        workspace_.handle_escape();
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Tab))
        workspace_.focus_next_panel(io.KeyShift);

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Left))
        handle_press(mx, my);

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Right) && !workspace_.modal_panel_id())
    {
        if (auto id = workspace_.computed_geometry().panel_at(mx, my))
        {
            workspace_.open_panel_menu(*id);
            menu_requested_ = true;
        }
    }

    if (pending_.kind != PendingPress::Kind::None
        && ImGui::IsMouseDragging(ImGuiMouseButton_Left, style_.drag_threshold))
    {
        PointerEvent start{0, pending_.x, pending_.y};
        switch (pending_.kind)
        {
            case PendingPress::Kind::Grip:
            case PendingPress::Kind::HeaderButton:
                workspace_.begin_panel_drag(pending_.panel_id, start);
                break;
            case PendingPress::Kind::Tab:
                workspace_.begin_panel_reorder(pending_.panel_id, start);
                break;
            case PendingPress::Kind::None:
                break;
        }
        pending_ = PendingPress{};
    }

    if (workspace_.interaction().listening() && (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f))
        workspace_.pointer_move(event);

    if (ImGui::IsMouseReleased(ImGuiMouseButton_Left))
    {
        if (pending_.kind == PendingPress::Kind::HeaderButton)
            workspace_.toggle_header_panel(pending_.panel_id);
        pending_ = PendingPress{};
        workspace_.pointer_up(event);
    }
}

void WorkspaceView::handle_press(float x, float y)
{
    PointerEvent event{0, x, y};
    workspace_.pointer_down(event);

    if (auto modal = modal_rect())
    {
        if (!modal->contains(x, y))
            workspace_.handle_modal_backdrop_click();
        return;
    }

    if (auto grip = popover_grip_rect(); grip && grip->contains(x, y))
    {
        workspace_.begin_header_popover_resize(event);
        return;
    }
    if (auto popover = workspace_.header_popover_rect(); popover && popover->contains(x, y))
        return;

    const LayoutGeometry& geometry = workspace_.computed_geometry();
    if (auto id = geometry.header_button_at(x, y))
    {
        pending_ = PendingPress{PendingPress::Kind::HeaderButton, *id, x, y};
        return;
    }
    if (const SplitHandle* handle = geometry.handle_at(x, y))
    {
        workspace_.begin_split_resize(handle->split_id, handle->index, event);
        return;
    }
    if (const TabButton* tab = geometry.tab_at(x, y); tab && !tab->panel_id.empty())
    {
        workspace_.activate_panel(tab->panel_id);
        pending_ = PendingPress{PendingPress::Kind::Tab, tab->panel_id, x, y};
        return;
    }
    if (auto id = geometry.panel_at(x, y))
    {
        workspace_.focus_panel(*id);
        auto rect = geometry.panel_rect(*id);
        if (rect && y <= rect->y + style_.grip_height)
            pending_ = PendingPress{PendingPress::Kind::Grip, *id, x, y};
    }
}

void WorkspaceView::draw_panel_menu()
{
    if (menu_requested_)
    {
        ImGui::OpenPopup(PANEL_MENU_POPUP);
        menu_requested_ = false;
    }

    auto menu_id = workspace_.interaction().menu_panel_id();
    if (!ImGui::BeginPopup(PANEL_MENU_POPUP))
    {
        if (menu_id)
            workspace_.close_panel_menu();
        return;
    }

    if (!menu_id)
    {
        ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
        return;
    }

    PanelId id = *menu_id;
    ImGui::TextDisabled("%s", workspace_.panel_title(id).c_str());
    ImGui::Separator();
    if (ImGui::MenuItem("Pin to header"))
    {
        workspace_.close_panel_menu();
        workspace_.pin_panel(id);
    }
    if (ImGui::MenuItem("Toggle tabs"))
    {
        workspace_.close_panel_menu();
        workspace_.toggle_split_view_mode_for_panel(id);
    }
    if (ImGui::MenuItem("Close"))
    {
        workspace_.close_panel_menu();
        workspace_.close_panel(id);
    }
    ImGui::EndPopup();
}

// ─── Drawing ─────────────────────────────────────────────────────────────────

void WorkspaceView::draw_frames(ImDrawList* dl) const
{
    const auto& active = workspace_.active_panel_id();
    for (const auto& frame : workspace_.computed_geometry().frames())
    {
        const Rect& r         = frame.rect;
        bool        is_active = active && *active == frame.panel_id;
        Rect        grip{r.x, r.y, r.w, std::min(style_.grip_height, r.h)};

        dl->AddRectFilled(top_left(r), bottom_right(r), colors::FRAME_BG);
        dl->AddRectFilled(top_left(grip), bottom_right(grip), is_active ? colors::GRIP_ACTIVE : colors::GRIP);
        draw_clipped_text(dl, grip, 8.0f, colors::TEXT, workspace_.panel_title(frame.panel_id));

        if (content_)
            content_(frame.panel_id, below(r, grip.h));

        dl->AddRect(top_left(r), bottom_right(r), is_active ? colors::BORDER_ACTIVE : colors::BORDER);
    }
}

void WorkspaceView::draw_tab_strips(ImDrawList* dl) const
{
    for (const auto& strip : workspace_.computed_geometry().tab_strips())
    {
        dl->AddRectFilled(top_left(strip.rect), bottom_right(strip.rect), colors::HEADER_BG);
        for (const auto& tab : strip.tabs)
        {
            Rect r{tab.rect.x + 1.0f, tab.rect.y + 2.0f, tab.rect.w - 2.0f, tab.rect.h - 2.0f};
            dl->AddRectFilled(top_left(r), bottom_right(r), tab.active ? colors::TAB_ACTIVE : colors::TAB, 4.0f,
                              ImDrawFlags_RoundCornersTop);
            draw_clipped_text(dl,
                              r,
                              8.0f,
                              tab.active ? colors::TEXT : colors::TEXT_DIM,
                              workspace_.panel_title(tab.panel_id));
        }
    }
}

void WorkspaceView::draw_handles(ImDrawList* dl) const
{
    ImVec2 mouse    = ImGui::GetIO().MousePos;
    auto   resizing = workspace_.interaction().resizing_split_id();
    for (const auto& handle : workspace_.computed_geometry().handles())
    {
        bool hot = (resizing && *resizing == handle.split_id) || handle.rect.contains(mouse.x, mouse.y);
        dl->AddRectFilled(top_left(handle.rect), bottom_right(handle.rect), hot ? colors::HANDLE_HOVER : colors::HANDLE);
    }
}

void WorkspaceView::draw_header(ImDrawList* dl) const
{
    Rect bar{last_viewport_.x, last_viewport_.y, last_viewport_.w, std::min(style_.header_height, last_viewport_.h)};
    dl->AddRectFilled(top_left(bar), bottom_right(bar), colors::HEADER_BG);
    draw_clipped_text(dl, bar, 12.0f, colors::TEXT_DIM, "paneldock");

    const auto& open = workspace_.open_header_panel_id();
    for (const auto& button : workspace_.computed_geometry().header_buttons())
    {
        Rect r{button.rect.x + 3.0f, button.rect.y + 6.0f, button.rect.w - 6.0f, button.rect.h - 12.0f};
        bool is_open = open && *open == button.panel_id;
        dl->AddRectFilled(top_left(r), bottom_right(r), is_open ? colors::BUTTON_OPEN : colors::BUTTON, 4.0f);

        std::string title = workspace_.panel_title(button.panel_id);
        std::string label(1, title.empty() ? '?' : static_cast<char>(std::toupper(static_cast<unsigned char>(title[0]))));
        ImVec2      size = ImGui::CalcTextSize(label.c_str());
        dl->AddText(ImVec2(r.x + (r.w - size.x) * 0.5f, r.y + (r.h - size.y) * 0.5f), colors::TEXT, label.c_str());
    }
}

void WorkspaceView::draw_popover(ImDrawList* dl) const
{
    auto rect = workspace_.header_popover_rect();
    auto open = workspace_.open_header_panel_id();
    if (!rect || !open)
        return;

    const Rect& r = *rect;
    dl->AddRectFilled(ImVec2(r.x + 4.0f, r.y + 6.0f), ImVec2(r.x + r.w + 4.0f, r.y + r.h + 6.0f), colors::SHADOW, 6.0f);
    dl->AddRectFilled(top_left(r), bottom_right(r), colors::POPOVER_BG, 6.0f);

    Rect title{r.x, r.y, r.w, std::min(style_.grip_height, r.h)};
    draw_clipped_text(dl, title, 10.0f, colors::TEXT, workspace_.panel_title(*open));
    if (content_)
        content_(*open, below(r, title.h));

    dl->AddRect(top_left(r), bottom_right(r), colors::BORDER_ACTIVE, 6.0f);
    if (auto grip = popover_grip_rect())
    {
        dl->AddTriangleFilled(ImVec2(grip->x + grip->w, grip->y),
                              ImVec2(grip->x + grip->w, grip->y + grip->h),
                              ImVec2(grip->x, grip->y + grip->h),
                              colors::BORDER);
    }
}

void WorkspaceView::draw_modal(ImDrawList* dl) const
{
    auto rect = modal_rect();
    auto id   = workspace_.modal_panel_id();
    if (!rect || !id)
        return;

    dl->AddRectFilled(top_left(last_viewport_), bottom_right(last_viewport_), colors::BACKDROP);

    const Rect& r = *rect;
    dl->AddRectFilled(top_left(r), bottom_right(r), colors::POPOVER_BG, 8.0f);
    Rect title{r.x, r.y, r.w, std::min(style_.grip_height + 6.0f, r.h)};
    draw_clipped_text(dl, title, 12.0f, colors::TEXT, workspace_.panel_title(*id));
    if (content_)
        content_(*id, below(r, title.h));
    dl->AddRect(top_left(r), bottom_right(r), colors::BORDER_ACTIVE, 8.0f);
}

void WorkspaceView::draw_highlight(ImDrawList* dl) const
{
    auto highlight = workspace_.interaction().highlight_rect();
    if (!highlight)
        return;
    dl->AddRectFilled(top_left(*highlight), bottom_right(*highlight), colors::DROP_FILL, 4.0f);
    dl->AddRect(top_left(*highlight), bottom_right(*highlight), colors::DROP_BORDER, 4.0f, 0, 2.0f);
}

// ─── Hit areas ───────────────────────────────────────────────────────────────

std::optional<Rect> WorkspaceView::modal_rect() const
{
    if (!workspace_.modal_panel_id())
        return std::nullopt;
    float w = last_viewport_.w * 0.6f;
    float h = last_viewport_.h * 0.7f;
    return Rect{last_viewport_.x + (last_viewport_.w - w) * 0.5f, last_viewport_.y + (last_viewport_.h - h) * 0.5f, w, h};
}

std::optional<Rect> WorkspaceView::popover_grip_rect() const
{
    auto rect = workspace_.header_popover_rect();
    if (!rect)
        return std::nullopt;
    float g = style_.resize_grip;
    return Rect{rect->x + rect->w - g, rect->y + rect->h - g, g, g};
}

}   // namespace paneldock

#endif   // PANELDOCK_USE_IMGUI
