#pragma once

#ifdef PANELDOCK_USE_IMGUI

    #include <functional>
    #include <optional>
    #include <paneldock/layout.hpp>
    #include <string>

struct ImDrawList;

namespace paneldock
{

class PanelWorkspace;

struct WorkspaceViewStyle
{
    float header_height  = 40.0f;   // top bar; the header dock sits at its right end
    float dock_width     = 320.0f;
    float grip_height    = 22.0f;   // drag strip at the top of each frame
    float drag_threshold = 4.0f;
    float resize_grip    = 14.0f;   // popover corner
};

// Immediate-mode rendition of a PanelWorkspace: frames, splitter handles,
// tab strips, the header dock and its popover, drop highlights and the
// modal backdrop, drawn into the background draw list of the main
// viewport. Mouse and keyboard input from ImGui is turned into workspace
// commands and pointer events.
class WorkspaceView
{
   public:
    // Draws panel content inside `content`. Called for every visible tree
    // panel, the open header popover and the modal.
    using ContentCallback = std::function<void(const PanelId& panel_id, const Rect& content)>;

    explicit WorkspaceView(PanelWorkspace& workspace, WorkspaceViewStyle style = {});

    WorkspaceView(const WorkspaceView&)            = delete;
    WorkspaceView& operator=(const WorkspaceView&) = delete;

    // Once per ImGui frame, between NewFrame() and Render().
    void draw();

    void set_content_callback(ContentCallback callback) { content_ = std::move(callback); }

   private:
    struct PendingPress
    {
        enum class Kind
        {
            None,
            Grip,
            Tab,
            HeaderButton
        };

        Kind    kind = Kind::None;
        PanelId panel_id;
        float   x = 0.0f;
        float   y = 0.0f;
    };

    void sync_viewport();
    void handle_input();
    void handle_press(float x, float y);
    void draw_panel_menu();

    void draw_frames(ImDrawList* dl) const;
    void draw_tab_strips(ImDrawList* dl) const;
    void draw_handles(ImDrawList* dl) const;
    void draw_header(ImDrawList* dl) const;
    void draw_popover(ImDrawList* dl) const;
    void draw_modal(ImDrawList* dl) const;
    void draw_highlight(ImDrawList* dl) const;

    std::optional<Rect> modal_rect() const;
    std::optional<Rect> popover_grip_rect() const;

    PanelWorkspace&    workspace_;
    WorkspaceViewStyle style_;
    ContentCallback    content_;
    Rect               last_viewport_;
    PendingPress       pending_;
    bool               menu_requested_ = false;
};

}   // namespace paneldock

#endif   // PANELDOCK_USE_IMGUI
