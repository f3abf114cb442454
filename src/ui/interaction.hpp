#pragma once

#include <paneldock/geometry_provider.hpp>
#include <paneldock/layout.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace paneldock
{

// ─── Geometry helpers ────────────────────────────────────────────────────────

Rect merge_rects(const Rect& a, const Rect& b);

// New sizes for two adjacent split children after moving their shared
// handle to `pointer`. Both sizes are fractions of the whole split; each
// keeps at least `min_fraction` (both get half the pair when the pair is
// smaller than twice that floor). Returns nullopt for a degenerate rect.
std::optional<std::pair<double, double>> compute_resize_pair(float          pointer,
                                                             float          merged_start,
                                                             float          merged_extent,
                                                             double         size_a,
                                                             double         size_b,
                                                             double         min_fraction);

// Edge bands of `edge_fraction` of the rect, tested left, right, top,
// bottom; the rest is center.
PanelRegion resolve_drop_region(float x, float y, const Rect& rect, double edge_fraction);

// Half of the rect for edges, the rect inset by `center_inset` per side for
// center.
Rect compute_drop_highlight(PanelRegion region, const Rect& rect, double center_inset);

// Child under the point, else 0 or the last child depending on which side
// of the container midpoint the point falls.
size_t resolve_split_child_index(const std::vector<Rect>& children,
                                 const Rect&              container,
                                 float                    x,
                                 float                    y,
                                 SplitDirection           direction);

struct PopoverLimits
{
    float min_width       = 320.0f;
    float min_height      = 240.0f;
    float viewport_margin = 32.0f;
    float gap             = 8.0f;
    float edge_padding    = 8.0f;
};

HeaderPanelSize clamp_popover_size(double               width,
                                   double               height,
                                   const Rect&          viewport,
                                   const PopoverLimits& limits);

// Below the anchor, clamped into the viewport; flipped above the anchor
// when it would overflow the bottom edge.
Rect position_popover(const Rect&            anchor,
                      const HeaderPanelSize& size,
                      const Rect&            viewport,
                      const PopoverLimits&   limits);

// ─── Interaction state machine ───────────────────────────────────────────────

struct PointerEvent
{
    int   pointer_id = 0;
    float x          = 0.0f;
    float y          = 0.0f;
};

enum class InteractionState
{
    Idle,
    Resizing,
    Docking,
    Reordering,
    PopoverResizing,
    MenuOpen
};

const char* interaction_state_name(InteractionState state);

struct DockTarget
{
    enum class Kind
    {
        None,
        Header,
        Layout
    };

    Kind                   kind = Kind::None;
    PanelPlacement         placement;
    std::optional<PanelId> target_panel_id;
    std::optional<Rect>    highlight;
};

// What the state machine needs from its owner. Commit callbacks are
// invoked after the session has ended, so they may start new work.
class InteractionDelegate
{
   public:
    virtual ~InteractionDelegate() = default;

    virtual const GeometryProvider& geometry() const = 0;

    // Current sizes and direction of a split; nullopt if it is gone.
    struct SplitInfo
    {
        SplitDirection      direction = SplitDirection::Horizontal;
        std::vector<double> sizes;
    };
    virtual std::optional<SplitInfo> split_info(const SplitId& split_id) const = 0;

    virtual void apply_live_split_sizes(const SplitId& split_id, const std::vector<double>& sizes) = 0;
    virtual void commit_split_resize(const SplitId& split_id) = 0;

    virtual void commit_pin(const PanelId& panel_id) = 0;
    virtual void commit_move(const PanelId&                panel_id,
                             const PanelPlacement&         placement,
                             const std::optional<PanelId>& target_panel_id) = 0;

    // Reorder inside the split that directly holds the panel.
    virtual void commit_reorder(const PanelId& panel_id, size_t target_index) = 0;

    virtual Rect viewport_rect() const = 0;
    virtual void apply_live_popover_size(const PanelId& panel_id, const HeaderPanelSize& size) = 0;
    virtual void commit_popover_size(const PanelId& panel_id, const HeaderPanelSize& size) = 0;

    virtual void on_interaction_changed(InteractionState state) = 0;
};

struct InteractionTuning
{
    double        split_min_fraction = 0.05;
    double        dock_edge_fraction = 0.25;
    double        center_inset       = 0.15;
    PopoverLimits popover;
};

// Drives every pointer gesture of the workspace. At most one session is
// live; starting another terminates the current one without committing.
// Pointer-up, pointer-cancel and capture loss all end a session, and only
// the first of them commits.
class InteractionController
{
   public:
    InteractionController(InteractionDelegate& delegate, InteractionTuning tuning = {});

    InteractionController(const InteractionController&)            = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    // Session starts. Each returns false when the session cannot begin.
    bool begin_resize(const SplitId& split_id, size_t handle_index, const PointerEvent& event);
    bool begin_dock_drag(const PanelId& panel_id, const PointerEvent& event);
    bool begin_reorder(const PanelId&      panel_id,
                       const SplitId&      split_id,
                       size_t              source_index,
                       SplitDirection      direction,
                       const PointerEvent& event);
    bool begin_popover_resize(const PanelId&         panel_id,
                              const HeaderPanelSize& start_size,
                              const PointerEvent&    event);
    void open_menu(const PanelId& panel_id);

    // Events
    void pointer_move(const PointerEvent& event);
    void pointer_up(const PointerEvent& event);
    void pointer_cancel(const PointerEvent& event);
    void lost_pointer_capture(const PointerEvent& event);
    // Cancels the live session. Returns false when idle.
    bool escape();

    // Ends the live session without committing. Resizes roll back to the
    // sizes they started from.
    void cancel();

    InteractionState state() const { return state_; }
    bool             active() const { return state_ != InteractionState::Idle; }
    bool             listening() const { return listening_; }

    std::optional<Rect>    highlight_rect() const;
    const DockTarget&      dock_target() const { return dock_.target; }
    std::optional<PanelId> session_panel_id() const;
    std::optional<SplitId> resizing_split_id() const;
    std::optional<size_t>  reorder_target_index() const;
    std::optional<PanelId> menu_panel_id() const;

    const InteractionTuning& tuning() const { return tuning_; }
    void                     set_tuning(const InteractionTuning& tuning) { tuning_ = tuning; }

   private:
    enum class EndReason
    {
        Commit,
        Cancel
    };

    void end_session(EndReason reason, const PointerEvent* event);
    void set_state(InteractionState state);

    void update_resize(const PointerEvent& event);
    void update_dock(const PointerEvent& event);
    void update_reorder(const PointerEvent& event);
    void update_popover(const PointerEvent& event);

    InteractionDelegate& delegate_;
    InteractionTuning    tuning_;
    InteractionState     state_     = InteractionState::Idle;
    bool                 listening_ = false;

    struct ResizeSession
    {
        SplitId             split_id;
        size_t              handle_index = 0;
        int                 pointer_id   = 0;
        std::vector<double> start_sizes;
    } resize_;

    struct DockSession
    {
        PanelId    panel_id;
        DockTarget target;
    } dock_;

    struct ReorderSession
    {
        PanelId               panel_id;
        SplitId               split_id;
        size_t                source_index = 0;
        SplitDirection        direction    = SplitDirection::Horizontal;
        std::optional<size_t> target_index;
        std::optional<Rect>   highlight;
    } reorder_;

    struct PopoverSession
    {
        PanelId         panel_id;
        int             pointer_id = 0;
        float           start_x    = 0.0f;
        float           start_y    = 0.0f;
        HeaderPanelSize start_size;
        HeaderPanelSize current_size;
    } popover_;

    PanelId menu_panel_id_;
};

}   // namespace paneldock
