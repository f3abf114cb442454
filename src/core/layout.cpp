#include <paneldock/layout.hpp>

namespace paneldock
{

LayoutNode LayoutNode::panel(PanelId id)
{
    LayoutNode node;
    node.kind     = Kind::Panel;
    node.panel_id = std::move(id);
    return node;
}

LayoutNode LayoutNode::split(SplitId                 id,
                             SplitDirection          direction,
                             std::vector<LayoutNode> children,
                             std::vector<double>     sizes,
                             ViewMode                view_mode,
                             std::optional<PanelId>  active_id)
{
    LayoutNode node;
    node.kind      = Kind::Split;
    node.split_id  = std::move(id);
    node.direction = direction;
    node.view_mode = view_mode;
    node.children  = std::move(children);
    node.sizes     = std::move(sizes);
    node.active_id = std::move(active_id);
    return node;
}

const char* region_to_string(PanelRegion region)
{
    switch (region)
    {
        case PanelRegion::Center:
            return "center";
        case PanelRegion::Left:
            return "left";
        case PanelRegion::Right:
            return "right";
        case PanelRegion::Top:
            return "top";
        case PanelRegion::Bottom:
            return "bottom";
    }
    return "center";
}

std::optional<PanelRegion> region_from_string(const std::string& text)
{
    if (text == "center")
        return PanelRegion::Center;
    if (text == "left")
        return PanelRegion::Left;
    if (text == "right")
        return PanelRegion::Right;
    if (text == "top")
        return PanelRegion::Top;
    if (text == "bottom")
        return PanelRegion::Bottom;
    return std::nullopt;
}

}   // namespace paneldock
