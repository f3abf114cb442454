#include <paneldock/panel_host.hpp>

#include "json.hpp"
#include "layout_store.hpp"

namespace paneldock
{

std::string panel_context_key(const PanelId& panel_id)
{
    return "panel." + panel_id + ".context";
}

std::string PanelInventoryPayload::to_json() const
{
    json::Value doc = json::Value::object();
    doc.set("type", "panel_inventory");

    json::Value items = json::Value::array();
    for (const auto& item : panels)
    {
        json::Value entry = json::Value::object();
        entry.set("panelId", item.panel_id);
        entry.set("panelType", item.panel_type);
        entry.set("panelTitle", item.panel_title);
        entry.set("visible", item.visible);
        entry.set("binding", item.binding ? panel_binding_to_json(*item.binding) : json::Value());
        if (item.context)
        {
            if (auto parsed = json::parse(*item.context); parsed && parsed->is_object())
                entry.set("context", std::move(*parsed));
        }
        items.push_back(std::move(entry));
    }
    doc.set("panels", std::move(items));

    doc.set("selectedPanelId", selected_panel_id ? json::Value(*selected_panel_id) : json::Value());
    doc.set("selectedChatPanelId",
            selected_chat_panel_id ? json::Value(*selected_chat_panel_id) : json::Value());
    doc.set("layout", layout_node_to_json(layout));

    json::Value header = json::Value::array();
    for (const auto& id : header_panels)
        header.push_back(id);
    doc.set("headerPanels", std::move(header));

    if (window_id)
        doc.set("windowId", *window_id);
    return doc.dump();
}

std::string PanelEvent::to_json() const
{
    json::Value doc = json::Value::object();
    doc.set("type", "panel_event");
    doc.set("panelId", panel_id);
    doc.set("panelType", panel_type);
    auto parsed = json::parse(payload);
    doc.set("payload", parsed ? std::move(*parsed) : json::Value());
    return doc.dump();
}

}   // namespace paneldock
