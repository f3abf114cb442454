#include "layout_store.hpp"

#include <cmath>
#include <limits>
#include <paneldock/logger.hpp>
#include <set>

namespace paneldock
{

namespace
{

bool set_error(std::string* error, const std::string& message)
{
    if (error && error->empty())
        *error = message;
    return false;
}

const char* status_to_string(PanelStatus status)
{
    switch (status)
    {
        case PanelStatus::Idle:
            return "idle";
        case PanelStatus::Busy:
            return "busy";
        case PanelStatus::Error:
            return "error";
    }
    return "idle";
}

std::optional<PanelStatus> status_from_string(const std::string& text)
{
    if (text == "idle")
        return PanelStatus::Idle;
    if (text == "busy")
        return PanelStatus::Busy;
    if (text == "error")
        return PanelStatus::Error;
    return std::nullopt;
}

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}   // namespace

// ─── Encoding ────────────────────────────────────────────────────────────────

json::Value layout_node_to_json(const LayoutNode& node)
{
    json::Value out = json::Value::object();
    if (node.is_panel())
    {
        out.set("kind", "panel");
        out.set("panelId", node.panel_id);
        return out;
    }

    out.set("kind", "split");
    out.set("splitId", node.split_id);
    out.set("direction", node.direction == SplitDirection::Horizontal ? "horizontal" : "vertical");

    json::Value sizes = json::Value::array();
    for (double s : node.sizes)
        sizes.push_back(s);
    out.set("sizes", std::move(sizes));

    json::Value children = json::Value::array();
    for (const auto& child : node.children)
        children.push_back(layout_node_to_json(child));
    out.set("children", std::move(children));

    if (node.view_mode == ViewMode::Tabs)
        out.set("viewMode", "tabs");
    if (node.active_id)
        out.set("activeId", *node.active_id);
    return out;
}

json::Value panel_binding_to_json(const PanelBinding& binding)
{
    json::Value out = json::Value::object();
    if (binding.is_fixed())
    {
        out.set("mode", "fixed");
        out.set("sessionId", binding.session_id);
    }
    else
    {
        out.set("mode", "global");
    }
    return out;
}

json::Value panel_instance_to_json(const PanelInstance& instance)
{
    json::Value out = json::Value::object();
    out.set("panelId", instance.panel_id);
    out.set("panelType", instance.panel_type);
    if (instance.binding)
        out.set("binding", panel_binding_to_json(*instance.binding));
    if (instance.meta)
    {
        json::Value meta = json::Value::object();
        if (instance.meta->title)
            meta.set("title", *instance.meta->title);
        if (instance.meta->icon)
            meta.set("icon", *instance.meta->icon);
        if (instance.meta->badge)
            meta.set("badge", *instance.meta->badge);
        if (instance.meta->status)
            meta.set("status", status_to_string(*instance.meta->status));
        out.set("meta", std::move(meta));
    }
    if (instance.state)
    {
        // State is stored as JSON text; anything unparsable is dropped.
        if (auto parsed = json::parse(*instance.state))
            out.set("state", std::move(*parsed));
    }
    return out;
}

json::Value persistence_to_json(const LayoutPersistence& layout)
{
    json::Value out = json::Value::object();
    out.set("layout", layout_node_to_json(layout.layout));

    json::Value panels = json::Value::object();
    for (const auto& [id, instance] : layout.panels)
        panels.set(id, panel_instance_to_json(instance));
    out.set("panels", std::move(panels));

    json::Value header = json::Value::array();
    for (const auto& id : layout.header_panels)
        header.push_back(id);
    out.set("headerPanels", std::move(header));

    json::Value sizes = json::Value::object();
    for (const auto& [id, size] : layout.header_panel_sizes)
    {
        json::Value entry = json::Value::object();
        entry.set("width", size.width);
        entry.set("height", size.height);
        sizes.set(id, std::move(entry));
    }
    out.set("headerPanelSizes", std::move(sizes));
    return out;
}

// ─── Decoding ────────────────────────────────────────────────────────────────

std::optional<LayoutNode> layout_node_from_json(const json::Value& value, std::string* error)
{
    if (!value.is_object())
    {
        set_error(error, "layout node is not an object");
        return std::nullopt;
    }

    auto kind = value.get_string("kind");
    if (!kind)
    {
        set_error(error, "layout node has no kind");
        return std::nullopt;
    }

    if (*kind == "panel")
    {
        auto panel_id = value.get_string("panelId");
        if (!panel_id || panel_id->empty())
        {
            set_error(error, "panel node has no panelId");
            return std::nullopt;
        }
        return LayoutNode::panel(*panel_id);
    }

    if (*kind != "split")
    {
        set_error(error, "unknown node kind '" + *kind + "'");
        return std::nullopt;
    }

    auto split_id  = value.get_string("splitId");
    auto direction = value.get_string("direction");
    if (!split_id || split_id->empty())
    {
        set_error(error, "split node has no splitId");
        return std::nullopt;
    }
    if (!direction || (*direction != "horizontal" && *direction != "vertical"))
    {
        set_error(error, "split " + *split_id + " has an invalid direction");
        return std::nullopt;
    }

    const json::Value* children = value.find("children");
    const json::Value* sizes    = value.find("sizes");
    if (!children || !children->is_array() || children->size() < 2)
    {
        set_error(error, "split " + *split_id + " needs at least two children");
        return std::nullopt;
    }
    if (!sizes || !sizes->is_array() || sizes->size() != children->size())
    {
        set_error(error, "split " + *split_id + " sizes do not match children");
        return std::nullopt;
    }

    LayoutNode node = LayoutNode::split(*split_id,
                                        *direction == "horizontal" ? SplitDirection::Horizontal
                                                                   : SplitDirection::Vertical,
                                        {},
                                        {});
    for (const auto& s : sizes->as_array())
    {
        if (!s.is_number() || !std::isfinite(s.as_number()) || s.as_number() <= 0.0)
        {
            set_error(error, "split " + *split_id + " has a non-positive size");
            return std::nullopt;
        }
        node.sizes.push_back(s.as_number());
    }
    for (const auto& c : children->as_array())
    {
        auto child = layout_node_from_json(c, error);
        if (!child)
            return std::nullopt;
        node.children.push_back(std::move(*child));
    }

    if (const json::Value* mode = value.find("viewMode"))
    {
        if (!mode->is_string() || (mode->as_string() != "split" && mode->as_string() != "tabs"))
        {
            set_error(error, "split " + *split_id + " has an invalid viewMode");
            return std::nullopt;
        }
        node.view_mode = mode->as_string() == "tabs" ? ViewMode::Tabs : ViewMode::Split;
    }
    if (const json::Value* active = value.find("activeId"); active && !active->is_null())
    {
        if (!active->is_string())
        {
            set_error(error, "split " + *split_id + " has an invalid activeId");
            return std::nullopt;
        }
        node.active_id = active->as_string();
    }
    return node;
}

std::optional<PanelBinding> panel_binding_from_json(const json::Value& value)
{
    auto mode = value.get_string("mode");
    if (!mode)
        return std::nullopt;
    if (*mode == "global")
        return PanelBinding::global();
    if (*mode == "fixed")
    {
        auto session = value.get_string("sessionId");
        if (!session || session->empty())
            return std::nullopt;
        return PanelBinding::fixed(*session);
    }
    return std::nullopt;
}

std::optional<PanelInstance> panel_instance_from_json(const json::Value& value,
                                                      std::string*       error)
{
    if (!value.is_object())
    {
        set_error(error, "panel entry is not an object");
        return std::nullopt;
    }

    PanelInstance instance;
    auto          panel_id   = value.get_string("panelId");
    auto          panel_type = value.get_string("panelType");
    if (!panel_id || panel_id->empty() || !panel_type || panel_type->empty())
    {
        set_error(error, "panel entry needs panelId and panelType");
        return std::nullopt;
    }
    instance.panel_id   = *panel_id;
    instance.panel_type = *panel_type;

    if (const json::Value* binding = value.find("binding"); binding && !binding->is_null())
    {
        instance.binding = panel_binding_from_json(*binding);
        if (!instance.binding)
        {
            set_error(error, "panel " + *panel_id + " has an invalid binding");
            return std::nullopt;
        }
    }

    if (const json::Value* meta = value.find("meta"); meta && meta->is_object())
    {
        PanelMetadata m;
        m.title = meta->get_string("title");
        m.icon  = meta->get_string("icon");
        m.badge = meta->get_string("badge");
        if (auto status = meta->get_string("status"))
            m.status = status_from_string(*status);
        instance.meta = std::move(m);
    }

    if (const json::Value* state = value.find("state"))
        instance.state = state->dump();
    return instance;
}

std::optional<LayoutPersistence> persistence_from_json(const json::Value& value,
                                                       std::string*       error)
{
    if (!value.is_object())
    {
        set_error(error, "layout document is not an object");
        return std::nullopt;
    }

    const json::Value* layout = value.find("layout");
    const json::Value* panels = value.find("panels");
    if (!layout || !panels || !panels->is_object())
    {
        set_error(error, "layout document needs layout and panels");
        return std::nullopt;
    }

    LayoutPersistence result;
    auto              root = layout_node_from_json(*layout, error);
    if (!root)
        return std::nullopt;
    result.layout = std::move(*root);

    for (const auto& [id, entry] : panels->as_object())
    {
        auto instance = panel_instance_from_json(entry, error);
        if (!instance)
            return std::nullopt;
        if (instance->panel_id != id)
        {
            set_error(error, "panel key " + id + " does not match its panelId");
            return std::nullopt;
        }
        result.panels[id] = std::move(*instance);
    }

    if (const json::Value* header = value.find("headerPanels"); header && !header->is_null())
    {
        if (!header->is_array())
        {
            set_error(error, "headerPanels is not an array");
            return std::nullopt;
        }
        for (const auto& id : header->as_array())
        {
            if (!id.is_string())
            {
                set_error(error, "headerPanels holds a non-string entry");
                return std::nullopt;
            }
            result.header_panels.push_back(id.as_string());
        }
    }

    if (const json::Value* sizes = value.find("headerPanelSizes"); sizes && sizes->is_object())
    {
        for (const auto& [id, entry] : sizes->as_object())
        {
            auto width  = entry.get_number("width");
            auto height = entry.get_number("height");
            if (!width || !height)
                continue;
            result.header_panel_sizes[id] = HeaderPanelSize{*width, *height};
        }
    }
    return result;
}

// ─── Layout store ────────────────────────────────────────────────────────────

std::string storage_key(const char* base, const std::string& window_id)
{
    std::string key(base);
    if (!window_id.empty())
        key += ":" + window_id;
    return key;
}

std::optional<int> stored_layout_version(const KeyValueStorage& storage,
                                         const std::string&     window_id)
{
    auto text = storage.get(storage_key(LAYOUT_VERSION_STORAGE_KEY, window_id));
    if (!text)
        return std::nullopt;
    auto parsed = json::parse(trim(*text));
    if (!parsed || !parsed->is_number())
        return std::nullopt;
    double value = parsed->as_number();
    if (!std::isfinite(value) || std::trunc(value) != value
        || value < static_cast<double>(std::numeric_limits<int>::min())
        || value > static_cast<double>(std::numeric_limits<int>::max()))
        return std::nullopt;
    return static_cast<int>(value);
}

std::optional<LayoutPersistence> load_panel_layout(const KeyValueStorage& storage,
                                                   const std::string&     window_id)
{
    auto text = storage.get(storage_key(LAYOUT_STORAGE_KEY, window_id));
    if (!text)
        return std::nullopt;

    auto version = stored_layout_version(storage, window_id);
    if (!version || *version != CURRENT_LAYOUT_VERSION)
    {
        PANELDOCK_LOG_WARN("storage",
                           "Discarding stored layout: version {} (expected {})",
                           version ? std::to_string(*version) : std::string("missing"),
                           CURRENT_LAYOUT_VERSION);
        return std::nullopt;
    }

    json::ParseError parse_error;
    auto             doc = json::parse(*text, &parse_error);
    if (!doc)
    {
        PANELDOCK_LOG_WARN("storage",
                           "Discarding stored layout: parse error at {}: {}",
                           parse_error.offset,
                           parse_error.message);
        return std::nullopt;
    }

    std::string schema_error;
    auto        layout = persistence_from_json(*doc, &schema_error);
    if (!layout)
    {
        PANELDOCK_LOG_WARN("storage", "Discarding stored layout: {}", schema_error);
        return std::nullopt;
    }
    return layout;
}

bool save_panel_layout(KeyValueStorage&         storage,
                       const LayoutPersistence& layout,
                       const std::string&       window_id)
{
    bool ok = storage.set(storage_key(LAYOUT_STORAGE_KEY, window_id),
                          persistence_to_json(layout).dump());
    ok      = storage.set(storage_key(LAYOUT_VERSION_STORAGE_KEY, window_id),
                     std::to_string(CURRENT_LAYOUT_VERSION))
         && ok;
    return ok;
}

void clear_panel_layout(KeyValueStorage& storage, const std::string& window_id)
{
    storage.remove(storage_key(LAYOUT_STORAGE_KEY, window_id));
    storage.remove(storage_key(LAYOUT_VERSION_STORAGE_KEY, window_id));
}

// ─── Focus history ───────────────────────────────────────────────────────────

std::vector<PanelId> parse_focus_history(const std::string& text, size_t limit)
{
    auto doc = json::parse(text);
    if (!doc)
        return {};

    const json::Value* list = &*doc;
    if (doc->is_object())
        list = doc->find("history");
    if (!list || !list->is_array())
        return {};

    std::vector<PanelId> out;
    std::set<PanelId>    seen;
    for (const auto& entry : list->as_array())
    {
        if (!entry.is_string())
            continue;
        std::string id = trim(entry.as_string());
        if (id.empty() || !seen.insert(id).second)
            continue;
        out.push_back(std::move(id));
        if (out.size() >= limit)
            break;
    }
    return out;
}

std::vector<PanelId> load_focus_history(const KeyValueStorage& storage,
                                        size_t                 limit,
                                        const std::string&     window_id)
{
    auto text = storage.get(storage_key(FOCUS_HISTORY_STORAGE_KEY, window_id));
    if (!text)
        return {};
    return parse_focus_history(*text, limit);
}

bool save_focus_history(KeyValueStorage&            storage,
                        const std::vector<PanelId>& history,
                        const std::string&          window_id)
{
    json::Value list = json::Value::array();
    for (const auto& id : history)
        list.push_back(id);
    return storage.set(storage_key(FOCUS_HISTORY_STORAGE_KEY, window_id), list.dump());
}

}   // namespace paneldock
