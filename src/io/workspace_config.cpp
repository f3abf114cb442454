#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <paneldock/workspace_config.hpp>
#include <sstream>

#include "json.hpp"

namespace paneldock
{

namespace
{

std::filesystem::path config_dir()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return std::filesystem::path(".");
    return std::filesystem::path(home) / ".config" / "paneldock";
}

void read_float(const json::Value& doc, const char* key, float& out)
{
    if (auto v = doc.get_number(key); v && *v > 0.0)
        out = static_cast<float>(*v);
}

void read_fraction(const json::Value& doc, const char* key, double& out)
{
    if (auto v = doc.get_number(key); v && *v > 0.0 && *v < 0.5)
        out = *v;
}

}   // namespace

std::string WorkspaceConfig::default_path()
{
    if (const char* env = std::getenv("PANELDOCK_CONFIG"); env && *env)
        return env;
    return (config_dir() / "workspace.json").string();
}

std::string WorkspaceConfig::default_storage_dir()
{
    return (config_dir() / "state").string();
}

std::string WorkspaceConfig::resolved_storage_dir() const
{
    return storage_dir.empty() ? default_storage_dir() : storage_dir;
}

bool WorkspaceConfig::load_from_string(const std::string& text)
{
    json::ParseError error;
    auto             doc = json::parse(text, &error);
    if (!doc || !doc->is_object())
    {
        PANELDOCK_LOG_WARN("config",
                           "Ignoring malformed workspace config: {} at {}",
                           doc ? std::string("not an object") : error.message,
                           error.offset);
        return false;
    }

    auto version = doc->get_number("version");
    if (version && static_cast<int>(*version) > FORMAT_VERSION)
    {
        PANELDOCK_LOG_WARN("config",
                           "Workspace config version {} is newer than {}; reading known keys",
                           static_cast<int>(*version),
                           FORMAT_VERSION);
    }

    if (auto v = doc->get_string("storage_dir"))
        storage_dir = *v;
    if (auto v = doc->get_string("window_id"))
        window_id = *v;
    if (auto v = doc->get_number("focus_history_limit"); v && *v >= 1.0)
        focus_history_limit = static_cast<size_t>(*v);

    read_fraction(*doc, "split_min_fraction", split_min_fraction);
    read_fraction(*doc, "dock_edge_fraction", dock_edge_fraction);
    read_fraction(*doc, "tabs_highlight_inset", tabs_highlight_inset);

    read_float(*doc, "splitter_thickness", splitter_thickness);
    read_float(*doc, "tab_strip_height", tab_strip_height);
    read_float(*doc, "header_button_width", header_button_width);
    read_float(*doc, "popover_gap", popover_gap);
    read_float(*doc, "popover_edge_padding", popover_edge_padding);
    read_float(*doc, "popover_viewport_margin", popover_viewport_margin);
    read_float(*doc, "popover_min_width", popover_min_width);
    read_float(*doc, "popover_min_height", popover_min_height);
    read_float(*doc, "popover_default_width", popover_default_width);
    read_float(*doc, "popover_default_height", popover_default_height);

    if (auto v = doc->get_string("log_level"))
    {
        if (auto level = parse_log_level(*v))
            log_level = *level;
        else
            PANELDOCK_LOG_WARN("config", "Unknown log level '{}'", *v);
    }
    if (auto v = doc->get_string("log_file"))
        log_file = *v;
    return true;
}

std::string WorkspaceConfig::serialize() const
{
    json::Value doc = json::Value::object();
    doc.set("version", FORMAT_VERSION);
    doc.set("storage_dir", storage_dir);
    doc.set("window_id", window_id);
    doc.set("focus_history_limit", focus_history_limit);
    doc.set("split_min_fraction", split_min_fraction);
    doc.set("dock_edge_fraction", dock_edge_fraction);
    doc.set("tabs_highlight_inset", tabs_highlight_inset);
    doc.set("splitter_thickness", splitter_thickness);
    doc.set("tab_strip_height", tab_strip_height);
    doc.set("header_button_width", header_button_width);
    doc.set("popover_gap", popover_gap);
    doc.set("popover_edge_padding", popover_edge_padding);
    doc.set("popover_viewport_margin", popover_viewport_margin);
    doc.set("popover_min_width", popover_min_width);
    doc.set("popover_min_height", popover_min_height);
    doc.set("popover_default_width", popover_default_width);
    doc.set("popover_default_height", popover_default_height);
    doc.set("log_level", Logger::level_to_string(log_level));
    doc.set("log_file", log_file);
    return doc.dump();
}

bool WorkspaceConfig::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    std::ostringstream ss;
    ss << file.rdbuf();
    return load_from_string(ss.str());
}

bool WorkspaceConfig::save(const std::string& path) const
{
    std::filesystem::path p(path);
    if (p.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec)
            return false;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open())
        return false;
    file << serialize() << '\n';
    return file.good();
}

}   // namespace paneldock
