#include <gtest/gtest.h>

#include <paneldock/storage.hpp>

#include "io/layout_store.hpp"

using namespace paneldock;

namespace
{

LayoutPersistence sample_layout()
{
    LayoutPersistence layout;
    layout.layout = LayoutNode::split("split-1",
                                      SplitDirection::Horizontal,
                                      {LayoutNode::panel("chat-1"),
                                       LayoutNode::split("split-2",
                                                         SplitDirection::Vertical,
                                                         {LayoutNode::panel("notes-1"),
                                                          LayoutNode::panel("notes-2")},
                                                         {0.25, 0.75},
                                                         ViewMode::Tabs,
                                                         PanelId("notes-2"))},
                                      {0.6, 0.4});

    PanelInstance chat;
    chat.panel_id   = "chat-1";
    chat.panel_type = "chat";
    chat.binding    = PanelBinding::fixed("s-42");
    chat.state      = R"({"draft":"hello","lines":[1,2]})";
    layout.panels["chat-1"] = chat;

    PanelInstance notes;
    notes.panel_id   = "notes-1";
    notes.panel_type = "notes";
    notes.meta       = PanelMetadata{"Scratch", std::nullopt, "3", PanelStatus::Busy};
    layout.panels["notes-1"] = notes;

    layout.panels["notes-2"] = PanelInstance{.panel_id = "notes-2", .panel_type = "notes"};
    layout.panels["sessions-1"] =
        PanelInstance{.panel_id = "sessions-1", .panel_type = "sessions", .binding = PanelBinding::global()};
    layout.header_panels                    = {"sessions-1"};
    layout.header_panel_sizes["sessions-1"] = HeaderPanelSize{500.0, 420.0};
    return layout;
}

json::Value parse_or_die(const std::string& text)
{
    auto doc = json::parse(text);
    EXPECT_TRUE(doc.has_value()) << text;
    return doc.value_or(json::Value());
}

}   // namespace

// ─── Codec ───────────────────────────────────────────────────────────────────

TEST(LayoutCodec, EncodesFieldNames)
{
    auto doc = persistence_to_json(sample_layout());
    ASSERT_NE(doc.find("layout"), nullptr);
    EXPECT_EQ(doc.find("layout")->get_string("kind"), "split");
    EXPECT_EQ(doc.find("layout")->get_string("splitId"), "split-1");
    EXPECT_EQ(doc.find("layout")->get_string("direction"), "horizontal");

    const json::Value* chat = doc.find("panels")->find("chat-1");
    ASSERT_NE(chat, nullptr);
    EXPECT_EQ(chat->get_string("panelType"), "chat");
    EXPECT_EQ(chat->find("binding")->get_string("mode"), "fixed");
    EXPECT_EQ(chat->find("binding")->get_string("sessionId"), "s-42");
    EXPECT_TRUE(chat->find("state")->is_object());

    EXPECT_EQ(doc.find("headerPanels")->size(), 1u);
    EXPECT_EQ(doc.find("headerPanelSizes")->find("sessions-1")->get_number("width"), 500.0);
}

TEST(LayoutCodec, TabsFieldsOnlyWhenSet)
{
    auto tabs = layout_node_to_json(sample_layout().layout.children[1]);
    EXPECT_EQ(tabs.get_string("viewMode"), "tabs");
    EXPECT_EQ(tabs.get_string("activeId"), "notes-2");

    auto split = layout_node_to_json(sample_layout().layout);
    EXPECT_EQ(split.find("viewMode"), nullptr);
    EXPECT_EQ(split.find("activeId"), nullptr);
}

TEST(LayoutCodec, DecodesWhatItEncodes)
{
    auto original = sample_layout();
    auto decoded  = persistence_from_json(persistence_to_json(original));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->layout, original.layout);
    EXPECT_EQ(decoded->header_panels, original.header_panels);
    EXPECT_EQ(decoded->header_panel_sizes, original.header_panel_sizes);
    EXPECT_EQ(decoded->panels.at("notes-1").meta, original.panels.at("notes-1").meta);
    EXPECT_EQ(decoded->panels.at("chat-1").binding, PanelBinding::fixed("s-42"));
    EXPECT_EQ(decoded->panels.at("chat-1").state, R"({"draft":"hello","lines":[1,2]})");
}

TEST(LayoutCodec, RejectsSplitWithOneChild)
{
    std::string error;
    auto        node = layout_node_from_json(parse_or_die(R"({
        "kind": "split", "splitId": "split-1", "direction": "horizontal",
        "sizes": [1], "children": [{"kind": "panel", "panelId": "a"}]
    })"),
                                      &error);
    EXPECT_FALSE(node.has_value());
    EXPECT_NE(error.find("two children"), std::string::npos);
}

TEST(LayoutCodec, RejectsBadSizes)
{
    std::string error;
    auto        mismatched = layout_node_from_json(parse_or_die(R"({
        "kind": "split", "splitId": "s", "direction": "vertical", "sizes": [1],
        "children": [{"kind": "panel", "panelId": "a"}, {"kind": "panel", "panelId": "b"}]
    })"),
                                            &error);
    EXPECT_FALSE(mismatched.has_value());

    auto negative = layout_node_from_json(parse_or_die(R"({
        "kind": "split", "splitId": "s", "direction": "vertical", "sizes": [1, -1],
        "children": [{"kind": "panel", "panelId": "a"}, {"kind": "panel", "panelId": "b"}]
    })"));
    EXPECT_FALSE(negative.has_value());
}

TEST(LayoutCodec, RejectsUnknownKindAndDirection)
{
    EXPECT_FALSE(layout_node_from_json(parse_or_die(R"({"kind": "grid"})")).has_value());
    EXPECT_FALSE(layout_node_from_json(parse_or_die(R"({"kind": "panel"})")).has_value());
    EXPECT_FALSE(layout_node_from_json(parse_or_die(R"({
        "kind": "split", "splitId": "s", "direction": "diagonal", "sizes": [1, 1],
        "children": [{"kind": "panel", "panelId": "a"}, {"kind": "panel", "panelId": "b"}]
    })"))
                     .has_value());
}

TEST(LayoutCodec, PanelKeyMustMatchId)
{
    std::string error;
    auto        layout = persistence_from_json(parse_or_die(R"({
        "layout": {"kind": "panel", "panelId": "a"},
        "panels": {"a": {"panelId": "b", "panelType": "notes"}}
    })"),
                                        &error);
    EXPECT_FALSE(layout.has_value());
    EXPECT_NE(error.find("does not match"), std::string::npos);
}

TEST(LayoutCodec, InvalidBindingRejected)
{
    EXPECT_FALSE(panel_binding_from_json(parse_or_die(R"({"mode": "fixed"})")).has_value());
    EXPECT_FALSE(panel_binding_from_json(parse_or_die(R"({"mode": "pinned"})")).has_value());
    EXPECT_EQ(panel_binding_from_json(parse_or_die(R"({"mode": "global"})")), PanelBinding::global());
}

TEST(LayoutCodec, IncompleteHeaderSizesSkipped)
{
    auto layout = persistence_from_json(parse_or_die(R"({
        "layout": {"kind": "panel", "panelId": "a"},
        "panels": {"a": {"panelId": "a", "panelType": "notes"}},
        "headerPanels": [],
        "headerPanelSizes": {"a": {"width": 300}}
    })"));
    ASSERT_TRUE(layout.has_value());
    EXPECT_TRUE(layout->header_panel_sizes.empty());
}

// ─── Store ───────────────────────────────────────────────────────────────────

TEST(LayoutStore, SaveThenLoad)
{
    MemoryStorage storage;
    ASSERT_TRUE(save_panel_layout(storage, sample_layout()));
    EXPECT_EQ(stored_layout_version(storage), CURRENT_LAYOUT_VERSION);

    auto loaded = load_panel_layout(storage);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->layout, sample_layout().layout);
}

TEST(LayoutStore, MissingEntry)
{
    MemoryStorage storage;
    EXPECT_FALSE(load_panel_layout(storage).has_value());
    EXPECT_FALSE(stored_layout_version(storage).has_value());
}

TEST(LayoutStore, VersionMismatchDiscards)
{
    MemoryStorage storage;
    save_panel_layout(storage, sample_layout());
    storage.set(LAYOUT_VERSION_STORAGE_KEY, "2");
    EXPECT_FALSE(load_panel_layout(storage).has_value());

    storage.remove(LAYOUT_VERSION_STORAGE_KEY);
    EXPECT_FALSE(load_panel_layout(storage).has_value());

    storage.set(LAYOUT_VERSION_STORAGE_KEY, " 3\n");
    EXPECT_TRUE(load_panel_layout(storage).has_value());
}

TEST(LayoutStore, NonIntegralVersionDiscards)
{
    MemoryStorage storage;
    save_panel_layout(storage, sample_layout());

    storage.set(LAYOUT_VERSION_STORAGE_KEY, "3.9");
    EXPECT_FALSE(stored_layout_version(storage).has_value());
    EXPECT_FALSE(load_panel_layout(storage).has_value());

    storage.set(LAYOUT_VERSION_STORAGE_KEY, "1e20");
    EXPECT_FALSE(stored_layout_version(storage).has_value());
    EXPECT_FALSE(load_panel_layout(storage).has_value());

    storage.set(LAYOUT_VERSION_STORAGE_KEY, "-1e20");
    EXPECT_FALSE(stored_layout_version(storage).has_value());
}

TEST(LayoutStore, CorruptTextDiscards)
{
    MemoryStorage storage;
    storage.set(LAYOUT_STORAGE_KEY, R"({"layout": )");
    storage.set(LAYOUT_VERSION_STORAGE_KEY, "3");
    EXPECT_FALSE(load_panel_layout(storage).has_value());

    storage.set(LAYOUT_STORAGE_KEY, R"({"layout": {"kind": "panel"}, "panels": {}})");
    EXPECT_FALSE(load_panel_layout(storage).has_value());
}

TEST(LayoutStore, WindowIdScopesKeys)
{
    MemoryStorage storage;
    save_panel_layout(storage, sample_layout(), "w2");
    EXPECT_TRUE(storage.get("paneldock.layout:w2").has_value());
    EXPECT_FALSE(load_panel_layout(storage).has_value());
    EXPECT_TRUE(load_panel_layout(storage, "w2").has_value());

    clear_panel_layout(storage, "w2");
    EXPECT_EQ(storage.size(), 0u);
}

// ─── Focus history ───────────────────────────────────────────────────────────

TEST(FocusHistoryStore, ParsesBothForms)
{
    EXPECT_EQ(parse_focus_history(R"(["a", "b"])", 10), (std::vector<PanelId>{"a", "b"}));
    EXPECT_EQ(parse_focus_history(R"({"history": ["c"]})", 10), (std::vector<PanelId>{"c"}));
    EXPECT_TRUE(parse_focus_history(R"({"other": []})", 10).empty());
    EXPECT_TRUE(parse_focus_history("not json", 10).empty());
}

TEST(FocusHistoryStore, TrimsDedupesAndLimits)
{
    auto history = parse_focus_history(R"([" a ", "a", "", 7, null, "b", "c", "d"])", 3);
    EXPECT_EQ(history, (std::vector<PanelId>{"a", "b", "c"}));
}

TEST(FocusHistoryStore, SaveThenLoad)
{
    MemoryStorage storage;
    ASSERT_TRUE(save_focus_history(storage, {"notes-1", "chat-1"}));
    EXPECT_EQ(storage.get(FOCUS_HISTORY_STORAGE_KEY), R"(["notes-1","chat-1"])");
    EXPECT_EQ(load_focus_history(storage, 50), (std::vector<PanelId>{"notes-1", "chat-1"}));
    EXPECT_EQ(load_focus_history(storage, 1), (std::vector<PanelId>{"notes-1"}));
}
