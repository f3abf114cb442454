#include <gtest/gtest.h>

#include <paneldock/panel_registry.hpp>
#include <stdexcept>

using namespace paneldock;

namespace
{

PanelTypeManifest manifest(const std::string& type)
{
    PanelTypeManifest m;
    m.type  = type;
    m.title = type;
    return m;
}

}   // namespace

// ─── Registry ────────────────────────────────────────────────────────────────

TEST(PanelRegistry, RegisterAndLookup)
{
    PanelRegistry registry;
    registry.register_panel(manifest("notes"));
    registry.register_panel(manifest("chat"));

    EXPECT_TRUE(registry.has("notes"));
    EXPECT_FALSE(registry.has("terminal"));
    EXPECT_EQ(registry.size(), 2u);
    ASSERT_NE(registry.get_manifest("chat"), nullptr);
    EXPECT_EQ(registry.get_manifest("chat")->title, "chat");
    EXPECT_EQ(registry.get_manifest("terminal"), nullptr);
}

TEST(PanelRegistry, ListKeepsRegistrationOrder)
{
    PanelRegistry registry;
    registry.register_panel(manifest("zeta"));
    registry.register_panel(manifest("alpha"));
    registry.register_or_replace(manifest("zeta"));

    auto list = registry.list_manifests();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].type, "zeta");
    EXPECT_EQ(list[1].type, "alpha");
}

TEST(PanelRegistry, DuplicateRegistrationThrows)
{
    PanelRegistry registry;
    registry.register_panel(manifest("notes"));
    EXPECT_THROW(registry.register_panel(manifest("notes")), std::invalid_argument);
}

TEST(PanelRegistry, UpdateManifest)
{
    PanelRegistry registry;
    registry.register_panel(manifest("notes"));

    auto updated  = manifest("notes");
    updated.title = "Notes";
    registry.update_manifest("notes", updated);
    EXPECT_EQ(registry.get_manifest("notes")->title, "Notes");

    EXPECT_THROW(registry.update_manifest("chat", manifest("chat")), std::invalid_argument);
    EXPECT_THROW(registry.update_manifest("notes", manifest("chat")), std::invalid_argument);
}

TEST(PanelRegistry, CreateInstanceCopiesOptions)
{
    PanelRegistry registry;
    registry.register_panel(manifest("chat"));

    PanelInitOptions options;
    options.binding = PanelBinding::fixed("s1");
    options.state   = R"({"scroll":10})";

    auto instance = registry.create_instance("chat", "chat-3", options);
    EXPECT_EQ(instance.panel_id, "chat-3");
    EXPECT_EQ(instance.panel_type, "chat");
    EXPECT_EQ(instance.binding, PanelBinding::fixed("s1"));
    EXPECT_EQ(instance.state, R"({"scroll":10})");
    EXPECT_FALSE(instance.meta.has_value());

    EXPECT_THROW(registry.create_instance("terminal", "terminal-1"), std::invalid_argument);
}

// ─── Availability ────────────────────────────────────────────────────────────

TEST(PanelAvailability, LoadingUntilBothSetsKnown)
{
    auto notes = manifest("notes");

    AvailabilityContext context;
    EXPECT_EQ(resolve_panel_availability("notes", &notes, context).state,
              PanelAvailability::State::Loading);

    context.allowed_panel_types = std::set<std::string>{"notes"};
    auto result                 = resolve_panel_availability("notes", &notes, context);
    EXPECT_EQ(result.state, PanelAvailability::State::Loading);
    EXPECT_TRUE(result.allows_open());
}

TEST(PanelAvailability, NotAllowedByServer)
{
    auto                notes = manifest("notes");
    AvailabilityContext context{std::set<std::string>{"chat"}, std::set<std::string>{}};

    auto result = resolve_panel_availability("notes", &notes, context);
    EXPECT_EQ(result.state, PanelAvailability::State::Unavailable);
    EXPECT_EQ(result.reason, "Panel type is not enabled on the server.");
    EXPECT_FALSE(result.allows_open());
}

TEST(PanelAvailability, MissingManifest)
{
    AvailabilityContext context{std::set<std::string>{"notes"}, std::set<std::string>{}};
    auto                result = resolve_panel_availability("notes", nullptr, context);
    EXPECT_EQ(result.state, PanelAvailability::State::Unavailable);
    EXPECT_EQ(result.reason, "Panel manifest is not registered in the client.");
}

TEST(PanelAvailability, MissingCapabilitiesListed)
{
    auto terminal         = manifest("terminal");
    terminal.capabilities = {"pty", "fs.read", "exec"};

    AvailabilityContext context{std::set<std::string>{"terminal"}, std::set<std::string>{"fs.read"}};
    auto                result = resolve_panel_availability("terminal", &terminal, context);
    EXPECT_EQ(result.state, PanelAvailability::State::Unavailable);
    EXPECT_EQ(result.reason, "Required capabilities are not available.");
    EXPECT_EQ(result.missing_capabilities, (std::vector<std::string>{"pty", "exec"}));

    context.available_capabilities = std::set<std::string>{"pty", "fs.read", "exec"};
    result                         = resolve_panel_availability("terminal", &terminal, context);
    EXPECT_EQ(result.state, PanelAvailability::State::Available);
    EXPECT_TRUE(result.missing_capabilities.empty());
}
