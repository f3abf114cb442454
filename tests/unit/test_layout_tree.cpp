#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numeric>
#include <paneldock/layout_tree.hpp>
#include <string>

using namespace paneldock;

namespace
{

LayoutNode leaf(const char* id)
{
    return LayoutNode::panel(id);
}

// split-1 H [a, split-2 V [b, c]]
LayoutNode nested_tree()
{
    return LayoutNode::split("split-1",
                             SplitDirection::Horizontal,
                             {leaf("a"),
                              LayoutNode::split("split-2",
                                                SplitDirection::Vertical,
                                                {leaf("b"), leaf("c")},
                                                {0.5, 0.5})},
                             {0.4, 0.6});
}

LayoutNode tabs_tree()
{
    return LayoutNode::split("split-1",
                             SplitDirection::Horizontal,
                             {leaf("a"), leaf("b"), leaf("c")},
                             {0.2, 0.3, 0.5},
                             ViewMode::Tabs,
                             PanelId("b"));
}

double sum(const std::vector<double>& v)
{
    return std::accumulate(v.begin(), v.end(), 0.0);
}

}   // namespace

// ─── Queries ─────────────────────────────────────────────────────────────────

TEST(LayoutTreeQuery, CollectsIdsInDocumentOrder)
{
    auto root = nested_tree();
    EXPECT_EQ(collect_panel_ids(root), (std::vector<PanelId>{"a", "b", "c"}));
    EXPECT_EQ(collect_split_ids(root), (std::vector<SplitId>{"split-1", "split-2"}));
    EXPECT_EQ(collect_panel_ids(leaf("x")), (std::vector<PanelId>{"x"}));
    EXPECT_TRUE(collect_split_ids(leaf("x")).empty());
}

TEST(LayoutTreeQuery, VisibleIdsSkipInactiveTabs)
{
    auto root = tabs_tree();
    EXPECT_EQ(collect_visible_panel_ids(root), (std::vector<PanelId>{"b"}));

    root.active_id = "missing";
    EXPECT_EQ(collect_visible_panel_ids(root), (std::vector<PanelId>{"a"}));

    root.active_id.reset();
    EXPECT_EQ(active_child_index(root), 0u);
}

TEST(LayoutTreeQuery, ContainsAndFirst)
{
    auto root = nested_tree();
    EXPECT_TRUE(contains_panel_id(root, "c"));
    EXPECT_FALSE(contains_panel_id(root, "z"));
    EXPECT_EQ(find_first_panel_id(root), "a");
    EXPECT_EQ(find_first_panel_id(root.children[1]), "b");
}

TEST(LayoutTreeQuery, Paths)
{
    auto root = nested_tree();
    auto path = find_panel_path(root, "c");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (LayoutPath{1, 1}));

    const LayoutNode* node = node_at_path(root, *path);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->panel_id, "c");

    EXPECT_EQ(find_split_path(root, "split-2"), (LayoutPath{1}));
    EXPECT_EQ(find_split_path(root, "split-1"), LayoutPath{});
    EXPECT_FALSE(find_split_path(root, "split-9").has_value());
    EXPECT_EQ(node_at_path(root, {3}), nullptr);
    EXPECT_EQ(node_at_path(root, {0, 0}), nullptr);
}

TEST(LayoutTreeQuery, NearestSplitIsDirectParent)
{
    auto   root  = nested_tree();
    size_t index = 99;

    const LayoutNode* split = find_nearest_split_for_panel(root, "c", &index);
    ASSERT_NE(split, nullptr);
    EXPECT_EQ(split->split_id, "split-2");
    EXPECT_EQ(index, 1u);

    split = find_nearest_split_for_panel(root, "a", &index);
    ASSERT_NE(split, nullptr);
    EXPECT_EQ(split->split_id, "split-1");
    EXPECT_EQ(index, 0u);

    EXPECT_EQ(find_nearest_split_for_panel(root, "z"), nullptr);
    EXPECT_EQ(find_nearest_split_for_panel(leaf("a"), "a"), nullptr);
}

// ─── Sizes ───────────────────────────────────────────────────────────────────

TEST(NormalizeSplitSizes, KeepsValidProportions)
{
    auto sizes = normalize_split_sizes({2.0, 6.0}, 2);
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_DOUBLE_EQ(sizes[0], 0.25);
    EXPECT_DOUBLE_EQ(sizes[1], 0.75);
}

TEST(NormalizeSplitSizes, EmptyInputIsEqual)
{
    auto sizes = normalize_split_sizes({}, 4);
    ASSERT_EQ(sizes.size(), 4u);
    for (double s : sizes)
        EXPECT_DOUBLE_EQ(s, 0.25);
    EXPECT_TRUE(normalize_split_sizes({0.5}, 0).empty());
}

TEST(NormalizeSplitSizes, InvalidEntriesShareRemainder)
{
    const double nan   = std::numeric_limits<double>::quiet_NaN();
    auto         sizes = normalize_split_sizes({0.5, nan, -1.0}, 3);
    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_DOUBLE_EQ(sizes[0], 0.5);
    EXPECT_DOUBLE_EQ(sizes[1], 0.25);
    EXPECT_DOUBLE_EQ(sizes[2], 0.25);
}

TEST(NormalizeSplitSizes, InvalidEntriesTakeMeanWhenNothingRemains)
{
    auto sizes = normalize_split_sizes({0.6, 0.6, 0.0}, 3);
    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_NEAR(sizes[0], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(sizes[2], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(sum(sizes), 1.0, 1e-12);
}

TEST(NormalizeSplitSizes, InvalidEntryTakesMeanWhenValidOverflow)
{
    const double nan   = std::numeric_limits<double>::quiet_NaN();
    auto         sizes = normalize_split_sizes({0.2, nan, 0.9}, 3);
    ASSERT_EQ(sizes.size(), 3u);
    for (double s : sizes)
        EXPECT_TRUE(std::isfinite(s) && s > 0.0);
    EXPECT_NEAR(sizes[0], 0.2 / 1.65, 1e-12);
    EXPECT_NEAR(sizes[1], 0.55 / 1.65, 1e-12);
    EXPECT_NEAR(sizes[2], 0.9 / 1.65, 1e-12);
    EXPECT_NEAR(sum(sizes), 1.0, 1e-12);
}

TEST(NormalizeSplitSizes, PadsAndTruncates)
{
    auto padded = normalize_split_sizes({0.4}, 3);
    ASSERT_EQ(padded.size(), 3u);
    EXPECT_DOUBLE_EQ(padded[0], 0.4);
    EXPECT_DOUBLE_EQ(padded[1], 0.3);

    auto truncated = normalize_split_sizes({1.0, 1.0, 2.0}, 2);
    ASSERT_EQ(truncated.size(), 2u);
    EXPECT_DOUBLE_EQ(truncated[0], 0.5);
    EXPECT_NEAR(sum(truncated), 1.0, 1e-12);
}

TEST(NormalizeSplitSizes, AllInvalidIsEqual)
{
    const double inf   = std::numeric_limits<double>::infinity();
    auto         sizes = normalize_split_sizes({inf, 0.0}, 2);
    EXPECT_DOUBLE_EQ(sizes[0], 0.5);
    EXPECT_DOUBLE_EQ(sizes[1], 0.5);
}

// ─── Insert ──────────────────────────────────────────────────────────────────

TEST(InsertPanel, EdgeWrapsWholeTreeWithoutTarget)
{
    auto root = insert_panel(leaf("a"), "b", {PanelRegion::Right, std::nullopt});
    ASSERT_TRUE(root.is_split());
    EXPECT_EQ(root.split_id, "split-1");
    EXPECT_EQ(root.direction, SplitDirection::Horizontal);
    EXPECT_EQ(collect_panel_ids(root), (std::vector<PanelId>{"a", "b"}));
    EXPECT_EQ(root.sizes, (std::vector<double>{0.5, 0.5}));
    EXPECT_EQ(root.view_mode, ViewMode::Split);
}

TEST(InsertPanel, LeftAndTopPutNewPanelFirst)
{
    auto left = insert_panel(leaf("a"), "b", {PanelRegion::Left, std::nullopt});
    EXPECT_EQ(collect_panel_ids(left), (std::vector<PanelId>{"b", "a"}));

    auto top = insert_panel(leaf("a"), "b", {PanelRegion::Top, std::nullopt});
    EXPECT_EQ(top.direction, SplitDirection::Vertical);
    EXPECT_EQ(collect_panel_ids(top), (std::vector<PanelId>{"b", "a"}));

    auto bottom = insert_panel(leaf("a"), "b", {PanelRegion::Bottom, std::nullopt});
    EXPECT_EQ(bottom.direction, SplitDirection::Vertical);
    EXPECT_EQ(collect_panel_ids(bottom), (std::vector<PanelId>{"a", "b"}));
}

TEST(InsertPanel, EdgeNextToTargetOnly)
{
    auto root = insert_panel(nested_tree(), "d", {PanelRegion::Bottom, std::nullopt}, PanelId("b"));

    EXPECT_EQ(collect_panel_ids(root), (std::vector<PanelId>{"a", "b", "d", "c"}));
    size_t      index = 0;
    const auto* split = find_nearest_split_for_panel(root, "d", &index);
    ASSERT_NE(split, nullptr);
    EXPECT_EQ(split->split_id, "split-3");
    EXPECT_EQ(split->direction, SplitDirection::Vertical);
    EXPECT_EQ(index, 1u);
    // Untouched siblings keep their sizes.
    EXPECT_EQ(root.sizes, (std::vector<double>{0.4, 0.6}));
}

TEST(InsertPanel, UnknownTargetFallsBackToRoot)
{
    auto root = insert_panel(nested_tree(), "d", {PanelRegion::Right, std::nullopt}, PanelId("zz"));
    ASSERT_TRUE(root.is_split());
    EXPECT_EQ(root.split_id, "split-3");
    EXPECT_EQ(root.children.size(), 2u);
    EXPECT_EQ(root.children[1].panel_id, "d");
}

TEST(InsertPanel, CenterWrapsTargetInTabs)
{
    auto root = insert_panel(nested_tree(), "d", {PanelRegion::Center, std::nullopt}, PanelId("a"));
    const LayoutNode& tabs = root.children[0];
    ASSERT_TRUE(tabs.is_tabs());
    EXPECT_EQ(tabs.active_id, "d");
    EXPECT_EQ(collect_panel_ids(tabs), (std::vector<PanelId>{"a", "d"}));
    EXPECT_EQ(collect_visible_panel_ids(root), (std::vector<PanelId>{"d", "b", "c"}));
}

TEST(InsertPanel, CenterJoinsExistingTabs)
{
    auto root = insert_panel(tabs_tree(), "d", {PanelRegion::Center, std::nullopt}, PanelId("b"));
    ASSERT_TRUE(root.is_tabs());
    EXPECT_EQ(collect_panel_ids(root), (std::vector<PanelId>{"a", "b", "d", "c"}));
    EXPECT_EQ(root.active_id, "d");
    ASSERT_EQ(root.sizes.size(), 4u);
    EXPECT_NEAR(root.sizes[2], 0.25, 1e-12);
    EXPECT_NEAR(sum(root.sizes), 1.0, 1e-12);
}

TEST(InsertPanel, CenterWithoutTargetAppendsToRootTabs)
{
    auto root = insert_panel(tabs_tree(), "d", {PanelRegion::Center, std::nullopt});
    ASSERT_TRUE(root.is_tabs());
    EXPECT_EQ(root.split_id, "split-1");
    EXPECT_EQ(collect_panel_ids(root).back(), "d");
    EXPECT_EQ(root.active_id, "d");
}

TEST(InsertPanel, SizedPlacementUsesContainer)
{
    PanelPlacement placement{PanelRegion::Left, PanelSize{300.0, std::nullopt}};
    auto           root = insert_panel(leaf("a"), "b", placement, std::nullopt, ContainerSize{1200, 800});
    EXPECT_DOUBLE_EQ(root.sizes[0], 0.25);
    EXPECT_DOUBLE_EQ(root.sizes[1], 0.75);

    placement.region = PanelRegion::Right;
    root             = insert_panel(leaf("a"), "b", placement, std::nullopt, ContainerSize{1200, 800});
    EXPECT_DOUBLE_EQ(root.sizes[0], 0.75);
    EXPECT_DOUBLE_EQ(root.sizes[1], 0.25);
}

TEST(ResolveSplitRatio, ClampsAndDefaults)
{
    ContainerSize  container{1000, 500};
    PanelPlacement huge{PanelRegion::Top, PanelSize{std::nullopt, 5000.0}};
    EXPECT_DOUBLE_EQ(resolve_split_ratio(huge, container), MAX_PLACEMENT_RATIO);

    PanelPlacement tiny{PanelRegion::Left, PanelSize{1.0, std::nullopt}};
    EXPECT_DOUBLE_EQ(resolve_split_ratio(tiny, container), MIN_PLACEMENT_RATIO);

    PanelPlacement wrong_axis{PanelRegion::Left, PanelSize{std::nullopt, 100.0}};
    EXPECT_DOUBLE_EQ(resolve_split_ratio(wrong_axis, container), 0.5);
    EXPECT_DOUBLE_EQ(resolve_split_ratio(tiny, std::nullopt), 0.5);

    PanelPlacement center{PanelRegion::Center, PanelSize{100.0, 100.0}};
    EXPECT_DOUBLE_EQ(resolve_split_ratio(center, container), 0.5);
}

TEST(CreateSplitId, SkipsTakenIds)
{
    EXPECT_EQ(create_split_id(leaf("a")), "split-1");
    EXPECT_EQ(create_split_id(nested_tree()), "split-3");

    auto root = LayoutNode::split("split-2", SplitDirection::Horizontal, {leaf("a"), leaf("b")}, {0.5, 0.5});
    EXPECT_EQ(create_split_id(root), "split-3");
}

// ─── Remove ──────────────────────────────────────────────────────────────────

TEST(RemovePanel, CollapsesSingleChildSplit)
{
    auto root = remove_panel(nested_tree(), "b");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->split_id, "split-1");
    ASSERT_EQ(root->children.size(), 2u);
    EXPECT_TRUE(root->children[1].is_panel());
    EXPECT_EQ(root->children[1].panel_id, "c");
    EXPECT_EQ(root->sizes, (std::vector<double>{0.4, 0.6}));
}

TEST(RemovePanel, RenormalizesRemainingSizes)
{
    auto root = remove_panel(tabs_tree(), "c");
    ASSERT_TRUE(root.has_value());
    ASSERT_EQ(root->sizes.size(), 2u);
    EXPECT_DOUBLE_EQ(root->sizes[0], 0.4);
    EXPECT_DOUBLE_EQ(root->sizes[1], 0.6);
    EXPECT_EQ(root->active_id, "b");
}

TEST(RemovePanel, RepairsTabsActiveId)
{
    auto root = remove_panel(tabs_tree(), "b");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->active_id, "a");
}

TEST(RemovePanel, AssignsTabsActiveIdWhenUnset)
{
    auto tabs = LayoutNode::split("split-1",
                                  SplitDirection::Horizontal,
                                  {leaf("a"), leaf("b"), leaf("c")},
                                  {0.2, 0.3, 0.5},
                                  ViewMode::Tabs);
    auto root = remove_panel(tabs, "a");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->active_id, "b");
}

TEST(RemovePanel, UndoesInsertForEveryRegion)
{
    const PanelRegion regions[] = {
        PanelRegion::Center, PanelRegion::Left, PanelRegion::Right, PanelRegion::Top, PanelRegion::Bottom};
    const std::optional<PanelId> targets[] = {std::nullopt, PanelId("a"), PanelId("b"), PanelId("c")};

    for (auto region : regions)
    {
        for (const auto& target : targets)
        {
            SCOPED_TRACE(target.value_or("<root>") + " region " + std::to_string(static_cast<int>(region)));
            auto inserted = insert_panel(nested_tree(), "d", {region, std::nullopt}, target);
            ASSERT_TRUE(contains_panel_id(inserted, "d"));

            auto removed = remove_panel(inserted, "d");
            ASSERT_TRUE(removed.has_value());
            EXPECT_EQ(*removed, nested_tree());
        }
    }
}

TEST(RemovePanel, CollapsesToTabsAfterChainedInserts)
{
    auto root = insert_panel(leaf("a"), "b", {PanelRegion::Right, std::nullopt});
    EXPECT_EQ(root.sizes, (std::vector<double>{0.5, 0.5}));

    root = insert_panel(root, "c", {PanelRegion::Center, std::nullopt}, PanelId("a"));
    ASSERT_EQ(root.children.size(), 2u);
    const LayoutNode& tabs = root.children[0];
    ASSERT_TRUE(tabs.is_tabs());
    EXPECT_EQ(collect_panel_ids(tabs), (std::vector<PanelId>{"a", "c"}));
    EXPECT_EQ(tabs.active_id, "c");

    auto collapsed = remove_panel(root, "b");
    ASSERT_TRUE(collapsed.has_value());
    ASSERT_TRUE(collapsed->is_tabs());
    EXPECT_EQ(collapsed->split_id, tabs.split_id);
    EXPECT_EQ(collect_panel_ids(*collapsed), (std::vector<PanelId>{"a", "c"}));
    EXPECT_EQ(collapsed->active_id, "c");
    EXPECT_EQ(collect_visible_panel_ids(*collapsed), (std::vector<PanelId>{"c"}));
}

TEST(RemovePanel, AbsentIdReturnsSameTree)
{
    auto root = remove_panel(nested_tree(), "zz");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, nested_tree());
}

TEST(RemovePanel, LastLeafYieldsNothing)
{
    EXPECT_FALSE(remove_panel(leaf("a"), "a").has_value());
}

TEST(MovePanel, RemovesThenInserts)
{
    auto root = move_panel(nested_tree(), "a", {PanelRegion::Bottom, std::nullopt}, PanelId("c"));
    EXPECT_EQ(collect_panel_ids(root), (std::vector<PanelId>{"b", "c", "a"}));
    const auto* split = find_nearest_split_for_panel(root, "a");
    ASSERT_NE(split, nullptr);
    EXPECT_EQ(split->direction, SplitDirection::Vertical);
    EXPECT_TRUE(contains_panel_id(*split, "c"));
}

TEST(MovePanel, SelfTargetMeansWholeTree)
{
    auto root = move_panel(nested_tree(), "a", {PanelRegion::Right, std::nullopt}, PanelId("a"));
    ASSERT_TRUE(root.is_split());
    EXPECT_EQ(root.children.back().panel_id, "a");
    EXPECT_EQ(collect_panel_ids(root), (std::vector<PanelId>{"b", "c", "a"}));
}

// ─── Split updates ───────────────────────────────────────────────────────────

TEST(UpdateSplit, ReplacesOnlyTargetNode)
{
    auto original = nested_tree();
    auto updated  = update_split(original,
                                "split-2",
                                [](const LayoutNode& split) -> std::optional<LayoutNode>
                                {
                                    LayoutNode copy = split;
                                    copy.direction  = SplitDirection::Horizontal;
                                    return copy;
                                });
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->children[1].direction, SplitDirection::Horizontal);
    EXPECT_EQ(original.children[1].direction, SplitDirection::Vertical);

    auto none = update_split(original, "split-2", [](const LayoutNode&) { return std::optional<LayoutNode>(); });
    EXPECT_FALSE(none.has_value());
    EXPECT_FALSE(update_split(original, "split-7", [](const LayoutNode& n) { return std::optional(n); }).has_value());
}

TEST(UpdateSplit, NearestSplitReceivesChildIndex)
{
    size_t seen    = 99;
    auto   updated = update_nearest_split_for_panel(nested_tree(),
                                                  "c",
                                                  [&](const LayoutNode& split, size_t index)
                                                  {
                                                      seen = index;
                                                      return std::optional<LayoutNode>(split);
                                                  });
    EXPECT_TRUE(updated.has_value());
    EXPECT_EQ(seen, 1u);
    EXPECT_FALSE(update_nearest_split_for_panel(leaf("a"),
                                                "a",
                                                [](const LayoutNode& split, size_t)
                                                { return std::optional<LayoutNode>(split); })
                     .has_value());
}

TEST(UpdateSplit, SetSizesNormalizes)
{
    auto root = set_split_sizes(nested_tree(), "split-1", {3.0, 1.0});
    ASSERT_TRUE(root.has_value());
    EXPECT_DOUBLE_EQ(root->sizes[0], 0.75);
    EXPECT_FALSE(set_split_sizes(nested_tree(), "nope", {0.5, 0.5}).has_value());
}

TEST(UpdateSplit, ViewModeRoundTrip)
{
    auto tabs = set_split_view_mode(nested_tree(), "split-2", ViewMode::Tabs);
    ASSERT_TRUE(tabs.has_value());
    const auto* split = find_split(*tabs, "split-2");
    ASSERT_NE(split, nullptr);
    EXPECT_TRUE(split->is_tabs());
    EXPECT_EQ(split->active_id, "b");
    EXPECT_FALSE(set_split_view_mode(*tabs, "split-2", ViewMode::Tabs).has_value());

    auto back = set_split_view_mode(*tabs, "split-2", ViewMode::Split);
    ASSERT_TRUE(back.has_value());
    EXPECT_FALSE(find_split(*back, "split-2")->active_id.has_value());
}

TEST(UpdateSplit, SetTabsActive)
{
    auto root = set_tabs_active(tabs_tree(), "split-1", "c");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->active_id, "c");
    EXPECT_FALSE(set_tabs_active(*root, "split-1", "c").has_value());
    EXPECT_FALSE(set_tabs_active(*root, "split-1", "zz").has_value());
    EXPECT_FALSE(set_tabs_active(nested_tree(), "split-1", "a").has_value());
}

TEST(UpdateSplit, ActivateTabsForNestedPanel)
{
    auto root = LayoutNode::split("split-1",
                                  SplitDirection::Horizontal,
                                  {leaf("a"),
                                   LayoutNode::split("split-2",
                                                     SplitDirection::Vertical,
                                                     {leaf("b"), leaf("c")},
                                                     {0.5, 0.5},
                                                     ViewMode::Tabs,
                                                     PanelId("b"))},
                                  {0.5, 0.5},
                                  ViewMode::Tabs,
                                  PanelId("a"));

    auto activated = activate_tabs_for_panel(root, "c");
    EXPECT_EQ(activated.active_id, "c");
    EXPECT_EQ(activated.children[1].active_id, "c");
    EXPECT_EQ(collect_visible_panel_ids(activated), (std::vector<PanelId>{"c"}));
}

TEST(UpdateSplit, ReorderCarriesSize)
{
    auto root = reorder_split_child(tabs_tree(), "split-1", 0, 2);
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(collect_panel_ids(*root), (std::vector<PanelId>{"b", "c", "a"}));
    EXPECT_DOUBLE_EQ(root->sizes[2], 0.2);

    auto clamped = reorder_split_child(tabs_tree(), "split-1", 2, 10);
    EXPECT_FALSE(clamped.has_value());
    EXPECT_FALSE(reorder_split_child(tabs_tree(), "split-1", 5, 0).has_value());
}
