#include "model/StateRegistry.h"
#include <gtest/gtest.h>
#include <memory>

namespace MST {

class StateRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        toolbar = std::make_shared<State>("Toolbar");
        sidebar = std::make_shared<State>("Sidebar");
        editor = std::make_shared<State>("Editor");
        workspace = std::make_shared<StateGroup>("Workspace", "Workspace",
                                                 std::vector<StatePtr>{toolbar, sidebar, editor});
    }

    StateRegistry registry;
    StatePtr toolbar;
    StatePtr sidebar;
    StatePtr editor;
    StateGroupPtr workspace;
};

TEST_F(StateRegistryTest, RegisterStateRejectsDuplicates) {
    EXPECT_TRUE(registry.registerState(toolbar));

    auto result = registry.registerState(std::make_shared<State>("Toolbar"));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Toolbar"), std::string::npos);

    EXPECT_FALSE(registry.registerState(nullptr));
    EXPECT_EQ(registry.getStateCount(), 1u);
}

TEST_F(StateRegistryTest, RegisterGroupWiresMembership) {
    ASSERT_TRUE(registry.registerGroup(workspace));

    EXPECT_EQ(registry.getGroupCount(), 1u);
    EXPECT_EQ(registry.getStateCount(), 3u);
    EXPECT_EQ(toolbar->getGroup(), "Workspace");
    EXPECT_EQ(registry.getGroupOf("Editor"), workspace);
    EXPECT_TRUE(registry.validate().empty());
}

TEST_F(StateRegistryTest, StateBelongsToAtMostOneGroup) {
    ASSERT_TRUE(registry.registerGroup(workspace));

    auto other = std::make_shared<StateGroup>("Panels", "Panels", std::vector<StatePtr>{sidebar});
    auto result = registry.registerGroup(other);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(sidebar->getGroup(), "Workspace");
    EXPECT_FALSE(registry.hasGroup("Panels"));
}

TEST_F(StateRegistryTest, RegisterGroupIsAllOrNothing) {
    ASSERT_TRUE(registry.registerState(std::make_shared<State>("Editor")));

    // A different object already owns the id "Editor"
    EXPECT_FALSE(registry.registerGroup(workspace));
    EXPECT_FALSE(toolbar->hasGroup());
    EXPECT_FALSE(registry.hasState("Toolbar"));
    EXPECT_FALSE(registry.hasGroup("Workspace"));
}

TEST_F(StateRegistryTest, GroupedStateCannotBypassItsGroup) {
    ASSERT_TRUE(registry.registerGroup(workspace));

    StateRegistry second;
    EXPECT_FALSE(second.registerState(toolbar));
}

TEST_F(StateRegistryTest, AddAndRemoveGroupMembers) {
    auto panel = std::make_shared<State>("Panel");
    ASSERT_TRUE(registry.registerGroup(workspace));
    ASSERT_TRUE(registry.registerState(panel));

    ASSERT_TRUE(registry.addStateToGroup("Workspace", "Panel"));
    EXPECT_EQ(panel->getGroup(), "Workspace");
    EXPECT_TRUE(workspace->hasState("Panel"));

    EXPECT_FALSE(registry.addStateToGroup("Unknown", "Panel"));
    EXPECT_FALSE(registry.addStateToGroup("Workspace", "Unknown"));

    ASSERT_TRUE(registry.removeStateFromGroup("Panel"));
    EXPECT_FALSE(panel->hasGroup());
    EXPECT_FALSE(workspace->hasState("Panel"));
    EXPECT_TRUE(registry.validate().empty());
}

TEST_F(StateRegistryTest, ResolveSkipsUnknownIds) {
    ASSERT_TRUE(registry.registerGroup(workspace));

    StateSet resolved = registry.resolve({"Toolbar", "Ghost", "Editor"});
    EXPECT_EQ(resolved.size(), 2u);
    EXPECT_TRUE(resolved.contains("Toolbar"));
    EXPECT_FALSE(resolved.contains("Ghost"));
}

TEST_F(StateRegistryTest, FindsPartiallyActiveGroups) {
    ASSERT_TRUE(registry.registerGroup(workspace));

    EXPECT_TRUE(registry.findAtomicityViolations(StateSet{toolbar, sidebar, editor}).empty());
    EXPECT_TRUE(registry.findAtomicityViolations(StateSet{}).empty());

    auto violations = registry.findAtomicityViolations(StateSet{toolbar});
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0], "Workspace");
}

}  // namespace MST
