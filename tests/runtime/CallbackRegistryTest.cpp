#include "runtime/CallbackRegistry.h"
#include <gtest/gtest.h>

namespace MST {

class CallbackRegistryTest : public ::testing::Test {
protected:
    CallbackRegistry registry;
};

TEST_F(CallbackRegistryTest, EmptyRegistryReturnsEmptyActions) {
    EXPECT_FALSE(static_cast<bool>(registry.getOutgoing("t")));
    EXPECT_FALSE(static_cast<bool>(registry.getIncoming("t", "A")));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(CallbackRegistryTest, IncomingIsKeyedByTransitionAndState) {
    registry.registerIncoming("open", "Editor", [] { return false; });

    EXPECT_TRUE(registry.hasIncoming("open", "Editor"));
    EXPECT_FALSE(registry.hasIncoming("open", "Menu"));
    EXPECT_FALSE(registry.hasIncoming("close", "Editor"));

    auto action = registry.getIncoming("open", "Editor");
    ASSERT_TRUE(static_cast<bool>(action));
    EXPECT_FALSE(action());
}

TEST_F(CallbackRegistryTest, LaterRegistrationReplacesEarlier) {
    registry.registerOutgoing("t", [] { return false; });
    registry.registerOutgoing("t", [] { return true; });

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.getOutgoing("t")());
}

TEST_F(CallbackRegistryTest, EmptyActionsAreIgnored) {
    registry.registerOutgoing("t", TransitionAction());
    registry.registerIncoming("t", "A", nullptr);

    EXPECT_FALSE(registry.hasOutgoing("t"));
    EXPECT_FALSE(registry.hasIncoming("t", "A"));
}

TEST_F(CallbackRegistryTest, ClearRemovesEverything) {
    registry.registerOutgoing("t", [] { return true; });
    registry.registerIncoming("t", "A", [] { return true; });
    ASSERT_EQ(registry.size(), 2u);

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

}  // namespace MST
