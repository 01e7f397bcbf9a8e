#include "common/TestUtils.h"
#include "model/StateSet.h"
#include <gtest/gtest.h>

namespace MST {

class StateSetTest : public ::testing::Test {
protected:
    MST::Test::Utils::StatePool pool;
};

TEST_F(StateSetTest, InsertIgnoresDuplicatesAndNull) {
    StateSet states;
    EXPECT_TRUE(states.insert(pool.get("A")));
    EXPECT_FALSE(states.insert(pool.get("A")));
    EXPECT_FALSE(states.insert(nullptr));
    EXPECT_EQ(states.size(), 1u);
}

TEST_F(StateSetTest, IdentityIsById) {
    // Two distinct objects with the same id are the same member
    StateSet states{pool.get("A")};
    auto twin = std::make_shared<State>("A", "Another A");
    EXPECT_TRUE(states.contains(*twin));
    EXPECT_FALSE(states.insert(twin));
    EXPECT_EQ(states.find("A"), pool.get("A"));
    EXPECT_EQ(states.find("missing"), nullptr);
}

TEST_F(StateSetTest, SetAlgebra) {
    StateSet abc = pool.set({"A", "B", "C"});
    StateSet bd = pool.set({"B", "D"});

    EXPECT_TRUE(abc.intersects(bd));
    EXPECT_EQ(abc.intersection(bd), pool.set({"B"}));
    EXPECT_EQ(abc.difference(bd), pool.set({"A", "C"}));
    EXPECT_EQ(abc.unionWith(bd), pool.set({"A", "B", "C", "D"}));

    EXPECT_TRUE(pool.set({"A", "C"}).isSubsetOf(abc));
    EXPECT_FALSE(bd.isSubsetOf(abc));
    EXPECT_TRUE(StateSet().isSubsetOf(abc));
    EXPECT_FALSE(StateSet().intersects(abc));
}

TEST_F(StateSetTest, EraseAndBulkOperations) {
    StateSet states = pool.set({"A", "B"});
    EXPECT_TRUE(states.erase("A"));
    EXPECT_FALSE(states.erase("A"));

    states.insertAll(pool.set({"C", "D"}));
    EXPECT_EQ(states.size(), 3u);

    states.eraseAll(pool.set({"B", "D", "Z"}));
    EXPECT_EQ(states, pool.set({"C"}));

    states.clear();
    EXPECT_TRUE(states.empty());
}

TEST_F(StateSetTest, RendersSortedIds) {
    StateSet states = pool.set({"Toolbar", "Editor", "Menu"});
    EXPECT_EQ(states.toString(), "{Editor, Menu, Toolbar}");
    EXPECT_EQ(StateSet().toString(), "{}");

    std::set<std::string> expected{"Editor", "Menu", "Toolbar"};
    EXPECT_EQ(states.ids(), expected);
}

}  // namespace MST
