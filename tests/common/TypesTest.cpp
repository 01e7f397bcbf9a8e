#include "common/JsonUtils.h"
#include "common/types.h"
#include <gtest/gtest.h>

namespace MST {

class TypesTest : public ::testing::Test {};

TEST_F(TypesTest, ParsesNamesLeniently) {
    SuccessPolicy policy = SuccessPolicy::STRICT;
    EXPECT_TRUE(parseSuccessPolicy("Threshold", policy));
    EXPECT_EQ(policy, SuccessPolicy::THRESHOLD);
    EXPECT_FALSE(parseSuccessPolicy("sometimes", policy));
    EXPECT_EQ(policy, SuccessPolicy::THRESHOLD);

    VisibilityDirective directive = VisibilityDirective::INHERIT;
    EXPECT_TRUE(parseVisibilityDirective("hide-source", directive));
    EXPECT_EQ(directive, VisibilityDirective::HIDE_SOURCE);

    SearchStrategy strategy = SearchStrategy::BFS;
    EXPECT_TRUE(parseSearchStrategy("A_STAR", strategy));
    EXPECT_EQ(strategy, SearchStrategy::A_STAR);
    EXPECT_TRUE(parseSearchStrategy("dijkstra", strategy));
    EXPECT_EQ(strategy, SearchStrategy::DIJKSTRA);
}

TEST_F(TypesTest, NamesParseBack) {
    for (auto strategy : {SearchStrategy::BFS, SearchStrategy::DIJKSTRA, SearchStrategy::A_STAR}) {
        SearchStrategy parsed = SearchStrategy::BFS;
        ASSERT_TRUE(parseSearchStrategy(toString(strategy), parsed));
        EXPECT_EQ(parsed, strategy);
    }
    EXPECT_EQ(toString(TransitionPhase::CLEANUP), "cleanup");
}

class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, TypedLookupsFallBackToDefaults) {
    auto value = JsonUtils::parseJson(R"({"name": "mst", "ratio": 0.5, "count": 7, "flag": true, "empty": null})");
    ASSERT_TRUE(value.has_value());

    EXPECT_EQ(JsonUtils::getString(*value, "name"), "mst");
    EXPECT_EQ(JsonUtils::getString(*value, "ratio", "none"), "none");
    EXPECT_DOUBLE_EQ(JsonUtils::getDouble(*value, "ratio"), 0.5);
    EXPECT_EQ(JsonUtils::getUInt64(*value, "count"), 7u);
    EXPECT_TRUE(JsonUtils::getBool(*value, "flag"));
    EXPECT_FALSE(JsonUtils::hasKey(*value, "empty"));
    EXPECT_FALSE(JsonUtils::hasKey(*value, "missing"));
}

TEST_F(JsonUtilsTest, ReportsParseErrors) {
    std::string error;
    EXPECT_FALSE(JsonUtils::parseJson("{\"unterminated\": ", &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST_F(JsonUtilsTest, CompactOutputIsSingleLine) {
    Json::Value value(Json::objectValue);
    value["ids"] = JsonUtils::toArray(std::set<std::string>{"b", "a"});

    std::string text = JsonUtils::toCompactString(value);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_LT(text.find("\"a\""), text.find("\"b\""));
}

}  // namespace MST
