#include "config/ConfigLoader.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace MST {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!tempFile.empty()) {
            std::filesystem::remove(tempFile);
        }
    }

    std::string writeTempFile(const std::string &content) {
        tempFile = (std::filesystem::temp_directory_path() / "mst_config_loader_test.json").string();
        std::ofstream out(tempFile);
        out << content;
        return tempFile;
    }

    std::string tempFile;
};

TEST_F(ConfigLoaderTest, EmptyObjectGivesDefaults) {
    auto config = ConfigLoader::loadFromString("{}");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->executor.successPolicy, SuccessPolicy::STRICT);
    EXPECT_DOUBLE_EQ(config->executor.successThreshold, 0.8);
    EXPECT_TRUE(config->executor.validateGroupAtomicity);
    EXPECT_EQ(config->pathfinder.strategy, SearchStrategy::DIJKSTRA);
    EXPECT_DOUBLE_EQ(config->reliability.maxCostMultiplier, 10.0);
}

TEST_F(ConfigLoaderTest, ReadsAllSections) {
    auto config = ConfigLoader::loadFromString(R"({
        "executor": {"success_policy": "threshold", "success_threshold": 0.66, "validate_group_atomicity": false},
        "pathfinder": {"strategy": "A*", "max_expanded_nodes": 5000, "max_search_seconds": 2.5},
        "reliability": {"cost_multiplier_on_failure": 3.0, "min_cost_multiplier": 1.0, "max_cost_multiplier": 4.0}
    })");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->executor.successPolicy, SuccessPolicy::THRESHOLD);
    EXPECT_DOUBLE_EQ(config->executor.successThreshold, 0.66);
    EXPECT_FALSE(config->executor.validateGroupAtomicity);
    EXPECT_EQ(config->pathfinder.strategy, SearchStrategy::A_STAR);
    EXPECT_EQ(config->pathfinder.maxExpandedNodes, 5000u);
    EXPECT_DOUBLE_EQ(config->pathfinder.maxSearchTime.count(), 2.5);
    EXPECT_DOUBLE_EQ(config->reliability.costMultiplierOnFailure, 3.0);
    EXPECT_DOUBLE_EQ(config->reliability.maxCostMultiplier, 4.0);
}

TEST_F(ConfigLoaderTest, RejectsInvalidValues) {
    std::string error;

    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"executor": {"success_policy": "optimistic"}})", &error));
    EXPECT_NE(error.find("optimistic"), std::string::npos);

    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"executor": {"success_threshold": 1.2}})", &error));
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"executor": {"success_threshold": "high"}})", &error));
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"pathfinder": {"max_expanded_nodes": 0}})", &error));
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"pathfinder": {"max_search_seconds": -1}})", &error));
    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"pathfinder": {"strategy": "dfs"}})", &error));
    EXPECT_FALSE(ConfigLoader::loadFromString(
        R"({"reliability": {"min_cost_multiplier": 5.0, "max_cost_multiplier": 2.0}})", &error));

    EXPECT_FALSE(ConfigLoader::loadFromString(R"({"executor": []})", &error));
    EXPECT_NE(error.find("executor"), std::string::npos);
}

TEST_F(ConfigLoaderTest, RejectsMalformedDocuments) {
    std::string error;
    EXPECT_FALSE(ConfigLoader::loadFromString("{not json", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(ConfigLoader::loadFromString("[1, 2]", &error));
    EXPECT_FALSE(ConfigLoader::loadFromString("", &error));
}

TEST_F(ConfigLoaderTest, LoadsFromFile) {
    std::string path = writeTempFile(R"({"executor": {"success_policy": "lenient"}})");

    auto config = ConfigLoader::loadFromFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->executor.successPolicy, SuccessPolicy::LENIENT);

    std::string error;
    EXPECT_FALSE(ConfigLoader::loadFromFile("/nonexistent/mst.json", &error));
    EXPECT_NE(error.find("/nonexistent/mst.json"), std::string::npos);
}

TEST_F(ConfigLoaderTest, SerializedConfigLoadsBack) {
    MultiStateConfig original;
    original.executor.successPolicy = SuccessPolicy::THRESHOLD;
    original.executor.successThreshold = 0.5;
    original.pathfinder.strategy = SearchStrategy::BFS;

    auto loaded = ConfigLoader::loadFromJson(ConfigLoader::toJson(original));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->executor.successPolicy, SuccessPolicy::THRESHOLD);
    EXPECT_DOUBLE_EQ(loaded->executor.successThreshold, 0.5);
    EXPECT_EQ(loaded->pathfinder.strategy, SearchStrategy::BFS);
}

}  // namespace MST
