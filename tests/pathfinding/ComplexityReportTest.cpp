#include "pathfinding/ComplexityReport.h"
#include <cmath>
#include <gtest/gtest.h>

namespace MST {

class ComplexityReportTest : public ::testing::Test {};

TEST_F(ComplexityReportTest, CountsConfigurations) {
    ComplexityReport report = estimateComplexity(10, 3);

    EXPECT_DOUBLE_EQ(report.stateConfigurations, 1024.0);
    EXPECT_DOUBLE_EQ(report.targetProgressConfigurations, 8.0);
    EXPECT_DOUBLE_EQ(report.totalSearchSpace, 8192.0);
    EXPECT_NE(report.complexityClass.find("n=10"), std::string::npos);
}

TEST_F(ComplexityReportTest, EmptyProblem) {
    ComplexityReport report = estimateComplexity(0, 0);
    EXPECT_DOUBLE_EQ(report.totalSearchSpace, 1.0);
}

TEST_F(ComplexityReportTest, HugeSpacesSaturate) {
    ComplexityReport report = estimateComplexity(2000, 4);

    EXPECT_TRUE(std::isinf(report.stateConfigurations));
    EXPECT_DOUBLE_EQ(report.targetProgressConfigurations, 16.0);

    Json::Value json = report.toJson();
    EXPECT_EQ(json["state_configurations"].asString(), "2^2000");
    EXPECT_DOUBLE_EQ(json["target_progress_configurations"].asDouble(), 16.0);
    EXPECT_TRUE(json["exponential_in_targets"].asBool());
}

}  // namespace MST
