#include "rules.hpp"
#include <gtest/gtest.h>

using namespace fillsched;

TEST(Rules, DefaultDurations) {
    FillConfig cfg;
    EXPECT_DOUBLE_EQ(cleanDuration(cfg), 24.0);
    EXPECT_DOUBLE_EQ(windowCapacity(cfg), 120.0);
    EXPECT_NEAR(fillDuration(cfg, 1000000), 50.2008, 1e-4);
    EXPECT_NEAR(fillDuration(cfg, 500000), 25.1004, 1e-4);
    EXPECT_NEAR(fillDuration(cfg, 2000000), 100.4016, 1e-4);
}

TEST(Rules, ChangeoverTable) {
    FillConfig cfg;
    EXPECT_DOUBLE_EQ(changeoverDuration(cfg, std::nullopt, "Solution"), 0.0);
    EXPECT_DOUBLE_EQ(changeoverDuration(cfg, std::string("Solution"), "Solution"), 4.0);
    EXPECT_DOUBLE_EQ(changeoverDuration(cfg, std::string("Solution"), "Suspension"), 8.0);

    cfg.changeover_same_hours = 1.5;
    cfg.changeover_diff_hours = 6.0;
    EXPECT_DOUBLE_EQ(changeoverDuration(cfg, std::string("X"), "X"), 1.5);
    EXPECT_DOUBLE_EQ(changeoverDuration(cfg, std::string("X"), "Y"), 6.0);
}

TEST(Rules, WindowBudgetCleanExcluded) {
    FillConfig cfg;
    // clock starts when the clean finishes
    EXPECT_DOUBLE_EQ(windowBudget(cfg, 24.0, 24.0), 120.0);
    EXPECT_DOUBLE_EQ(windowBudget(cfg, 24.0, 104.0), 40.0);
    EXPECT_FALSE(isOversize(cfg, 120.0));
    EXPECT_TRUE(isOversize(cfg, 120.01));
}

TEST(Rules, WindowBudgetCleanIncluded) {
    FillConfig cfg;
    cfg.clean_counts_toward_window = true;
    EXPECT_DOUBLE_EQ(windowCapacity(cfg), 96.0);
    EXPECT_DOUBLE_EQ(windowBudget(cfg, 24.0, 50.0), 70.0);
    EXPECT_FALSE(isOversize(cfg, 96.0));
    EXPECT_TRUE(isOversize(cfg, 100.4));
}

TEST(Rules, ForcedCleanUsesTolerance) {
    EXPECT_FALSE(requiresForcedClean(10.0, 10.0));
    EXPECT_FALSE(requiresForcedClean(10.0, 10.0 + 1e-9));
    EXPECT_TRUE(requiresForcedClean(10.0, 10.001));
    EXPECT_TRUE(requiresForcedClean(-1.0, 0.5));
}
