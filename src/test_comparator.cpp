#include "comparator.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include "validator.hpp"
#include <gtest/gtest.h>

using namespace fillsched;

TEST(Comparator, RanksSptAndLptByMakespan) {
    FillConfig cfg;
    auto lots = test::threeLotScenario(cfg);
    ComparisonReport rep = compareStrategies(lots, {"spt-pack", "lpt-pack"}, 0.0, cfg, SortMetric::Makespan);

    ASSERT_EQ(rep.ranked.size(), 2u);
    EXPECT_TRUE(rep.failures.empty());
    EXPECT_LE(rep.ranked[0].kpis.makespan, rep.ranked[1].kpis.makespan);
    for (const auto& r : rep.ranked) EXPECT_NO_THROW(postflight(r.schedule, cfg, lots)) << r.strategy;
}

TEST(Comparator, TiesBrokenByName) {
    FillConfig cfg = test::hourlyConfig();
    auto lots = test::makeLots({{"A", "X", 10000}, {"B", "X", 20000}}, cfg);
    ComparisonReport rep = compareStrategies(lots, {"spt-pack", "lpt-pack"}, 0.0, cfg, SortMetric::Makespan);
    ASSERT_EQ(rep.ranked.size(), 2u);
    EXPECT_DOUBLE_EQ(rep.ranked[0].kpis.makespan, 58.0);
    EXPECT_DOUBLE_EQ(rep.ranked[1].kpis.makespan, 58.0);
    EXPECT_EQ(rep.ranked[0].strategy, "lpt-pack");
    EXPECT_EQ(rep.ranked[1].strategy, "spt-pack");
}

TEST(Comparator, FailuresDoNotStopOthers) {
    FillConfig cfg;
    auto lots = test::threeLotScenario(cfg);
    ComparisonReport rep = compareStrategies(lots, {"spt-pack", "genetic", "milp-opt", "cfs"}, 0.0, cfg);

    ASSERT_EQ(rep.ranked.size(), 2u);
    ASSERT_EQ(rep.failures.size(), 2u);
    EXPECT_EQ(rep.failures[0].strategy, "genetic");
    EXPECT_EQ(rep.failures[0].error_kind, "UnknownStrategyError");
    EXPECT_EQ(rep.failures[1].strategy, "milp-opt");
    EXPECT_EQ(rep.failures[1].error_kind, "SolverUnavailableError");
    EXPECT_FALSE(rep.failures[1].message.empty());
}

TEST(Comparator, OversizeFailsEveryStrategy) {
    FillConfig cfg;
    auto lots = test::makeLots({{"HUGE", "X", 3000000}}, cfg);
    ComparisonReport rep = compareStrategies(lots, strategyNames(), 0.0, cfg);
    EXPECT_TRUE(rep.ranked.empty());
    ASSERT_EQ(rep.failures.size(), 6u);
    for (const auto& f : rep.failures) EXPECT_EQ(f.error_kind, "OversizeLotError") << f.strategy;
}

TEST(Comparator, AllStrategiesWithExactBackend) {
    FillConfig cfg;
    auto lots = test::threeLotScenario(cfg);
    auto backend = std::make_shared<test::EnumeratingBackend>(lots, cfg);
    ComparisonReport rep = compareStrategies(lots, strategyNames(), 0.0, cfg, SortMetric::Makespan, backend);
    ASSERT_EQ(rep.ranked.size(), 6u);
    EXPECT_EQ(backend->calls(), 1);
    for (size_t i = 1; i < rep.ranked.size(); ++i) {
        EXPECT_LE(rep.ranked[i - 1].kpis.makespan, rep.ranked[i].kpis.makespan);
    }
}

TEST(Comparator, UtilizationAndChangeoverOrdering) {
    FillConfig cfg = test::hourlyConfig();
    auto lots = test::makeLots({{"A", "X", 10000}, {"B", "Y", 11000}, {"C", "X", 12000}, {"D", "Y", 13000}}, cfg);
    std::vector<std::string> names = {"spt-pack", "lpt-pack", "cfs-pack", "smart-pack", "hybrid-pack"};

    ComparisonReport byUtil = compareStrategies(lots, names, 0.0, cfg, SortMetric::Utilization);
    ASSERT_EQ(byUtil.ranked.size(), names.size());
    for (size_t i = 1; i < byUtil.ranked.size(); ++i) {
        EXPECT_GE(byUtil.ranked[i - 1].kpis.utilization, byUtil.ranked[i].kpis.utilization);
    }
    // alternating types cost three 8 h changeovers; clustering pays 4 + 8 + 4
    EXPECT_GT(byUtil.ranked.front().kpis.utilization, byUtil.ranked.back().kpis.utilization);

    ComparisonReport byChg = compareStrategies(lots, names, 0.0, cfg, SortMetric::Changeovers);
    for (size_t i = 1; i < byChg.ranked.size(); ++i) {
        EXPECT_LE(byChg.ranked[i - 1].kpis.changeover_count, byChg.ranked[i].kpis.changeover_count);
    }
}

TEST(Comparator, SequentialMatchesParallel) {
    FillConfig cfg;
    auto lots = test::manySmallLots(10, cfg);
    auto names = std::vector<std::string>{"smart-pack", "spt-pack", "hybrid-pack", "lpt-pack"};
    ComparisonReport par = compareStrategies(lots, names, 0.0, cfg, SortMetric::Makespan, nullptr, true);
    ComparisonReport seq = compareStrategies(lots, names, 0.0, cfg, SortMetric::Makespan, nullptr, false);
    ASSERT_EQ(par.ranked.size(), seq.ranked.size());
    for (size_t i = 0; i < par.ranked.size(); ++i) {
        EXPECT_EQ(par.ranked[i].strategy, seq.ranked[i].strategy);
        EXPECT_EQ(par.ranked[i].schedule, seq.ranked[i].schedule);
    }
}

TEST(Comparator, ParseSortMetric) {
    EXPECT_EQ(parseSortMetric("makespan"), SortMetric::Makespan);
    EXPECT_EQ(parseSortMetric("Utilization"), SortMetric::Utilization);
    EXPECT_EQ(parseSortMetric("changeovers"), SortMetric::Changeovers);
    EXPECT_THROW(parseSortMetric("cost"), ConfigError);
}
