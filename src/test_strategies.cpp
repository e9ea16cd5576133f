#include "errors.hpp"
#include "heuristics.hpp"
#include "strategy.hpp"
#include "test_support.hpp"
#include "validator.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <random>

using namespace fillsched;

namespace {

std::vector<Lot> mixedLots(const FillConfig& cfg) {
    return test::makeLots({{"L1", "Solution", 400000},
                           {"L2", "Suspension", 900000},
                           {"L3", "Solution", 150000},
                           {"L4", "Lyo", 1200000},
                           {"L5", "Suspension", 400000},
                           {"L6", "Solution", 2000000},
                           {"L7", "Lyo", 60000},
                           {"L8", "Suspension", 700000}},
                          cfg);
}

std::vector<Hours> fillDurations(const Schedule& s) {
    std::vector<Hours> out;
    for (const auto& a : s.activities()) {
        if (a.kind == ActivityKind::Fill) out.push_back(a.duration());
    }
    return out;
}

std::vector<std::string> fillTypes(const Schedule& s) {
    std::vector<std::string> out;
    for (const auto& a : s.activities()) {
        if (a.kind == ActivityKind::Fill) out.push_back(a.lot->getType());
    }
    return out;
}

// Adjacent fills with no clean between them are separated by the rule's changeover.
void expectChangeoversFollowRules(const Schedule& s, const FillConfig& cfg) {
    const Activity* prevFill = nullptr;
    const Activity* chg = nullptr;
    for (const auto& a : s.activities()) {
        if (a.kind == ActivityKind::Clean) {
            prevFill = nullptr;
            chg = nullptr;
        } else if (a.kind == ActivityKind::Changeover) {
            chg = &a;
        } else {
            if (prevFill) {
                ASSERT_NE(chg, nullptr) << "no changeover before " << a.lot->getId();
                Hours expected = prevFill->lot->getType() == a.lot->getType() ? cfg.changeover_same_hours
                                                                               : cfg.changeover_diff_hours;
                EXPECT_NEAR(chg->duration(), expected, 1e-9) << "before " << a.lot->getId();
            }
            prevFill = &a;
            chg = nullptr;
        }
    }
}

} // namespace

TEST(Factory, NamesAndAliases) {
    EXPECT_EQ(strategyNames().size(), 6u);
    for (const auto& name : strategyNames()) {
        EXPECT_EQ(makeStrategy(name)->getName(), name);
    }
    EXPECT_EQ(canonicalStrategyName("spt"), "spt-pack");
    EXPECT_EQ(canonicalStrategyName("Smart_Pack"), "smart-pack");
    EXPECT_EQ(canonicalStrategyName("MILP"), "milp-opt");
    EXPECT_EQ(makeStrategy("hybrid")->getName(), "hybrid-pack");
    EXPECT_THROW(makeStrategy("genetic"), UnknownStrategyError);
}

TEST(SptPack, ThreeLotScenario) {
    FillConfig cfg;
    auto lots = test::threeLotScenario(cfg);
    PlanResult r = makeStrategy("spt-pack")->plan(lots, 0.0, cfg);

    EXPECT_EQ(r.schedule.fillOrder(), (std::vector<std::string>{"B", "A", "C"}));
    const Schedule& s = r.schedule;
    ASSERT_EQ(s.size(), 6u);
    EXPECT_EQ(s[0].kind, ActivityKind::Clean);
    EXPECT_DOUBLE_EQ(s[0].start, 0.0);
    EXPECT_EQ(s[1].lot->getId(), "B");
    EXPECT_EQ(s[2].kind, ActivityKind::Changeover);
    EXPECT_DOUBLE_EQ(s[2].duration(), 4.0);
    EXPECT_EQ(s[3].lot->getId(), "A");
    EXPECT_NEAR(s[3].end - s[0].end, 79.3012, 1e-3); // B + 4 + A in the first window
    EXPECT_EQ(s[4].kind, ActivityKind::Clean);       // C no longer fits
    EXPECT_EQ(s[5].lot->getId(), "C");
    EXPECT_NEAR(r.kpis.makespan, 24 + 25.1004 + 4 + 50.2008 + 24 + 100.4016, 1e-3);
    EXPECT_EQ(r.kpis.clean_blocks, 2);
    EXPECT_EQ(r.kpis.changeover_count, 1);
}

TEST(SptPack, ChangeoverBetweenTypesInOneWindow) {
    FillConfig cfg = test::hourlyConfig();
    auto lots = test::makeLots({{"A", "X", 10000}, {"B", "Y", 20000}}, cfg);
    PlanResult r = makeStrategy("spt-pack")->plan(lots, 0.0, cfg);
    ASSERT_EQ(r.schedule.size(), 4u);
    EXPECT_DOUBLE_EQ(r.schedule[2].duration(), 8.0);
    EXPECT_EQ(r.schedule[2].note, "X->Y 8h");
}

TEST(LptPack, OrderingLaw) {
    FillConfig cfg;
    PlanResult r = makeStrategy("lpt-pack")->plan(mixedLots(cfg), 0.0, cfg);
    auto d = fillDurations(r.schedule);
    for (size_t i = 1; i < d.size(); ++i) EXPECT_GE(d[i - 1], d[i]);
}

TEST(SptPack, OrderingLaw) {
    FillConfig cfg;
    PlanResult r = makeStrategy("spt-pack")->plan(mixedLots(cfg), 0.0, cfg);
    auto d = fillDurations(r.schedule);
    for (size_t i = 1; i < d.size(); ++i) EXPECT_LE(d[i - 1], d[i]);
}

TEST(SptPack, TiesBrokenById) {
    FillConfig cfg = test::hourlyConfig();
    auto lots = test::makeLots({{"C", "X", 5000}, {"A", "Y", 5000}, {"B", "X", 5000}}, cfg);
    EXPECT_EQ(makeStrategy("spt")->plan(lots, 0.0, cfg).schedule.fillOrder(),
              (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(makeStrategy("lpt")->plan(lots, 0.0, cfg).schedule.fillOrder(),
              (std::vector<std::string>{"A", "B", "C"}));
}

TEST(CfsPack, GroupsByTotalVials) {
    FillConfig cfg = test::hourlyConfig();
    auto lots = test::makeLots(
        {{"X3", "X", 20000}, {"Y1", "Y", 40000}, {"X1", "X", 20000}, {"X2", "X", 20000}, {"Y2", "Y", 50000}}, cfg);
    PlanResult r = makeStrategy("cfs-pack")->plan(lots, 0.0, cfg);
    EXPECT_EQ(r.schedule.fillOrder(), (std::vector<std::string>{"Y1", "Y2", "X1", "X2", "X3"}));

    cfg.cfs_cluster_order = "by_count";
    r = makeStrategy("cfs-pack")->plan(lots, 0.0, cfg);
    EXPECT_EQ(r.schedule.fillOrder(), (std::vector<std::string>{"X1", "X2", "X3", "Y1", "Y2"}));

    cfg.cfs_within = "lpt";
    r = makeStrategy("cfs-pack")->plan(lots, 0.0, cfg);
    EXPECT_EQ(r.schedule.fillOrder(), (std::vector<std::string>{"X1", "X2", "X3", "Y2", "Y1"}));
}

TEST(CfsPack, ThreeLotScenario) {
    FillConfig cfg;
    PlanResult r = makeStrategy("cfs-pack")->plan(test::threeLotScenario(cfg), 0.0, cfg);
    EXPECT_EQ(r.schedule.fillOrder(), (std::vector<std::string>{"C", "A", "B"}));
}

TEST(Strategy, EmptyLotSetGivesEmptySchedule) {
    FillConfig cfg;
    for (const auto& name : strategyNames()) {
        PlanResult r = makeStrategy(name)->plan({}, 0.0, cfg);
        EXPECT_TRUE(r.schedule.empty()) << name;
        EXPECT_EQ(r.kpis.makespan, 0.0) << name;
        EXPECT_EQ(r.strategy, name);
    }
}

TEST(Strategy, InvalidConfigIsRejected) {
    FillConfig cfg;
    cfg.window_hours = 0.0;
    EXPECT_THROW(makeStrategy("spt-pack")->plan(test::threeLotScenario(), 0.0, cfg), ConfigError);
}

TEST(Strategy, CleanInsideWindowMakesScenarioOversize) {
    FillConfig cfg;
    cfg.clean_counts_toward_window = true; // C needs 100.4 h of a 96 h window
    auto lots = test::threeLotScenario(cfg);
    for (const auto& name : strategyNames()) {
        try {
            makeStrategy(name)->plan(lots, 0.0, cfg);
            ADD_FAILURE() << name << " planned an oversize lot";
        } catch (const OversizeLotError& e) {
            EXPECT_EQ(e.lotId(), "C") << name;
        }
    }
}

TEST(Strategy, CleanInsideWindowPacksTighter) {
    FillConfig cfg = test::hourlyConfig();
    auto lots = test::makeLots({{"A", "X", 50000}, {"B", "X", 45000}}, cfg);
    // 50 + 4 + 45 = 99: fits 120, not 96
    EXPECT_EQ(makeStrategy("lpt-pack")->plan(lots, 0.0, cfg).kpis.clean_blocks, 1);
    cfg.clean_counts_toward_window = true;
    PlanResult r = makeStrategy("lpt-pack")->plan(lots, 0.0, cfg);
    EXPECT_EQ(r.kpis.clean_blocks, 2);
    EXPECT_EQ(r.kpis.changeover_count, 0);
}

class EveryHeuristic : public ::testing::TestWithParam<std::string> {};

TEST_P(EveryHeuristic, ProducesValidDeterministicSchedules) {
    FillConfig cfg;
    auto lots = mixedLots(cfg);
    auto strategy = makeStrategy(GetParam());
    PlanResult first = strategy->plan(lots, 1000.0, cfg);
    PlanResult second = makeStrategy(GetParam())->plan(lots, 1000.0, cfg);

    EXPECT_EQ(first.schedule, second.schedule);
    EXPECT_NO_THROW(postflight(first.schedule, cfg, lots));
    EXPECT_EQ(first.kpis.lots_scheduled, static_cast<int>(lots.size()));
    EXPECT_DOUBLE_EQ(first.schedule[0].start, 1000.0);
    EXPECT_EQ(first.schedule[0].kind, ActivityKind::Clean);
    expectChangeoversFollowRules(first.schedule, cfg);
}

TEST_P(EveryHeuristic, RejectsOversizeLot) {
    FillConfig cfg;
    auto lots = test::makeLots({{"OK", "Solution", 100000}, {"HUGE", "Solution", 2500000}}, cfg);
    EXPECT_THROW(makeStrategy(GetParam())->plan(lots, 0.0, cfg), OversizeLotError);
    EXPECT_THROW(makeStrategy(GetParam())->plan(lots, 0.0, cfg), InfeasibleScheduleError);
}

TEST_P(EveryHeuristic, UsesConfiguredLineId) {
    FillConfig cfg;
    cfg.line_id = "FILL-7";
    PlanResult r = makeStrategy(GetParam())->plan(test::threeLotScenario(cfg), 0.0, cfg);
    for (const auto& a : r.schedule.activities()) EXPECT_EQ(a.line_id, "FILL-7");
}

// Seeded instances across lot mixes and line configurations; engine output is
// used directly so the sequence is the same on every standard library.
TEST_P(EveryHeuristic, GeneratedInstancesPassPostflight) {
    std::mt19937 rng(20250117u);
    auto pick = [&rng](unsigned lo, unsigned hi) { return lo + static_cast<unsigned>(rng() % (hi - lo + 1)); };
    const std::vector<std::string> types = {"Solution", "Suspension", "Lyo", "Emulsion"};

    for (int instance = 0; instance < 80; ++instance) {
        FillConfig cfg;
        cfg.fill_rate_vials_per_hour = 1000.0;
        cfg.clean_hours = pick(1, 30);
        cfg.window_hours = cfg.clean_hours + pick(10, 140);
        cfg.changeover_same_hours = pick(0, 6);
        cfg.changeover_diff_hours = pick(0, 12);
        cfg.clean_counts_toward_window = pick(0, 1) == 1;
        cfg.beam_width = static_cast<int>(pick(1, 4));
        cfg.smart_lookahead = static_cast<int>(pick(1, 4));
        cfg.cfs_cluster_order = pick(0, 1) ? "by_count" : "by_vials";
        cfg.cfs_within = std::vector<std::string>{"by_id", "spt", "lpt"}[pick(0, 2)];

        const long long maxVials = static_cast<long long>(windowCapacity(cfg) * cfg.fill_rate_vials_per_hour);
        const unsigned typeCount = pick(1, 4);
        const unsigned lotCount = pick(1, 15);
        std::vector<RawLotRecord> records;
        for (unsigned i = 0; i < lotCount; ++i) {
            const long long vials = 1 + static_cast<long long>(rng() % static_cast<unsigned long long>(maxVials));
            records.push_back({"G" + std::to_string(i), types[pick(0, typeCount - 1)], std::to_string(vials)});
        }
        PreflightReport rep = preflight(records, cfg);
        ASSERT_TRUE(rep.ok()) << "instance " << instance;

        PlanResult first = makeStrategy(GetParam())->plan(rep.lots, 0.0, cfg);
        PlanResult second = makeStrategy(GetParam())->plan(rep.lots, 0.0, cfg);
        EXPECT_NO_THROW(postflight(first.schedule, cfg, rep.lots)) << "instance " << instance;
        EXPECT_EQ(first.schedule, second.schedule) << "instance " << instance;
        EXPECT_EQ(first.kpis.lots_scheduled, static_cast<int>(lotCount)) << "instance " << instance;
    }
}

INSTANTIATE_TEST_SUITE_P(Heuristics, EveryHeuristic,
                         ::testing::Values("spt-pack", "lpt-pack", "cfs-pack", "smart-pack", "hybrid-pack"));
