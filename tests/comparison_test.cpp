///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "comparison.hpp"
#include "demo_instances.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

OptimizerConfig seededConfig(bool parallel) {
    OptimizerConfig cfg;
    cfg.genetic.populationSize = 20;
    cfg.genetic.maxGenerations = 30;
    cfg.genetic.seed = 13;
    cfg.annealing.seed = 17;
    cfg.parallelComparison = parallel;
    return cfg;
}

} // namespace


///////////////////////////
///       FACTORY       ///
///////////////////////////
TEST(ComparisonFactoryTest, KnowsExactlyThreeAlgorithms) {
    EXPECT_EQ(availableAlgorithms(), (std::vector<std::string>{"CSP", "GA", "SA"}));
    for (const std::string& name : availableAlgorithms()) {
        std::unique_ptr<IScheduleOptimizer> optimizer = makeOptimizer(name, OptimizerConfig{});
        ASSERT_TRUE(optimizer != nullptr);
        EXPECT_EQ(optimizer->name(), name);
        EXPECT_FALSE(algorithmDisplayName(name).empty());
    }
}

TEST(ComparisonFactoryTest, UnknownAlgorithmIsRejected) {
    EXPECT_THROW(makeOptimizer("TABU", OptimizerConfig{}), std::invalid_argument);
    EXPECT_THROW(algorithmDisplayName("csp"), std::invalid_argument);

    ProblemInstance inst = identicalWindowsInstance();
    ComparisonHarness harness(seededConfig(false));
    EXPECT_THROW(harness.runOne("TABU", inst.appointments, inst.resources), std::invalid_argument);
    EXPECT_THROW(harness.compare({"CSP", "TABU"}, inst.appointments, inst.resources), std::invalid_argument);
}


///////////////////////////
///       HARNESS       ///
///////////////////////////
TEST(ComparisonHarnessTest, RejectsInvalidConfigBeforeRunning) {
    OptimizerConfig cfg = seededConfig(false);
    cfg.genetic.populationSize = 0;
    EXPECT_THROW(ComparisonHarness{cfg}, std::invalid_argument);

    cfg = seededConfig(true);
    cfg.annealing.minTemperature = cfg.annealing.initialTemperature * 2.0;
    EXPECT_THROW(ComparisonHarness{cfg}, std::invalid_argument);
}

TEST(ComparisonHarnessTest, RunsEveryAlgorithmOnTheSameInput) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    ComparisonMap results = ComparisonHarness(seededConfig(true)).compareAll(inst.appointments, inst.resources);

    ASSERT_EQ(results.size(), 3u);
    for (const auto& [name, r] : results) {
        EXPECT_EQ(r.algorithmName, name);
        EXPECT_EQ(r.schedule.algorithmName(), name);
        EXPECT_TRUE(r.schedule.isFinalized());
        EXPECT_EQ(r.schedule.appointments().size(), inst.appointments.size());
        EXPECT_GE(r.executionTimeMs, 0.0);
        EXPECT_GE(r.efficiencyScore, 0.0);
        EXPECT_LE(r.efficiencyScore, 100.0);
        EXPECT_DOUBLE_EQ(r.totalCost, r.schedule.totalCost());
        EXPECT_EQ(r.conflictCount, r.schedule.conflictCount());
        EXPECT_EQ(r.iterations, r.stats.iterations);
    }
}

TEST(ComparisonHarnessTest, ConcurrentAndSequentialRunsAgree) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    ComparisonMap concurrent = ComparisonHarness(seededConfig(true)).compareAll(inst.appointments, inst.resources);
    ComparisonMap sequential = ComparisonHarness(seededConfig(false)).compareAll(inst.appointments, inst.resources);

    for (const std::string& name : availableAlgorithms()) {
        EXPECT_EQ(concurrent.at(name).schedule.assignments(), sequential.at(name).schedule.assignments()) << name;
    }
}

TEST(ComparisonHarnessTest, SubsetOfAlgorithms) {
    ProblemInstance inst = identicalWindowsInstance();
    ComparisonMap results = ComparisonHarness(seededConfig(true)).compare({"SA"}, inst.appointments, inst.resources);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.count("SA"), 1u);
}

TEST(ComparisonHarnessTest, CancellationReachesEveryOptimizer) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    std::atomic<bool> cancel{true};
    ComparisonHarness harness(seededConfig(true));
    harness.setCancellationFlag(&cancel);

    ComparisonMap results = harness.compareAll(inst.appointments, inst.resources);
    for (const auto& [name, r] : results) {
        EXPECT_TRUE(r.stats.cancelled) << name;
    }
}

TEST(ComparisonHarnessTest, WinnerHasHighestEfficiency) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    ComparisonMap results = ComparisonHarness(seededConfig(false)).compareAll(inst.appointments, inst.resources);

    std::optional<std::string> winner = selectWinner(results);
    ASSERT_TRUE(winner.has_value());
    for (const auto& [name, r] : results) {
        EXPECT_GE(results.at(*winner).efficiencyScore, r.efficiencyScore);
    }
    EXPECT_FALSE(selectWinner(ComparisonMap{}).has_value());
}

TEST(ComparisonHarnessTest, TiesGoToFirstAlgorithmByName) {
    // Nothing can be scheduled, so every algorithm reaches the same score.
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 30)};
    ComparisonMap results = ComparisonHarness(seededConfig(false)).compareAll(appts, {});
    EXPECT_EQ(selectWinner(results).value(), "CSP");
}
