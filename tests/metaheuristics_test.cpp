///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "genetic_optimizer.hpp"
#include "annealing_optimizer.hpp"
#include "comparison.hpp"
#include "demo_instances.hpp"
#include "validation.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <unordered_map>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

GeneticConfig smallGenetic(unsigned int seed) {
    GeneticConfig cfg;
    cfg.populationSize = 20;
    cfg.maxGenerations = 40;
    cfg.seed = seed;
    return cfg;
}

AnnealingConfig seededAnnealing(unsigned int seed) {
    AnnealingConfig cfg;
    cfg.seed = seed;
    return cfg;
}

/// Every assignment goes to a resource that could host the appointment.
void expectOnlyEligibleAssignments(const Schedule& s, const std::vector<Resource>& resources) {
    std::unordered_map<std::string, const Resource*> byId;
    for (const Resource& r : resources) byId[r.id()] = &r;

    for (const auto& [apptId, resId] : s.assignments()) {
        const Appointment* appt = s.findAppointment(apptId);
        ASSERT_NE(appt, nullptr);
        ASSERT_EQ(byId.count(resId), 1u);
        EXPECT_TRUE(isEligible(*appt, *byId[resId])) << apptId << " -> " << resId;
    }
    EXPECT_EQ(s.assignments().size() + s.unassigned().size(), s.appointments().size());
}

/// Both randomized optimizers, seeded and small enough for unit tests.
std::vector<std::unique_ptr<IScheduleOptimizer>> seededMetaheuristics() {
    OptimizerConfig cfg;
    cfg.genetic = smallGenetic(19);
    cfg.annealing = seededAnnealing(23);

    std::vector<std::unique_ptr<IScheduleOptimizer>> optimizers;
    optimizers.push_back(makeOptimizer("GA", cfg));
    optimizers.push_back(makeOptimizer("SA", cfg));
    return optimizers;
}

bool mentions(const std::vector<std::string>& messages, const std::string& text) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& m) { return m.find(text) != std::string::npos; });
}

} // namespace


///////////////////////////
///       GENETIC       ///
///////////////////////////
TEST(GeneticOptimizerTest, FitnessCombinesRateConflictsAndCost) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60), makeTestAppointment("B", 9, 30, 60)};
    std::vector<Resource> res = {makeTestResource("R1", {}, 60.0)};

    EXPECT_DOUBLE_EQ(GeneticOptimizer::fitness(appts, res, {kUnassigned, kUnassigned}), 40.0);
    // cost 60, score 1.5: cost efficiency 0.025.
    EXPECT_NEAR(GeneticOptimizer::fitness(appts, res, {0, kUnassigned}), (0.15 + 0.4 + 0.3 * 0.025) * 100.0, 1e-9);
    // Both on R1: one conflict, cost 120, score 3.
    EXPECT_NEAR(GeneticOptimizer::fitness(appts, res, {0, 0}), (0.3 + 0.36 + 0.3 * 0.025) * 100.0, 1e-9);
}

TEST(GeneticOptimizerTest, RejectsOutOfRangeParameters) {
    GeneticConfig cfg = smallGenetic(1);
    cfg.populationSize = 0;
    EXPECT_THROW(GeneticOptimizer{cfg}, std::invalid_argument);

    cfg = smallGenetic(1);
    cfg.tournamentSize = 0;
    EXPECT_THROW(GeneticOptimizer{cfg}, std::invalid_argument);

    cfg = smallGenetic(1);
    cfg.mutationRate = 1.5;
    EXPECT_THROW(GeneticOptimizer{cfg}, std::invalid_argument);

    EXPECT_NO_THROW(GeneticOptimizer{smallGenetic(1)});
}

TEST(GeneticOptimizerTest, SeededRunsAreReproducible) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    Schedule a = GeneticOptimizer(smallGenetic(7)).optimize(inst.appointments, inst.resources);
    Schedule b = GeneticOptimizer(smallGenetic(7)).optimize(inst.appointments, inst.resources);
    EXPECT_EQ(a.assignments(), b.assignments());
    EXPECT_NE(a.id(), b.id());
}

TEST(GeneticOptimizerTest, BestNeverWorseThanInitial) {
    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    OptimizerRun run = GeneticOptimizer(smallGenetic(11)).run(inst.appointments, inst.resources);

    EXPECT_GE(run.stats.bestObjective, run.stats.initialObjective);
    EXPECT_LE(run.stats.iterations, 40);
    expectOnlyEligibleAssignments(run.schedule, inst.resources);
    EXPECT_GE(run.schedule.efficiencyScore(), 0.0);
    EXPECT_LE(run.schedule.efficiencyScore(), 100.0);
}

TEST(GeneticOptimizerTest, ZeroGenerationsReturnsInitialBest) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    GeneticConfig cfg = smallGenetic(3);
    cfg.maxGenerations = 0;

    OptimizerRun run = GeneticOptimizer(cfg).run(inst.appointments, inst.resources);
    EXPECT_EQ(run.stats.iterations, 0);
    EXPECT_TRUE(run.stats.exhausted);
    EXPECT_DOUBLE_EQ(run.stats.bestObjective, run.stats.initialObjective);
}

TEST(GeneticOptimizerTest, ZeroResourcesLeavesEverythingUnassigned) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 30), makeTestAppointment("B", 9, 0, 30)};
    Schedule s = GeneticOptimizer(smallGenetic(1)).optimize(appts, {});
    EXPECT_TRUE(s.assignments().empty());
    EXPECT_EQ(s.infeasible().size(), 2u);
    EXPECT_DOUBLE_EQ(s.totalCost(), 0.0);
}

TEST(GeneticOptimizerTest, HonoursCancellation) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    std::atomic<bool> cancel{true};
    GeneticOptimizer optimizer(smallGenetic(5));
    optimizer.setCancellationFlag(&cancel);

    OptimizerRun run = optimizer.run(inst.appointments, inst.resources);
    EXPECT_TRUE(run.stats.cancelled);
    EXPECT_FALSE(run.stats.exhausted);
    EXPECT_EQ(run.stats.iterations, 0);
    expectOnlyEligibleAssignments(run.schedule, inst.resources);
}


///////////////////////////
///      ANNEALING      ///
///////////////////////////
TEST(AnnealingOptimizerTest, EnergyPenalizesConflictsAndGaps) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60), makeTestAppointment("B", 9, 30, 60)};
    std::vector<Resource> res = {makeTestResource("R1", {}, 60.0)};

    EXPECT_DOUBLE_EQ(AnnealingOptimizer::energy(appts, res, {kUnassigned, kUnassigned}), 400.0);
    EXPECT_DOUBLE_EQ(AnnealingOptimizer::energy(appts, res, {0, kUnassigned}), 260.0);
    EXPECT_DOUBLE_EQ(AnnealingOptimizer::energy(appts, res, {0, 0}), 220.0);
}

TEST(AnnealingOptimizerTest, RejectsOutOfRangeParameters) {
    AnnealingConfig cfg = seededAnnealing(1);
    cfg.coolingRate = 1.0;
    EXPECT_THROW(AnnealingOptimizer{cfg}, std::invalid_argument);

    cfg = seededAnnealing(1);
    cfg.minTemperature = 0.0;
    EXPECT_THROW(AnnealingOptimizer{cfg}, std::invalid_argument);

    cfg = seededAnnealing(1);
    cfg.multiMoveCount = 0;
    EXPECT_THROW(AnnealingOptimizer{cfg}, std::invalid_argument);
}

TEST(AnnealingOptimizerTest, SeededRunsAreReproducible) {
    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    Schedule a = AnnealingOptimizer(seededAnnealing(21)).optimize(inst.appointments, inst.resources);
    Schedule b = AnnealingOptimizer(seededAnnealing(21)).optimize(inst.appointments, inst.resources);
    EXPECT_EQ(a.assignments(), b.assignments());
    EXPECT_DOUBLE_EQ(a.totalCost(), b.totalCost());
}

TEST(AnnealingOptimizerTest, BestNeverWorseThanInitial) {
    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    OptimizerRun run = AnnealingOptimizer(seededAnnealing(4)).run(inst.appointments, inst.resources);

    EXPECT_LE(run.stats.bestObjective, run.stats.initialObjective);
    expectOnlyEligibleAssignments(run.schedule, inst.resources);
    EXPECT_GE(run.schedule.efficiencyScore(), 0.0);
    EXPECT_LE(run.schedule.efficiencyScore(), 100.0);
}

TEST(AnnealingOptimizerTest, StopsOnTemperatureOrIterationBound) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);

    // Defaults cool from 1000 to below 0.1 long before 10000 steps.
    OptimizerRun cooled = AnnealingOptimizer(seededAnnealing(8)).run(inst.appointments, inst.resources);
    EXPECT_FALSE(cooled.stats.exhausted);
    EXPECT_GT(cooled.stats.iterations, 0);
    EXPECT_LT(cooled.stats.iterations, 10000);

    AnnealingConfig capped = seededAnnealing(8);
    capped.maxIterations = 10;
    OptimizerRun bounded = AnnealingOptimizer(capped).run(inst.appointments, inst.resources);
    EXPECT_TRUE(bounded.stats.exhausted);
    EXPECT_EQ(bounded.stats.iterations, 10);
}

TEST(AnnealingOptimizerTest, ZeroResourcesLeavesEverythingUnassigned) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 30), makeTestAppointment("B", 11, 0, 30)};
    OptimizerRun run = AnnealingOptimizer(seededAnnealing(2)).run(appts, {});
    EXPECT_TRUE(run.schedule.assignments().empty());
    EXPECT_EQ(run.schedule.unassigned().size(), 2u);
    EXPECT_DOUBLE_EQ(run.schedule.totalCost(), 0.0);
    EXPECT_DOUBLE_EQ(run.stats.bestObjective, 400.0);
}

TEST(AnnealingOptimizerTest, HonoursCancellation) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    std::atomic<bool> cancel{true};
    AnnealingOptimizer optimizer(seededAnnealing(6));
    optimizer.setCancellationFlag(&cancel);

    OptimizerRun run = optimizer.run(inst.appointments, inst.resources);
    EXPECT_TRUE(run.stats.cancelled);
    EXPECT_EQ(run.stats.iterations, 0);
    EXPECT_DOUBLE_EQ(run.stats.bestObjective, run.stats.initialObjective);
}


///////////////////////////
///  SHARED SCENARIOS   ///
///////////////////////////
TEST(MetaheuristicScenarioTest, IdenticalWindowsAreDoubleBooked) {
    ProblemInstance inst = identicalWindowsInstance();

    for (const auto& optimizer : seededMetaheuristics()) {
        Schedule s = optimizer->optimize(inst.appointments, inst.resources);

        // A feasible appointment is never left out, so both share R1.
        EXPECT_EQ(s.resourceFor("A").value_or(""), "R1") << optimizer->name();
        EXPECT_EQ(s.resourceFor("B").value_or(""), "R1") << optimizer->name();
        EXPECT_EQ(s.conflictCount(), 1) << optimizer->name();

        ValidationReport report = validateSchedule(s, inst.resources);
        EXPECT_FALSE(report.isValid()) << optimizer->name();
        EXPECT_TRUE(mentions(report.errors, "Resource R1 is double booked by appointments A and B"))
                << optimizer->name();
    }
}

TEST(MetaheuristicScenarioTest, RequiredCapabilityBeatsCost) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60, {"X"})};
    std::vector<Resource> res = {makeTestResource("cheap", {}, 1.0), makeTestResource("holder", {"X"}, 500.0)};

    for (const auto& optimizer : seededMetaheuristics()) {
        Schedule s = optimizer->optimize(appts, res);
        ASSERT_EQ(s.assignments().size(), 1u) << optimizer->name();
        EXPECT_EQ(s.resourceFor("A").value(), "holder") << optimizer->name();
    }
}

TEST(MetaheuristicScenarioTest, FeasibleInstanceValidatesWithoutErrors) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 8, 0, 60, {"general"}),
                                      makeTestAppointment("B", 10, 0, 45, {"xray"}),
                                      makeTestAppointment("C", 13, 30, 30, {"cardiology"})};
    std::vector<Resource> res = {makeTestResource("R1", {"general"}, 50.0),
                                 makeTestResource("E1", {"xray"}, 200.0),
                                 makeTestResource("S1", {"cardiology"}, 120.0)};

    for (const auto& optimizer : seededMetaheuristics()) {
        Schedule s = optimizer->optimize(appts, res);
        ValidationReport report = validateSchedule(s, res);
        EXPECT_TRUE(report.isValid()) << optimizer->name();
        EXPECT_TRUE(report.warnings.empty()) << optimizer->name();
        EXPECT_EQ(s.assignments().size(), 3u) << optimizer->name();
        EXPECT_EQ(s.resourceFor("B").value_or(""), "E1") << optimizer->name();
    }
}
