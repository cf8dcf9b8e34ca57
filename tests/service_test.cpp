///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "service.hpp"
#include "repository.hpp"
#include "demo_instances.hpp"
#include "stats.hpp"
#include "instance_io.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>


///////////////////////////
///      FIXTURES       ///
///////////////////////////
class SchedulingServiceTest : public ::testing::Test {
protected:
    SchedulingServiceTest() : repository(makeDemoInstance(DemoSize::S)), service(repository, seededConfig()) {}

    static OptimizerConfig seededConfig() {
        OptimizerConfig cfg;
        cfg.genetic.populationSize = 20;
        cfg.genetic.maxGenerations = 30;
        cfg.genetic.seed = 5;
        cfg.annealing.seed = 9;
        return cfg;
    }

    InMemoryRepository repository;
    SchedulingService service;
};


///////////////////////////
///       SERVICE       ///
///////////////////////////
TEST_F(SchedulingServiceTest, OptimizesWithNamedAlgorithm) {
    Schedule s = service.optimizeSchedule("CSP");
    EXPECT_EQ(s.algorithmName(), "CSP");
    EXPECT_EQ(s.appointments().size(), 12u);
    EXPECT_TRUE(service.validateSchedule(s).isValid());

    EXPECT_THROW(service.optimizeSchedule("ILP"), std::invalid_argument);
    EXPECT_EQ(service.availableAlgorithms().size(), 3u);
}

TEST_F(SchedulingServiceTest, AllAlgorithmsReturnsTheWinner) {
    Schedule best = service.optimizeWithAllAlgorithms();
    ComparisonMap results = service.compareAlgorithms();

    ASSERT_EQ(results.size(), 3u);
    for (const auto& [name, r] : results) {
        EXPECT_GE(best.efficiencyScore(), r.efficiencyScore) << name;
    }
}

TEST_F(SchedulingServiceTest, RepositoryChangesReachTheOptimizer) {
    Appointment extra = makeTestAppointment("X1", 9, 0, 30);
    service.addAppointment(extra);
    EXPECT_EQ(service.optimizeSchedule("CSP").appointments().size(), 13u);

    EXPECT_TRUE(service.removeAppointment("X1"));
    EXPECT_FALSE(service.removeAppointment("X1"));

    // Without the ultrasound the scan becomes infeasible.
    EXPECT_TRUE(service.removeResource("E2"));
    Schedule s = service.optimizeSchedule("CSP");
    EXPECT_EQ(s.infeasible().count("A05"), 1u);
    EXPECT_EQ(s.appointments().size(), 12u);
}

TEST_F(SchedulingServiceTest, SavesOnlyFinalizedSchedules) {
    Schedule s = service.optimizeSchedule("SA");
    service.saveSchedule(s);
    ASSERT_EQ(repository.savedScheduleIds().size(), 1u);
    EXPECT_EQ(repository.savedScheduleIds()[0], s.id());

    Schedule draft("draft", "CSP", {});
    EXPECT_THROW(service.saveSchedule(draft), std::logic_error);
}

TEST_F(SchedulingServiceTest, ComparisonReportSummarizesSchedules) {
    EXPECT_THROW(service.generateComparisonReport({}), std::invalid_argument);

    std::vector<Schedule> schedules;
    for (const auto& [name, r] : service.compareAlgorithms()) {
        schedules.push_back(r.schedule);
    }
    ScheduleComparisonReport report = service.generateComparisonReport(schedules);

    EXPECT_EQ(report.scheduleCount, 3);
    EXPECT_GE(report.bestEfficiency, report.averageEfficiency);
    EXPECT_LE(report.worstEfficiency, report.averageEfficiency);
    EXPECT_GE(report.efficiencyStdDev, 0.0);

    std::vector<double> costs, efficiencies;
    for (const Schedule& s : schedules) {
        costs.push_back(s.totalCost());
        efficiencies.push_back(s.efficiencyScore());
    }
    EXPECT_DOUBLE_EQ(report.averageCost, mean(costs));
    EXPECT_DOUBLE_EQ(report.medianEfficiency, median(efficiencies));
    EXPECT_GE(report.medianEfficiency, report.worstEfficiency);
    EXPECT_LE(report.medianEfficiency, report.bestEfficiency);
}

TEST_F(SchedulingServiceTest, InvalidConfigIsRejected) {
    OptimizerConfig cfg;
    cfg.genetic.tournamentSize = 0;
    EXPECT_THROW(SchedulingService(repository, cfg).config(), std::invalid_argument);
}


///////////////////////////
///     REPOSITORY      ///
///////////////////////////
TEST(JsonFileRepositoryTest, ChangesArePersistedToDisk) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "appt_json_repository_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::string instancePath = (dir / "instance.json").string();
    writeJsonFile(instancePath, instanceToJson(identicalWindowsInstance()));

    {
        JsonFileRepository repository(instancePath, dir.string());
        EXPECT_EQ(repository.loadAppointments().size(), 2u);
        repository.saveResource(makeTestResource("R2", {"general"}));
        EXPECT_FALSE(repository.removeAppointment("missing"));

        SchedulingService service(repository);
        Schedule s = service.optimizeSchedule("CSP");
        EXPECT_EQ(s.assignments().size(), 2u);
        service.saveSchedule(s);
        EXPECT_TRUE(fs::exists(dir / (s.id() + ".json")));
        EXPECT_EQ(repository.savedScheduleIds().size(), 1u);
    }

    JsonFileRepository reopened(instancePath, dir.string());
    EXPECT_EQ(reopened.loadResources().size(), 2u);
    fs::remove_all(dir);
}


///////////////////////////
///     STATISTICS      ///
///////////////////////////
TEST(StatsTest, MeanMedianAndDeviation) {
    EXPECT_DOUBLE_EQ(mean({}), 0.0);
    EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 3.0, 6.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
    EXPECT_DOUBLE_EQ(standardDeviation({7.0}), 0.0);
    EXPECT_DOUBLE_EQ(standardDeviation({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.0);
}
