///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "service.hpp"
#include "stats.hpp"
#include <stdexcept>


///////////////////////////
///       SERVICE       ///
///////////////////////////
SchedulingService::SchedulingService(ISchedulingRepository& repository, OptimizerConfig config)
        : repository_(repository), config_(std::move(config)) {
    validateConfig(config_);
}

Schedule SchedulingService::optimizeSchedule(const std::string& algorithm) const {
    std::unique_ptr<IScheduleOptimizer> optimizer = makeOptimizer(algorithm, config_);
    return optimizer->optimize(repository_.loadAppointments(), repository_.loadResources());
}

Schedule SchedulingService::optimizeWithAllAlgorithms() const {
    ComparisonMap results = compareAlgorithms();
    std::optional<std::string> winner = selectWinner(results);
    if (!winner) {
        throw std::logic_error("no algorithm produced a schedule");
    }
    return results.at(*winner).schedule;
}

ComparisonMap SchedulingService::compareAlgorithms() const {
    ComparisonHarness harness(config_);
    return harness.compareAll(repository_.loadAppointments(), repository_.loadResources());
}

ValidationReport SchedulingService::validateSchedule(const Schedule& schedule) const {
    return ::validateSchedule(schedule, repository_.loadResources());
}

ScheduleComparisonReport SchedulingService::generateComparisonReport(const std::vector<Schedule>& schedules) const {
    if (schedules.empty()) {
        throw std::invalid_argument("Cannot compare empty schedule list");
    }

    ScheduleComparisonReport report;
    report.scheduleCount = (int)schedules.size();

    std::vector<double> efficiency, cost, conflicts;
    const Schedule* best = &schedules.front();
    const Schedule* worst = &schedules.front();
    for (const Schedule& s : schedules) {
        efficiency.push_back(s.efficiencyScore());
        cost.push_back(s.totalCost());
        conflicts.push_back((double)s.conflictCount());
        if (s.efficiencyScore() > best->efficiencyScore()) best = &s;
        if (s.efficiencyScore() < worst->efficiencyScore()) worst = &s;
    }

    report.bestScheduleId = best->id();
    report.worstScheduleId = worst->id();
    report.bestEfficiency = best->efficiencyScore();
    report.worstEfficiency = worst->efficiencyScore();
    report.averageEfficiency = mean(efficiency);
    report.medianEfficiency = median(efficiency);
    report.efficiencyStdDev = standardDeviation(efficiency);
    report.averageCost = mean(cost);
    report.averageConflicts = mean(conflicts);
    return report;
}

std::vector<std::string> SchedulingService::availableAlgorithms() const {
    return ::availableAlgorithms();
}
