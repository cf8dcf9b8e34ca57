#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "schedule.hpp"
#include "comparison.hpp"
#include "validation.hpp"
#include "repository.hpp"
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Summary statistics over a set of schedules.
 */
struct ScheduleComparisonReport {
    int scheduleCount = 0;
    std::string bestScheduleId;   ///< Highest efficiency score.
    std::string worstScheduleId;  ///< Lowest efficiency score.
    double bestEfficiency = 0.0;
    double worstEfficiency = 0.0;
    double averageEfficiency = 0.0;
    double medianEfficiency = 0.0;
    double efficiencyStdDev = 0.0; ///< Population standard deviation.
    double averageCost = 0.0;
    double averageConflicts = 0.0;
};


///////////////////////////
///       SERVICE       ///
///////////////////////////
/**
 * @brief Entry point for callers that work with stored data.
 *
 * Every call takes a fresh snapshot from the injected repository and runs
 * the optimizers on it; the repository must outlive the service.
 */
class SchedulingService {
public:
    SchedulingService(ISchedulingRepository& repository, OptimizerConfig config = OptimizerConfig{});

    /**
     * @brief Run one algorithm on the current data.
     *
     * @throws std::invalid_argument for an unknown algorithm name.
     */
    Schedule optimizeSchedule(const std::string& algorithm) const;

    /**
     * @brief Run every algorithm and return the schedule with the best efficiency score.
     */
    Schedule optimizeWithAllAlgorithms() const;

    /**
     * @brief Run every algorithm and return the timed comparison.
     */
    ComparisonMap compareAlgorithms() const;

    /**
     * @brief Validate a schedule against the currently stored resources.
     */
    ValidationReport validateSchedule(const Schedule& schedule) const;

    /**
     * @brief Best, worst, mean, median and spread of efficiency plus mean cost and conflicts.
     *
     * @throws std::invalid_argument for an empty list.
     */
    ScheduleComparisonReport generateComparisonReport(const std::vector<Schedule>& schedules) const;

    std::vector<std::string> availableAlgorithms() const;

    void saveSchedule(const Schedule& schedule) { repository_.saveSchedule(schedule); }

    void addAppointment(const Appointment& appointment) { repository_.saveAppointment(appointment); }
    bool removeAppointment(const std::string& id) { return repository_.removeAppointment(id); }
    void addResource(const Resource& resource) { repository_.saveResource(resource); }
    bool removeResource(const std::string& id) { return repository_.removeResource(id); }

    const OptimizerConfig& config() const { return config_; }

private:
    ISchedulingRepository& repository_;
    OptimizerConfig config_;
};
