#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "schedule.hpp"
#include "random.hpp"
#include <atomic>
#include <string>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Search statistics reported alongside every schedule.
 *
 * The objective is algorithm specific: assigned count for backtracking,
 * fitness for the evolutionary search (higher is better) and energy for
 * annealing (lower is better).
 */
struct SearchStats {
    long iterations = 0; ///< Backtrack calls, generations or annealing steps.
    double initialObjective = 0.0; ///< Objective of the starting solution.
    double bestObjective = 0.0; ///< Objective of the returned solution.
    bool exhausted = false; ///< Stopped by its iteration bound rather than by convergence.
    bool cancelled = false; ///< Stopped by the external cancellation flag.
};

/**
 * @brief Finalized schedule plus the statistics of the run that produced it.
 */
struct OptimizerRun {
    Schedule schedule;
    SearchStats stats;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for schedule optimizers.
 *
 * Implementations are stateless across calls: every run works on private
 * copies of its input and owns its random source, so one optimizer per task
 * can run concurrently with the others. Degenerate input never throws; the
 * returned schedule may simply leave appointments unassigned.
 */
class IScheduleOptimizer {
public:
    virtual ~IScheduleOptimizer() = default;

    /**
     * @brief Algorithm name used by the factory and the comparison tables.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Optimize and return the finalized schedule with search statistics.
     */
    virtual OptimizerRun run(const std::vector<Appointment>& appointments,
                             const std::vector<Resource>& resources) = 0;

    /**
     * @brief Optimize and return only the finalized schedule.
     */
    Schedule optimize(const std::vector<Appointment>& appointments,
                      const std::vector<Resource>& resources) {
        return run(appointments, resources).schedule;
    }

    /**
     * @brief Install an external flag checked at every loop head (nullptr to clear).
     */
    void setCancellationFlag(const std::atomic<bool>* flag) { cancel_ = flag; }

protected:
    bool cancelRequested() const { return cancel_ != nullptr && cancel_->load(); }

private:
    const std::atomic<bool>* cancel_ = nullptr;
};


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Unique schedule id of the form "<algorithm>-<sequence>".
 */
std::string nextScheduleId(const std::string& algorithm);

/**
 * @brief Each appointment gets a uniformly random eligible resource, or none.
 */
Assignment randomAssignment(const EligibilityTable& eligible, RandomGenerator& rng);

/**
 * @brief Convert an index assignment into a finalized Schedule.
 *
 * Appointments without any eligible resource are recorded as infeasible,
 * the remaining unplaced ones as unassigned.
 */
Schedule buildSchedule(const std::string& algorithm,
                       const std::vector<Appointment>& appointments,
                       const std::vector<Resource>& resources,
                       const EligibilityTable& eligible,
                       const Assignment& assignment);
