#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "schedule.hpp"
#include "solver_base.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief One row of an algorithm comparison.
 */
struct ComparisonResult {
    std::string algorithmName;
    Schedule schedule;
    double executionTimeMs = 0.0; ///< Wall-clock time of the optimizer run.
    long iterations = 0; ///< Backtrack calls, generations or annealing steps.
    double efficiencyScore = 0.0;
    double totalCost = 0.0;
    int conflictCount = 0;
    SearchStats stats; ///< Full statistics of the run.
};

/// Results keyed by algorithm name, in name order.
using ComparisonMap = std::map<std::string, ComparisonResult>;


///////////////////////////
///       FACTORY       ///
///////////////////////////
/**
 * @brief Names accepted by makeOptimizer(), in the order the harness runs them.
 */
const std::vector<std::string>& availableAlgorithms();

/**
 * @brief Long human-readable name ("Genetic Algorithm", ...).
 *
 * @throws std::invalid_argument for an unknown algorithm name.
 */
std::string algorithmDisplayName(const std::string& name);

/**
 * @brief Create a fresh optimizer for "CSP", "GA" or "SA".
 *
 * @throws std::invalid_argument for an unknown algorithm name.
 */
std::unique_ptr<IScheduleOptimizer> makeOptimizer(const std::string& name, const OptimizerConfig& config);

/**
 * @brief Package a finished run and its measured time as a comparison row.
 */
ComparisonResult makeComparisonResult(const std::string& name, OptimizerRun run, double executionTimeMs);


///////////////////////////
///       HARNESS       ///
///////////////////////////
/**
 * @brief Runs several optimizers over one input snapshot and times them.
 *
 * Every algorithm gets its own optimizer instance and its own copy of the
 * input. With parallelComparison enabled each algorithm runs as an
 * independent std::async task and the harness joins on all of them.
 */
class ComparisonHarness {
public:
    /// @throws std::invalid_argument for out-of-range parameters.
    explicit ComparisonHarness(OptimizerConfig config = OptimizerConfig{});

    /**
     * @brief Run every available algorithm.
     */
    ComparisonMap compareAll(const std::vector<Appointment>& appointments,
                             const std::vector<Resource>& resources) const;

    /**
     * @brief Run the named algorithms.
     *
     * @throws std::invalid_argument before anything runs if a name is unknown.
     */
    ComparisonMap compare(const std::vector<std::string>& names,
                          const std::vector<Appointment>& appointments,
                          const std::vector<Resource>& resources) const;

    /**
     * @brief Run one algorithm and measure it.
     */
    ComparisonResult runOne(const std::string& name,
                            const std::vector<Appointment>& appointments,
                            const std::vector<Resource>& resources) const;

    /**
     * @brief Forward an external cancellation flag to every optimizer created.
     */
    void setCancellationFlag(const std::atomic<bool>* flag) { cancel_ = flag; }

    const OptimizerConfig& config() const { return config_; }

private:
    OptimizerConfig config_;
    const std::atomic<bool>* cancel_ = nullptr;
};

/**
 * @brief Name of the result with the highest efficiency score (ties: first by name).
 *
 * Returns std::nullopt for an empty map.
 */
std::optional<std::string> selectWinner(const ComparisonMap& results);
