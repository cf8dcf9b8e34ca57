#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "constraints.hpp"
#include "comparison.hpp"
#include <string>
#include <vector>


///////////////////////////
///       HARNESS       ///
///////////////////////////
/**
 * @brief Comparison harness that spreads the algorithms over MPI ranks.
 *
 * Every rank holds the same instance. Rank r runs the algorithms whose index
 * in availableAlgorithms() is congruent to r modulo the number of ranks, one
 * at a time and single-process. Results travel to rank 0 as a small record
 * (timing and statistics) plus the assignment vector; rank 0 rebuilds and
 * finalizes each schedule from its own copy of the input.
 */
class MPIComparisonHarness {
public:
    explicit MPIComparisonHarness(OptimizerConfig config);

    /**
     * @brief Run the comparison cooperatively across all ranks.
     *
     * Must be called on every rank. Returns the complete comparison on rank 0
     * and an empty map on every other rank.
     */
    ComparisonMap compareAll(const ProblemInstance& inst);

private:
    OptimizerConfig config_;

    /**
     * @brief Encode timing and statistics as a fixed-size double record.
     *
     * Layout: executionTimeMs, iterations, initialObjective, bestObjective,
     * exhausted, cancelled.
     */
    static void serializeStats(const ComparisonResult& result, std::vector<double>& record);

    /**
     * @brief Decode a record produced by serializeStats().
     */
    static void deserializeStats(const std::vector<double>& record, double& executionTimeMs, SearchStats& stats);

    /**
     * @brief Resource index per appointment (kUnassigned when none).
     */
    static Assignment serializeAssignment(const Schedule& schedule, const ProblemInstance& inst);
};
