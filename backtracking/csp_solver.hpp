#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "config.hpp"
#include "solver_base.hpp"
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Deterministic depth-first constraint satisfaction search.
 *
 * Appointments are ordered hardest first and resources tried cheapest and
 * best-matching first. Every depth also has a final "leave unassigned"
 * branch, so the search always yields a (possibly partial) assignment; a
 * branch-and-bound on the assigned count prunes subtrees that cannot beat
 * the incumbent. The total number of recursive calls is capped.
 */
class CspBacktrackingOptimizer : public IScheduleOptimizer {
public:
    /**
     * @brief Construct a backtracking optimizer.
     *
     * @param config Search limits (maxBacktrackAttempts caps recursive calls).
     */
    explicit CspBacktrackingOptimizer(CspConfig config = CspConfig{});

    std::string name() const override { return "CSP"; }

    /**
     * @brief Search for the assignment placing the most appointments.
     *
     * Stops early once every appointment that has an eligible resource is
     * placed; on reaching the attempt cap the best assignment seen so far
     * (including the current partial one) is returned.
     */
    OptimizerRun run(const std::vector<Appointment>& appointments,
                     const std::vector<Resource>& resources) override;

private:
    CspConfig config_;

    /// Input appointments reordered by the search heuristic (valid during run()).
    std::vector<Appointment> ordered_;

    /// order_[k] = input index of ordered_[k].
    std::vector<int> order_;

    /// candidates_[k] = eligible resource indices for ordered_[k], best first.
    EligibilityTable candidates_;

    /// remainingFeasible_[k] = appointments at depth >= k that have a candidate.
    std::vector<int> remainingFeasible_;

    /// Mutable occupancy used during backtracking.
    AssignmentState* state_ = nullptr;

    Assignment best_;           ///< Best assignment found, in ordered_ index space.
    int bestAssigned_ = -1;     ///< Assigned count of best_.
    int feasibleTotal_ = 0;     ///< Upper bound on the assigned count.
    long backtrackCount_ = 0;   ///< Recursive calls made so far.
    bool complete_ = false;     ///< Every feasible appointment was placed.
    bool aborted_ = false;      ///< Attempt cap reached.
    bool cancelled_ = false;    ///< External cancellation observed.

    /**
     * @brief Order appointments by priority level, then by calculateScore(), both descending.
     */
    void orderAppointments(const std::vector<Appointment>& appointments);

    /**
     * @brief Order each appointment's candidates by resourceCost - capabilityMatchBonus.
     */
    void orderCandidates(const EligibilityTable& eligible, const std::vector<Resource>& resources);

    /**
     * @brief Recursive depth-first search over ordered_.
     */
    void backtrack(int depth);

    /**
     * @brief Snapshot the current partial assignment if it beats the incumbent.
     */
    void recordIfBetter();
};
