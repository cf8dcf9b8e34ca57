///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "csp_solver.hpp"
#include <algorithm>
#include <numeric>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
CspBacktrackingOptimizer::CspBacktrackingOptimizer(CspConfig config)
        : config_(config) {
    validateCspConfig(config_);
}

/**
 * @brief Run the bounded backtracking search and build the schedule.
 *
 * Sets up the working AssignmentState over the reordered appointments,
 * searches, then maps the best assignment back to input order.
 */
OptimizerRun CspBacktrackingOptimizer::run(const std::vector<Appointment>& appointments,
                                           const std::vector<Resource>& resources) {
    EligibilityTable eligible = buildEligibility(appointments, resources);

    orderAppointments(appointments);
    orderCandidates(eligible, resources);

    // Local mutable state used during the search.
    AssignmentState state(ordered_, resources);
    state_ = &state;

    // Reset incumbent and counters; nothing survives from a previous run.
    int n = (int)ordered_.size();
    best_.assign(n, kUnassigned);
    bestAssigned_ = -1;
    backtrackCount_ = 0;
    complete_ = false;
    aborted_ = false;
    cancelled_ = false;

    remainingFeasible_.assign(n + 1, 0);
    for (int k = n - 1; k >= 0; --k) {
        remainingFeasible_[k] = remainingFeasible_[k + 1] + (candidates_[k].empty() ? 0 : 1);
    }
    feasibleTotal_ = remainingFeasible_[0];

    backtrack(0);
    state_ = nullptr;

    // Map the ordered assignment back to the caller's appointment order.
    Assignment result(appointments.size(), kUnassigned);
    for (int k = 0; k < n; ++k) {
        result[order_[k]] = best_[k];
    }

    SearchStats stats;
    stats.iterations = backtrackCount_;
    stats.initialObjective = 0.0;
    stats.bestObjective = (double)std::max(bestAssigned_, 0);
    stats.exhausted = aborted_;
    stats.cancelled = cancelled_;

    return OptimizerRun{buildSchedule(name(), appointments, resources, eligible, result), stats};
}

/**
 * @brief Hardest first: higher priority level, then higher weighted score.
 *
 * stable_sort keeps input order among ties so the search is deterministic.
 */
void CspBacktrackingOptimizer::orderAppointments(const std::vector<Appointment>& appointments) {
    order_.resize(appointments.size());
    std::iota(order_.begin(), order_.end(), 0);
    std::stable_sort(order_.begin(), order_.end(), [&](int a, int b) {
        const Appointment& x = appointments[a];
        const Appointment& y = appointments[b];
        int lx = priorityInfo(x.priority()).level;
        int ly = priorityInfo(y.priority()).level;
        if (lx != ly) return lx > ly;
        return x.calculateScore() > y.calculateScore();
    });

    ordered_.clear();
    ordered_.reserve(appointments.size());
    for (int idx : order_) {
        ordered_.push_back(appointments[idx]);
    }
}

/**
 * @brief Cheaper and better matching resources are tried first.
 */
void CspBacktrackingOptimizer::orderCandidates(const EligibilityTable& eligible,
                                               const std::vector<Resource>& resources) {
    candidates_.assign(ordered_.size(), {});
    for (size_t k = 0; k < ordered_.size(); ++k) {
        const Appointment& appt = ordered_[k];
        std::vector<int> list = eligible[order_[k]];
        std::stable_sort(list.begin(), list.end(), [&](int a, int b) {
            double ka = resourceCost(resources[a], appt.duration()) - capabilityMatchBonus(appt, resources[a]);
            double kb = resourceCost(resources[b], appt.duration()) - capabilityMatchBonus(appt, resources[b]);
            return ka < kb;
        });
        candidates_[k] = std::move(list);
    }
}

/**
 * @brief Depth-first search with an explicit skip branch.
 *
 * At each depth every candidate accepted by the state is tried in order,
 * then the appointment is left unassigned. A subtree is pruned when even
 * placing every remaining feasible appointment could not beat the incumbent.
 */
void CspBacktrackingOptimizer::backtrack(int depth) {
    if (complete_ || aborted_ || cancelled_) return;

    if (cancelRequested()) {
        cancelled_ = true;
        recordIfBetter();
        return;
    }

    // Attempt cap: abandon the remaining branches, keep what we have.
    if (backtrackCount_ >= config_.maxBacktrackAttempts) {
        aborted_ = true;
        recordIfBetter();
        return;
    }
    backtrackCount_++;

    // Leaf: every appointment decided.
    if (depth == (int)ordered_.size()) {
        recordIfBetter();
        if (bestAssigned_ == feasibleTotal_) complete_ = true;
        return;
    }

    // Bound: this subtree cannot improve on the incumbent.
    if (state_->placedCount() + remainingFeasible_[depth] <= bestAssigned_) return;

    for (int resIndex : candidates_[depth]) {
        if (state_->place(depth, resIndex)) {
            backtrack(depth + 1);
            state_->undo(depth, resIndex);
            if (complete_ || aborted_ || cancelled_) return;
        }
    }

    // Leave this appointment unassigned and continue with the next one.
    backtrack(depth + 1);
}

void CspBacktrackingOptimizer::recordIfBetter() {
    if (state_->placedCount() > bestAssigned_) {
        bestAssigned_ = state_->placedCount();
        best_ = state_->assignment();
    }
}
